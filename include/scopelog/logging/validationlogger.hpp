#ifndef SCOPELOG_LOGGING_VALIDATIONLOGGER_HPP
#define SCOPELOG_LOGGING_VALIDATIONLOGGER_HPP

#include "scopelog/logging/logmessage.hpp"
#include "scopelog/logging/validationlog.hpp"

#include <ostream>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/program_options.hpp>

namespace bpo = boost::program_options;


namespace scopelog {

    namespace logging {

        class Logger;

        /*!  @class     ValidationLogger
         *   @brief     Accumulates the messages of a validation pass and formats them as a report.
         *   @details   Messages are tagged with a single severity level and a property name, and
         *              record the scope stack at the time they were logged. Only levels in the
         *              enabled mask are recorded, but warnings and errors are always counted.
         *              The report (str()) nests the messages in braces following their scopes:
         *   @code
         *   Scope1 {
         *     Warning: Something: Danger
         *     Scope2 {
         *       Error: CPU: CPU failure
         *     }
         *   }
         *   @endcode
         *              A new logger is meant to be created for every validation run.
         */
        class ValidationLogger : public ValidationLog, private boost::noncopyable {
        public:

            explicit ValidationLogger( uint8_t enabledLevels = LOG_MASK_DEFAULT );
            explicit ValidationLogger( bpo::variables_map& );

            ScopeContext beginScope( const std::string& name ) override;

            /*! @brief Add a message.
             *  @param level    one of LOG_MASK_TRACE, LOG_MASK_DEBUG, LOG_MASK_INFO, LOG_MASK_WARNING or LOG_MASK_ERROR
             *  @throws BadArgument if \c level is not a single level. Nothing is modified in that case.
             */
            void log( int level, const std::string& propertyName, const std::string& message ) override;

            uint8_t getEnabledLevels( void ) const override { return enabledLevels; }
            inline void setEnabledLevels( uint8_t m ) { enabledLevels = m; }
            bool isEnabled( uint8_t level ) const override { return ( level & enabledLevels ) != 0; }

            inline uint8_t getLoggedLevels( void ) const { return loggedLevels; }
            inline int getErrors( void ) const { return errors; }
            inline int getWarnings( void ) const { return warnings; }
            inline bool passedValidation( void ) const { return !( loggedLevels & LOG_MASK_ERROR ); }
            inline bool hasWarning( void ) const { return ( loggedLevels & LOG_MASK_WARNING ) != 0; }
            inline bool hasFlag( uint8_t level ) const { return ( loggedLevels & level ) != 0; }

            inline const std::vector<LogMessage>& getMessages( void ) const { return messages; }
            inline const std::vector<std::string>& getScope( void ) const { return scope; }

            /*! Send every recorded message to \c lg as well. nullptr disables the echo. */
            inline void setEcho( Logger* lg ) { echo = lg; }

            void write( std::ostream& ) const;
            std::string str( void ) const;

            static std::string environmentMap( const std::string& );
            static bpo::options_description getOptions( void );

        protected:
            void endScope( size_t depth ) override;

        private:
            uint8_t enabledLevels;
            uint8_t loggedLevels;
            int errors;
            int warnings;

            std::vector<std::string> scope;
            std::vector<LogMessage> messages;

            Logger* echo;

        };

    }   // logging

}   // scopelog

std::ostream &operator<<( std::ostream &os, const scopelog::logging::ValidationLogger &vl );

#endif // SCOPELOG_LOGGING_VALIDATIONLOGGER_HPP
