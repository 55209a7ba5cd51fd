#ifndef SCOPELOG_LOGGING_LOGGER_HPP
#define SCOPELOG_LOGGING_LOGGER_HPP

#include "scopelog/logging/logitem.hpp"
#include "scopelog/logging/logoutput.hpp"

#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>

#include <boost/program_options.hpp>

namespace bpo = boost::program_options;


namespace scopelog {

    namespace logging {

        /*!  @class     Logger
         *   @brief     Diagnostic log of the application.
         *   @details   Items are built in a thread-local LogItem (see getItem()) and published
         *              with the \c ende manipulator. Published items that pass the mask are
         *              forwarded to all registered outputs.
         *   @code
         *   Logger logger;
         *   logger.addStream( std::cout );
         *   SCOPELOG_WARN(logger) << "value out of range: " << x << ende;
         *   @endcode
         */
        class Logger : public LogOutput {
        public:

            Logger(void);
            explicit Logger( bpo::variables_map& );
            ~Logger();

            void append( LogItem& );
            void flushBuffer( void ) override;
            void flushAll( void );

            void addStream( std::ostream&, uint8_t m=0, unsigned int flushPeriod=1 );
            void removeStream( std::ostream& );
            void removeOutput( const std::string& );
            void removeAllOutputs( void );
            size_t outputCount( void );
            void setContext( const std::string& c ) { context = c; };

            LogItem& getItem( uint8_t m=LOG_MASK_INFO ) {
                threadItem.setLogger( this );
                threadItem.entry.setMask(m);
                threadItem.context = context;
                return threadItem;
            }

            static inline int getDefaultLevel(void) { return verbosityFromMask(defaultLevelMask); }
            static inline void setDefaultMask( uint8_t m ) { defaultLevelMask = m; }
            static inline uint8_t getDefaultMask(void) { return defaultLevelMask; }

            static std::pair<std::string, std::string> customParser( const std::string& s );
            static std::string environmentMap( const std::string& );
            static bpo::options_description getOptions( void );

        private:
            std::string context;

            typedef std::map<std::string, LogOutputPtr> OutputMap;
            OutputMap outputs;
            std::mutex outputMutex;

            static uint8_t defaultLevelMask;
            static thread_local LogItem threadItem;
        };

    }

}

#define SCOPELOG_TRACE(mylog) mylog.getItem(scopelog::logging::LOG_MASK_TRACE)
#define SCOPELOG_DEBUG(mylog) mylog.getItem(scopelog::logging::LOG_MASK_DEBUG)
#define SCOPELOG_INFO(mylog) mylog.getItem(scopelog::logging::LOG_MASK_INFO)
#define SCOPELOG_WARN(mylog) mylog.getItem(scopelog::logging::LOG_MASK_WARNING)
#define SCOPELOG_ERR(mylog) mylog.getItem(scopelog::logging::LOG_MASK_ERROR)


#endif //   SCOPELOG_LOGGING_LOGGER_HPP
