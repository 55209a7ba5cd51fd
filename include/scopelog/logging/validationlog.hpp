#ifndef SCOPELOG_LOGGING_VALIDATIONLOG_HPP
#define SCOPELOG_LOGGING_VALIDATIONLOG_HPP

#include "scopelog/logging/level.hpp"

#include <cstddef>
#include <string>

namespace scopelog {

    namespace logging {

        class ValidationLog;

        /*!  @class     ScopeContext
         *   @brief     Handle for an open scope, returned by ValidationLog::beginScope().
         *   @details   Closing the handle truncates the scope stack to where it was before the
         *              scope was opened, which also closes any nested scopes that are still open.
         *              The destructor closes the scope, close() may be called any number of times.
         *              The handle can be moved into a new ScopeContext but not assigned to, since
         *              closing the old scope on assignment would also pop a scope opened after it.
         *              The ValidationLog must outlive the handle.
         */
        class ScopeContext {
        public:
            ScopeContext( void ) : log(nullptr), depth(0) {}
            ScopeContext( ValidationLog* l, size_t d ) : log(l), depth(d) {}
            ScopeContext( ScopeContext&& );
            ScopeContext( const ScopeContext& ) = delete;
            ~ScopeContext() { close(); }

            ScopeContext& operator=( ScopeContext&& ) = delete;
            ScopeContext& operator=( const ScopeContext& ) = delete;

            void close( void );
            inline bool isOpen( void ) const { return depth > 0; }
            inline size_t getDepth( void ) const { return depth; }

        private:
            ValidationLog* log;
            size_t depth;           // stack depth including this scope, 0 once closed
        };


        /*!  @class     ValidationLog
         *   @brief     Interface for collecting validation messages.
         */
        class ValidationLog {
        public:
            virtual ~ValidationLog() {}

            virtual ScopeContext beginScope( const std::string& name ) = 0;
            virtual void log( int level, const std::string& propertyName, const std::string& message ) = 0;

            virtual uint8_t getEnabledLevels( void ) const = 0;
            virtual bool isEnabled( uint8_t level ) const = 0;

        protected:
            /*! Truncate the scope stack to \c depth-1 entries. Does nothing if the stack already
             *  is shallower than \c depth.
             */
            virtual void endScope( size_t depth ) = 0;

            friend class ScopeContext;
        };

    }   // logging

}   // scopelog


#endif // SCOPELOG_LOGGING_VALIDATIONLOG_HPP
