#ifndef SCOPELOG_LOGGING_LOGMESSAGE_HPP
#define SCOPELOG_LOGGING_LOGMESSAGE_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>


namespace scopelog {

    namespace logging {

        /*!  @class     LogMessage
         *   @brief     A recorded validation message.
         *   @details   Holds its own copy of the scope stack as it was when the message was
         *              logged, so later scope changes do not affect it.
         */
        class LogMessage {
        public:
            LogMessage( const std::vector<std::string>& scope, uint8_t level,
                        const std::string& propertyName, const std::string& message )
                : scope(scope), level(level), propertyName(propertyName), message(message) {}

            inline const std::vector<std::string>& getScope(void) const { return scope; }
            inline uint8_t getLevel(void) const { return level; }
            inline const std::string& getPropertyName(void) const { return propertyName; }
            inline const std::string& getMessage(void) const { return message; }

        private:
            std::vector<std::string> scope;
            uint8_t level;
            std::string propertyName;
            std::string message;
        };

    }   // logging

}   // scopelog

std::ostream &operator<<( std::ostream &os, const scopelog::logging::LogMessage &msg );

#endif // SCOPELOG_LOGGING_LOGMESSAGE_HPP
