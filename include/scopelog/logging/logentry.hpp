#ifndef SCOPELOG_LOGGING_LOGENTRY_HPP
#define SCOPELOG_LOGGING_LOGENTRY_HPP

#include "scopelog/logging/level.hpp"

#include <string>
#include <sstream>
#include <ostream>

#include <boost/io/ios_state.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace scopelog {

    namespace logging {

        /*!  @class     LogEntry
         *   @brief     One message of the diagnostic log.
         *   @details   The text is streamed into an internal buffer and moved to \c message
         *              by finalize(), which also stamps the entry with the current time.
         */
        class LogEntry {
        public:

            LogEntry(void) : mask(LOG_MASK_ERROR), settings(buffer) {}
            LogEntry( uint8_t m, const std::string &msg ) : mask(m), message(msg), settings(buffer) {}

            LogEntry( const LogEntry& rhs) : mask(rhs.mask), message(rhs.message),
                    entryTime(rhs.entryTime), settings(buffer) {
            }

            LogEntry &operator=( const LogEntry& rhs ) {
                mask = rhs.mask;
                message = rhs.message;
                entryTime = rhs.entryTime;
                return *this;
            }

            inline void now(void){
                entryTime = boost::posix_time::microsec_clock::universal_time();
            }
            inline void setMask( uint8_t m ) { mask = m; }
            inline uint8_t getMask(void) const { return mask; }
            inline const std::string& getMessage(void) const { return message; }
            inline const boost::posix_time::ptime &getTime(void) const { return entryTime; }

            template <typename T>
            inline LogEntry &operator<<(const T &v) {
                buffer << v;
                return *this;
            }

            // forward iostream manipulators (i.e. endl)
            inline LogEntry &operator<<(std::ostream &(*f)(std::ostream &)) {
                buffer << f;
                return *this;
            }

            // forward ios_base manipulators
            inline LogEntry &operator<<(std::ios_base &(*f)(std::ios_base &)) {
                buffer << f;
                return *this;
            }

            inline LogEntry &operator<<(LogEntry &(*f)(LogEntry &)) {
                return f(*this);
            }

            void finalize(void);

        private:
            uint8_t mask;
            std::string message;
            boost::posix_time::ptime entryTime;
            std::stringstream buffer;
            boost::io::ios_all_saver settings;

        };


    }   // logging

}   // scopelog

std::ostream &operator<<(std::ostream &os, const scopelog::logging::LogEntry &le);

#endif //  SCOPELOG_LOGGING_LOGENTRY_HPP
