#ifndef SCOPELOG_LOGGING_LOGOUTPUT_HPP
#define SCOPELOG_LOGGING_LOGOUTPUT_HPP

#include "scopelog/logging/logitem.hpp"

#include <deque>
#include <mutex>
#include <vector>


namespace scopelog {

    namespace logging {


        class LogOutput {

            unsigned int flushPeriod;

        protected:

            uint8_t mask;
            std::mutex queueMutex;
            std::deque<LogItemPtr> itemQueue;
            unsigned int itemCount;

            virtual void flushBuffer( void ) {}

            LogOutput( uint8_t m=LOG_MASK_ALL, unsigned int flushPeriod=1 );

        public:
            virtual ~LogOutput();

            inline void setMask( uint8_t m ) { mask = m; }
            inline uint8_t getMask(void) const { return mask; }

            void addItem( LogItemPtr );
            void addItems( const std::vector<LogItemPtr>& );

            friend class Logger;

        };
        typedef std::shared_ptr<LogOutput> LogOutputPtr;


    } // end namespace logging

} // end namespace scopelog



#endif // SCOPELOG_LOGGING_LOGOUTPUT_HPP
