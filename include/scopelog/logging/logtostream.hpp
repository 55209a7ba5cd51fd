#ifndef SCOPELOG_LOGGING_LOGTOSTREAM_HPP
#define SCOPELOG_LOGGING_LOGTOSTREAM_HPP

#include "scopelog/logging/logoutput.hpp"

#include <ostream>


namespace scopelog {

    namespace logging {


        class LogToStream : public LogOutput {

        public:
            LogToStream( std::ostream &os, uint8_t m=LOG_MASK_ALL, unsigned int flushPeriod=1);
            ~LogToStream();

            void flushBuffer( void ) override;

            inline void setColor( bool c ) { color = c; }

        private:
            void writeFormatted( const LogItem& );

            std::ostream& out;
            bool color;

        };

    } // end namespace logging

} // end namespace scopelog



#endif // SCOPELOG_LOGGING_LOGTOSTREAM_HPP
