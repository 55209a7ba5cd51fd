#include "scopelog/logging/logtostream.hpp"

#include <iostream>
#include <strings.h>
#include <vector>

#include <boost/date_time/posix_time/time_formatters.hpp>

using namespace scopelog::logging;
using namespace std;

namespace bpx = boost::posix_time;

namespace {

    const char* level_tags[] = { "", "[T]", "[D]", "[I]", "[W]", "[E]" };
    const char* color_level_tags[] = {
        "",
        "\033[95m[T]\033[0m",
        "\033[36m[D]\033[0m",
        "\033[32m[I]\033[0m",
        "\033[33m[W]\033[0m",
        "\033[91m[E]\033[0m"
    };

}


LogToStream::LogToStream( ostream &os, uint8_t m, unsigned int flushPeriod) : LogOutput(m,flushPeriod), out(os),
    color( &os == &cout || &os == &cerr ) {

}


LogToStream::~LogToStream() {

    if( !itemQueue.empty() ) {
        LogToStream::flushBuffer();
    }

}


void LogToStream::writeFormatted( const LogItem &i ) {

    if( out.good() ) {
        boost::io::ios_all_saver settings(out);
        out << bpx::to_iso_extended_string( i.entry.getTime() ) << " ";
        uint8_t m = i.entry.getMask() & LOG_MASK_ALL;
        if( m ) {
            int pos = ffs(m);
            if( color ) {
                out << color_level_tags[ pos ];
            } else {
                out << level_tags[ pos ];
            }
        }
        if( ! i.context.empty() ) {
            out << " (" << i.context << ")";
        }
        out << " " << i.entry.getMessage() << endl;
    }
}


void LogToStream::flushBuffer( void ) {

    unique_lock<mutex> lock( queueMutex );
    vector<LogItemPtr> tmpQueue( itemQueue.begin(), itemQueue.end() );
    itemQueue.clear();
    itemCount = 0;

    for( const auto& it: tmpQueue ) {
        if( it ) writeFormatted( *it );
    }

}
