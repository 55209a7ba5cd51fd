#include "scopelog/logging/logentry.hpp"

using namespace scopelog::logging;
using namespace std;
using namespace boost::posix_time;


void LogEntry::finalize( void ) {

    now();
    message = buffer.str();
    buffer.str( string() );
    settings.restore();

}


std::ostream &operator<<( std::ostream &os, const scopelog::logging::LogEntry &le ) {

    const char* name = levelName( le.getMask() );
    os << ( name ? name : maskToString( le.getMask() ).c_str() ) << '|' << to_iso_extended_string( le.getTime() )
       << '|' << le.getMessage();

    return os;
}
