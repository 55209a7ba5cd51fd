#include "scopelog/logging/logmessage.hpp"

#include "scopelog/logging/level.hpp"

#include <boost/algorithm/string/join.hpp>

using namespace scopelog::logging;


std::ostream &operator<<( std::ostream &os, const scopelog::logging::LogMessage &msg ) {

    const char* name = levelName( msg.getLevel() );
    if( !msg.getScope().empty() ) {
        os << boost::algorithm::join( msg.getScope(), "/" ) << ": ";
    }
    os << ( name ? name : "?" ) << ": " << msg.getPropertyName() << ": " << msg.getMessage();

    return os;
}
