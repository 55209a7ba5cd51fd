#include "scopelog/logging/level.hpp"

#include "scopelog/exception.hpp"

#include <strings.h>
#include <vector>

#include <boost/algorithm/string.hpp>

using namespace scopelog::logging;
using namespace scopelog;
using namespace std;

namespace {

    const char* level_names[] = { "Trace", "Debug", "Information", "Warning", "Error" };

}


int scopelog::logging::verbosityFromMask( uint8_t m ) {

    m &= LOG_MASK_ALL;
    if( m == 0 ) return 0;
    return LOG_VERBOSITY_MAX + 1 - ffs( m );     // lowest enabled level decides

}


const char* scopelog::logging::levelName( uint8_t m ) {

    if( !isSingleLevel( m ) ) return nullptr;
    return level_names[ ffs( m ) - 1 ];

}


string scopelog::logging::maskToString( uint8_t m ) {

    if( m == LOG_MASK_NONE ) return "None";
    if( m == LOG_MASK_ALL ) return "All";

    string ret;
    for( int i = 0; i < LOG_VERBOSITY_MAX; ++i ) {
        if( m & ( 1 << i ) ) {
            if( !ret.empty() ) ret += "|";
            ret += level_names[i];
        }
    }
    if( m & ~LOG_MASK_ALL ) {       // bits outside the known levels
        if( !ret.empty() ) ret += "|";
        ret += to_string( m & ~LOG_MASK_ALL );
    }
    return ret;

}


uint8_t scopelog::logging::stringToMask( const string& s ) {

    using boost::algorithm::iequals;

    vector<string> tokens;
    boost::split( tokens, s, boost::is_any_of( "|,+ \t" ), boost::token_compress_on );

    uint8_t mask = LOG_MASK_NONE;
    for( const auto& tok: tokens ) {
        if( tok.empty() || iequals( tok, "None" ) ) {
            continue;
        } else if( iequals( tok, "All" ) ) {
            mask |= LOG_MASK_ALL;
        } else if( iequals( tok, "Info" ) ) {
            mask |= LOG_MASK_INFO;
        } else {
            bool found = false;
            for( int i = 0; i < LOG_VERBOSITY_MAX; ++i ) {
                if( iequals( tok, level_names[i] ) ) {
                    mask |= ( 1 << i );
                    found = true;
                    break;
                }
            }
            if( !found ) {
                throw BadArgument( "Unknown validation level: \"" + tok + "\"" );
            }
        }
    }
    return mask;

}
