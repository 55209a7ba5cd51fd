#include "scopelog/logging/validationlogger.hpp"

#include "scopelog/exception.hpp"
#include "scopelog/logging/logger.hpp"

#include <algorithm>
#include <map>
#include <sstream>

#include <boost/algorithm/string/join.hpp>

using namespace scopelog::logging;
using namespace scopelog;
using namespace std;

namespace {

    inline void closeScopes( ostream& os, size_t from, size_t to ) {
        for( size_t i = from; i > to; --i ) {
            os << string( (i-1)*2, ' ' ) << "}\n";
        }
    }

}


ValidationLogger::ValidationLogger( uint8_t enabledLevels ) : enabledLevels( enabledLevels ),
    loggedLevels( LOG_MASK_NONE ), errors( 0 ), warnings( 0 ), echo( nullptr ) {

}


ValidationLogger::ValidationLogger( bpo::variables_map& vm ) : ValidationLogger() {

    if( vm.count( "validation-levels" ) ) {
        enabledLevels = stringToMask( vm["validation-levels"].as<string>() );
    }

}


ScopeContext ValidationLogger::beginScope( const string& name ) {

    scope.push_back( name );
    return ScopeContext( this, scope.size() );

}


void ValidationLogger::endScope( size_t depth ) {

    if( depth > 0 && scope.size() >= depth ) {
        scope.resize( depth-1 );
    }

}


void ValidationLogger::log( int lvl, const string& propertyName, const string& message ) {

    if( !isSingleLevel( lvl ) ) {
        throw BadArgument( "Must be Trace, Debug, Information, Warning, or Error" );
    }
    uint8_t level = static_cast<uint8_t>( lvl );

    bool record = isEnabled( level );
    LogMessage msg( record ? scope : vector<string>(), level, propertyName, message );
    if( record && ( messages.size() == messages.capacity() ) ) {
        messages.reserve( std::max<size_t>( 16, 2*messages.capacity() ) );
    }

    // nothing below can throw until the message is stored
    if( level == LOG_MASK_WARNING ) {
        ++warnings;
    } else if( level == LOG_MASK_ERROR ) {
        ++errors;
    }

    if( !record ) return;

    loggedLevels |= level;
    messages.push_back( std::move( msg ) );

    if( echo ) {
        LogItem& item = echo->getItem( level );
        item.context = boost::algorithm::join( scope, "/" );
        item << propertyName << ": " << message << ende;
    }

}


void ValidationLogger::write( ostream& os ) const {

    static const vector<string> noScope;
    const vector<string>* previous = &noScope;

    for( const auto& msg: messages ) {
        const vector<string>& current = msg.getScope();

        size_t nMatch(0);
        size_t nCommon = std::min( previous->size(), current.size() );
        while( nMatch < nCommon && (*previous)[nMatch] == current[nMatch] ) {
            ++nMatch;
        }

        closeScopes( os, previous->size(), nMatch );
        previous = &current;

        for( size_t i = nMatch; i < current.size(); ++i ) {
            os << string( i*2, ' ' ) << current[i] << " {\n";
        }

        os << string( current.size()*2, ' ' ) << levelName( msg.getLevel() ) << ": "
           << msg.getPropertyName() << ": " << msg.getMessage() << "\n";
    }

    closeScopes( os, previous->size(), 0 );

}


string ValidationLogger::str( void ) const {

    ostringstream oss;
    write( oss );
    return oss.str();

}


string ValidationLogger::environmentMap( const string &envName ) {

    static map<string, string> vmap;
    if( vmap.empty() ) {
        vmap["SCOPELOG_LEVELS"] = "validation-levels";
    }
    map<string, string>::const_iterator ci = vmap.find( envName );
    if( ci == vmap.end() ) {
        return "";
    } else {
        return ci->second;
    }

}


bpo::options_description ValidationLogger::getOptions( void ) {

    bpo::options_description validation( "Validation Options" );
    validation.add_options()
    ( "validation-levels", bpo::value<string>(), "Levels to record, e.g. \"Warning|Error\" or \"All\"."
      " Default is Information|Warning|Error."
      " The environment variable SCOPELOG_LEVELS will be used as default if it exists." )
    ;

    return validation;

}


std::ostream &operator<<( std::ostream &os, const scopelog::logging::ValidationLogger &vl ) {

    vl.write( os );
    return os;

}
