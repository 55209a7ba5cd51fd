#include "scopelog/logging/logger.hpp"

#include "scopelog/logging/logtostream.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <vector>

using namespace scopelog::logging;
using namespace std;

uint8_t Logger::defaultLevelMask = LOG_MASK_DEFAULT;
thread_local LogItem Logger::threadItem;

namespace {

    string outputName( const void* p ) {
        ostringstream oss;
        oss << "0x" << hex << reinterpret_cast<uintptr_t>( p );
        return oss.str();
    }

}


pair<string, string> Logger::customParser( const string& s ) { // custom parser to handle multiple -q/-v flags (e.g. -vvvv)

    if( s.find( "-v" ) == 0 || s.find( "--verbose" ) == 0 ) {
        int count = std::count( s.begin(), s.end(), 'v' );
        defaultLevelMask = maskFromVerbosity( verbosityFromMask( defaultLevelMask ) + count );
    }
    else if( s.find( "-q" ) == 0 || s.find( "--quiet" ) == 0 ) {
        int count = std::count( s.begin(), s.end(), 'q' );
        defaultLevelMask = maskFromVerbosity( verbosityFromMask( defaultLevelMask ) - count );
    }
    return make_pair( string(), string() );                 // the verbosity is handled directly, nothing to return
}


string Logger::environmentMap( const string &envName ) {

    static map<string, string> vmap;
    if( vmap.empty() ) {
        vmap["SCOPELOG_VERBOSITY"] = "verbosity";
    }
    map<string, string>::const_iterator ci = vmap.find( envName );
    if( ci == vmap.end() ) {
        return "";
    } else {
        return ci->second;
    }
}


bpo::options_description Logger::getOptions( void ) {

    bpo::options_description logging( "Logging Options" );
    logging.add_options()
    ( "verbosity", bpo::value< int >(), "Specify verbosity level (0-5, 0 means no output)."
      " The environment variable SCOPELOG_VERBOSITY will be used as default if it exists." )
    ( "verbose,v", bpo::value<vector<string>>()->implicit_value( vector<string>( 1, "1" ), "" )
      ->composing(), "More output. (ignored if --verbosity is specified)" )
    ( "quiet,q", bpo::value<vector<string>>()->implicit_value( vector<string>( 1, "-1" ), "" )
      ->composing(), "Less output. (ignored if --verbosity is specified)" )
    ( "log-stdout,d", "Write the diagnostic log to stdout." )
    ;

    return logging;
}


Logger::Logger( bpo::variables_map& vm ) : LogOutput( defaultLevelMask, 1 ) {

    if( vm.count( "verbosity" ) > 0 ) {         // if --verbosity N is specified, use it.
        defaultLevelMask = maskFromVerbosity( vm["verbosity"].as<int>() );
    }

    mask = defaultLevelMask;

    if( vm.count( "log-stdout" ) ) {
        addStream( cout, mask );
    }

}


Logger::Logger(void) : LogOutput(defaultLevelMask,1) {

}


Logger::~Logger() {

    this->flushAll();
    outputs.clear();

}


void Logger::append( LogItem &i ) {

    if( !(i.entry.getMask() & mask) ) {
        return;
    }

    LogItemPtr tmpItem( new LogItem() );
    tmpItem->setLogger( this );
    tmpItem->entry = i.entry;
    tmpItem->context = i.context;

    addItem( tmpItem );

}


void Logger::flushBuffer( void ) {

    unique_lock<mutex> lock( queueMutex );
    vector<LogItemPtr> tmpQueue( itemQueue.begin(), itemQueue.end() );
    itemQueue.clear();
    itemCount = 0;
    lock.unlock();

    unique_lock<mutex> lock2( outputMutex );
    for( auto &it: outputs ) {
        it.second->addItems( tmpQueue );
    }

}


void Logger::flushAll( void ) {

    flushBuffer();

    unique_lock<mutex> lock( outputMutex );
    for( auto &it: outputs ) {
        it.second->flushBuffer();
    }

}


void Logger::addStream( ostream& strm, uint8_t m, unsigned int flushPeriod ) {

    if( m == 0 ) {
        m = getMask();
    }
    string name = outputName( &strm );
    unique_lock<mutex> lock( outputMutex );
    OutputMap::iterator it = outputs.find( name );
    if( it == outputs.end() ) {
        std::shared_ptr<LogOutput> output( new LogToStream( strm, m, flushPeriod) );
        outputs.insert(make_pair(name,output));
    }

}


void Logger::removeStream( ostream& strm ) {
    removeOutput( outputName( &strm ) );
}


void Logger::removeOutput( const string& name ) {

    unique_lock<mutex> lock( outputMutex );
    OutputMap::iterator it = outputs.find( name );
    if( it != outputs.end() ) {
        it->second->flushBuffer();
        outputs.erase(it);
    }
}


void Logger::removeAllOutputs( void ) {

    unique_lock<mutex> lock( outputMutex );
    for( auto &op: outputs ) {
        op.second->flushBuffer();
    }
    outputs.clear();

}


size_t Logger::outputCount( void ) {

    unique_lock<mutex> lock( outputMutex );
    return outputs.size();

}
