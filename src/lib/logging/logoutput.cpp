#include "scopelog/logging/logoutput.hpp"

#include <algorithm>
#include <iterator>

using namespace scopelog::logging;
using namespace std;


LogOutput::LogOutput( uint8_t m, unsigned int flushPeriod ) : flushPeriod(flushPeriod), mask(m), itemCount(0) {

}


LogOutput::~LogOutput( )  {

}


void LogOutput::addItem( LogItemPtr item ) {

    if( !item || !(item->entry.getMask() & mask) ) {
        return;
    }

    unique_lock<mutex> lock(queueMutex);
    itemQueue.push_back(item);
    itemCount = itemQueue.size();
    if( itemCount >= flushPeriod ) {
        lock.unlock();
        this->flushBuffer();
    }

}


void LogOutput::addItems( const vector<LogItemPtr>& items ) {

    if( items.empty() ) return;

    unique_lock<mutex> lock(queueMutex);
    std::copy_if( std::begin(items), std::end(items), back_inserter(itemQueue),
                  [this]( const LogItemPtr& i ) { return i && (i->entry.getMask() & mask); } );
    itemCount = itemQueue.size();
    if( (flushPeriod == 0) || (itemCount >= flushPeriod) ) {
        lock.unlock();
        this->flushBuffer();
    }

}
