#include "scopelog/logging/logitem.hpp"

#include "scopelog/logging/logger.hpp"

using namespace scopelog::logging;


void LogItem::endEntry(void) {
    entry.finalize();
    if( logger ) {
        logger->append( *this );
    }
    context.clear();
}
