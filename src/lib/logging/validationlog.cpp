#include "scopelog/logging/validationlog.hpp"

using namespace scopelog::logging;


ScopeContext::ScopeContext( ScopeContext&& rhs ) : log( rhs.log ), depth( rhs.depth ) {
    rhs.depth = 0;
}


void ScopeContext::close( void ) {

    if( depth == 0 ) return;         // already closed
    if( log ) {
        log->endScope( depth );
    }
    depth = 0;

}
