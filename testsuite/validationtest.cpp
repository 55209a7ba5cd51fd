#include <boost/test/unit_test.hpp>

#include "scopelog/exception.hpp"
#include "scopelog/logging/logger.hpp"
#include "scopelog/logging/validationlogger.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <type_traits>

using namespace scopelog::logging;
using namespace scopelog;
using namespace std;
using namespace boost::unit_test_framework;

namespace {

    // validates a nested structure and bails out early on a missing id
    bool validateItem( ValidationLog& vl, const string& name, bool hasId ) {
        ScopeContext scope = vl.beginScope( name );
        if( !hasId ) {
            vl.log( LOG_MASK_ERROR, "id", "missing" );
            return false;
        }
        vl.log( LOG_MASK_TRACE, "id", "ok" );
        return true;
    }

}

namespace testsuite {

    namespace validation {


        void defaultsTest( void ) {

            ValidationLogger vl;
            BOOST_CHECK_EQUAL( vl.getEnabledLevels(), LOG_MASK_DEFAULT );
            BOOST_CHECK_EQUAL( vl.getLoggedLevels(), LOG_MASK_NONE );
            BOOST_CHECK_EQUAL( vl.getErrors(), 0 );
            BOOST_CHECK_EQUAL( vl.getWarnings(), 0 );
            BOOST_CHECK( vl.passedValidation() );
            BOOST_CHECK( !vl.hasWarning() );
            BOOST_CHECK( vl.getMessages().empty() );
            BOOST_CHECK( vl.getScope().empty() );
            BOOST_CHECK( vl.str().empty() );

            BOOST_CHECK( vl.isEnabled( LOG_MASK_INFO ) );
            BOOST_CHECK( vl.isEnabled( LOG_MASK_WARNING ) );
            BOOST_CHECK( vl.isEnabled( LOG_MASK_ERROR ) );
            BOOST_CHECK( !vl.isEnabled( LOG_MASK_TRACE ) );
            BOOST_CHECK( !vl.isEnabled( LOG_MASK_DEBUG ) );
            BOOST_CHECK( vl.isEnabled( LOG_MASK_TRACE|LOG_MASK_ERROR ) );
            BOOST_CHECK( !vl.isEnabled( LOG_MASK_NONE ) );

        }


        void filterTest( void ) {

            {   // trace & debug are not recorded by default
                ValidationLogger vl;
                vl.log( LOG_MASK_TRACE, "Test", "Starting log." );
                vl.log( LOG_MASK_DEBUG, "Test", "Debug message" );
                BOOST_CHECK( vl.getMessages().empty() );
                BOOST_CHECK_EQUAL( vl.getLoggedLevels(), LOG_MASK_NONE );
                BOOST_CHECK( vl.str().empty() );
            }

            {   // filtered errors/warnings are still counted
                ValidationLogger vl( LOG_MASK_TRACE );
                vl.log( LOG_MASK_ERROR, "a", "filtered error" );
                vl.log( LOG_MASK_WARNING, "b", "filtered warning" );
                vl.log( LOG_MASK_WARNING, "c", "filtered warning" );
                BOOST_CHECK_EQUAL( vl.getErrors(), 1 );
                BOOST_CHECK_EQUAL( vl.getWarnings(), 2 );
                BOOST_CHECK_EQUAL( vl.getLoggedLevels(), LOG_MASK_NONE );
                BOOST_CHECK( vl.passedValidation() );
                BOOST_CHECK( !vl.hasWarning() );
                BOOST_CHECK( vl.getMessages().empty() );
            }

            {   // changing the enabled levels only affects later messages
                ValidationLogger vl( LOG_MASK_ALL );
                vl.log( LOG_MASK_TRACE, "a", "kept" );
                vl.setEnabledLevels( LOG_MASK_ERROR );
                BOOST_CHECK_EQUAL( vl.getEnabledLevels(), LOG_MASK_ERROR );
                vl.log( LOG_MASK_TRACE, "b", "dropped" );
                vl.log( LOG_MASK_ERROR, "c", "kept" );
                vl.setEnabledLevels( LOG_MASK_NONE );
                vl.log( LOG_MASK_ERROR, "d", "dropped" );
                BOOST_REQUIRE_EQUAL( vl.getMessages().size(), 2 );
                BOOST_CHECK_EQUAL( vl.getMessages()[0].getPropertyName(), "a" );
                BOOST_CHECK_EQUAL( vl.getMessages()[1].getPropertyName(), "c" );
                BOOST_CHECK_EQUAL( vl.getLoggedLevels(), LOG_MASK_TRACE|LOG_MASK_ERROR );
                BOOST_CHECK_EQUAL( vl.getErrors(), 2 );
                BOOST_CHECK( !vl.passedValidation() );
            }

        }


        void counterTest( void ) {

            const uint8_t levels[] = { LOG_MASK_TRACE, LOG_MASK_DEBUG, LOG_MASK_INFO, LOG_MASK_WARNING, LOG_MASK_ERROR };

            for( uint8_t enabled = 0; enabled <= LOG_MASK_ALL; ++enabled ) {
                ValidationLogger vl( enabled );
                int nErrors(0), nWarnings(0);
                size_t nRecorded(0);
                uint8_t expectedMask(0);
                for( int i = 0; i < 40; ++i ) {
                    uint8_t lvl = levels[ (i*7+i/3) % 5 ];
                    vl.log( lvl, "prop", "msg" );
                    if( lvl == LOG_MASK_ERROR ) nErrors++;
                    if( lvl == LOG_MASK_WARNING ) nWarnings++;
                    if( lvl & enabled ) {
                        nRecorded++;
                        expectedMask |= lvl;
                    }
                }
                BOOST_CHECK_EQUAL( vl.getErrors(), nErrors );
                BOOST_CHECK_EQUAL( vl.getWarnings(), nWarnings );
                BOOST_CHECK_EQUAL( vl.getMessages().size(), nRecorded );
                BOOST_CHECK_EQUAL( vl.getLoggedLevels(), expectedMask );
                BOOST_CHECK_EQUAL( vl.passedValidation(), !( expectedMask & LOG_MASK_ERROR ) );
                BOOST_CHECK_EQUAL( vl.hasWarning(), ( expectedMask & LOG_MASK_WARNING ) != 0 );
                for( auto l: levels ) {
                    BOOST_CHECK_EQUAL( vl.hasFlag( l ), ( expectedMask & l ) != 0 );
                }
            }

        }


        void badLevelTest( void ) {

            ValidationLogger vl( LOG_MASK_ALL );
            ScopeContext scope = vl.beginScope( "outer" );
            vl.log( LOG_MASK_WARNING, "w", "warning" );
            string before = vl.str();

            const int badLevels[] = { LOG_MASK_NONE, LOG_MASK_ALL, LOG_MASK_WARNING|LOG_MASK_ERROR,
                                      LOG_MASK_TRACE|LOG_MASK_DEBUG, LOG_MASK_DEFAULT, 32, 64, 128, 255,
                                      256, 256|LOG_MASK_WARNING, 512|LOG_MASK_ERROR, 0x10000|LOG_MASK_INFO, -1 };
            for( auto lvl: badLevels ) {
                BOOST_CHECK_THROW( vl.log( lvl, "bad", "level" ), BadArgument );
            }

            try {
                vl.log( LOG_MASK_ERROR|LOG_MASK_WARNING, "bad", "level" );
                BOOST_ERROR( "log() accepted a combined level" );
            } catch( const BadArgument& e ) {
                BOOST_CHECK_EQUAL( string( e.what() ), "Must be Trace, Debug, Information, Warning, or Error" );
            }

            BOOST_CHECK_EQUAL( vl.getErrors(), 0 );
            BOOST_CHECK_EQUAL( vl.getWarnings(), 1 );
            BOOST_CHECK_EQUAL( vl.getLoggedLevels(), LOG_MASK_WARNING );
            BOOST_CHECK_EQUAL( vl.getMessages().size(), 1 );
            BOOST_CHECK_EQUAL( vl.getScope().size(), 1 );
            BOOST_CHECK_EQUAL( vl.str(), before );

        }


        void scopeTest( void ) {

            ValidationLogger vl;

            {   // stack follows begin/close
                ScopeContext a = vl.beginScope( "a" );
                BOOST_CHECK( a.isOpen() );
                BOOST_CHECK_EQUAL( a.getDepth(), 1 );
                ScopeContext b = vl.beginScope( "b" );
                BOOST_CHECK_EQUAL( b.getDepth(), 2 );
                BOOST_REQUIRE_EQUAL( vl.getScope().size(), 2 );
                BOOST_CHECK_EQUAL( vl.getScope()[1], "b" );
                b.close();
                BOOST_CHECK( !b.isOpen() );
                BOOST_CHECK_EQUAL( vl.getScope().size(), 1 );
                b.close();                          // second close is a no-op
                BOOST_CHECK_EQUAL( vl.getScope().size(), 1 );
                ScopeContext c = vl.beginScope( "c" );
                b.close();                          // must not pop "c"
                BOOST_CHECK_EQUAL( vl.getScope().size(), 2 );
            }
            BOOST_CHECK( vl.getScope().empty() );

            {   // closing an outer scope closes the inner ones too
                ScopeContext outer = vl.beginScope( "outer" );
                ScopeContext inner = vl.beginScope( "inner" );
                ScopeContext innermost = vl.beginScope( "innermost" );
                outer.close();
                BOOST_CHECK( vl.getScope().empty() );
                ScopeContext other = vl.beginScope( "other" );
                ScopeContext other2 = vl.beginScope( "other2" );
                inner.close();                      // stale depth 2: truncates to depth 1
                BOOST_REQUIRE_EQUAL( vl.getScope().size(), 1 );
                BOOST_CHECK_EQUAL( vl.getScope()[0], "other" );
                innermost.close();                  // deeper than the stack: nothing happens
                BOOST_CHECK_EQUAL( vl.getScope().size(), 1 );
            }
            BOOST_CHECK( vl.getScope().empty() );

            {   // duplicate and empty names are fine
                ScopeContext a = vl.beginScope( "" );
                ScopeContext b = vl.beginScope( "" );
                ScopeContext c = vl.beginScope( "x" );
                ScopeContext d = vl.beginScope( "x" );
                BOOST_CHECK_EQUAL( vl.getScope().size(), 4 );
            }
            BOOST_CHECK( vl.getScope().empty() );

            // scopes are released when an exception propagates
            try {
                ScopeContext s = vl.beginScope( "throwing" );
                ScopeContext s2 = vl.beginScope( "nested" );
                throw std::runtime_error( "validation aborted" );
            } catch( const std::runtime_error& ) {
                BOOST_CHECK( vl.getScope().empty() );
            }

            // ...and on early return
            BOOST_CHECK( !validateItem( vl, "item1", false ) );
            BOOST_CHECK( vl.getScope().empty() );
            BOOST_CHECK( validateItem( vl, "item2", true ) );
            BOOST_CHECK( vl.getScope().empty() );
            BOOST_CHECK_EQUAL( vl.getErrors(), 1 );

            {   // moving a handle transfers the responsibility to close
                ScopeContext a = vl.beginScope( "moved" );
                ScopeContext b( std::move( a ) );
                BOOST_CHECK( !a.isOpen() );
                BOOST_CHECK( b.isOpen() );
                a.close();
                BOOST_CHECK_EQUAL( vl.getScope().size(), 1 );
                ScopeContext c;
                BOOST_CHECK( !c.isOpen() );
                BOOST_CHECK( !std::is_move_assignable<ScopeContext>::value );
                BOOST_CHECK( std::is_move_constructible<ScopeContext>::value );
                ScopeContext d( std::move( b ) );
                BOOST_CHECK_EQUAL( vl.getScope().size(), 1 );
                ScopeContext e = vl.beginScope( "second" );
                ScopeContext f = vl.beginScope( "third" );
                ScopeContext g( std::move( e ) );   // "third" stays open
                BOOST_REQUIRE_EQUAL( vl.getScope().size(), 3 );
                BOOST_CHECK_EQUAL( vl.getScope()[2], "third" );
                g.close();
                BOOST_REQUIRE_EQUAL( vl.getScope().size(), 1 );
                BOOST_CHECK_EQUAL( vl.getScope()[0], "moved" );
            }
            BOOST_CHECK( vl.getScope().empty() );

        }


        void snapshotTest( void ) {

            ValidationLogger vl( LOG_MASK_ALL );
            {
                ScopeContext a = vl.beginScope( "a" );
                vl.log( LOG_MASK_INFO, "p1", "first" );
                ScopeContext b = vl.beginScope( "b" );
                vl.log( LOG_MASK_INFO, "p2", "second" );
            }
            ScopeContext c = vl.beginScope( "c" );
            vl.log( LOG_MASK_INFO, "p3", "third" );

            const vector<LogMessage>& msgs = vl.getMessages();
            BOOST_REQUIRE_EQUAL( msgs.size(), 3 );
            BOOST_REQUIRE_EQUAL( msgs[0].getScope().size(), 1 );
            BOOST_CHECK_EQUAL( msgs[0].getScope()[0], "a" );
            BOOST_REQUIRE_EQUAL( msgs[1].getScope().size(), 2 );
            BOOST_CHECK_EQUAL( msgs[1].getScope()[0], "a" );
            BOOST_CHECK_EQUAL( msgs[1].getScope()[1], "b" );
            BOOST_REQUIRE_EQUAL( msgs[2].getScope().size(), 1 );
            BOOST_CHECK_EQUAL( msgs[2].getScope()[0], "c" );

            BOOST_CHECK_EQUAL( msgs[1].getLevel(), LOG_MASK_INFO );
            BOOST_CHECK_EQUAL( msgs[1].getPropertyName(), "p2" );
            BOOST_CHECK_EQUAL( msgs[1].getMessage(), "second" );

            ostringstream oss;
            oss << msgs[1];
            BOOST_CHECK_EQUAL( oss.str(), "a/b: Information: p2: second" );

        }


        void echoTest( void ) {

            Logger lg;
            lg.setMask( LOG_MASK_ALL );
            stringstream ss;
            lg.addStream( ss, LOG_MASK_ALL );

            ValidationLogger vl( LOG_MASK_WARNING|LOG_MASK_ERROR );
            vl.setEcho( &lg );
            {
                ScopeContext a = vl.beginScope( "config" );
                ScopeContext b = vl.beginScope( "server" );
                vl.log( LOG_MASK_WARNING, "port", "using default" );
                vl.log( LOG_MASK_TRACE, "host", "not echoed" );
            }
            vl.log( LOG_MASK_ERROR, "root", "invalid" );
            vl.setEcho( nullptr );
            vl.log( LOG_MASK_ERROR, "root", "after echo" );
            lg.flushAll();

            string out = ss.str();
            BOOST_CHECK_EQUAL( std::count( out.begin(), out.end(), '\n' ), 2 );
            BOOST_CHECK( out.find( "[W] (config/server) port: using default\n" ) != string::npos );
            BOOST_CHECK( out.find( "[E] root: invalid\n" ) != string::npos );
            BOOST_CHECK( out.find( "not echoed" ) == string::npos );
            BOOST_CHECK( out.find( "after echo" ) == string::npos );
            BOOST_CHECK_EQUAL( vl.getMessages().size(), 3 );

            lg.removeAllOutputs();

        }


        void interfaceTest( void ) {

            ValidationLogger logger( LOG_MASK_ALL );
            ValidationLog& vl = logger;
            BOOST_CHECK_EQUAL( vl.getEnabledLevels(), LOG_MASK_ALL );
            BOOST_CHECK( vl.isEnabled( LOG_MASK_TRACE ) );
            {
                ScopeContext s = vl.beginScope( "item" );
                vl.log( LOG_MASK_DEBUG, "name", "checked" );
            }
            BOOST_CHECK( logger.getScope().empty() );
            BOOST_CHECK_EQUAL( logger.str(), "item {\n  Debug: name: checked\n}\n" );

        }


        void add_render_tests( test_suite* ts );    // defined in validation/render.cpp
        void add_options_tests( test_suite* ts );   // defined in validation/options.cpp

        void add_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &defaultsTest, "Defaults" ) );
            ts->add( BOOST_TEST_CASE_NAME( &filterTest, "Level filtering" ) );
            ts->add( BOOST_TEST_CASE_NAME( &counterTest, "Counters" ) );
            ts->add( BOOST_TEST_CASE_NAME( &badLevelTest, "Invalid levels" ) );
            ts->add( BOOST_TEST_CASE_NAME( &scopeTest, "Scopes" ) );
            ts->add( BOOST_TEST_CASE_NAME( &snapshotTest, "Scope snapshots" ) );
            ts->add( BOOST_TEST_CASE_NAME( &echoTest, "Echo to Logger" ) );
            ts->add( BOOST_TEST_CASE_NAME( &interfaceTest, "ValidationLog interface" ) );

            add_render_tests( ts );
            add_options_tests( ts );

        }

    }

}
