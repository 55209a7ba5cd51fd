#include "scopelog/logging/validationlogger.hpp"

#include "testsuite.hpp"

#include <sstream>

#include <boost/test/unit_test.hpp>

using namespace scopelog::logging;
using namespace std;

using namespace boost::unit_test_framework;

namespace testsuite {

    namespace validation {


        void renderScenarioTest( void ) {

            ValidationLogger vl( LOG_MASK_ALL );
            vl.log( LOG_MASK_TRACE, "Test", "Starting log." );
            vl.log( LOG_MASK_DEBUG, "Test", "Debug message" );
            {
                ScopeContext scope1 = vl.beginScope( "Scope1" );
                vl.log( LOG_MASK_INFO, "InScope", "At the information level." );
                vl.log( LOG_MASK_WARNING, "Something", "Danger, Will Robinson!" );
                {
                    ScopeContext scope2 = vl.beginScope( "Scope2" );
                    vl.log( LOG_MASK_ERROR, "CPU", "CPU Failure imminent." );
                }
                vl.log( LOG_MASK_TRACE, "Test", "Scope2 Ended" );
            }
            vl.log( LOG_MASK_TRACE, "Test", "Scope1 Ended" );
            {
                ScopeContext some = vl.beginScope( "SomeScope" );
                vl.log( LOG_MASK_ERROR, "Outer", "You have reached the outer limits" );
            }
            vl.log( LOG_MASK_TRACE, "Test", "Ending log." );

            BOOST_CHECK_EQUAL( vl.getErrors(), 2 );
            BOOST_CHECK_EQUAL( vl.getWarnings(), 1 );
            BOOST_CHECK( !vl.passedValidation() );
            BOOST_CHECK( vl.hasWarning() );
            BOOST_CHECK_EQUAL( vl.getLoggedLevels(), LOG_MASK_ALL );
            BOOST_CHECK_EQUAL( vl.getMessages().size(), 9 );

            const string expected =
                "Trace: Test: Starting log.\n"
                "Debug: Test: Debug message\n"
                "Scope1 {\n"
                "  Information: InScope: At the information level.\n"
                "  Warning: Something: Danger, Will Robinson!\n"
                "  Scope2 {\n"
                "    Error: CPU: CPU Failure imminent.\n"
                "  }\n"
                "  Trace: Test: Scope2 Ended\n"
                "}\n"
                "Trace: Test: Scope1 Ended\n"
                "SomeScope {\n"
                "  Error: Outer: You have reached the outer limits\n"
                "}\n"
                "Trace: Test: Ending log.\n";

            BOOST_CHECK( compare_strings( vl.str(), expected ) );

            ostringstream oss;
            oss << vl;
            BOOST_CHECK( compare_strings( oss.str(), expected ) );

            // the same run with the default levels drops trace/debug, and the scope blocks with them
            ValidationLogger vl2;
            vl2.log( LOG_MASK_TRACE, "Test", "Starting log." );
            {
                ScopeContext scope1 = vl2.beginScope( "Scope1" );
                vl2.log( LOG_MASK_WARNING, "Something", "Danger, Will Robinson!" );
            }
            {
                ScopeContext empty = vl2.beginScope( "Empty" );
                vl2.log( LOG_MASK_DEBUG, "Test", "dropped" );
            }
            BOOST_CHECK( compare_strings( vl2.str(), "Scope1 {\n  Warning: Something: Danger, Will Robinson!\n}\n" ) );

        }


        void renderScopeTest( void ) {

            {   // nothing logged
                ValidationLogger vl;
                ScopeContext s = vl.beginScope( "unused" );
                BOOST_CHECK_EQUAL( vl.str(), "" );
            }

            {   // scopes still open at the end are closed
                ValidationLogger vl;
                ScopeContext a = vl.beginScope( "a" );
                ScopeContext b = vl.beginScope( "b" );
                ScopeContext c = vl.beginScope( "c" );
                vl.log( LOG_MASK_ERROR, "p", "deep" );
                BOOST_CHECK( compare_strings( vl.str(),
                    "a {\n"
                    "  b {\n"
                    "    c {\n"
                    "      Error: p: deep\n"
                    "    }\n"
                    "  }\n"
                    "}\n" ) );
            }

            {   // jump from a deep scope straight to a sibling branch
                ValidationLogger vl;
                ScopeContext a = vl.beginScope( "a" );
                {
                    ScopeContext b = vl.beginScope( "b" );
                    ScopeContext c = vl.beginScope( "c" );
                    vl.log( LOG_MASK_INFO, "p1", "m1" );
                }
                ScopeContext d = vl.beginScope( "d" );
                vl.log( LOG_MASK_INFO, "p2", "m2" );
                BOOST_CHECK( compare_strings( vl.str(),
                    "a {\n"
                    "  b {\n"
                    "    c {\n"
                    "      Information: p1: m1\n"
                    "    }\n"
                    "  }\n"
                    "  d {\n"
                    "    Information: p2: m2\n"
                    "  }\n"
                    "}\n" ) );
            }

            {   // consecutive scopes with the same name are merged into one block
                ValidationLogger vl;
                {
                    ScopeContext s = vl.beginScope( "item" );
                    vl.log( LOG_MASK_INFO, "p", "first" );
                }
                {
                    ScopeContext s = vl.beginScope( "item" );
                    vl.log( LOG_MASK_INFO, "p", "second" );
                }
                BOOST_CHECK( compare_strings( vl.str(), "item {\n  Information: p: first\n  Information: p: second\n}\n" ) );
            }

            {   // names are compared case-sensitively
                ValidationLogger vl;
                {
                    ScopeContext s = vl.beginScope( "item" );
                    vl.log( LOG_MASK_INFO, "p", "lower" );
                }
                {
                    ScopeContext s = vl.beginScope( "Item" );
                    vl.log( LOG_MASK_INFO, "p", "upper" );
                }
                BOOST_CHECK( compare_strings( vl.str(),
                    "item {\n  Information: p: lower\n}\nItem {\n  Information: p: upper\n}\n" ) );
            }

            {   // empty and duplicate names
                ValidationLogger vl;
                ScopeContext a = vl.beginScope( "" );
                ScopeContext b = vl.beginScope( "x" );
                ScopeContext c = vl.beginScope( "x" );
                vl.log( LOG_MASK_WARNING, "", "" );
                BOOST_CHECK( compare_strings( vl.str(), " {\n  x {\n    x {\n      Warning: : \n    }\n  }\n}\n" ) );
            }

            {   // a renamed scope at the same depth closes and reopens only that level
                ValidationLogger vl;
                ScopeContext a = vl.beginScope( "root" );
                ScopeContext b = vl.beginScope( "first" );
                vl.log( LOG_MASK_INFO, "p", "1" );
                b.close();
                ScopeContext c = vl.beginScope( "second" );
                vl.log( LOG_MASK_INFO, "p", "2" );
                a.close();
                vl.log( LOG_MASK_INFO, "p", "3" );
                BOOST_CHECK( compare_strings( vl.str(),
                    "root {\n"
                    "  first {\n"
                    "    Information: p: 1\n"
                    "  }\n"
                    "  second {\n"
                    "    Information: p: 2\n"
                    "  }\n"
                    "}\n"
                    "Information: p: 3\n" ) );
            }

            {   // rendering does not change the logger
                ValidationLogger vl;
                ScopeContext a = vl.beginScope( "a" );
                vl.log( LOG_MASK_ERROR, "p", "m" );
                string first = vl.str();
                BOOST_CHECK_EQUAL( vl.str(), first );
                BOOST_CHECK_EQUAL( vl.getScope().size(), 1 );
                BOOST_CHECK_EQUAL( vl.getMessages().size(), 1 );
            }

        }


        void add_render_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &renderScenarioTest, "Render scenario" ) );
            ts->add( BOOST_TEST_CASE_NAME( &renderScopeTest, "Render scopes" ) );

        }

    }

}
