#include "scopelog/exception.hpp"
#include "scopelog/logging/validationlogger.hpp"

#include <cstdlib>

#include <boost/test/unit_test.hpp>

using namespace scopelog::logging;
using namespace scopelog;
using namespace std;

using namespace boost::unit_test_framework;

namespace testsuite {

    namespace validation {

        namespace {

            void parse( bpo::variables_map& vm, int argc, const char* const argv[] ) {
                bpo::store( bpo::command_line_parser( argc, argv ).options( ValidationLogger::getOptions() ).run(), vm );
                vm.notify();
            }

        }


        void optionsTest( void ) {

            {
                const char* argv[] = { "test" };
                bpo::variables_map vm;
                parse( vm, 1, argv );
                ValidationLogger vl( vm );
                BOOST_CHECK_EQUAL( vl.getEnabledLevels(), LOG_MASK_DEFAULT );
            }

            {
                const char* argv[] = { "test", "--validation-levels", "Warning|Error" };
                bpo::variables_map vm;
                parse( vm, 3, argv );
                ValidationLogger vl( vm );
                BOOST_CHECK_EQUAL( vl.getEnabledLevels(), LOG_MASK_WARNING|LOG_MASK_ERROR );
                vl.log( LOG_MASK_INFO, "p", "dropped" );
                BOOST_CHECK( vl.getMessages().empty() );
            }

            {
                const char* argv[] = { "test", "--validation-levels=none" };
                bpo::variables_map vm;
                parse( vm, 2, argv );
                ValidationLogger vl( vm );
                BOOST_CHECK_EQUAL( vl.getEnabledLevels(), LOG_MASK_NONE );
            }

            {
                const char* argv[] = { "test", "--validation-levels", "Warning|Critical" };
                bpo::variables_map vm;
                parse( vm, 3, argv );
                BOOST_CHECK_THROW( ValidationLogger vl( vm ), BadArgument );
            }

        }


        void environmentTest( void ) {

            bpo::options_description desc = ValidationLogger::getOptions();

            setenv( "SCOPELOG_LEVELS", "all", 1 );

            {
                bpo::variables_map vm;
                bpo::store( bpo::parse_environment( desc, &ValidationLogger::environmentMap ), vm );
                vm.notify();
                ValidationLogger vl( vm );
                BOOST_CHECK_EQUAL( vl.getEnabledLevels(), LOG_MASK_ALL );
            }

            {   // the command line takes precedence when stored first
                const char* argv[] = { "test", "--validation-levels", "Error" };
                bpo::variables_map vm;
                bpo::store( bpo::command_line_parser( 3, argv ).options( desc ).run(), vm );
                bpo::store( bpo::parse_environment( desc, &ValidationLogger::environmentMap ), vm );
                vm.notify();
                ValidationLogger vl( vm );
                BOOST_CHECK_EQUAL( vl.getEnabledLevels(), LOG_MASK_ERROR );
            }

            unsetenv( "SCOPELOG_LEVELS" );

            BOOST_CHECK_EQUAL( ValidationLogger::environmentMap( "SCOPELOG_LEVELS" ), "validation-levels" );
            BOOST_CHECK_EQUAL( ValidationLogger::environmentMap( "PATH" ), "" );

        }


        void add_options_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &optionsTest, "Options" ) );
            ts->add( BOOST_TEST_CASE_NAME( &environmentTest, "Environment" ) );

        }

    }

}
