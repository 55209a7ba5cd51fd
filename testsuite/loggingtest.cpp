#include <boost/test/unit_test.hpp>

#include "scopelog/exception.hpp"
#include "scopelog/logging/level.hpp"

using namespace scopelog::logging;
using namespace scopelog;
using namespace std;
using namespace boost::unit_test_framework;

namespace testsuite {

    namespace logging {


        void levelTest( void ) {

            // isSingleLevel
            BOOST_CHECK( isSingleLevel( LOG_MASK_TRACE ) );
            BOOST_CHECK( isSingleLevel( LOG_MASK_DEBUG ) );
            BOOST_CHECK( isSingleLevel( LOG_MASK_INFO ) );
            BOOST_CHECK( isSingleLevel( LOG_MASK_WARNING ) );
            BOOST_CHECK( isSingleLevel( LOG_MASK_ERROR ) );
            BOOST_CHECK( !isSingleLevel( LOG_MASK_NONE ) );
            BOOST_CHECK( !isSingleLevel( LOG_MASK_ALL ) );
            BOOST_CHECK( !isSingleLevel( LOG_MASK_WARNING|LOG_MASK_ERROR ) );
            BOOST_CHECK( !isSingleLevel( 32 ) );
            BOOST_CHECK( !isSingleLevel( 128 ) );
            BOOST_CHECK( !isSingleLevel( -1 ) );

            // names
            BOOST_CHECK_EQUAL( levelName( LOG_MASK_TRACE ), "Trace" );
            BOOST_CHECK_EQUAL( levelName( LOG_MASK_DEBUG ), "Debug" );
            BOOST_CHECK_EQUAL( levelName( LOG_MASK_INFO ), "Information" );
            BOOST_CHECK_EQUAL( levelName( LOG_MASK_WARNING ), "Warning" );
            BOOST_CHECK_EQUAL( levelName( LOG_MASK_ERROR ), "Error" );
            BOOST_CHECK( levelName( LOG_MASK_NONE ) == nullptr );
            BOOST_CHECK( levelName( LOG_MASK_DEFAULT ) == nullptr );

            BOOST_CHECK_EQUAL( maskToString( LOG_MASK_NONE ), "None" );
            BOOST_CHECK_EQUAL( maskToString( LOG_MASK_ALL ), "All" );
            BOOST_CHECK_EQUAL( maskToString( LOG_MASK_ERROR ), "Error" );
            BOOST_CHECK_EQUAL( maskToString( LOG_MASK_DEFAULT ), "Information|Warning|Error" );
            BOOST_CHECK_EQUAL( maskToString( LOG_MASK_TRACE|64 ), "Trace|64" );

            // parsing
            BOOST_CHECK_EQUAL( stringToMask( "" ), LOG_MASK_NONE );
            BOOST_CHECK_EQUAL( stringToMask( "None" ), LOG_MASK_NONE );
            BOOST_CHECK_EQUAL( stringToMask( "all" ), LOG_MASK_ALL );
            BOOST_CHECK_EQUAL( stringToMask( "Warning|Error" ), LOG_MASK_WARNING|LOG_MASK_ERROR );
            BOOST_CHECK_EQUAL( stringToMask( " info, WARNING + error " ), LOG_MASK_DEFAULT );
            BOOST_CHECK_EQUAL( stringToMask( "Trace Debug" ), LOG_MASK_TRACE|LOG_MASK_DEBUG );
            BOOST_CHECK_EQUAL( stringToMask( "Information|Information" ), LOG_MASK_INFO );
            BOOST_CHECK_THROW( stringToMask( "Warning|Fatal" ), BadArgument );
            BOOST_CHECK_THROW( stringToMask( "16" ), BadArgument );

            for( uint8_t m = 0; m <= LOG_MASK_ALL; ++m ) {
                BOOST_CHECK_EQUAL( stringToMask( maskToString( m ) ), m );
            }

            // verbosity
            BOOST_CHECK_EQUAL( maskFromVerbosity( -2 ), LOG_MASK_NONE );
            BOOST_CHECK_EQUAL( maskFromVerbosity( 0 ), LOG_MASK_NONE );
            BOOST_CHECK_EQUAL( maskFromVerbosity( 1 ), LOG_MASK_ERROR );
            BOOST_CHECK_EQUAL( maskFromVerbosity( 2 ), LOG_MASK_WARNING|LOG_MASK_ERROR );
            BOOST_CHECK_EQUAL( maskFromVerbosity( 3 ), LOG_MASK_DEFAULT );
            BOOST_CHECK_EQUAL( maskFromVerbosity( 5 ), LOG_MASK_ALL );
            BOOST_CHECK_EQUAL( maskFromVerbosity( 9 ), LOG_MASK_ALL );
            for( int i = 0; i <= LOG_VERBOSITY_MAX; ++i ) {
                BOOST_CHECK_EQUAL( verbosityFromMask( maskFromVerbosity( i ) ), i );
            }
            BOOST_CHECK_EQUAL( verbosityFromMask( LOG_MASK_WARNING ), 2 );

        }


        void add_logger_tests( test_suite* ts );    // defined in logging/logger.cpp

        void add_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &levelTest, "Levels" ) );

            add_logger_tests( ts );

        }

    }

}
