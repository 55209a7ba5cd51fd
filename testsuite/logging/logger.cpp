#include "scopelog/logging/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include <boost/test/unit_test.hpp>

using namespace scopelog::logging;
using namespace std;

using namespace boost::unit_test_framework;

namespace testsuite {

    namespace logging {

        namespace {

            size_t countLines( const string& s ) {
                return std::count( s.begin(), s.end(), '\n' );
            }

        }


        void loggerTest( void ) {

            Logger lg;
            lg.setMask( LOG_MASK_DEFAULT );
            BOOST_CHECK_EQUAL( lg.outputCount(), 0 );

            // no outputs, should just be dropped
            SCOPELOG_ERR(lg) << "nowhere" << ende;

            stringstream ss;
            lg.addStream( ss, LOG_MASK_ALL );
            lg.addStream( ss );                 // same stream is only added once
            BOOST_CHECK_EQUAL( lg.outputCount(), 1 );

            SCOPELOG_WARN(lg) << "value " << 42 << ende;
            lg.flushAll();
            string out = ss.str();
            BOOST_CHECK_EQUAL( countLines( out ), 1 );
            BOOST_CHECK( out.find( "[W]" ) != string::npos );
            BOOST_CHECK( out.find( " value 42\n" ) != string::npos );
            BOOST_CHECK( out.find( "\033[" ) == string::npos );       // no colours for a stringstream

            // filtered by the logger mask
            ss.str("");
            SCOPELOG_TRACE(lg) << "trace" << ende;
            SCOPELOG_DEBUG(lg) << "debug" << ende;
            lg.flushAll();
            BOOST_CHECK( ss.str().empty() );

            lg.setMask( LOG_MASK_ALL );
            SCOPELOG_TRACE(lg) << "trace" << ende;
            lg.flushAll();
            BOOST_CHECK( ss.str().find( "[T] trace" ) != string::npos );

            // context
            ss.str("");
            lg.setContext( "main" );
            SCOPELOG_INFO(lg) << "with context" << ende;
            lg.flushAll();
            BOOST_CHECK( ss.str().find( "[I] (main) with context" ) != string::npos );
            lg.setContext( "" );

            // stream state is restored between entries
            ss.str("");
            SCOPELOG_INFO(lg) << hex << 255 << ende;
            SCOPELOG_INFO(lg) << 255 << ende;
            lg.flushAll();
            out = ss.str();
            BOOST_CHECK( out.find( " ff\n" ) != string::npos );
            BOOST_CHECK( out.find( " 255\n" ) != string::npos );

            // mask given in the stream
            ss.str("");
            SCOPELOG_INFO(lg) << LOG_MASK_ERROR << "promoted" << ende;
            lg.flushAll();
            BOOST_CHECK( ss.str().find( "[E] promoted" ) != string::npos );

            // per-output mask
            stringstream errors;
            lg.addStream( errors, LOG_MASK_ERROR );
            BOOST_CHECK_EQUAL( lg.outputCount(), 2 );
            ss.str("");
            SCOPELOG_WARN(lg) << "warning" << ende;
            SCOPELOG_ERR(lg) << "error" << ende;
            lg.flushAll();
            BOOST_CHECK_EQUAL( countLines( ss.str() ), 2 );
            BOOST_CHECK_EQUAL( countLines( errors.str() ), 1 );
            BOOST_CHECK( errors.str().find( "[E] error" ) != string::npos );

            lg.removeStream( errors );
            BOOST_CHECK_EQUAL( lg.outputCount(), 1 );
            SCOPELOG_ERR(lg) << "error" << ende;
            lg.flushAll();
            BOOST_CHECK_EQUAL( countLines( errors.str() ), 1 );

            lg.removeAllOutputs();
            BOOST_CHECK_EQUAL( lg.outputCount(), 0 );

        }


        void logEntryTest( void ) {

            LogEntry entry( LOG_MASK_WARNING, "text" );
            ostringstream oss;
            oss << entry;
            BOOST_CHECK_EQUAL( oss.str().substr( 0, 8 ), "Warning|" );
            BOOST_CHECK_EQUAL( oss.str().substr( oss.str().size()-5 ), "|text" );

            entry << "first " << 1;
            entry.finalize();
            BOOST_CHECK_EQUAL( entry.getMessage(), "first 1" );
            BOOST_CHECK( !entry.getTime().is_not_a_date_time() );
            entry.finalize();                   // buffer was emptied
            BOOST_CHECK_EQUAL( entry.getMessage(), "" );

        }


        void loggerOptionsTest( void ) {

            uint8_t savedMask = Logger::getDefaultMask();
            bpo::options_description desc = Logger::getOptions();

            {
                Logger::setDefaultMask( LOG_MASK_DEFAULT );
                const char* argv[] = { "test", "-vv" };
                bpo::variables_map vm;
                bpo::store( bpo::command_line_parser( 2, argv ).options( desc )
                            .extra_parser( Logger::customParser ).run(), vm );
                vm.notify();
                BOOST_CHECK_EQUAL( Logger::getDefaultMask(), LOG_MASK_ALL );
                Logger lg( vm );
                BOOST_CHECK_EQUAL( lg.getMask(), LOG_MASK_ALL );
                BOOST_CHECK_EQUAL( lg.outputCount(), 0 );
            }

            {
                Logger::setDefaultMask( LOG_MASK_DEFAULT );
                const char* argv[] = { "test", "-q" };
                bpo::variables_map vm;
                bpo::store( bpo::command_line_parser( 2, argv ).options( desc )
                            .extra_parser( Logger::customParser ).run(), vm );
                vm.notify();
                BOOST_CHECK_EQUAL( Logger::getDefaultLevel(), 2 );
                BOOST_CHECK_EQUAL( Logger::getDefaultMask(), LOG_MASK_WARNING|LOG_MASK_ERROR );
            }

            {
                Logger::setDefaultMask( LOG_MASK_DEFAULT );
                const char* argv[] = { "test", "--verbosity", "1", "--log-stdout" };
                bpo::variables_map vm;
                bpo::store( bpo::command_line_parser( 4, argv ).options( desc )
                            .extra_parser( Logger::customParser ).run(), vm );
                vm.notify();
                Logger lg( vm );
                BOOST_CHECK_EQUAL( lg.getMask(), LOG_MASK_ERROR );
                BOOST_CHECK_EQUAL( lg.outputCount(), 1 );
            }

            {
                Logger::setDefaultMask( LOG_MASK_DEFAULT );
                setenv( "SCOPELOG_VERBOSITY", "2", 1 );
                bpo::variables_map vm;
                bpo::store( bpo::parse_environment( desc, &Logger::environmentMap ), vm );
                vm.notify();
                unsetenv( "SCOPELOG_VERBOSITY" );
                Logger lg( vm );
                BOOST_CHECK_EQUAL( lg.getMask(), LOG_MASK_WARNING|LOG_MASK_ERROR );
            }

            Logger::setDefaultMask( savedMask );

        }


        void add_logger_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &loggerTest, "Logger" ) );
            ts->add( BOOST_TEST_CASE_NAME( &logEntryTest, "LogEntry" ) );
            ts->add( BOOST_TEST_CASE_NAME( &loggerOptionsTest, "Logger options" ) );

        }

    }

}
