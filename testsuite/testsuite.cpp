#include <boost/test/included/unit_test.hpp>
using namespace boost::unit_test;


namespace testsuite  {
    namespace logging    { void add_tests( test_suite* ts ); }
    namespace validation { void add_tests( test_suite* ts ); }
}


test_suite* init_unit_test_suite( int , char* [] ) {

    framework::master_test_suite().p_name.value = "Scopelog Testsuite";

    test_suite* logging_tests = BOOST_TEST_SUITE( "Logging" );
    testsuite::logging::add_tests( logging_tests );
    framework::master_test_suite().add( logging_tests );

    test_suite* validation_tests = BOOST_TEST_SUITE( "Validation" );
    testsuite::validation::add_tests( validation_tests );
    framework::master_test_suite().add( validation_tests );

    return 0;
}
