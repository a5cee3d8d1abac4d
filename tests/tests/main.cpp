#define BOOST_TEST_MODULE Market Tests
#include <boost/test/included/unit_test.hpp>
