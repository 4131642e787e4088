#define BOOST_TEST_MODULE BeadTests
#include <boost/test/unit_test.hpp>
