#include "lmstat/log_math.hh"

#include <cmath>
#include <limits>

#define BOOST_TEST_MODULE LogMathTest
#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>

namespace lmstat {
namespace {

BOOST_AUTO_TEST_CASE(Base2) {
  BOOST_CHECK_CLOSE(3.0, Log2(8.0), 0.0001);
  BOOST_CHECK_CLOSE(-1.0, Log2(0.5), 0.0001);
  BOOST_CHECK_EQUAL(-std::numeric_limits<double>::infinity(), Log2(0.0));
}

BOOST_AUTO_TEST_CASE(Add) {
  // 1/4 + 1/4 = 1/2
  BOOST_CHECK_CLOSE(-1.0, AddLogs(-2.0, -2.0), 0.0001);
  BOOST_CHECK_CLOSE(Log2(0.75), AddLogs(-1.0, -2.0), 0.0001);
  BOOST_CHECK_CLOSE(Log2(0.75), AddLogs(-2.0, -1.0), 0.0001);
  // More than 1e30 apart: the smaller vanishes.
  BOOST_CHECK_EQUAL(-1.0, AddLogs(-1.0, -200.0));
  BOOST_CHECK_EQUAL(-1.0, AddLogs(-200.0, -1.0));
}

BOOST_AUTO_TEST_CASE(Sum) {
  std::vector<double> logs;
  BOOST_CHECK_EQUAL(kNegativeInfinityLog, SumLogs(logs));
  logs.push_back(-2.0);
  BOOST_CHECK_EQUAL(-2.0, SumLogs(logs));
  logs.push_back(-2.0);
  logs.push_back(-1.0);
  // 1/4 + 1/4 + 1/2
  BOOST_CHECK_SMALL(SumLogs(logs), 1e-9);
}

} // namespace
} // namespace lmstat
