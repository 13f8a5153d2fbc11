#include "lmstat/heldout.hh"

#include <string>

#define BOOST_TEST_MODULE HeldoutTest
#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>

namespace lmstat {
namespace {

FreqDist<std::string> Letters(const char *letters) {
  FreqDist<std::string> ret;
  for (const char *i = letters; *i; ++i) ret.Increment(std::string(1, *i));
  return ret;
}

BOOST_AUTO_TEST_CASE(Heldout) {
  FreqDist<std::string> base(Letters("aabbbc")), heldout(Letters("abbbbd"));
  HeldoutProbDist<std::string> dist(base, heldout, 5);
  // Nr(0) = 2 unseen bins share the heldout count of d.
  BOOST_CHECK_CLOSE(1.0 / 12.0, dist.Prob("d"), 0.0001);
  BOOST_CHECK_CLOSE(1.0 / 12.0, dist.Prob("z"), 0.0001);
  BOOST_CHECK_CLOSE(1.0 / 6.0, dist.Prob("a"), 0.0001);
  BOOST_CHECK_CLOSE(2.0 / 3.0, dist.Prob("b"), 0.0001);
  // c never shows up in the heldout counts.
  BOOST_CHECK_EQUAL(0.0, dist.Prob("c"));
  BOOST_CHECK_EQUAL("b", dist.Max());
  BOOST_CHECK_EQUAL(3, dist.Samples().size());
  BOOST_CHECK(!dist.SumsToOne());
}

BOOST_AUTO_TEST_CASE(HeldoutWithoutUnseenBins) {
  FreqDist<std::string> base(Letters("aabbbc")), heldout(Letters("abbbbd"));
  HeldoutProbDist<std::string> dist(base, heldout);
  BOOST_CHECK_EQUAL(0.0, dist.Prob("z"));
  BOOST_CHECK_THROW(HeldoutProbDist<std::string>(base, heldout, 2), BinsException);
}

BOOST_AUTO_TEST_CASE(CrossValidation) {
  FreqDist<std::string> first(Letters("aabbbc")), second(Letters("abbbbd"));
  std::vector<const FreqDist<std::string>*> folds;
  folds.push_back(&first);
  folds.push_back(&second);
  CrossValidationProbDist<std::string> dist(folds, 5);
  BOOST_CHECK_EQUAL(2, dist.Folds());
  BOOST_CHECK_CLOSE(1.0 / 6.0, dist.Prob("a"), 0.0001);
  BOOST_CHECK_CLOSE(7.0 / 12.0, dist.Prob("b"), 0.0001);
  BOOST_CHECK_CLOSE(1.0 / 24.0, dist.Prob("c"), 0.0001);
  BOOST_CHECK_CLOSE(1.0 / 8.0, dist.Prob("d"), 0.0001);
  BOOST_CHECK_CLOSE(1.0 / 12.0, dist.Prob("z"), 0.0001);
  BOOST_CHECK_EQUAL("b", dist.Max());

  std::vector<std::string> samples(dist.Samples());
  const char *expected[] = {"a", "b", "c", "d"};
  BOOST_CHECK_EQUAL_COLLECTIONS(expected, expected + 4, samples.begin(), samples.end());
}

BOOST_AUTO_TEST_CASE(CrossValidationEmpty) {
  std::vector<const FreqDist<std::string>*> folds;
  CrossValidationProbDist<std::string> dist(folds);
  BOOST_CHECK_EQUAL(0.0, dist.Prob("a"));
  BOOST_CHECK_THROW(dist.Max(), EmptyDistributionException);
}

} // namespace
} // namespace lmstat
