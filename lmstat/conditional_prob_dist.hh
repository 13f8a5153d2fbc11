#ifndef LMSTAT_CONDITIONAL_PROB_DIST__
#define LMSTAT_CONDITIONAL_PROB_DIST__

#include "lmstat/conditional_freq_dist.hh"
#include "lmstat/estimators.hh"
#include "lmstat/freq_dist.hh"
#include "lmstat/prob_dist.hh"

#include <boost/function.hpp>
#include <boost/functional/hash.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/unordered_map.hpp>

#include <algorithm>
#include <vector>

#include <stdint.h>

namespace lmstat {

/* One estimator per condition of a ConditionalFreqDist, made by a factory such
 * as
 *   MakeEstimator<ELEProbDist<std::string> >(10)
 * Conditions the counts never saw get an estimator over an empty FreqDist the
 * first time they are asked for.  The ConditionalFreqDist must outlive this.
 */
template <class Condition, class Sample> class ConditionalProbDist : boost::noncopyable {
  public:
    typedef boost::function<ProbDist<Sample> *(const FreqDist<Sample> &)> Factory;

    ConditionalProbDist(const ConditionalFreqDist<Condition, Sample> &counts, const Factory &factory)
      : factory_(factory) {
      for (typename ConditionalFreqDist<Condition, Sample>::const_iterator i = counts.begin(); i != counts.end(); ++i) {
        dists_[i->first].reset(factory_(i->second));
      }
    }

    const ProbDist<Sample> &operator[](const Condition &condition) const {
      typename Map::iterator i = dists_.find(condition);
      if (i != dists_.end()) return *i->second;
      // The factory may throw, so only insert once it has succeeded.
      boost::shared_ptr<ProbDist<Sample> > made(factory_(empty_));
      dists_[condition] = made;
      return *made;
    }

    bool Contains(const Condition &condition) const {
      return dists_.find(condition) != dists_.end();
    }

    std::vector<Condition> Conditions() const {
      std::vector<Condition> ret;
      ret.reserve(dists_.size());
      for (typename Map::const_iterator i = dists_.begin(); i != dists_.end(); ++i) ret.push_back(i->first);
      std::sort(ret.begin(), ret.end());
      return ret;
    }

    std::size_t size() const { return dists_.size(); }

  private:
    typedef boost::unordered_map<Condition, boost::shared_ptr<ProbDist<Sample> >, boost::hash<Condition> > Map;

    Factory factory_;

    // Grows when an unseen condition is looked up.
    mutable Map dists_;

    const FreqDist<Sample> empty_;
};

namespace detail {
template <class Estimator> struct EstimatorMaker {
  typedef typename Estimator::value_type Sample;
  typedef ProbDist<Sample> *result_type;

  explicit EstimatorMaker(uint64_t bins_in) : bins(bins_in) {}

  ProbDist<Sample> *operator()(const FreqDist<Sample> &freq) const {
    return new Estimator(freq, bins);
  }

  uint64_t bins;
};

template <class Estimator> struct MLEMaker {
  typedef typename Estimator::value_type Sample;
  typedef ProbDist<Sample> *result_type;

  ProbDist<Sample> *operator()(const FreqDist<Sample> &freq) const {
    return new Estimator(freq);
  }
};

template <class Sample> struct LidstoneMaker {
  typedef ProbDist<Sample> *result_type;

  LidstoneMaker(double gamma_in, uint64_t bins_in) : gamma(gamma_in), bins(bins_in) {}

  ProbDist<Sample> *operator()(const FreqDist<Sample> &freq) const {
    return new LidstoneProbDist<Sample>(freq, gamma, bins);
  }

  double gamma;
  uint64_t bins;
};
} // namespace detail

// Factory for estimators constructed as Estimator(freq, bins).
template <class Estimator> detail::EstimatorMaker<Estimator> MakeEstimator(uint64_t bins = 0) {
  return detail::EstimatorMaker<Estimator>(bins);
}

// Factory for estimators constructed as Estimator(freq).
template <class Estimator> detail::MLEMaker<Estimator> MakeUnbinnedEstimator() {
  return detail::MLEMaker<Estimator>();
}

template <class Sample> detail::LidstoneMaker<Sample> MakeLidstone(double gamma, uint64_t bins = 0) {
  return detail::LidstoneMaker<Sample>(gamma, bins);
}

} // namespace lmstat

#endif // LMSTAT_CONDITIONAL_PROB_DIST__
