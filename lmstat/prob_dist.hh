#ifndef LMSTAT_PROB_DIST__
#define LMSTAT_PROB_DIST__

#include "lmstat/exception.hh"
#include "lmstat/log_math.hh"

#include <boost/random/uniform_int.hpp>
#include <boost/random/uniform_real.hpp>
#include <boost/random/variate_generator.hpp>

#include <cmath>
#include <ostream>
#include <vector>

namespace lmstat {

/* A probability distribution over samples, usually estimated from a FreqDist.
 * Implementations hold a const reference to the counts they were built from;
 * the counts must outlive the distribution and must not change under it.
 */
template <class Sample> class ProbDist {
  public:
    typedef Sample value_type;

    virtual ~ProbDist() {}

    // In [0, 1].  Samples the estimator knows nothing about are not an error.
    virtual double Prob(const Sample &sample) const = 0;

    // Base 2.  kNegativeInfinityLog instead of -inf for zero probability.
    virtual double LogProb(const Sample &sample) const {
      double p = Prob(sample);
      if (p == 0.0) return kNegativeInfinityLog;
      return Log2(p);
    }

    // Most probable sample.  Throws EmptyDistributionException if there are
    // no samples.
    virtual Sample Max() const = 0;

    // Samples with nonzero probability.
    virtual std::vector<Sample> Samples() const = 0;

    // Fraction of probability mass moved away from the observed counts.
    virtual double Discount() const { return 0.0; }

    // Whether Prob over Samples() is guaranteed to total one.
    virtual bool SumsToOne() const { return true; }

    virtual const char *Name() const = 0;

    /* Draw a sample with probability Prob(sample) by walking the cumulative
     * mass of Samples().  Mass left over from rounding falls back to a
     * uniform choice, reported to messages if the distribution claims to sum
     * to one.
     */
    template <class Engine> Sample Generate(Engine &rng, std::ostream *messages = NULL) const {
      std::vector<Sample> samples(Samples());
      UTIL_THROW_IF(samples.empty(), EmptyDistributionException, "Cannot generate from a " << Name() << " distribution with no samples.");
      boost::uniform_real<double> unit(0.0, 1.0);
      boost::variate_generator<Engine&, boost::uniform_real<double> > draw(rng, unit);
      double p = draw();
      for (typename std::vector<Sample>::const_iterator i = samples.begin(); i != samples.end(); ++i) {
        p -= Prob(*i);
        if (p <= 0.0) return *i;
      }
      if (p < 0.0001) return samples.back();
      if (SumsToOne() && messages) {
        *messages << "Probability distribution " << Name() << " sums to " << (1.0 - p)
          << "; Generate is returning an arbitrary sample." << std::endl;
      }
      boost::uniform_int<std::size_t> pick(0, samples.size() - 1);
      boost::variate_generator<Engine&, boost::uniform_int<std::size_t> > choose(rng, pick);
      return samples[choose()];
    }
};

// -sum p log2 p over Samples().
template <class Sample> double Entropy(const ProbDist<Sample> &dist) {
  std::vector<Sample> samples(dist.Samples());
  double ret = 0.0;
  for (typename std::vector<Sample>::const_iterator i = samples.begin(); i != samples.end(); ++i) {
    double p = dist.Prob(*i);
    if (p > 0.0) ret -= p * Log2(p);
  }
  return ret;
}

// sum over actual's samples of actual(s) * log2 test(s).
template <class Sample> double LogLikelihood(const ProbDist<Sample> &test, const ProbDist<Sample> &actual) {
  std::vector<Sample> samples(actual.Samples());
  double ret = 0.0;
  for (typename std::vector<Sample>::const_iterator i = samples.begin(); i != samples.end(); ++i) {
    ret += actual.Prob(*i) * test.LogProb(*i);
  }
  return ret;
}

} // namespace lmstat

#endif // LMSTAT_PROB_DIST__
