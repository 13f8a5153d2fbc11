#ifndef LMSTAT_SIMPLE_GOOD_TURING__
#define LMSTAT_SIMPLE_GOOD_TURING__

#include "lmstat/estimators.hh"
#include "lmstat/freq_dist.hh"
#include "lmstat/prob_dist.hh"

#include <vector>

#include <stdint.h>

namespace lmstat {

/* Gale and Sampson's Simple Good-Turing, "Good-Turing Frequency Estimation
 * Without Tears" (1995).  Works on a frequency-of-frequency histogram alone so
 * it is independent of the sample type.
 *
 * The nonzero Nr are averaged with their zero neighbours (Zr = 2 Nr / (r+ - r-))
 * and a line log Zr = a + b log r is fit by least squares, giving the smoothed
 * S(r) = exp(a + b log r).  Small counts use the Turing estimate
 * r* = (r + 1) Nr(r + 1) / Nr(r) until it is no longer significantly different
 * from the smoothed (r + 1) S(r + 1) / S(r), or until the observed counts stop
 * being contiguous; from there on the smoothed estimate is used.  Unseen
 * samples get Nr(1) / N and the seen estimates are rescaled to fill the rest.
 */
class SimpleGoodTuring {
  public:
    // nr[r] is the number of types seen exactly r times; nr[0] is ignored.
    // total is the number of tokens, the sum of r * nr[r].
    SimpleGoodTuring(const std::vector<uint64_t> &nr, uint64_t total);

    // Total probability of all unseen types.  1 when nothing was seen.
    double UnseenMass() const;

    // Probability of one type seen count > 0 times, after renormalization.
    double SeenProb(uint64_t count) const;

    // Adjusted count r* for an observed count, before renormalization.
    double AdjustedCount(uint64_t count) const;

    double SmoothedNr(double r) const;

    double Slope() const { return slope_; }
    double Intercept() const { return intercept_; }

    // Counts at or above this use the smoothed curve.
    uint64_t SwitchAt() const { return switch_at_; }

    double Renormalization() const { return renormal_; }

    // Unseen mass plus the renormalized mass of every seen type.  Should be 1.
    double Check() const;

  private:
    uint64_t Nr(uint64_t r) const { return r < nr_.size() ? nr_[r] : 0; }

    void FindBestFit(const std::vector<uint64_t> &r, const std::vector<uint64_t> &nr);
    void FindSwitch(const std::vector<uint64_t> &r, const std::vector<uint64_t> &nr);
    void Renormalize(const std::vector<uint64_t> &r, const std::vector<uint64_t> &nr);

    // r* / N, unrenormalized.  count 0 gives the unseen mass.
    double ProbMeasure(uint64_t count) const;

    std::vector<uint64_t> nr_;
    uint64_t total_;

    double slope_, intercept_;
    uint64_t switch_at_;
    double renormal_;
};

template <class Sample> class SimpleGoodTuringProbDist : public ProbDist<Sample> {
  public:
    explicit SimpleGoodTuringProbDist(const FreqDist<Sample> &freq, uint64_t bins = 0)
      : freq_(freq),
        bins_(detail::ResolveBins("SimpleGoodTuring", freq, bins, false)),
        fit_(freq.NrHistogram(), freq.N()) {}

    double Prob(const Sample &sample) const {
      uint64_t count = freq_.Count(sample);
      if (count) return fit_.SeenProb(count);
      if (bins_ == freq_.B()) return 0.0;
      return fit_.UnseenMass() / static_cast<double>(bins_ - freq_.B());
    }

    Sample Max() const { return freq_.Max(); }
    std::vector<Sample> Samples() const { return freq_.Keys(); }

    // Mass moved from seen to unseen samples, from the smoothed Nr(1).
    double Discount() const {
      if (!freq_.N()) return 0.0;
      return fit_.SmoothedNr(1.0) / static_cast<double>(freq_.N());
    }

    const char *Name() const { return "SimpleGoodTuring"; }

    const SimpleGoodTuring &Fit() const { return fit_; }
    uint64_t Bins() const { return bins_; }
    const FreqDist<Sample> &Freq() const { return freq_; }

  private:
    const FreqDist<Sample> &freq_;
    uint64_t bins_;
    SimpleGoodTuring fit_;
};

} // namespace lmstat

#endif // LMSTAT_SIMPLE_GOOD_TURING__
