#ifndef LMSTAT_ESTIMATORS__
#define LMSTAT_ESTIMATORS__

#include "lmstat/exception.hh"
#include "lmstat/freq_dist.hh"
#include "lmstat/prob_dist.hh"

#include <vector>

#include <stdint.h>

namespace lmstat {

/* Estimators built from one FreqDist.  Each takes bins, the number of sample
 * values the experiment could produce.  bins = 0 means "just the observed
 * ones", i.e. freq.B().  Anything else smaller than freq.B() throws
 * BinsException.
 */
namespace detail {
template <class Sample> uint64_t ResolveBins(const char *name, const FreqDist<Sample> &freq, uint64_t bins, bool require_bin) {
  UTIL_THROW_IF_ARG(bins && bins < freq.B(), BinsException, (name, bins, freq.B()), "");
  if (!bins) bins = freq.B();
  UTIL_THROW_IF(require_bin && !bins, ConfigurationException, "A " << name << " probability distribution must have at least one bin.");
  return bins;
}
} // namespace detail

// Maximum likelihood: the relative frequency.
template <class Sample> class MLEProbDist : public ProbDist<Sample> {
  public:
    explicit MLEProbDist(const FreqDist<Sample> &freq) : freq_(freq) {}

    double Prob(const Sample &sample) const { return freq_.Freq(sample); }
    Sample Max() const { return freq_.Max(); }
    std::vector<Sample> Samples() const { return freq_.Keys(); }
    const char *Name() const { return "MLE"; }

    const FreqDist<Sample> &Freq() const { return freq_; }

  private:
    const FreqDist<Sample> &freq_;
};

/* (c + gamma) / (N + bins * gamma): add gamma to every bin then take the
 * maximum likelihood estimate.  Sums to one only when bins is the true number
 * of sample values.
 */
template <class Sample> class LidstoneProbDist : public ProbDist<Sample> {
  public:
    LidstoneProbDist(const FreqDist<Sample> &freq, double gamma, uint64_t bins = 0)
      : freq_(freq), gamma_(gamma), bins_(detail::ResolveBins("Lidstone", freq, bins, true)) {
      UTIL_THROW_IF(gamma < 0.0, ConfigurationException, "Lidstone gamma must be non-negative, not " << gamma);
      divisor_ = static_cast<double>(freq_.N()) + static_cast<double>(bins_) * gamma_;
      if (divisor_ == 0.0) {
        // Only reachable with gamma 0 and no counts, so every probability is 0 anyway.
        gamma_ = 0.0;
        divisor_ = 1.0;
      }
    }

    double Prob(const Sample &sample) const {
      return (static_cast<double>(freq_.Count(sample)) + gamma_) / divisor_;
    }

    // Probability is monotonic in count.
    Sample Max() const { return freq_.Max(); }

    std::vector<Sample> Samples() const { return freq_.Keys(); }

    double Discount() const {
      double gb = gamma_ * static_cast<double>(bins_);
      return gb / (static_cast<double>(freq_.N()) + gb);
    }

    bool SumsToOne() const { return false; }

    const char *Name() const { return "Lidstone"; }

    double Gamma() const { return gamma_; }
    uint64_t Bins() const { return bins_; }
    const FreqDist<Sample> &Freq() const { return freq_; }

  private:
    const FreqDist<Sample> &freq_;
    double gamma_;
    uint64_t bins_;
    double divisor_;
};

// Lidstone with gamma = 1.
template <class Sample> class LaplaceProbDist : public LidstoneProbDist<Sample> {
  public:
    explicit LaplaceProbDist(const FreqDist<Sample> &freq, uint64_t bins = 0)
      : LidstoneProbDist<Sample>(freq, 1.0, bins) {}

    const char *Name() const { return "Laplace"; }
};

// Expected likelihood estimate: Lidstone with gamma = 0.5.
template <class Sample> class ELEProbDist : public LidstoneProbDist<Sample> {
  public:
    explicit ELEProbDist(const FreqDist<Sample> &freq, uint64_t bins = 0)
      : LidstoneProbDist<Sample>(freq, 0.5, bins) {}

    const char *Name() const { return "ELE"; }
};

/* Witten-Bell: reserve T / (N + T) for unseen types, where T is the number of
 * observed types, and spread it evenly over the Z = bins - T unseen bins.
 *   p = c / (N + T)            if c > 0
 *   p = T / (Z (N + T))        otherwise
 * With no counts at all the unseen bins share the mass uniformly.
 */
template <class Sample> class WittenBellProbDist : public ProbDist<Sample> {
  public:
    explicit WittenBellProbDist(const FreqDist<Sample> &freq, uint64_t bins = 0)
      : freq_(freq), bins_(detail::ResolveBins("WittenBell", freq, bins, true)) {
      const double types = static_cast<double>(freq_.B());
      const double unseen_bins = static_cast<double>(bins_ - freq_.B());
      const double total = static_cast<double>(freq_.N());
      if (unseen_bins == 0.0) {
        p0_ = 0.0;
      } else if (freq_.N() == 0) {
        p0_ = 1.0 / unseen_bins;
      } else {
        p0_ = types / (unseen_bins * (total + types));
      }
    }

    double Prob(const Sample &sample) const {
      uint64_t c = freq_.Count(sample);
      if (!c) return p0_;
      return static_cast<double>(c) / static_cast<double>(freq_.N() + freq_.B());
    }

    Sample Max() const { return freq_.Max(); }
    std::vector<Sample> Samples() const { return freq_.Keys(); }

    // Mass reserved for unseen types.
    double Discount() const {
      if (!freq_.N()) return 1.0;
      return static_cast<double>(freq_.B()) / static_cast<double>(freq_.N() + freq_.B());
    }

    const char *Name() const { return "WittenBell"; }

    const FreqDist<Sample> &Freq() const { return freq_; }

  private:
    const FreqDist<Sample> &freq_;
    uint64_t bins_;
    double p0_;
};

/* Good-Turing with the raw frequency-of-frequency counts:
 *   c* = (c + 1) Nr(c + 1) / Nr(c)      p = c* / N     for c >= 1
 *   Nr(1) / N spread over the bins - B() unseen bins  for c == 0
 * Nothing repairs holes in Nr: a count c whose Nr(c + 1) is 0 (including the
 * largest count) gets probability 0.
 */
template <class Sample> class GoodTuringProbDist : public ProbDist<Sample> {
  public:
    explicit GoodTuringProbDist(const FreqDist<Sample> &freq, uint64_t bins = 0)
      : freq_(freq), bins_(detail::ResolveBins("GoodTuring", freq, bins, false)) {}

    double Prob(const Sample &sample) const {
      const uint64_t count = freq_.Count(sample);
      if (!freq_.N()) return 0.0;
      const double total = static_cast<double>(freq_.N());
      if (!count) {
        if (bins_ == freq_.B()) return 0.0;
        return static_cast<double>(freq_.Nr(1)) / total / static_cast<double>(bins_ - freq_.B());
      }
      const uint64_t nc = freq_.Nr(count);
      if (!nc) return 0.0;
      return static_cast<double>(count + 1) * static_cast<double>(freq_.Nr(count + 1)) / (static_cast<double>(nc) * total);
    }

    Sample Max() const { return freq_.Max(); }
    std::vector<Sample> Samples() const { return freq_.Keys(); }

    // Mass moved from seen to unseen samples.
    double Discount() const {
      if (!freq_.N()) return 0.0;
      return static_cast<double>(freq_.Nr(1)) / static_cast<double>(freq_.N());
    }

    const char *Name() const { return "GoodTuring"; }

    uint64_t Bins() const { return bins_; }
    const FreqDist<Sample> &Freq() const { return freq_; }

  private:
    const FreqDist<Sample> &freq_;
    uint64_t bins_;
};

} // namespace lmstat

#endif // LMSTAT_ESTIMATORS__
