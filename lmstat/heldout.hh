#ifndef LMSTAT_HELDOUT__
#define LMSTAT_HELDOUT__

#include "lmstat/estimators.hh"
#include "lmstat/freq_dist.hh"
#include "lmstat/prob_dist.hh"

#include <boost/ptr_container/ptr_vector.hpp>

#include <algorithm>
#include <vector>

#include <stdint.h>

namespace lmstat {

/* Heldout estimate.  A sample seen r times in the base counts gets the average
 * heldout frequency of all samples seen r times in the base counts:
 *   Tr[r] / (Nr[r] * N)
 * where Tr[r] is their total heldout count, Nr[r] is how many there are, and
 * N is the heldout total.  bins only matters for r = 0, where Nr[0] is
 * bins - base.B().
 */
template <class Sample> class HeldoutProbDist : public ProbDist<Sample> {
  public:
    HeldoutProbDist(const FreqDist<Sample> &base, const FreqDist<Sample> &heldout, uint64_t bins = 0)
      : base_(base), heldout_(heldout) {
      bins = detail::ResolveBins("Heldout", base, bins, false);
      const uint64_t max_r = base.empty() ? 0 : base.Count(base.Max());
      std::vector<double> tr(max_r + 1, 0.0);
      for (typename FreqDist<Sample>::const_iterator i = heldout.begin(); i != heldout.end(); ++i) {
        tr[base.Count(i->first)] += static_cast<double>(i->second);
      }
      const double total = static_cast<double>(heldout.N());
      estimate_.resize(max_r + 1, 0.0);
      for (uint64_t r = 0; r <= max_r; ++r) {
        uint64_t nr = base.Nr(r, bins);
        // Empty Nr[r] means no base sample has count r, so the value is never read.
        if (nr && total > 0.0) estimate_[r] = tr[r] / (static_cast<double>(nr) * total);
      }
    }

    double Prob(const Sample &sample) const {
      uint64_t r = base_.Count(sample);
      return r < estimate_.size() ? estimate_[r] : 0.0;
    }

    // Heldout estimates are not necessarily monotonic in count, so this is
    // usually but not always the most probable sample.
    Sample Max() const { return base_.Max(); }

    std::vector<Sample> Samples() const { return base_.Keys(); }

    bool SumsToOne() const { return false; }

    const char *Name() const { return "Heldout"; }

    const FreqDist<Sample> &Base() const { return base_; }
    const FreqDist<Sample> &Heldout() const { return heldout_; }

  private:
    const FreqDist<Sample> &base_;
    const FreqDist<Sample> &heldout_;

    // Indexed by base count r.
    std::vector<double> estimate_;
};

// Average of the heldout estimates over every ordered pair of distinct count sets.
template <class Sample> class CrossValidationProbDist : public ProbDist<Sample> {
  public:
    CrossValidationProbDist(const std::vector<const FreqDist<Sample>*> &freqs, uint64_t bins = 0)
      : freqs_(freqs) {
      for (std::size_t i = 0; i < freqs_.size(); ++i) {
        for (std::size_t j = 0; j < freqs_.size(); ++j) {
          if (i != j) heldout_.push_back(new HeldoutProbDist<Sample>(*freqs_[i], *freqs_[j], bins));
        }
      }
    }

    double Prob(const Sample &sample) const {
      if (heldout_.empty()) return 0.0;
      double sum = 0.0;
      for (typename boost::ptr_vector<HeldoutProbDist<Sample> >::const_iterator i = heldout_.begin(); i != heldout_.end(); ++i) {
        sum += i->Prob(sample);
      }
      return sum / static_cast<double>(heldout_.size());
    }

    Sample Max() const {
      std::vector<Sample> samples(Samples());
      UTIL_THROW_IF(samples.empty(), EmptyDistributionException, "No samples to take the maximum of.");
      typename std::vector<Sample>::const_iterator best = samples.begin();
      double best_prob = Prob(*best);
      for (typename std::vector<Sample>::const_iterator i = samples.begin() + 1; i != samples.end(); ++i) {
        double p = Prob(*i);
        if (p > best_prob) {
          best = i;
          best_prob = p;
        }
      }
      return *best;
    }

    // Union of every count set's samples, ascending.
    std::vector<Sample> Samples() const {
      std::vector<Sample> ret;
      for (std::size_t i = 0; i < freqs_.size(); ++i) {
        for (typename FreqDist<Sample>::const_iterator j = freqs_[i]->begin(); j != freqs_[i]->end(); ++j) {
          ret.push_back(j->first);
        }
      }
      std::sort(ret.begin(), ret.end());
      ret.erase(std::unique(ret.begin(), ret.end()), ret.end());
      return ret;
    }

    bool SumsToOne() const { return false; }

    const char *Name() const { return "CrossValidation"; }

    std::size_t Folds() const { return freqs_.size(); }

  private:
    std::vector<const FreqDist<Sample>*> freqs_;

    boost::ptr_vector<HeldoutProbDist<Sample> > heldout_;
};

} // namespace lmstat

#endif // LMSTAT_HELDOUT__
