#ifndef LMSTAT_DICTIONARY_PROB_DIST__
#define LMSTAT_DICTIONARY_PROB_DIST__

#include "lmstat/exception.hh"
#include "lmstat/log_math.hh"
#include "lmstat/prob_dist.hh"

#include <boost/functional/hash.hpp>
#include <boost/unordered_map.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace lmstat {

// Equal probability for every distinct sample in a fixed set, 0 elsewhere.
template <class Sample> class UniformProbDist : public ProbDist<Sample> {
  public:
    explicit UniformProbDist(const std::vector<Sample> &samples) : samples_(samples) {
      std::sort(samples_.begin(), samples_.end());
      samples_.erase(std::unique(samples_.begin(), samples_.end()), samples_.end());
      UTIL_THROW_IF(samples_.empty(), ConfigurationException, "A Uniform probability distribution must have at least one sample.");
      prob_ = 1.0 / static_cast<double>(samples_.size());
    }

    double Prob(const Sample &sample) const {
      return std::binary_search(samples_.begin(), samples_.end(), sample) ? prob_ : 0.0;
    }

    Sample Max() const { return samples_.front(); }
    std::vector<Sample> Samples() const { return samples_; }
    const char *Name() const { return "Uniform"; }

  private:
    std::vector<Sample> samples_;
    double prob_;
};

/* Probabilities given directly, either linear or as base 2 logs.  With
 * normalize, values are scaled to total one; if they total zero every sample
 * gets the same share instead.
 */
template <class Sample> class DictionaryProbDist : public ProbDist<Sample> {
  public:
    typedef boost::unordered_map<Sample, double, boost::hash<Sample> > Map;

    explicit DictionaryProbDist(const Map &values, bool log = false, bool normalize = false)
      : values_(values), log_(log) {
      if (normalize && !values_.empty()) Normalize();
    }

    double Prob(const Sample &sample) const {
      typename Map::const_iterator i = values_.find(sample);
      if (i == values_.end()) return 0.0;
      return log_ ? std::pow(2.0, i->second) : i->second;
    }

    double LogProb(const Sample &sample) const {
      typename Map::const_iterator i = values_.find(sample);
      if (i == values_.end()) return kNegativeInfinityLog;
      if (log_) return i->second;
      if (i->second == 0.0) return kNegativeInfinityLog;
      return Log2(i->second);
    }

    // Ties go to the greatest sample.
    Sample Max() const {
      UTIL_THROW_IF(values_.empty(), EmptyDistributionException, "No samples to take the maximum of.");
      typename Map::const_iterator best = values_.begin();
      for (typename Map::const_iterator i = values_.begin(); i != values_.end(); ++i) {
        if (i->second > best->second || (i->second == best->second && best->first < i->first)) best = i;
      }
      return best->first;
    }

    std::vector<Sample> Samples() const {
      std::vector<Sample> ret;
      ret.reserve(values_.size());
      for (typename Map::const_iterator i = values_.begin(); i != values_.end(); ++i) {
        ret.push_back(i->first);
      }
      std::sort(ret.begin(), ret.end());
      return ret;
    }

    const char *Name() const { return "Dictionary"; }

    // Replace one probability.  Keeping the distribution normalized is up to
    // the caller.
    void Update(const Sample &sample, double value, bool value_is_log) {
      if (log_ == value_is_log) {
        values_[sample] = value;
      } else if (log_) {
        values_[sample] = value == 0.0 ? kNegativeInfinityLog : Log2(value);
      } else {
        values_[sample] = std::pow(2.0, value);
      }
    }

  private:
    void Normalize() {
      const double size = static_cast<double>(values_.size());
      if (log_) {
        std::vector<double> logs;
        logs.reserve(values_.size());
        for (typename Map::const_iterator i = values_.begin(); i != values_.end(); ++i) logs.push_back(i->second);
        double sum = SumLogs(logs);
        for (typename Map::iterator i = values_.begin(); i != values_.end(); ++i) {
          i->second = (sum <= kNegativeInfinityLog) ? Log2(1.0 / size) : i->second - sum;
        }
      } else {
        double sum = 0.0;
        for (typename Map::const_iterator i = values_.begin(); i != values_.end(); ++i) sum += i->second;
        for (typename Map::iterator i = values_.begin(); i != values_.end(); ++i) {
          i->second = (sum == 0.0) ? 1.0 / size : i->second / sum;
        }
      }
    }

    Map values_;
    bool log_;
};

} // namespace lmstat

#endif // LMSTAT_DICTIONARY_PROB_DIST__
