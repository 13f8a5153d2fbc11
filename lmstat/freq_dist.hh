#ifndef LMSTAT_FREQ_DIST__
#define LMSTAT_FREQ_DIST__

#include "lmstat/exception.hh"

#include <boost/functional/hash.hpp>
#include <boost/unordered_map.hpp>

#include <algorithm>
#include <utility>
#include <vector>

#include <stdint.h>

namespace lmstat {

/* Counts of discrete outcomes.  Sample must be copyable, hashable with
 * boost::hash, and totally ordered by operator<.  The order only breaks ties
 * in Sorted() and Max().
 *
 * The frequency-of-frequency histogram, the sorted view, and the max outcome
 * are computed on first read and thrown away by every mutation.  None of this
 * is threadsafe, including reads.
 */
template <class Sample> class FreqDist {
  private:
    typedef boost::unordered_map<Sample, uint64_t, boost::hash<Sample> > Map;

  public:
    typedef Sample value_type;
    typedef std::pair<Sample, uint64_t> Entry;
    typedef typename Map::const_iterator const_iterator;

    FreqDist() : total_(0) {
      InvalidateCaches();
    }

    template <class Iterator> FreqDist(Iterator begin, Iterator end) : total_(0) {
      InvalidateCaches();
      Update(begin, end);
    }

    // Caches are not carried across copies.
    FreqDist(const FreqDist<Sample> &from) : counts_(from.counts_), total_(from.total_) {
      InvalidateCaches();
    }

    FreqDist<Sample> &operator=(const FreqDist<Sample> &from) {
      counts_ = from.counts_;
      total_ = from.total_;
      InvalidateCaches();
      return *this;
    }

    void Increment(const Sample &sample, uint64_t by = 1) {
      if (!by) return;
      counts_[sample] += by;
      total_ += by;
      InvalidateCaches();
    }

    // Overwrite a count.  Setting 0 removes the sample so that B() only
    // counts samples that were actually observed.
    void Set(const Sample &sample, uint64_t value) {
      typename Map::iterator i = counts_.find(sample);
      if (i == counts_.end()) {
        if (!value) return;
        counts_.insert(std::make_pair(sample, value));
        total_ += value;
      } else if (!value) {
        total_ -= i->second;
        counts_.erase(i);
      } else {
        total_ = total_ - i->second + value;
        i->second = value;
      }
      InvalidateCaches();
    }

    template <class Iterator> void Update(Iterator begin, Iterator end) {
      for (; begin != end; ++begin) Increment(*begin);
    }

    FreqDist<Sample> &operator+=(const FreqDist<Sample> &other) {
      for (const_iterator i = other.begin(); i != other.end(); ++i) {
        Increment(i->first, i->second);
      }
      return *this;
    }

    void Clear() {
      counts_.clear();
      total_ = 0;
      InvalidateCaches();
    }

    uint64_t Count(const Sample &sample) const {
      const_iterator i = counts_.find(sample);
      return i == counts_.end() ? 0 : i->second;
    }

    bool Contains(const Sample &sample) const {
      return counts_.find(sample) != counts_.end();
    }

    // Relative frequency.  0 for an empty distribution.
    double Freq(const Sample &sample) const {
      if (!total_) return 0.0;
      return static_cast<double>(Count(sample)) / static_cast<double>(total_);
    }

    // Total number of outcomes recorded.
    uint64_t N() const { return total_; }

    // Number of sample values with count > 0.
    uint64_t B() const { return counts_.size(); }

    std::size_t size() const { return counts_.size(); }
    bool empty() const { return counts_.empty(); }

    // Unordered iteration over (sample, count).
    const_iterator begin() const { return counts_.begin(); }
    const_iterator end() const { return counts_.end(); }

    /* Number of samples with count exactly r.  Nr(0) is bins - B(), the
     * number of possible samples never observed; it is 0 when bins is
     * omitted or smaller than B().
     */
    uint64_t Nr(uint64_t r, uint64_t bins = 0) const {
      if (r == 0) return bins > B() ? bins - B() : 0;
      const std::vector<uint64_t> &hist = NrHistogram();
      if (r >= hist.size()) return 0;
      return hist[r];
    }

    // hist[r] is the number of samples seen exactly r times.  hist[0] is 0.
    const std::vector<uint64_t> &NrHistogram() const {
      if (!nr_valid_) {
        nr_cache_.assign(1, 0);
        for (const_iterator i = counts_.begin(); i != counts_.end(); ++i) {
          if (i->second >= nr_cache_.size()) nr_cache_.resize(i->second + 1, 0);
          ++nr_cache_[i->second];
        }
        nr_valid_ = true;
      }
      return nr_cache_;
    }

    // Samples with their counts, most frequent first, ties by ascending sample.
    const std::vector<Entry> &Sorted() const {
      if (!sorted_valid_) {
        sorted_cache_.assign(counts_.begin(), counts_.end());
        std::sort(sorted_cache_.begin(), sorted_cache_.end(), ByDecreasingCount());
        sorted_valid_ = true;
      }
      return sorted_cache_;
    }

    std::vector<Sample> Keys() const {
      const std::vector<Entry> &sorted = Sorted();
      std::vector<Sample> ret;
      ret.reserve(sorted.size());
      for (typename std::vector<Entry>::const_iterator i = sorted.begin(); i != sorted.end(); ++i) {
        ret.push_back(i->first);
      }
      return ret;
    }

    // Samples that occur once, in Keys() order.
    std::vector<Sample> Hapaxes() const {
      const std::vector<Entry> &sorted = Sorted();
      std::vector<Sample> ret;
      for (typename std::vector<Entry>::const_iterator i = sorted.begin(); i != sorted.end(); ++i) {
        if (i->second == 1) ret.push_back(i->first);
      }
      return ret;
    }

    // Running count totals over samples in the given order.
    std::vector<uint64_t> CumulativeFrequencies(const std::vector<Sample> &samples) const {
      std::vector<uint64_t> ret;
      ret.reserve(samples.size());
      uint64_t sum = 0;
      for (typename std::vector<Sample>::const_iterator i = samples.begin(); i != samples.end(); ++i) {
        sum += Count(*i);
        ret.push_back(sum);
      }
      return ret;
    }

    // Sample with the greatest count.  Ties go to the greatest sample.
    const Sample &Max() const {
      UTIL_THROW_IF(counts_.empty(), EmptyDistributionException, "No samples to take the maximum of.");
      if (!max_) {
        const_iterator best = counts_.begin();
        for (const_iterator i = counts_.begin(); i != counts_.end(); ++i) {
          if (i->second > best->second || (i->second == best->second && best->first < i->first)) best = i;
        }
        max_ = &best->first;
      }
      return *max_;
    }

  private:
    struct ByDecreasingCount {
      bool operator()(const Entry &a, const Entry &b) const {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
      }
    };

    void InvalidateCaches() {
      nr_valid_ = false;
      sorted_valid_ = false;
      max_ = NULL;
    }

    Map counts_;
    uint64_t total_;

    mutable std::vector<uint64_t> nr_cache_;
    mutable bool nr_valid_;
    mutable std::vector<Entry> sorted_cache_;
    mutable bool sorted_valid_;
    // Points into counts_, which does not move nodes until they are erased.
    mutable const Sample *max_;
};

} // namespace lmstat

#endif // LMSTAT_FREQ_DIST__
