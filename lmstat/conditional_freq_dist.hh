#ifndef LMSTAT_CONDITIONAL_FREQ_DIST__
#define LMSTAT_CONDITIONAL_FREQ_DIST__

#include "lmstat/freq_dist.hh"

#include <boost/functional/hash.hpp>
#include <boost/unordered_map.hpp>

#include <algorithm>
#include <vector>

#include <stdint.h>

namespace lmstat {

/* One FreqDist per condition.  A condition exists once it has been accessed
 * through operator[], even if nothing was counted under it.  Find() looks
 * without creating.
 */
template <class Condition, class Sample> class ConditionalFreqDist {
  private:
    typedef boost::unordered_map<Condition, FreqDist<Sample>, boost::hash<Condition> > Map;

  public:
    typedef Condition condition_type;
    typedef FreqDist<Sample> Dist;
    typedef typename Map::const_iterator const_iterator;

    ConditionalFreqDist() {}

    Dist &operator[](const Condition &condition) {
      return dists_[condition];
    }

    Dist &GetOrCreate(const Condition &condition) {
      return dists_[condition];
    }

    // NULL if the condition was never accessed.
    const Dist *Find(const Condition &condition) const {
      const_iterator i = dists_.find(condition);
      return i == dists_.end() ? NULL : &i->second;
    }

    void Increment(const Condition &condition, const Sample &sample, uint64_t by = 1) {
      dists_[condition].Increment(sample, by);
    }

    // Accessed conditions in ascending order.
    std::vector<Condition> Conditions() const {
      std::vector<Condition> ret;
      ret.reserve(dists_.size());
      for (const_iterator i = dists_.begin(); i != dists_.end(); ++i) {
        ret.push_back(i->first);
      }
      std::sort(ret.begin(), ret.end());
      return ret;
    }

    // Outcomes recorded under all conditions.
    uint64_t N() const {
      uint64_t ret = 0;
      for (const_iterator i = dists_.begin(); i != dists_.end(); ++i) {
        ret += i->second.N();
      }
      return ret;
    }

    std::size_t size() const { return dists_.size(); }
    bool empty() const { return dists_.empty(); }

    const_iterator begin() const { return dists_.begin(); }
    const_iterator end() const { return dists_.end(); }

  private:
    Map dists_;
};

} // namespace lmstat

#endif // LMSTAT_CONDITIONAL_FREQ_DIST__
