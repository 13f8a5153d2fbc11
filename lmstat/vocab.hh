#ifndef LMSTAT_VOCAB__
#define LMSTAT_VOCAB__

#include "lmstat/freq_dist.hh"
#include "lmstat/ngram.hh"

#include <string>
#include <vector>

#include <stdint.h>

namespace lmstat {

extern const char kDefaultUnknown[];

/* Token counts with a cutoff.  Tokens counted at least unk_cutoff times are
 * known; everything else maps to the unknown label.  The unknown label is
 * itself always known.
 */
class Vocabulary {
  public:
    explicit Vocabulary(uint64_t unk_cutoff = 1, const std::string &unk_label = kDefaultUnknown);

    void Add(const std::string &token) { counts_.Increment(token); }

    template <class Iterator> void Update(Iterator begin, Iterator end) {
      counts_.Update(begin, end);
    }

    void Update(const std::vector<std::string> &tokens) {
      Update(tokens.begin(), tokens.end());
    }

    // Raw count, except that the unknown label reports the cutoff.
    uint64_t Count(const std::string &token) const;

    bool Contains(const std::string &token) const {
      return Count(token) >= unk_cutoff_;
    }

    // The token if it is known, otherwise the unknown label.
    std::string Lookup(const std::string &token) const {
      return Contains(token) ? token : unk_label_;
    }

    NGram Lookup(const NGram &tokens) const;

    // Known tokens, ascending, followed by the unknown label.  Empty until
    // something has been counted.
    std::vector<std::string> Words() const;

    std::size_t size() const;

    bool empty() const { return counts_.empty(); }

    uint64_t Cutoff() const { return unk_cutoff_; }
    const std::string &UnknownLabel() const { return unk_label_; }

    const FreqDist<std::string> &Counts() const { return counts_; }

  private:
    FreqDist<std::string> counts_;

    uint64_t unk_cutoff_;
    std::string unk_label_;
};

} // namespace lmstat

#endif // LMSTAT_VOCAB__
