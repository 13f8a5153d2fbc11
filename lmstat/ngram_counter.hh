#ifndef LMSTAT_NGRAM_COUNTER__
#define LMSTAT_NGRAM_COUNTER__

#include "lmstat/conditional_freq_dist.hh"
#include "lmstat/freq_dist.hh"
#include "lmstat/ngram.hh"

#include <string>
#include <vector>

#include <stdint.h>

namespace lmstat {

/* Counts n-grams of every order fed to it.  Unigrams go in a plain FreqDist;
 * an order k > 1 n-gram increments the count of its last word in the
 * FreqDist for its k-1 token context.
 */
class NGramCounter {
  public:
    typedef FreqDist<std::string> Dist;
    typedef ConditionalFreqDist<NGram, std::string> Table;

    NGramCounter();

    // Throws TypeMismatchException for an empty n-gram.
    void Add(const NGram &ngram);

    void Update(const NGramSentence &sentence);

    void Update(const std::vector<NGramSentence> &text);

    const Dist &Unigrams() const { return unigrams_; }

    // Contexts and their continuations for order >= 2.  An order that was
    // never fed returns an empty table.
    const Table &Order(std::size_t order) const;

    // Continuations of context: table[len(context) + 1][context].  The empty
    // context gives the unigrams.  Unseen contexts give an empty FreqDist.
    const Dist &Lookup(const NGram &context) const;

    // Highest order fed so far, 0 if nothing was counted.
    std::size_t MaxOrder() const;

    // Total count over every order.  Overlapping orders are each counted.
    uint64_t N() const;

    // hist[r] is the number of (context, word) cells of this order seen
    // exactly r times.
    std::vector<uint64_t> FrequencyOfFrequency(std::size_t order) const;

  private:
    Dist unigrams_;

    // Indexed by order.  Entries 0 and 1 are unused.
    std::vector<Table> tables_;

    const Table empty_table_;
    const Dist empty_dist_;
};

} // namespace lmstat

#endif // LMSTAT_NGRAM_COUNTER__
