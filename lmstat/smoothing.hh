#ifndef LMSTAT_SMOOTHING__
#define LMSTAT_SMOOTHING__

#include "lmstat/ngram.hh"
#include "lmstat/ngram_counter.hh"

#include <string>

#include <stdint.h>

namespace lmstat {

// score(word | context) = alpha + gamma * score(word | context[1:])
struct Interpolation {
  double alpha;
  double gamma;
};

/* Smoothing strategy for InterpolatedModel.  Implementations read the counts
 * they were given and never change them; the counts must outlive them.
 * AlphaGamma is only asked about contexts that have at least one
 * continuation.
 */
class Smoothing {
  public:
    explicit Smoothing(const NGramCounter &counts) : counts_(counts) {}

    virtual ~Smoothing();

    // Base case of the recursion, the empty context.
    virtual double UnigramScore(const std::string &word) const = 0;

    virtual Interpolation AlphaGamma(const std::string &word, const NGram &context) const = 0;

  protected:
    const NGramCounter &counts_;
};

// Interpolated Witten-Bell.  gamma = n+ / (n+ + N) where n+ is the number of
// distinct words seen after the context and N is the context's count.
class WittenBellSmoothing : public Smoothing {
  public:
    explicit WittenBellSmoothing(const NGramCounter &counts) : Smoothing(counts) {}

    double UnigramScore(const std::string &word) const;

    Interpolation AlphaGamma(const std::string &word, const NGram &context) const;
};

// Subtract a fixed discount from every observed count and hand the freed mass
// to the lower order.
class AbsoluteDiscountingSmoothing : public Smoothing {
  public:
    AbsoluteDiscountingSmoothing(const NGramCounter &counts, double discount);

    double UnigramScore(const std::string &word) const;

    Interpolation AlphaGamma(const std::string &word, const NGram &context) const;

    double Discount() const { return discount_; }

  private:
    double discount_;
};

/* Interpolated Kneser-Ney.  Below the highest order, counts are replaced by
 * continuation counts: the number of distinct words that precede
 * context + word.  The unigram base is the continuation unigram.
 */
class KneserNeySmoothing : public Smoothing {
  public:
    KneserNeySmoothing(const NGramCounter &counts, unsigned int order, double discount);

    double UnigramScore(const std::string &word) const;

    Interpolation AlphaGamma(const std::string &word, const NGram &context) const;

    struct Continuation {
      // Distinct left extensions of context that were followed by word.
      uint64_t word;
      // Distinct (left extension, following word) pairs over all words.
      uint64_t total;
    };

    // Scans the len(context) + 2 order table.
    Continuation ContinuationCounts(const std::string &word, const NGram &context) const;

    double Discount() const { return discount_; }

  private:
    unsigned int order_;
    double discount_;
};

} // namespace lmstat

#endif // LMSTAT_SMOOTHING__
