#ifndef LMSTAT_MODEL__
#define LMSTAT_MODEL__

#include "lmstat/config.hh"
#include "lmstat/ngram.hh"
#include "lmstat/ngram_counter.hh"
#include "lmstat/smoothing.hh"
#include "lmstat/vocab.hh"

#include <boost/noncopyable.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/scoped_ptr.hpp>

#include <string>
#include <vector>

namespace lmstat {

/* N-gram language model over a Vocabulary and an NGramCounter that it owns.
 * Words and contexts handed to the scoring functions go through the
 * vocabulary first, so unknown words score as the unknown label.  Contexts
 * longer than order - 1 are cut down to their last order - 1 tokens.
 */
class LanguageModel : boost::noncopyable {
  public:
    virtual ~LanguageModel();

    /* Count the n-grams of text.  If the vocabulary is still empty it is
     * filled first, from vocabulary_text when given and otherwise from the
     * unigrams of text.  Every token is mapped through the vocabulary before
     * counting.
     */
    void Fit(const std::vector<NGramSentence> &text, const std::vector<std::string> *vocabulary_text = NULL);

    double Score(const std::string &word, const NGram &context = NGram()) const;

    // Base 2.  Negative infinity for zero probability.
    double LogScore(const std::string &word, const NGram &context = NGram()) const;

    // Score without mapping through the vocabulary or truncating the context.
    virtual double UnmaskedScore(const std::string &word, const NGram &context) const = 0;

    // Continuations of the context as counted, empty if it was never seen.
    const NGramCounter::Dist &ContextCounts(const NGram &context) const;

    // Average negative LogScore of each n-gram's last word given the rest.
    double Entropy(const std::vector<NGram> &ngrams) const;

    // 2 ^ Entropy(ngrams).
    double Perplexity(const std::vector<NGram> &ngrams) const;

    /* Generate num_words words, each conditioned on the last order - 1 tokens
     * of seed plus what has been generated so far.  Contexts without any
     * continuations are shortened from the left until one has some.
     */
    std::vector<std::string> Generate(std::size_t num_words, const NGram &seed, boost::mt19937 &rng) const;

    unsigned int Order() const { return order_; }

    const Vocabulary &GetVocabulary() const { return vocab_; }

    const NGramCounter &Counts() const { return counts_; }

  protected:
    // vocab seeds the vocabulary if non-NULL.
    LanguageModel(const Config &config, const Vocabulary *vocab);

    std::string GenerateOne(const NGram &context, boost::mt19937 &rng) const;

    NGram Truncate(const NGram &context) const {
      return LastTokens(context, order_ - 1);
    }

    unsigned int order_;

    std::ostream *messages_;

    Vocabulary vocab_;

    NGramCounter counts_;
};

// Relative frequency of word after context.
class MLEModel : public LanguageModel {
  public:
    explicit MLEModel(const Config &config, const Vocabulary *vocab = NULL);

    double UnmaskedScore(const std::string &word, const NGram &context) const;
};

// (count + gamma) / (N + |V| gamma) where |V| is the vocabulary size.
class LidstoneModel : public LanguageModel {
  public:
    explicit LidstoneModel(const Config &config, const Vocabulary *vocab = NULL);

    double UnmaskedScore(const std::string &word, const NGram &context) const;

    double Gamma() const { return gamma_; }

  protected:
    LidstoneModel(const Config &config, const Vocabulary *vocab, double gamma);

  private:
    double gamma_;
};

class LaplaceModel : public LidstoneModel {
  public:
    explicit LaplaceModel(const Config &config, const Vocabulary *vocab = NULL);
};

/* Recursive interpolation with lower orders:
 *   score(w | c) = alpha(w, c) + gamma(c) * score(w | c[1:])
 * bottoming out at the smoothing's unigram score.
 */
class InterpolatedModel : public LanguageModel {
  public:
    double UnmaskedScore(const std::string &word, const NGram &context) const;

    const Smoothing &GetSmoothing() const { return *smoothing_; }

  protected:
    InterpolatedModel(const Config &config, const Vocabulary *vocab);

    // Takes ownership.  The smoothing should read counts_.
    void SetSmoothing(Smoothing *smoothing) { smoothing_.reset(smoothing); }

  private:
    boost::scoped_ptr<Smoothing> smoothing_;
};

class WittenBellInterpolated : public InterpolatedModel {
  public:
    explicit WittenBellInterpolated(const Config &config, const Vocabulary *vocab = NULL);
};

class AbsoluteDiscountingInterpolated : public InterpolatedModel {
  public:
    explicit AbsoluteDiscountingInterpolated(const Config &config, const Vocabulary *vocab = NULL);
};

class KneserNeyInterpolated : public InterpolatedModel {
  public:
    explicit KneserNeyInterpolated(const Config &config, const Vocabulary *vocab = NULL);
};

// Model of config.model_type.  Caller owns the result.
LanguageModel *CreateModel(const Config &config, const Vocabulary *vocab = NULL);

} // namespace lmstat

#endif // LMSTAT_MODEL__
