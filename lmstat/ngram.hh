#ifndef LMSTAT_NGRAM__
#define LMSTAT_NGRAM__

#include <cstddef>
#include <string>
#include <vector>

namespace lmstat {

// A sequence of tokens: an n-gram, or the context preceding a word.
typedef std::vector<std::string> NGram;

// Sentence as a sequence of (mixed order) n-grams, the unit of counting.
typedef std::vector<NGram> NGramSentence;

extern const char kBeginSentence[];
extern const char kEndSentence[];

// All but the last token.  Empty for an empty n-gram.
NGram ContextOf(const NGram &ngram);

// Drop the leftmost token.
NGram ShortenContext(const NGram &context);

// The last max_length tokens (fewer if the input is shorter).
NGram LastTokens(const NGram &tokens, std::size_t max_length);

// n-1 copies of <s> in front and </s> behind.
std::vector<std::string> PadBothEnds(const std::vector<std::string> &sentence, std::size_t n);

// Contiguous n-grams of exactly length n.
NGramSentence NGrams(const std::vector<std::string> &sentence, std::size_t n);

// Contiguous n-grams of every length in [1, max_length], grouped by start
// position, shortest first.
NGramSentence Everygrams(const std::vector<std::string> &sentence, std::size_t max_length);

// Everygrams of PadBothEnds(sentence, order).
NGramSentence PaddedEverygrams(const std::vector<std::string> &sentence, std::size_t order);

/* Turn tokenized text into what LanguageModel::Fit wants: every sentence's
 * padded everygrams, plus the padded tokens of all sentences flattened into
 * one stream for building the vocabulary.
 */
void PaddedEverygramPipeline(
    std::size_t order,
    const std::vector<std::vector<std::string> > &text,
    std::vector<NGramSentence> &ngrams_out,
    std::vector<std::string> &vocabulary_out);

} // namespace lmstat

#endif // LMSTAT_NGRAM__
