#include "lmstat/ngram.hh"

#include <algorithm>

namespace lmstat {

const char kBeginSentence[] = "<s>";
const char kEndSentence[] = "</s>";

NGram ContextOf(const NGram &ngram) {
  if (ngram.empty()) return NGram();
  return NGram(ngram.begin(), ngram.end() - 1);
}

NGram ShortenContext(const NGram &context) {
  if (context.empty()) return NGram();
  return NGram(context.begin() + 1, context.end());
}

NGram LastTokens(const NGram &tokens, std::size_t max_length) {
  if (tokens.size() <= max_length) return tokens;
  return NGram(tokens.end() - max_length, tokens.end());
}

std::vector<std::string> PadBothEnds(const std::vector<std::string> &sentence, std::size_t n) {
  std::vector<std::string> ret;
  std::size_t pad = n ? n - 1 : 0;
  ret.reserve(sentence.size() + 2 * pad);
  ret.insert(ret.end(), pad, kBeginSentence);
  ret.insert(ret.end(), sentence.begin(), sentence.end());
  ret.insert(ret.end(), pad, kEndSentence);
  return ret;
}

NGramSentence NGrams(const std::vector<std::string> &sentence, std::size_t n) {
  NGramSentence ret;
  if (!n || sentence.size() < n) return ret;
  ret.reserve(sentence.size() - n + 1);
  for (std::vector<std::string>::const_iterator i = sentence.begin(); i + n <= sentence.end(); ++i) {
    ret.push_back(NGram(i, i + n));
  }
  return ret;
}

NGramSentence Everygrams(const std::vector<std::string> &sentence, std::size_t max_length) {
  NGramSentence ret;
  for (std::vector<std::string>::const_iterator start = sentence.begin(); start != sentence.end(); ++start) {
    std::size_t remaining = sentence.end() - start;
    std::size_t longest = std::min(max_length, remaining);
    for (std::size_t length = 1; length <= longest; ++length) {
      ret.push_back(NGram(start, start + length));
    }
  }
  return ret;
}

NGramSentence PaddedEverygrams(const std::vector<std::string> &sentence, std::size_t order) {
  return Everygrams(PadBothEnds(sentence, order), order);
}

void PaddedEverygramPipeline(
    std::size_t order,
    const std::vector<std::vector<std::string> > &text,
    std::vector<NGramSentence> &ngrams_out,
    std::vector<std::string> &vocabulary_out) {
  ngrams_out.clear();
  vocabulary_out.clear();
  ngrams_out.reserve(text.size());
  for (std::vector<std::vector<std::string> >::const_iterator sentence = text.begin(); sentence != text.end(); ++sentence) {
    std::vector<std::string> padded(PadBothEnds(*sentence, order));
    ngrams_out.push_back(Everygrams(padded, order));
    vocabulary_out.insert(vocabulary_out.end(), padded.begin(), padded.end());
  }
}

} // namespace lmstat
