#include "lmstat/model.hh"

#include "lmstat/exception.hh"
#include "lmstat/log_math.hh"

#include <boost/random/uniform_int.hpp>
#include <boost/random/uniform_real.hpp>
#include <boost/random/variate_generator.hpp>

#include <algorithm>
#include <cmath>
#include <ostream>

namespace lmstat {

namespace {
Vocabulary SeedVocabulary(const Config &config, const Vocabulary *vocab) {
  if (vocab) return *vocab;
  return Vocabulary(config.unk_cutoff, config.unknown_label);
}
} // namespace

LanguageModel::LanguageModel(const Config &config, const Vocabulary *vocab)
  : order_(config.order), messages_(config.messages), vocab_(SeedVocabulary(config, vocab)) {
  UTIL_THROW_IF(config.order < 1, ConfigurationException, "Model order must be at least 1.");
}

LanguageModel::~LanguageModel() {}

void LanguageModel::Fit(const std::vector<NGramSentence> &text, const std::vector<std::string> *vocabulary_text) {
  if (vocab_.empty()) {
    if (vocabulary_text) {
      vocab_.Update(*vocabulary_text);
    } else {
      for (std::vector<NGramSentence>::const_iterator sentence = text.begin(); sentence != text.end(); ++sentence) {
        for (NGramSentence::const_iterator ngram = sentence->begin(); ngram != sentence->end(); ++ngram) {
          if (ngram->size() == 1) vocab_.Add(ngram->front());
        }
      }
    }
  }
  for (std::vector<NGramSentence>::const_iterator sentence = text.begin(); sentence != text.end(); ++sentence) {
    for (NGramSentence::const_iterator ngram = sentence->begin(); ngram != sentence->end(); ++ngram) {
      counts_.Add(vocab_.Lookup(*ngram));
    }
  }
  if (messages_) {
    *messages_ << "Counted " << counts_.N() << " n-grams up to order " << counts_.MaxOrder()
      << " with a vocabulary of " << vocab_.size() << " words." << std::endl;
  }
}

double LanguageModel::Score(const std::string &word, const NGram &context) const {
  return UnmaskedScore(vocab_.Lookup(word), vocab_.Lookup(Truncate(context)));
}

double LanguageModel::LogScore(const std::string &word, const NGram &context) const {
  return Log2(Score(word, context));
}

const NGramCounter::Dist &LanguageModel::ContextCounts(const NGram &context) const {
  return counts_.Lookup(vocab_.Lookup(Truncate(context)));
}

double LanguageModel::Entropy(const std::vector<NGram> &ngrams) const {
  UTIL_THROW_IF(ngrams.empty(), util::Exception, "Entropy of no n-grams is undefined.");
  double sum = 0.0;
  for (std::vector<NGram>::const_iterator i = ngrams.begin(); i != ngrams.end(); ++i) {
    UTIL_THROW_IF(i->empty(), TypeMismatchException, "Cannot score an empty n-gram.");
    sum += LogScore(i->back(), ContextOf(*i));
  }
  return -sum / static_cast<double>(ngrams.size());
}

double LanguageModel::Perplexity(const std::vector<NGram> &ngrams) const {
  return std::pow(2.0, Entropy(ngrams));
}

std::string LanguageModel::GenerateOne(const NGram &history, boost::mt19937 &rng) const {
  NGram context(Truncate(history));
  const NGramCounter::Dist *continuations = &ContextCounts(context);
  while (continuations->empty() && !context.empty()) {
    context = ShortenContext(context);
    continuations = &ContextCounts(context);
  }
  UTIL_THROW_IF(continuations->empty(), EmptyDistributionException, "Nothing has been counted to generate from.");

  std::vector<std::string> words;
  words.reserve(continuations->size());
  for (NGramCounter::Dist::const_iterator i = continuations->begin(); i != continuations->end(); ++i) {
    words.push_back(i->first);
  }
  std::sort(words.begin(), words.end());

  std::vector<double> cumulative;
  cumulative.reserve(words.size());
  double total = 0.0;
  for (std::vector<std::string>::const_iterator i = words.begin(); i != words.end(); ++i) {
    total += Score(*i, context);
    cumulative.push_back(total);
  }

  if (total <= 0.0) {
    boost::uniform_int<std::size_t> pick(0, words.size() - 1);
    boost::variate_generator<boost::mt19937&, boost::uniform_int<std::size_t> > choose(rng, pick);
    return words[choose()];
  }
  boost::uniform_real<double> unit(0.0, total);
  boost::variate_generator<boost::mt19937&, boost::uniform_real<double> > draw(rng, unit);
  double threshold = draw();
  std::vector<double>::const_iterator found = std::upper_bound(cumulative.begin(), cumulative.end(), threshold);
  if (found == cumulative.end()) return words.back();
  return words[found - cumulative.begin()];
}

std::vector<std::string> LanguageModel::Generate(std::size_t num_words, const NGram &seed, boost::mt19937 &rng) const {
  std::vector<std::string> generated;
  generated.reserve(num_words);
  NGram history(seed);
  for (std::size_t i = 0; i < num_words; ++i) {
    std::string word(GenerateOne(history, rng));
    history.push_back(word);
    generated.push_back(word);
  }
  return generated;
}

MLEModel::MLEModel(const Config &config, const Vocabulary *vocab) : LanguageModel(config, vocab) {}

double MLEModel::UnmaskedScore(const std::string &word, const NGram &context) const {
  return counts_.Lookup(context).Freq(word);
}

LidstoneModel::LidstoneModel(const Config &config, const Vocabulary *vocab)
  : LanguageModel(config, vocab), gamma_(config.gamma) {
  UTIL_THROW_IF(gamma_ < 0.0, ConfigurationException, "Lidstone gamma must be non-negative, not " << gamma_);
}

LidstoneModel::LidstoneModel(const Config &config, const Vocabulary *vocab, double gamma)
  : LanguageModel(config, vocab), gamma_(gamma) {}

double LidstoneModel::UnmaskedScore(const std::string &word, const NGram &context) const {
  const NGramCounter::Dist &continuations = counts_.Lookup(context);
  double denominator = static_cast<double>(continuations.N()) + static_cast<double>(vocab_.size()) * gamma_;
  if (denominator == 0.0) return 0.0;
  return (static_cast<double>(continuations.Count(word)) + gamma_) / denominator;
}

LaplaceModel::LaplaceModel(const Config &config, const Vocabulary *vocab)
  : LidstoneModel(config, vocab, 1.0) {}

InterpolatedModel::InterpolatedModel(const Config &config, const Vocabulary *vocab)
  : LanguageModel(config, vocab) {}

double InterpolatedModel::UnmaskedScore(const std::string &word, const NGram &context) const {
  // Weight that the remaining lower orders are scaled by.
  double weight = 1.0;
  double score = 0.0;
  NGram current(context);
  for (; !current.empty(); current = ShortenContext(current)) {
    Interpolation ag(smoothing_->AlphaGamma(word, current));
    score += weight * ag.alpha;
    weight *= ag.gamma;
    if (weight == 0.0) return score;
  }
  return score + weight * smoothing_->UnigramScore(word);
}

WittenBellInterpolated::WittenBellInterpolated(const Config &config, const Vocabulary *vocab)
  : InterpolatedModel(config, vocab) {
  SetSmoothing(new WittenBellSmoothing(counts_));
}

AbsoluteDiscountingInterpolated::AbsoluteDiscountingInterpolated(const Config &config, const Vocabulary *vocab)
  : InterpolatedModel(config, vocab) {
  SetSmoothing(new AbsoluteDiscountingSmoothing(counts_, config.absolute_discount));
}

KneserNeyInterpolated::KneserNeyInterpolated(const Config &config, const Vocabulary *vocab)
  : InterpolatedModel(config, vocab) {
  SetSmoothing(new KneserNeySmoothing(counts_, config.order, config.kneser_ney_discount));
}

LanguageModel *CreateModel(const Config &config, const Vocabulary *vocab) {
  switch (config.model_type) {
    case MLE:
      return new MLEModel(config, vocab);
    case LIDSTONE:
      return new LidstoneModel(config, vocab);
    case LAPLACE:
      return new LaplaceModel(config, vocab);
    case WITTEN_BELL:
      return new WittenBellInterpolated(config, vocab);
    case ABSOLUTE_DISCOUNTING:
      return new AbsoluteDiscountingInterpolated(config, vocab);
    case KNESER_NEY:
      return new KneserNeyInterpolated(config, vocab);
  }
  UTIL_THROW(ConfigurationException, "Unknown model type " << static_cast<int>(config.model_type));
}

} // namespace lmstat
