#include "lmstat/smoothing.hh"

#include "lmstat/exception.hh"

#include <algorithm>

namespace lmstat {

namespace {
Interpolation Defer() {
  Interpolation ret;
  ret.alpha = 0.0;
  ret.gamma = 1.0;
  return ret;
}

Interpolation Make(double alpha, double gamma) {
  Interpolation ret;
  ret.alpha = alpha;
  ret.gamma = gamma;
  return ret;
}
} // namespace

Smoothing::~Smoothing() {}

double WittenBellSmoothing::UnigramScore(const std::string &word) const {
  return counts_.Unigrams().Freq(word);
}

Interpolation WittenBellSmoothing::AlphaGamma(const std::string &word, const NGram &context) const {
  const NGramCounter::Dist &continuations = counts_.Lookup(context);
  if (continuations.empty()) return Defer();
  const double n_plus = static_cast<double>(continuations.B());
  const double gamma = n_plus / (n_plus + static_cast<double>(continuations.N()));
  return Make((1.0 - gamma) * continuations.Freq(word), gamma);
}

AbsoluteDiscountingSmoothing::AbsoluteDiscountingSmoothing(const NGramCounter &counts, double discount)
  : Smoothing(counts), discount_(discount) {
  UTIL_THROW_IF(discount < 0.0, ConfigurationException, "Absolute discount must be non-negative, not " << discount);
}

double AbsoluteDiscountingSmoothing::UnigramScore(const std::string &word) const {
  return counts_.Unigrams().Freq(word);
}

Interpolation AbsoluteDiscountingSmoothing::AlphaGamma(const std::string &word, const NGram &context) const {
  const NGramCounter::Dist &continuations = counts_.Lookup(context);
  if (continuations.empty()) return Defer();
  const double total = static_cast<double>(continuations.N());
  const double discounted = std::max(static_cast<double>(continuations.Count(word)) - discount_, 0.0);
  return Make(discounted / total, discount_ * static_cast<double>(continuations.B()) / total);
}

KneserNeySmoothing::KneserNeySmoothing(const NGramCounter &counts, unsigned int order, double discount)
  : Smoothing(counts), order_(order), discount_(discount) {
  UTIL_THROW_IF(discount < 0.0, ConfigurationException, "Kneser-Ney discount must be non-negative, not " << discount);
}

KneserNeySmoothing::Continuation KneserNeySmoothing::ContinuationCounts(const std::string &word, const NGram &context) const {
  Continuation ret;
  ret.word = 0;
  ret.total = 0;
  const NGramCounter::Table &table = counts_.Order(context.size() + 2);
  for (NGramCounter::Table::const_iterator i = table.begin(); i != table.end(); ++i) {
    const NGram &prefix = i->first;
    if (prefix.size() != context.size() + 1 || !std::equal(prefix.begin() + 1, prefix.end(), context.begin())) continue;
    if (i->second.Contains(word)) ++ret.word;
    ret.total += i->second.B();
  }
  return ret;
}

double KneserNeySmoothing::UnigramScore(const std::string &word) const {
  Continuation cont(ContinuationCounts(word, NGram()));
  // No bigrams to take continuations from.
  if (!cont.total) return counts_.Unigrams().Freq(word);
  return static_cast<double>(cont.word) / static_cast<double>(cont.total);
}

Interpolation KneserNeySmoothing::AlphaGamma(const std::string &word, const NGram &context) const {
  const NGramCounter::Dist &continuations = counts_.Lookup(context);
  if (continuations.empty()) return Defer();
  double count, total;
  if (context.size() + 1 >= order_ || context.size() + 2 > counts_.MaxOrder()) {
    // Highest order, or highest counted: nothing longer to take continuations from.
    count = static_cast<double>(continuations.Count(word));
    total = static_cast<double>(continuations.N());
  } else {
    Continuation cont(ContinuationCounts(word, context));
    count = static_cast<double>(cont.word);
    total = static_cast<double>(cont.total);
  }
  if (total == 0.0) return Defer();
  return Make(std::max(count - discount_, 0.0) / total, discount_ * static_cast<double>(continuations.B()) / total);
}

} // namespace lmstat
