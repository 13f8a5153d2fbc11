#include "lmstat/ngram_counter.hh"

#include "lmstat/exception.hh"

namespace lmstat {

NGramCounter::NGramCounter() {}

void NGramCounter::Add(const NGram &ngram) {
  UTIL_THROW_IF(ngram.empty(), TypeMismatchException, "N-grams must have at least one token to split into context and word.");
  if (ngram.size() == 1) {
    unigrams_.Increment(ngram.front());
    return;
  }
  if (tables_.size() <= ngram.size()) tables_.resize(ngram.size() + 1);
  tables_[ngram.size()][ContextOf(ngram)].Increment(ngram.back());
}

void NGramCounter::Update(const NGramSentence &sentence) {
  for (NGramSentence::const_iterator i = sentence.begin(); i != sentence.end(); ++i) {
    Add(*i);
  }
}

void NGramCounter::Update(const std::vector<NGramSentence> &text) {
  for (std::vector<NGramSentence>::const_iterator i = text.begin(); i != text.end(); ++i) {
    Update(*i);
  }
}

const NGramCounter::Table &NGramCounter::Order(std::size_t order) const {
  if (order < 2 || order >= tables_.size()) return empty_table_;
  return tables_[order];
}

const NGramCounter::Dist &NGramCounter::Lookup(const NGram &context) const {
  if (context.empty()) return unigrams_;
  const Dist *found = Order(context.size() + 1).Find(context);
  return found ? *found : empty_dist_;
}

std::size_t NGramCounter::MaxOrder() const {
  for (std::size_t order = tables_.size(); order > 2; --order) {
    if (!tables_[order - 1].empty()) return order - 1;
  }
  return unigrams_.empty() ? 0 : 1;
}

uint64_t NGramCounter::N() const {
  uint64_t ret = unigrams_.N();
  for (std::vector<Table>::const_iterator i = tables_.begin(); i != tables_.end(); ++i) {
    ret += i->N();
  }
  return ret;
}

std::vector<uint64_t> NGramCounter::FrequencyOfFrequency(std::size_t order) const {
  if (order == 1) return unigrams_.NrHistogram();
  std::vector<uint64_t> hist(1, 0);
  const Table &table = Order(order);
  for (Table::const_iterator context = table.begin(); context != table.end(); ++context) {
    const std::vector<uint64_t> &sub = context->second.NrHistogram();
    if (sub.size() > hist.size()) hist.resize(sub.size(), 0);
    for (std::size_t r = 1; r < sub.size(); ++r) {
      hist[r] += sub[r];
    }
  }
  return hist;
}

} // namespace lmstat
