#include "lmstat/vocab.hh"

#include "lmstat/exception.hh"

#include <algorithm>

namespace lmstat {

const char kDefaultUnknown[] = "<UNK>";

Vocabulary::Vocabulary(uint64_t unk_cutoff, const std::string &unk_label)
  : unk_cutoff_(unk_cutoff), unk_label_(unk_label) {
  UTIL_THROW_IF(unk_cutoff < 1, ConfigurationException, "Vocabulary cutoff must be at least 1, not " << unk_cutoff);
}

uint64_t Vocabulary::Count(const std::string &token) const {
  if (token == unk_label_) return unk_cutoff_;
  return counts_.Count(token);
}

NGram Vocabulary::Lookup(const NGram &tokens) const {
  NGram ret;
  ret.reserve(tokens.size());
  for (NGram::const_iterator i = tokens.begin(); i != tokens.end(); ++i) {
    ret.push_back(Lookup(*i));
  }
  return ret;
}

std::vector<std::string> Vocabulary::Words() const {
  std::vector<std::string> ret;
  if (counts_.empty()) return ret;
  for (FreqDist<std::string>::const_iterator i = counts_.begin(); i != counts_.end(); ++i) {
    if (i->second >= unk_cutoff_ && i->first != unk_label_) ret.push_back(i->first);
  }
  std::sort(ret.begin(), ret.end());
  ret.push_back(unk_label_);
  return ret;
}

std::size_t Vocabulary::size() const {
  if (counts_.empty()) return 0;
  std::size_t ret = 1;
  for (FreqDist<std::string>::const_iterator i = counts_.begin(); i != counts_.end(); ++i) {
    if (i->second >= unk_cutoff_ && i->first != unk_label_) ++ret;
  }
  return ret;
}

} // namespace lmstat
