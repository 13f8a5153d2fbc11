#ifndef LMSTAT_EXCEPTION__
#define LMSTAT_EXCEPTION__

#include "util/exception.hh"

#include <string>

#include <stdint.h>

namespace lmstat {

// Invalid parameters supplied when building an estimator, vocabulary, or
// model.  Thrown at construction.
class ConfigurationException : public util::Exception {
  public:
    ConfigurationException() throw();
    ~ConfigurationException() throw();
};

// Bins smaller than the number of observed sample types.
class BinsException : public ConfigurationException {
  public:
    BinsException(const char *estimator, uint64_t bins, uint64_t observed) throw();
    ~BinsException() throw();
};

// An n-gram handed to the counter that cannot be split into context and word.
class TypeMismatchException : public util::Exception {
  public:
    TypeMismatchException() throw();
    ~TypeMismatchException() throw();
};

// Max() or Generate() asked of a distribution with no samples.
class EmptyDistributionException : public util::Exception {
  public:
    EmptyDistributionException() throw();
    ~EmptyDistributionException() throw();
};

} // namespace lmstat

#endif // LMSTAT_EXCEPTION__
