#include "lmstat/exception.hh"

namespace lmstat {

ConfigurationException::ConfigurationException() throw() {}
ConfigurationException::~ConfigurationException() throw() {}

BinsException::BinsException(const char *estimator, uint64_t bins, uint64_t observed) throw() {
  *this << "The number of bins in a " << estimator << " distribution (" << bins
    << ") must be greater than or equal to the number of bins in the FreqDist used to create it (" << observed << "). ";
}
BinsException::~BinsException() throw() {}

TypeMismatchException::TypeMismatchException() throw() {}
TypeMismatchException::~TypeMismatchException() throw() {}

EmptyDistributionException::EmptyDistributionException() throw() {}
EmptyDistributionException::~EmptyDistributionException() throw() {}

} // namespace lmstat
