#ifndef LMSTAT_LOG_MATH__
#define LMSTAT_LOG_MATH__

#include <vector>

namespace lmstat {

/* Stand-in for log2(0) returned by ProbDist::LogProb.  Large enough to swamp
 * any real log probability while keeping sums finite.
 */
const double kNegativeInfinityLog = -1e300;

// Base 2 logarithm.  Negative infinity for 0.
double Log2(double value);

// log2(2^logx + 2^logy) without leaving log space.  When the two are more
// than 30 decimal orders of magnitude apart the larger is returned.
double AddLogs(double logx, double logy);

// AddLogs folded over logs.  kNegativeInfinityLog for an empty vector.
double SumLogs(const std::vector<double> &logs);

} // namespace lmstat

#endif // LMSTAT_LOG_MATH__
