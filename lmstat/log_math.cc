#include "lmstat/log_math.hh"

#include <algorithm>
#include <cmath>
#include <limits>

namespace lmstat {

namespace {
// log2(1e-30)
const double kAddLogsMaxDiff = -99.65784284662087;
} // namespace

double Log2(double value) {
  if (value == 0.0) return -std::numeric_limits<double>::infinity();
  return std::log(value) / M_LN2;
}

double AddLogs(double logx, double logy) {
  if (logx < logy + kAddLogsMaxDiff) return logy;
  if (logy < logx + kAddLogsMaxDiff) return logx;
  double base = std::min(logx, logy);
  return base + Log2(std::pow(2.0, logx - base) + std::pow(2.0, logy - base));
}

double SumLogs(const std::vector<double> &logs) {
  if (logs.empty()) return kNegativeInfinityLog;
  double ret = logs.front();
  for (std::vector<double>::const_iterator i = logs.begin() + 1; i != logs.end(); ++i) {
    ret = AddLogs(ret, *i);
  }
  return ret;
}

} // namespace lmstat
