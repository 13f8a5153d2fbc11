#include "lmstat/simple_good_turing.hh"

#include <cmath>

namespace lmstat {

namespace {
// 0.05 significance.
const double kSignificance = 1.96;

double TuringVariance(double r, double nr, double nr_next) {
  return (r + 1.0) * (r + 1.0) * (nr_next / (nr * nr)) * (1.0 + nr_next / nr);
}
} // namespace

SimpleGoodTuring::SimpleGoodTuring(const std::vector<uint64_t> &nr, uint64_t total)
  : nr_(nr), total_(total), slope_(0.0), intercept_(0.0), switch_at_(0), renormal_(1.0) {
  if (!nr_.empty()) nr_[0] = 0;
  // Observed counts and how many types have each, ascending.
  std::vector<uint64_t> r, r_types;
  for (uint64_t i = 1; i < nr_.size(); ++i) {
    if (nr_[i]) {
      r.push_back(i);
      r_types.push_back(nr_[i]);
    }
  }
  FindBestFit(r, r_types);
  FindSwitch(r, r_types);
  Renormalize(r, r_types);
}

void SimpleGoodTuring::FindBestFit(const std::vector<uint64_t> &r, const std::vector<uint64_t> &nr) {
  if (r.empty()) return;
  // At high r most Nr are 1 with zeros in between.  Averaging each Nr over
  // the gap around it (Church and Gale, 1991) straightens the log-log plot.
  std::vector<double> log_r, log_zr;
  log_r.reserve(r.size());
  log_zr.reserve(r.size());
  for (std::size_t j = 0; j < r.size(); ++j) {
    double before = j ? static_cast<double>(r[j - 1]) : 0.0;
    double after = (j + 1 != r.size()) ? static_cast<double>(r[j + 1]) : 2.0 * static_cast<double>(r[j]) - before;
    double zr = 2.0 * static_cast<double>(nr[j]) / (after - before);
    log_r.push_back(std::log(static_cast<double>(r[j])));
    log_zr.push_back(std::log(zr));
  }

  double x_mean = 0.0, y_mean = 0.0;
  for (std::size_t j = 0; j < log_r.size(); ++j) {
    x_mean += log_r[j];
    y_mean += log_zr[j];
  }
  x_mean /= static_cast<double>(log_r.size());
  y_mean /= static_cast<double>(log_zr.size());

  double xy_cov = 0.0, x_var = 0.0;
  for (std::size_t j = 0; j < log_r.size(); ++j) {
    xy_cov += (log_r[j] - x_mean) * (log_zr[j] - y_mean);
    x_var += (log_r[j] - x_mean) * (log_r[j] - x_mean);
  }
  // A single distinct count has no spread to fit: flat line through it.
  slope_ = (x_var != 0.0) ? xy_cov / x_var : 0.0;
  intercept_ = y_mean - slope_ * x_mean;
}

void SimpleGoodTuring::FindSwitch(const std::vector<uint64_t> &r, const std::vector<uint64_t> &nr) {
  for (std::size_t i = 0; i < r.size(); ++i) {
    if (i + 1 == r.size() || r[i + 1] != r[i] + 1) {
      // Last count, or Nr(r + 1) is 0 so the Turing estimate is unusable.
      switch_at_ = r[i];
      return;
    }
    double next = static_cast<double>(r[i] + 1);
    double smooth_r_star = next * SmoothedNr(next) / SmoothedNr(static_cast<double>(r[i]));
    double unsmooth_r_star = next * static_cast<double>(nr[i + 1]) / static_cast<double>(nr[i]);
    double std_dev = std::sqrt(TuringVariance(static_cast<double>(r[i]), static_cast<double>(nr[i]), static_cast<double>(nr[i + 1])));
    if (std::fabs(unsmooth_r_star - smooth_r_star) <= kSignificance * std_dev) {
      switch_at_ = r[i];
      return;
    }
  }
}

void SimpleGoodTuring::Renormalize(const std::vector<uint64_t> &r, const std::vector<uint64_t> &nr) {
  double seen = 0.0;
  for (std::size_t i = 0; i < r.size(); ++i) {
    seen += static_cast<double>(nr[i]) * ProbMeasure(r[i]);
  }
  if (seen != 0.0) renormal_ = (1.0 - ProbMeasure(0)) / seen;
}

double SimpleGoodTuring::SmoothedNr(double r) const {
  return std::exp(intercept_ + slope_ * std::log(r));
}

double SimpleGoodTuring::AdjustedCount(uint64_t count) const {
  double expected, expected_next;
  if (count < switch_at_) {
    expected = static_cast<double>(Nr(count));
    expected_next = static_cast<double>(Nr(count + 1));
  } else {
    expected = SmoothedNr(static_cast<double>(count));
    expected_next = SmoothedNr(static_cast<double>(count + 1));
  }
  if (expected == 0.0) return 0.0;
  return static_cast<double>(count + 1) * expected_next / expected;
}

double SimpleGoodTuring::ProbMeasure(uint64_t count) const {
  if (!count) {
    if (!total_) return 1.0;
    return static_cast<double>(Nr(1)) / static_cast<double>(total_);
  }
  if (!total_) return 0.0;
  return AdjustedCount(count) / static_cast<double>(total_);
}

double SimpleGoodTuring::UnseenMass() const {
  return ProbMeasure(0);
}

double SimpleGoodTuring::SeenProb(uint64_t count) const {
  return ProbMeasure(count) * renormal_;
}

double SimpleGoodTuring::Check() const {
  double sum = UnseenMass();
  for (uint64_t r = 1; r < nr_.size(); ++r) {
    if (nr_[r]) sum += static_cast<double>(nr_[r]) * SeenProb(r);
  }
  return sum;
}

} // namespace lmstat
