#include "lmstat/dictionary_prob_dist.hh"
#include "lmstat/estimators.hh"
#include "lmstat/freq_dist.hh"
#include "lmstat/heldout.hh"
#include "lmstat/simple_good_turing.hh"

#include <boost/program_options.hpp>
#include <boost/ptr_container/ptr_vector.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int.hpp>
#include <boost/random/variate_generator.hpp>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <stdint.h>

namespace {

typedef lmstat::FreqDist<unsigned int> Counts;
typedef lmstat::ProbDist<unsigned int> Dist;

// Outcomes are the sum of two uniform draws, which gives a triangular
// distribution over 1 through samples.
void SampleOutcomes(unsigned int samples, uint64_t outcomes, boost::mt19937 &rng, Counts &out) {
  boost::uniform_int<unsigned int> first(1, (1 + samples) / 2), second(0, samples / 2);
  boost::variate_generator<boost::mt19937&, boost::uniform_int<unsigned int> > draw_first(rng, first), draw_second(rng, second);
  for (uint64_t i = 0; i < outcomes; ++i) {
    out.Increment(draw_first() + draw_second());
  }
}

// The distribution SampleOutcomes draws from.
void TrueDistribution(unsigned int samples, Counts &out) {
  for (unsigned int x = 1; x <= (1 + samples) / 2; ++x) {
    for (unsigned int y = 0; y <= samples / 2; ++y) {
      out.Increment(x + y);
    }
  }
}

void PrintCounts(const char *name, const Counts &counts) {
  std::cout << "  " << name << ":";
  const std::vector<Counts::Entry> &sorted = counts.Sorted();
  for (std::vector<Counts::Entry>::const_iterator i = sorted.begin(); i != sorted.end(); ++i) {
    std::cout << ' ' << i->first << ':' << i->second;
  }
  std::cout << '\n';
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    namespace po = boost::program_options;
    po::options_description options("Estimator demo options");
    unsigned int samples;
    uint64_t outcomes, draws;
    uint32_t seed;
    options.add_options()
      ("help,h", po::bool_switch(), "Show this help message")
      ("samples,s", po::value<unsigned int>(&samples)->default_value(6), "Number of distinct samples, numbered 1 through this")
      ("outcomes,n", po::value<uint64_t>(&outcomes)->default_value(500), "Outcomes drawn for each frequency distribution")
      ("draws,g", po::value<uint64_t>(&draws)->default_value(5000), "Samples generated from each estimator")
      ("seed", po::value<uint32_t>(&seed)->default_value(5489), "Random seed");
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, options), vm);
    if (vm["help"].as<bool>()) {
      std::cerr <<
        "Samples a random process three times and compares every estimator's\n"
        "probabilities against the true distribution.\n\n";
      std::cerr << options << std::endl;
      return 1;
    }
    po::notify(vm);
    if (samples < 1) {
      std::cerr << "--samples must be at least 1" << std::endl;
      return 1;
    }

    boost::mt19937 rng(seed);
    Counts fdist1, fdist2, fdist3, actual_counts;
    SampleOutcomes(samples, outcomes, rng, fdist1);
    SampleOutcomes(samples, outcomes, rng, fdist2);
    SampleOutcomes(samples, outcomes, rng, fdist3);
    TrueDistribution(samples, actual_counts);

    std::vector<const Counts*> folds;
    folds.push_back(&fdist1);
    folds.push_back(&fdist2);
    folds.push_back(&fdist3);

    boost::ptr_vector<Dist> dists;
    dists.push_back(new lmstat::MLEProbDist<unsigned int>(fdist1));
    dists.push_back(new lmstat::LidstoneProbDist<unsigned int>(fdist1, 0.5, samples));
    dists.push_back(new lmstat::HeldoutProbDist<unsigned int>(fdist1, fdist2, samples));
    dists.push_back(new lmstat::HeldoutProbDist<unsigned int>(fdist2, fdist1, samples));
    dists.push_back(new lmstat::CrossValidationProbDist<unsigned int>(folds, samples));
    dists.push_back(new lmstat::GoodTuringProbDist<unsigned int>(fdist1));
    dists.push_back(new lmstat::SimpleGoodTuringProbDist<unsigned int>(fdist1));
    dists.push_back(new lmstat::SimpleGoodTuringProbDist<unsigned int>(fdist1, samples + 1));
    dists.push_back(new lmstat::MLEProbDist<unsigned int>(actual_counts));

    const std::size_t width = 9 * (dists.size() + 2);
    std::cout << samples << " samples (1-" << samples << "); " << outcomes << " outcomes were sampled for each FreqDist\n";
    std::cout << std::string(width, '=') << '\n';
    std::cout << "      FreqDist ";
    for (std::size_t d = 0; d + 1 < dists.size(); ++d) {
      std::cout << std::setw(8) << std::string(dists[d].Name()).substr(0, 8) << ' ';
    }
    std::cout << "|  Actual\n" << std::string(width, '-') << '\n';

    std::cout << std::fixed << std::setprecision(6);
    std::vector<double> totals(dists.size() + 1, 0.0);
    for (unsigned int s = 1; s <= samples; ++s) {
      double freq = fdist1.Freq(s);
      totals[0] += freq;
      std::cout << std::setw(3) << s << "   " << std::setw(8) << freq << ' ';
      for (std::size_t d = 0; d < dists.size(); ++d) {
        double p = dists[d].Prob(s);
        totals[d + 1] += p;
        if (d + 1 == dists.size()) std::cout << "| ";
        std::cout << std::setw(8) << p << ' ';
      }
      std::cout << '\n';
    }
    std::cout << std::string(width, '-') << "\nTotal ";
    for (std::size_t t = 0; t < totals.size(); ++t) {
      if (t == dists.size()) std::cout << "| ";
      std::cout << std::setw(8) << totals[t] << ' ';
    }
    std::cout << '\n' << std::string(width, '=') << '\n';

    PrintCounts("fdist1", fdist1);
    PrintCounts("fdist2", fdist2);
    PrintCounts("fdist3", fdist3);
    std::cout << "\nGenerating:\n";
    for (std::size_t d = 0; d < dists.size(); ++d) {
      Counts generated;
      for (uint64_t i = 0; i < draws; ++i) {
        generated.Increment(dists[d].Generate(rng, &std::cerr));
      }
      std::cout << std::setw(20) << dists[d].Name();
      PrintCounts("", generated);
    }
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
}
