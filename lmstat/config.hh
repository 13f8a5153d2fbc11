#ifndef LMSTAT_CONFIG__
#define LMSTAT_CONFIG__

/* Configuration for language models.  Separate header to reduce pollution. */

#include <iostream>
#include <string>

#include <stdint.h>

namespace lmstat {

typedef enum {MLE, LIDSTONE, LAPLACE, WITTEN_BELL, ABSOLUTE_DISCOUNTING, KNESER_NEY} ModelType;

struct Config {
  // Where to log messages.  Set to NULL for silence.
  std::ostream *messages;

  // Only consulted by CreateModel.
  ModelType model_type;

  // Longest n-gram scored.  Contexts are truncated to order - 1 tokens.
  unsigned int order;

  // Pseudo-count added to every word.  LIDSTONE only; LAPLACE always uses 1.
  double gamma;

  // Subtracted from every observed count.
  double absolute_discount;
  double kneser_ney_discount;

  // Words seen fewer times than this become unknown_label.
  uint64_t unk_cutoff;
  std::string unknown_label;

  // Defaults.
  Config() :
    messages(&std::cerr),
    model_type(MLE),
    order(3),
    gamma(0.1),
    absolute_discount(0.75),
    kneser_ney_discount(0.1),
    unk_cutoff(1),
    unknown_label("<UNK>") {}
};

} // namespace lmstat

#endif // LMSTAT_CONFIG__
