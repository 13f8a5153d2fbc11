#include "lmstat/model.hh"

#include "lmstat/exception.hh"

#include <boost/scoped_ptr.hpp>

#include <cmath>
#include <limits>

#define BOOST_TEST_MODULE LanguageModelTest
#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>

namespace lmstat {
namespace {

std::vector<std::string> Split(const char *letters) {
  std::vector<std::string> ret;
  for (const char *i = letters; *i; ++i) ret.push_back(std::string(1, *i));
  return ret;
}

NGram Gram(const char *a, const char *b = NULL, const char *c = NULL) {
  NGram ret;
  ret.push_back(a);
  if (b) ret.push_back(b);
  if (c) ret.push_back(c);
  return ret;
}

NGram Context(const char *a = NULL, const char *b = NULL) {
  NGram ret;
  if (a) ret.push_back(a);
  if (b) ret.push_back(b);
  return ret;
}

// "a b c d" and "e g a d b e", padded for the order.
std::vector<NGramSentence> Training(unsigned int order) {
  std::vector<std::vector<std::string> > text;
  text.push_back(Split("abcd"));
  text.push_back(Split("egadbe"));
  std::vector<NGramSentence> ngrams;
  std::vector<std::string> vocab_text;
  PaddedEverygramPipeline(order, text, ngrams, vocab_text);
  return ngrams;
}

// e and g are left out, so they become <UNK>.
Vocabulary TestVocabulary() {
  Vocabulary vocab(1);
  const char *words[] = {"a", "b", "c", "d", "z", "<s>", "</s>"};
  vocab.Update(words, words + 7);
  return vocab;
}

Config TestConfig(unsigned int order) {
  Config config;
  config.messages = NULL;
  config.order = order;
  return config;
}

// Score over the whole vocabulary after context.
double TotalScore(const LanguageModel &model, const NGram &context) {
  std::vector<std::string> words(model.GetVocabulary().Words());
  double sum = 0.0;
  for (std::vector<std::string>::const_iterator i = words.begin(); i != words.end(); ++i) {
    sum += model.Score(*i, context);
  }
  return sum;
}

BOOST_AUTO_TEST_CASE(MLEBigram) {
  Vocabulary vocab(TestVocabulary());
  MLEModel model(TestConfig(2), &vocab);
  model.Fit(Training(2));
  BOOST_CHECK_EQUAL(8, model.GetVocabulary().size());
  BOOST_CHECK_CLOSE(1.0, model.Score("d", Context("c")), 0.0001);
  // e is unknown, so the context is <UNK>, which was never followed by d.
  BOOST_CHECK_EQUAL(0.0, model.Score("d", Context("e")));
  BOOST_CHECK_EQUAL(-std::numeric_limits<double>::infinity(), model.LogScore("d", Context("e")));
  BOOST_CHECK_CLOSE(2.0 / 14.0, model.Score("a"), 0.0001);
  BOOST_CHECK_CLOSE(3.0 / 14.0, model.Score("y"), 0.0001);
  // Only the last token of a long context matters.
  BOOST_CHECK_CLOSE(1.0, model.Score("d", Context("a", "c")), 0.0001);
  BOOST_CHECK_EQUAL(2, model.ContextCounts(Context("a")).N());
}

BOOST_AUTO_TEST_CASE(MLEEntropy) {
  Vocabulary vocab(TestVocabulary());
  MLEModel model(TestConfig(2), &vocab);
  model.Fit(Training(2));

  std::vector<NGram> seen;
  seen.push_back(Gram("<s>", "a"));
  seen.push_back(Gram("a", "b"));
  seen.push_back(Gram("b", "e"));
  seen.push_back(Gram("e", "a"));
  seen.push_back(Gram("a", "d"));
  seen.push_back(Gram("d", "</s>"));
  BOOST_CHECK_CLOSE(1.0974937501201927, model.Entropy(seen), 0.0001);
  BOOST_CHECK_CLOSE(2.139826387867326, model.Perplexity(seen), 0.0001);

  std::vector<NGram> unigrams;
  const char *tokens[] = {"<s>", "a", "c", "-", "d", "c", "</s>"};
  for (unsigned int i = 0; i < 7; ++i) unigrams.push_back(Gram(tokens[i]));
  BOOST_CHECK_CLOSE(3.0095031362402964, model.Entropy(unigrams), 0.0001);
  BOOST_CHECK_CLOSE(8.052870516514687, model.Perplexity(unigrams), 0.0001);

  std::vector<NGram> unseen;
  unseen.push_back(Gram("<s>", "a"));
  unseen.push_back(Gram("a", "c"));
  BOOST_CHECK(std::isinf(model.Entropy(unseen)));
  BOOST_CHECK(std::isinf(model.Perplexity(unseen)));

  BOOST_CHECK_THROW(model.Entropy(std::vector<NGram>()), util::Exception);
}

BOOST_AUTO_TEST_CASE(MLETrigram) {
  Vocabulary vocab(TestVocabulary());
  MLEModel model(TestConfig(3), &vocab);
  model.Fit(Training(3));
  BOOST_CHECK_CLOSE(1.0, model.Score("d", Context("b", "c")), 0.0001);
  BOOST_CHECK_CLOSE(2.0 / 18.0, model.Score("a"), 0.0001);
  BOOST_CHECK_CLOSE(3.0 / 18.0, model.Score("y"), 0.0001);

  const char *seen_contexts[] = {"a", "c", "<s>", "b", "<UNK>", "d"};
  for (unsigned int i = 0; i < 6; ++i) {
    BOOST_CHECK_CLOSE(1.0, TotalScore(model, Context(seen_contexts[i])), 0.0001);
  }
}

BOOST_AUTO_TEST_CASE(LidstoneBigram) {
  Vocabulary vocab(TestVocabulary());
  Config config(TestConfig(2));
  config.gamma = 0.1;
  LidstoneModel model(config, &vocab);
  model.Fit(Training(2));
  BOOST_CHECK_CLOSE(1.1 / 1.8, model.Score("d", Context("c")), 0.0001);
  BOOST_CHECK_CLOSE(2.1 / 14.8, model.Score("a"), 0.0001);
  BOOST_CHECK_CLOSE(0.1 / 14.8, model.Score("z"), 0.0001);
  BOOST_CHECK_CLOSE(3.1 / 14.8, model.Score("y"), 0.0001);

  std::vector<NGram> text;
  text.push_back(Gram("<s>", "a"));
  text.push_back(Gram("a", "c"));
  text.push_back(Gram("c", "<UNK>"));
  text.push_back(Gram("<UNK>", "d"));
  text.push_back(Gram("d", "c"));
  text.push_back(Gram("c", "</s>"));
  BOOST_CHECK_CLOSE(4.091735110643954, model.Entropy(text), 0.0001);
  BOOST_CHECK_CLOSE(17.050416908482575, model.Perplexity(text), 0.0001);

  const char *contexts[] = {"a", "c", "z", "<s>", "y", "d"};
  for (unsigned int i = 0; i < 6; ++i) {
    BOOST_CHECK_CLOSE(1.0, TotalScore(model, Context(contexts[i])), 0.0001);
  }
}

BOOST_AUTO_TEST_CASE(LidstoneTrigram) {
  Vocabulary vocab(TestVocabulary());
  Config config(TestConfig(3));
  config.gamma = 0.1;
  LidstoneModel model(config, &vocab);
  model.Fit(Training(3));
  BOOST_CHECK_CLOSE(1.1 / 1.8, model.Score("d", Context("c")), 0.0001);
  BOOST_CHECK_CLOSE(0.1 / 1.8, model.Score("e", Context("c")), 0.0001);
  BOOST_CHECK_CLOSE(1.1 / 1.8, model.Score("d", Context("b", "c")), 0.0001);
  BOOST_CHECK_CLOSE(0.1 / 1.8, model.Score("e", Context("b", "c")), 0.0001);
}

BOOST_AUTO_TEST_CASE(LaplaceBigram) {
  Vocabulary vocab(TestVocabulary());
  LaplaceModel model(TestConfig(2), &vocab);
  model.Fit(Training(2));
  BOOST_CHECK_EQUAL(1.0, model.Gamma());
  BOOST_CHECK_CLOSE(2.0 / 9.0, model.Score("d", Context("c")), 0.0001);
  BOOST_CHECK_CLOSE(3.0 / 22.0, model.Score("a"), 0.0001);
  BOOST_CHECK_CLOSE(1.0 / 22.0, model.Score("z"), 0.0001);
  BOOST_CHECK_CLOSE(4.0 / 22.0, model.Score("y"), 0.0001);

  std::vector<NGram> text;
  text.push_back(Gram("<s>", "a"));
  text.push_back(Gram("a", "c"));
  text.push_back(Gram("c", "<UNK>"));
  text.push_back(Gram("<UNK>", "d"));
  text.push_back(Gram("d", "c"));
  text.push_back(Gram("c", "</s>"));
  BOOST_CHECK_CLOSE(3.1275109843640014, model.Entropy(text), 0.0001);
  BOOST_CHECK_CLOSE(8.73925915309143, model.Perplexity(text), 0.0001);
}

BOOST_AUTO_TEST_CASE(WittenBellTrigram) {
  Vocabulary vocab(TestVocabulary());
  WittenBellInterpolated model(TestConfig(3), &vocab);
  model.Fit(Training(3));
  BOOST_CHECK_CLOSE(1.0 / 18.0, model.Score("c"), 0.0001);
  BOOST_CHECK_EQUAL(0.0, model.Score("z"));
  BOOST_CHECK_CLOSE(3.0 / 18.0, model.Score("y"), 0.0001);
  BOOST_CHECK_CLOSE(0.2777777777777778, model.Score("c", Context("b")), 0.0001);
  BOOST_CHECK_CLOSE(0.6388888888888888, model.Score("c", Context("a", "b")), 0.0001);
  // (z, b) was never seen, so it defers to the bigram.
  BOOST_CHECK_CLOSE(0.2777777777777778, model.Score("c", Context("z", "b")), 0.0001);

  const char *contexts[] = {"a", "c", "z", "<s>", "<UNK>"};
  for (unsigned int i = 0; i < 5; ++i) {
    BOOST_CHECK_CLOSE(1.0, TotalScore(model, Context(contexts[i])), 0.0001);
  }
  BOOST_CHECK_CLOSE(1.0, TotalScore(model, Context("a", "b")), 0.0001);
  BOOST_CHECK_CLOSE(1.0, TotalScore(model, Context("z", "z")), 0.0001);
}

BOOST_AUTO_TEST_CASE(AbsoluteDiscountingBigram) {
  Vocabulary vocab(TestVocabulary());
  AbsoluteDiscountingInterpolated model(TestConfig(2), &vocab);
  model.Fit(Training(2));
  BOOST_CHECK_CLOSE(1.0 / 14.0, model.Score("c"), 0.0001);
  BOOST_CHECK_CLOSE(0.17857142857142858, model.Score("c", Context("b")), 0.0001);
  const char *contexts[] = {"a", "c", "z", "<s>", "<UNK>"};
  for (unsigned int i = 0; i < 5; ++i) {
    BOOST_CHECK_CLOSE(1.0, TotalScore(model, Context(contexts[i])), 0.0001);
  }
}

BOOST_AUTO_TEST_CASE(KneserNeyTrigram) {
  Vocabulary vocab(TestVocabulary());
  KneserNeyInterpolated model(TestConfig(3), &vocab);
  model.Fit(Training(3));
  BOOST_CHECK_CLOSE(1.0 / 14.0, model.Score("c"), 0.0001);
  BOOST_CHECK_CLOSE(3.0 / 14.0, model.Score("y"), 0.0001);
  BOOST_CHECK_CLOSE(0.45714285714285713, model.Score("c", Context("b")), 0.0001);
  BOOST_CHECK_CLOSE(0.9457142857142857, model.Score("c", Context("a", "b")), 0.0001);
  BOOST_CHECK_CLOSE(0.9142857142857143, model.Score("d", Context("c")), 0.0001);
  double score = model.Score("a", Context("z", "z"));
  BOOST_CHECK(score >= 0.0 && score <= 1.0);
}

// Order 3 over counts that stop at bigrams behaves like order 2.
BOOST_AUTO_TEST_CASE(KneserNeyBeyondCountedOrders) {
  Vocabulary vocab(TestVocabulary());
  KneserNeyInterpolated wide(TestConfig(3), &vocab);
  wide.Fit(Training(2));
  KneserNeyInterpolated narrow(TestConfig(2), &vocab);
  narrow.Fit(Training(2));
  BOOST_CHECK_CLOSE(0.45833333333333337, wide.Score("c", Context("b")), 0.0001);
  BOOST_CHECK(wide.Score("c", Context("b")) > wide.Score("c"));
  const char *words[] = {"a", "b", "c", "d", "</s>", "<UNK>"};
  const char *contexts[] = {"a", "b", "d", "<s>"};
  for (unsigned int c = 0; c < 4; ++c) {
    for (unsigned int w = 0; w < 6; ++w) {
      BOOST_CHECK_CLOSE(narrow.Score(words[w], Context(contexts[c])), wide.Score(words[w], Context(contexts[c])), 0.0001);
    }
    BOOST_CHECK_CLOSE(narrow.Score(words[0], Context(contexts[c])), wide.Score(words[0], Context("z", contexts[c])), 0.0001);
  }
}

BOOST_AUTO_TEST_CASE(VocabularyFromText) {
  MLEModel model(TestConfig(2));
  model.Fit(Training(2));
  // <s> a b c d </s> e g plus <UNK>
  BOOST_CHECK_EQUAL(9, model.GetVocabulary().size());
  BOOST_CHECK_CLOSE(0.5, model.Score("g", Context("e")), 0.0001);

  std::vector<std::vector<std::string> > text;
  text.push_back(Split("abcd"));
  text.push_back(Split("egadbe"));
  std::vector<NGramSentence> ngrams;
  std::vector<std::string> vocab_text;
  PaddedEverygramPipeline(2, text, ngrams, vocab_text);
  Config config(TestConfig(2));
  config.unk_cutoff = 2;
  MLEModel cut(config);
  cut.Fit(ngrams, &vocab_text);
  // c and g fall below the cutoff.
  BOOST_CHECK_EQUAL(7, cut.GetVocabulary().size());
  BOOST_CHECK_EQUAL("<UNK>", cut.GetVocabulary().Lookup("c"));
}

BOOST_AUTO_TEST_CASE(Generation) {
  Vocabulary vocab(TestVocabulary());
  MLEModel model(TestConfig(3), &vocab);
  model.Fit(Training(3));
  boost::mt19937 rng(7);

  std::vector<std::string> words(model.Generate(5, Context("a", "b"), rng));
  BOOST_REQUIRE_EQUAL(5, words.size());
  BOOST_CHECK_EQUAL("c", words[0]);
  BOOST_CHECK_EQUAL("d", words[1]);
  BOOST_CHECK_EQUAL("</s>", words[2]);
  BOOST_CHECK_EQUAL("</s>", words[3]);
  // (</s>, </s>) has no continuations, so this came from (</s>).
  BOOST_CHECK_EQUAL("</s>", words[4]);

  // z was never a context: fall back to the unigrams.
  std::vector<std::string> backoff(model.Generate(20, Context("z"), rng));
  BOOST_REQUIRE_EQUAL(20, backoff.size());
  for (std::vector<std::string>::const_iterator i = backoff.begin(); i != backoff.end(); ++i) {
    BOOST_CHECK(model.GetVocabulary().Contains(*i));
  }

  MLEModel empty(TestConfig(2));
  BOOST_CHECK_THROW(empty.Generate(1, Context(), rng), EmptyDistributionException);
  BOOST_CHECK(empty.Generate(0, Context(), rng).empty());
}

BOOST_AUTO_TEST_CASE(Factory) {
  Config config(TestConfig(3));
  config.model_type = KNESER_NEY;
  boost::scoped_ptr<LanguageModel> model(CreateModel(config));
  BOOST_CHECK(dynamic_cast<KneserNeyInterpolated*>(model.get()) != NULL);
  BOOST_CHECK_EQUAL(3, model->Order());

  config.model_type = LAPLACE;
  model.reset(CreateModel(config));
  BOOST_CHECK(dynamic_cast<LaplaceModel*>(model.get()) != NULL);
}

BOOST_AUTO_TEST_CASE(BadConfiguration) {
  Config config(TestConfig(0));
  BOOST_CHECK_THROW(MLEModel bad(config), ConfigurationException);
  config.order = 2;
  config.gamma = -1.0;
  BOOST_CHECK_THROW(LidstoneModel bad(config), ConfigurationException);
  config.absolute_discount = -0.5;
  BOOST_CHECK_THROW(AbsoluteDiscountingInterpolated bad(config), ConfigurationException);
  config.kneser_ney_discount = -0.5;
  BOOST_CHECK_THROW(KneserNeyInterpolated bad(config), ConfigurationException);
  config.unk_cutoff = 0;
  BOOST_CHECK_THROW(MLEModel bad(config), ConfigurationException);
}

} // namespace
} // namespace lmstat
