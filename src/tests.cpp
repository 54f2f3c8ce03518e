#include <absl/container/flat_hash_set.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../corpus.hpp"
#include "../matrix.hpp"
#include "../sampler.hpp"
#include "../scoring.hpp"
#include "../streamer.hpp"
#include "../tokenizer.hpp"
#include "../tools.hpp"
#include "../vocab.hpp"

const std::string DSAVE = "/tmp/sensediff_test/";

const std::vector<std::string> REFERENCE = {"cat sat mat", "dog sat log"};
const std::vector<std::string> FOCUS = {"cat sat log", "dog sat mat"};

void write_lines(const std::string &fname,
                 const std::vector<std::string> &lines) {
  std::ofstream out(fname);
  for (const auto &line : lines) {
    out << line << "\n";
  }
}

snsd::Config small_config(const std::string &output = "") {
  snsd::Config config;
  config.floor = 0;
  config.window_size = 4;
  config.output = output;
  return config;
}

std::vector<u32> iota(u32 n) {
  std::vector<u32> v(n);
  for (u32 i = 0; i < n; ++i)
    v[i] = i;
  return v;
}

/////////////////////////////////////////////////////////////////////////////
//                                tokenizer                                //
/////////////////////////////////////////////////////////////////////////////

TEST(Tokenizer, SplitsPunctuation) {
  snsd::WordTokenizer tok;
  auto tokens = tok.tokenize("The cat, sat...  on\tthe mat.");
  std::vector<std::string> expected = {"The", "cat", ",",   "sat", "...",
                                       "on",  "the", "mat", "."};
  ASSERT_EQ(tokens, expected);
  ASSERT_TRUE(tok.tokenize("   ").empty());
}

TEST(Tokenizer, Stopwords) {
  snsd::WordTokenizer tok;
  ASSERT_EQ(tok.stopwords().count("the"), 1);
  ASSERT_EQ(tok.stopwords().count("don't"), 1);
  ASSERT_EQ(tok.stopwords().count("cat"), 0);

  auto fname = DSAVE + "stopwords.txt";
  write_lines(fname, {"foo", " bar ", ""});
  snsd::WordTokenizer custom(fname);
  ASSERT_EQ(custom.stopwords().size(), 2);
  ASSERT_EQ(custom.stopwords().count("bar"), 1);
}

/////////////////////////////////////////////////////////////////////////////
//                               vocabulary                                //
/////////////////////////////////////////////////////////////////////////////

TEST(Vocabulary, FloorAndStopwords) {
  snsd::WordTokenizer tok;
  std::vector<std::string> lines = {"the apple banana", "apple cherry the",
                                    "apple"};

  auto sentences = snsd::preprocess(lines, tok, 1);
  std::vector<snsd::Sentence> expected = {{"apple"}, {"apple"}, {"apple"}};
  ASSERT_EQ(sentences, expected);

  sentences = snsd::preprocess(lines, tok, 0);
  expected = {{"apple", "banana"}, {"apple", "cherry"}, {"apple"}};
  ASSERT_EQ(sentences, expected);

  sentences = snsd::preprocess({"the of", "apple"}, tok, 0);
  expected = {{"apple"}};
  ASSERT_EQ(sentences, expected);
}

TEST(Vocabulary, DenseIds) {
  snsd::WordTokenizer tok;
  snsd::Corpus corpus(REFERENCE, FOCUS, small_config(), tok);
  const auto &vocab = corpus.vocab();

  ASSERT_EQ(vocab.size(), 5);
  std::vector<std::string> words = {"cat", "sat", "mat", "dog", "log"};
  for (u32 id = 0; id < vocab.size(); ++id) {
    ASSERT_EQ(vocab.word(id), words[id]);
    ASSERT_EQ(vocab.id(vocab.word(id)), id);
  }
  ASSERT_EQ(vocab.count(vocab.id("sat")), 4);
  ASSERT_EQ(vocab.count(vocab.id("cat")), 2);

  absl::flat_hash_set<u32> used;
  for (const auto &doc : corpus.docs()) {
    used.insert(doc.words().begin(), doc.words().end());
  }
  ASSERT_EQ(used.size(), vocab.size());

  ASSERT_EQ(corpus.docs().size(), 4);
  ASSERT_EQ(corpus.docs()[0].origin(), snsd::Origin::reference);
  ASSERT_EQ(corpus.docs()[2].origin(), snsd::Origin::focus);
  ASSERT_EQ(corpus.docs()[2].index(), 0);
  std::vector<u32> ids = {0, 1, 4};
  ASSERT_EQ(corpus.docs()[2].words(), ids);
}

TEST(Vocabulary, FocusExtendsIds) {
  snsd::WordTokenizer tok;
  snsd::Corpus corpus({"cat sat"}, {"dog sat", "cat"}, small_config(), tok);
  const auto &vocab = corpus.vocab();

  ASSERT_EQ(vocab.size(), 3);
  ASSERT_EQ(vocab.id("cat"), 0);
  ASSERT_EQ(vocab.id("sat"), 1);
  ASSERT_EQ(vocab.id("dog"), 2);
  ASSERT_EQ(vocab.count(0), 2);
  ASSERT_EQ(vocab.count(2), 1);
}

TEST(Vocabulary, RareWordsNeverKept) {
  snsd::WordTokenizer tok;
  auto config = small_config();
  config.floor = 1;
  snsd::Corpus corpus({"cat sat mat", "dog sat log", "cat sat"}, {}, config,
                      tok);
  const auto &vocab = corpus.vocab();

  ASSERT_EQ(vocab.size(), 2);
  ASSERT_FALSE(vocab.find("mat").has_value());
  ASSERT_FALSE(vocab.find("dog").has_value());
  ASSERT_THROW(vocab.id("log"), std::logic_error);
  ASSERT_THROW(vocab.word(2), std::logic_error);
}

TEST(Vocabulary, InputErrors) {
  snsd::WordTokenizer tok;
  auto config = small_config();
  config.reference = DSAVE + "missing.txt";
  ASSERT_THROW(snsd::Corpus(config, tok), std::runtime_error);

  config.reference = DSAVE + "empty.txt";
  write_lines(config.reference, {});
  ASSERT_THROW(snsd::Corpus(config, tok), std::runtime_error);

  ASSERT_THROW(snsd::Corpus({"the a of", "is"}, {}, small_config(), tok),
               std::runtime_error);
}

TEST(Vocabulary, LoadsFiles) {
  snsd::WordTokenizer tok;
  auto config = small_config();
  config.reference = DSAVE + "reference.txt";
  config.focus = DSAVE + "focus.txt";
  write_lines(config.reference, REFERENCE);
  write_lines(config.focus, FOCUS);

  snsd::Corpus corpus(config, tok);
  ASSERT_EQ(corpus.vocab().size(), 5);
  ASSERT_EQ(corpus.docs().size(), 4);
}

/////////////////////////////////////////////////////////////////////////////
//                           co-occurrence, ppmi                           //
/////////////////////////////////////////////////////////////////////////////

TEST(Cooccurrence, ContextAndCenter) {
  snsd::Vocabulary vocab;
  vocab.add("A");
  vocab.add("B");
  vocab.add("C");
  std::vector<snsd::Sentence> sentences = {{"A", "B", "C"}};

  for (u32 window : {4, 5, 10}) {
    auto m = snsd::cooccurrences(sentences, vocab, window);
    ASSERT_EQ(m.get(1, 0), 1) << window; // (B, A)
    ASSERT_EQ(m.get(0, 1), 1) << window; // (A, B)
    ASSERT_EQ(m.get(0, 2), 1) << window;
    ASSERT_EQ(m.get(1, 2), 1) << window;
    // последний токен в окно не попадает
    ASSERT_EQ(m.get(2, 0), 0) << window;
    ASSERT_EQ(m.get(2, 1), 0) << window;
    for (u32 i = 0; i < 3; ++i)
      ASSERT_EQ(m.get(i, i), 0);
    ASSERT_EQ(m.nonzeros(), 4);
    ASSERT_EQ(m.total(), 4);
  }

  // при окне 2 половина окна 1: (A, B) и (B, C)
  auto m = snsd::cooccurrences(sentences, vocab, 2);
  ASSERT_EQ(m.get(0, 1), 1);
  ASSERT_EQ(m.get(1, 2), 1);
  ASSERT_EQ(m.nonzeros(), 2);

  ASSERT_THROW(snsd::cooccurrences(sentences, vocab, 0),
               std::invalid_argument);
}

TEST(Cooccurrence, NoSelfPairs) {
  snsd::Vocabulary vocab;
  vocab.add("a");
  vocab.add("b");
  auto m = snsd::cooccurrences({{"a", "b", "a", "b"}}, vocab, 10);
  ASSERT_EQ(m.get(0, 0), 0);
  ASSERT_EQ(m.get(1, 1), 0);
  ASSERT_EQ(m.get(1, 0), 2);
  ASSERT_EQ(m.get(0, 1), 4);
}

TEST(Cooccurrence, SkipsUnknownWords) {
  snsd::Vocabulary vocab;
  vocab.add("a");
  vocab.add("b");
  auto m = snsd::cooccurrences({{"a", "x", "b", "c"}}, vocab, 10);
  ASSERT_EQ(m.get(0, 1), 1);
  ASSERT_EQ(m.get(1, 0), 1);
  ASSERT_EQ(m.nonzeros(), 2);
}

TEST(Cooccurrence, SmallCorpus) {
  snsd::WordTokenizer tok;
  snsd::Corpus corpus(REFERENCE, FOCUS, small_config(), tok);
  const auto &vocab = corpus.vocab();
  const auto &m = corpus.collocations();
  auto cell = [&](const char *l, const char *r) {
    return m.get(vocab.id(l), vocab.id(r));
  };

  ASSERT_EQ(m.size(), 5);
  ASSERT_EQ(m.total(), 16);
  ASSERT_EQ(m.nonzeros(), 10);
  ASSERT_EQ(cell("sat", "cat"), 2);
  ASSERT_EQ(cell("cat", "sat"), 2);
  ASSERT_EQ(cell("sat", "dog"), 2);
  ASSERT_EQ(cell("dog", "sat"), 2);
  ASSERT_EQ(cell("cat", "mat"), 1);
  ASSERT_EQ(cell("sat", "mat"), 2);
  ASSERT_EQ(cell("mat", "sat"), 0);

  // по умолчанию сэмплеру отдаются сырые счетчики
  ASSERT_EQ(corpus.weighting(), snsd::Weighting::raw);
  ASSERT_TRUE(corpus.association() == corpus.collocations());
  ASSERT_EQ(corpus.association_row(vocab.id("cat")).size(), 3);
  ASSERT_THROW(corpus.association_row(5), std::logic_error);
  ASSERT_THROW(m.row(5), std::out_of_range);
}

TEST(Ppmi, SmallCorpus) {
  snsd::WordTokenizer tok;
  auto config = small_config();
  config.weighting = snsd::Weighting::ppmi;
  snsd::Corpus corpus(REFERENCE, FOCUS, config, tok);
  const auto &vocab = corpus.vocab();
  const auto &p = corpus.ppmi();

  // log2(16 / (1 * 2 * 2)) = 2, log2(16 / (2 * 4 * 2)) = 0
  ASSERT_DOUBLE_EQ(p.get(vocab.id("cat"), vocab.id("mat")), 2);
  ASSERT_DOUBLE_EQ(p.get(vocab.id("dog"), vocab.id("log")), 2);
  ASSERT_EQ(p.get(vocab.id("sat"), vocab.id("cat")), 0);
  ASSERT_EQ(p.nonzeros(), 4);

  auto total = corpus.collocations().total();
  corpus.collocations().for_each([&](u32 i, u32 j, double f) {
    auto expected = std::max(
        0., std::log2(total / (f * vocab.count(i) * vocab.count(j))));
    ASSERT_GE(p.get(i, j), 0);
    ASSERT_NEAR(p.get(i, j), expected, 1e-12);
  });

  ASSERT_TRUE(corpus.association() == corpus.ppmi());
  auto row = corpus.association_row(vocab.id("cat"));
  ASSERT_EQ(row.size(), 2);
  ASSERT_EQ(row[0].col, vocab.id("mat"));
  ASSERT_DOUBLE_EQ(row[0].weight, 2);
}

TEST(Ppmi, NegativeIsClipped) {
  snsd::Vocabulary vocab;
  vocab.add("a", 10);
  vocab.add("b", 10);
  vocab.add("c", 1);
  snsd::Counts counts;
  counts[{0, 1}] = 1;
  counts[{2, 0}] = 1;
  snsd::SparseMatrix cooc(3, counts);

  // log2(2 / (1 * 10 * 10)) < 0, log2(2 / (1 * 1 * 10)) < 0
  auto p = snsd::ppmi(cooc, vocab);
  ASSERT_EQ(p.get(0, 1), 0);
  ASSERT_EQ(p.get(2, 0), 0);
  ASSERT_EQ(p.nonzeros(), 0);

  snsd::Vocabulary other;
  other.add("a");
  ASSERT_THROW(snsd::ppmi(cooc, other), std::logic_error);
}

TEST(Ppmi, NonFiniteCellFails) {
  snsd::Vocabulary vocab;
  vocab.add("a", 3);
  vocab.add("b", 2);
  // сумма ячеек нулевая, доли получаются inf / inf
  snsd::Counts counts;
  counts[{0, 1}] = 1;
  counts[{1, 0}] = -1;
  snsd::SparseMatrix cooc(2, counts);
  ASSERT_EQ(cooc.total(), 0);
  ASSERT_THROW(snsd::ppmi(cooc, vocab), std::domain_error);
}

TEST(SparseMatrix, Layout) {
  snsd::Counts counts;
  counts[{2, 1}] = 3;
  counts[{0, 2}] = 1;
  counts[{2, 0}] = 5;
  counts[{1, 1}] = 0;
  snsd::SparseMatrix m(3, counts);

  ASSERT_EQ(m.nonzeros(), 3);
  ASSERT_EQ(m.row(1).size(), 0);
  auto row = m.row(2);
  ASSERT_EQ(row.size(), 2);
  ASSERT_EQ(row[0].col, 0);
  ASSERT_EQ(row[1].col, 1);
  ASSERT_EQ(m.get(2, 1), 3);
  ASSERT_EQ(m.total(), 9);

  counts[{3, 0}] = 1;
  ASSERT_THROW(snsd::SparseMatrix(3, counts), std::logic_error);
}

/////////////////////////////////////////////////////////////////////////////
//                                   crp                                   //
/////////////////////////////////////////////////////////////////////////////

TEST(Crp, PartitionCoversDocument) {
  for (double alpha : {0.1, 1.0, 10.0}) {
    for (unsigned seed = 0; seed < 20; ++seed) {
      snsd::Document doc(0, std::vector<u32>(30, 7),
                         snsd::Origin::reference);
      std::mt19937_64 gen(seed);
      doc.init_partition(alpha, gen);
      ASSERT_NO_THROW(doc.check_partition());

      std::vector<u32> all;
      for (const auto &table : doc.partition()) {
        ASSERT_FALSE(table.empty());
        // позиции внутри кластера идут по порядку
        ASSERT_TRUE(std::is_sorted(table.begin(), table.end()));
        all.insert(all.end(), table.begin(), table.end());
      }
      std::sort(all.begin(), all.end());
      ASSERT_EQ(all, iota(30));
    }
  }
}

TEST(Crp, TinyAlphaGivesOneCluster) {
  for (unsigned seed = 0; seed < 20; ++seed) {
    snsd::Document doc(0, iota(30), snsd::Origin::focus);
    std::mt19937_64 gen(seed);
    doc.init_partition(1e-9, gen);
    ASSERT_EQ(doc.partition().size(), 1);
    ASSERT_EQ(doc.partition()[0], iota(30));
  }
}

TEST(Crp, HugeAlphaGivesSingletons) {
  for (unsigned seed = 0; seed < 20; ++seed) {
    snsd::Document doc(0, iota(30), snsd::Origin::focus);
    std::mt19937_64 gen(seed);
    doc.init_partition(1e12, gen);
    ASSERT_EQ(doc.partition().size(), 30);
  }
}

TEST(Crp, ExpectedClusterCount) {
  // E[K] = sum alpha / (alpha + i), i = 0..n-1
  const double alpha = 1.0;
  const u32 n = 10;
  double expected = 0;
  for (u32 i = 0; i < n; ++i)
    expected += alpha / (alpha + i);

  std::mt19937_64 gen(12345);
  const int runs = 4000;
  double sum = 0;
  for (int r = 0; r < runs; ++r) {
    snsd::Document doc(0, iota(n), snsd::Origin::reference);
    doc.init_partition(alpha, gen);
    sum += doc.partition().size();
  }
  ASSERT_NEAR(sum / runs, expected, 0.1);
}

TEST(Crp, Reproducible) {
  snsd::Document a(0, iota(50), snsd::Origin::reference);
  snsd::Document b(0, iota(50), snsd::Origin::reference);
  std::mt19937_64 gen1(42), gen2(42);
  a.init_partition(1.0, gen1);
  b.init_partition(1.0, gen2);
  ASSERT_EQ(a.partition(), b.partition());
}

TEST(Crp, InvalidUse) {
  snsd::Document doc(3, iota(5), snsd::Origin::reference);
  std::mt19937_64 gen(1);
  ASSERT_THROW(doc.init_partition(0, gen), std::invalid_argument);
  ASSERT_THROW(doc.init_partition(-1, gen), std::invalid_argument);
  doc.init_partition(1.0, gen);
  ASSERT_THROW(doc.init_partition(1.0, gen), std::logic_error);

  snsd::Document single(0, {4}, snsd::Origin::reference);
  single.init_partition(1.0, gen);
  ASSERT_EQ(single.partition(), snsd::Partition{snsd::Cluster{0}});
}

TEST(Crp, SeededPerDocument) {
  snsd::WordTokenizer tok;
  snsd::Corpus both(REFERENCE, FOCUS, small_config(), tok);
  snsd::Corpus again(REFERENCE, FOCUS, small_config(), tok);
  snsd::Corpus reference(REFERENCE, {}, small_config(), tok);
  both.init_partitions(1.0, 7);
  again.init_partitions(1.0, 7);
  reference.init_partitions(1.0, 7);

  for (size_t i = 0; i < both.docs().size(); ++i) {
    ASSERT_NO_THROW(both.docs()[i].check_partition());
    ASSERT_EQ(both.docs()[i].partition(), again.docs()[i].partition());
  }
  // разбиение документа зависит только от (seed, номер документа)
  for (size_t i = 0; i < reference.docs().size(); ++i) {
    ASSERT_EQ(both.docs()[i].partition(), reference.docs()[i].partition());
  }
}

TEST(Partition, CheckDetectsViolations) {
  snsd::Document doc(1, iota(3), snsd::Origin::reference);
  ASSERT_THROW(doc.check_partition(), std::logic_error);

  doc.partition() = {{0, 1}, {2}};
  ASSERT_NO_THROW(doc.check_partition());

  doc.partition() = {{0, 1}, {1, 2}};
  ASSERT_THROW(doc.check_partition(), std::logic_error);

  doc.partition() = {{0, 1}, {3}};
  ASSERT_THROW(doc.check_partition(), std::logic_error);

  doc.partition() = {{0, 1}, {2}};
  doc.set_senses({5});
  ASSERT_THROW(doc.check_partition(), std::logic_error);
}

TEST(Partition, SensesBeforeSampling) {
  snsd::Document doc(1, iota(3), snsd::Origin::reference);
  ASSERT_FALSE(doc.has_senses());
  ASSERT_THROW(doc.sense_of(0), std::logic_error);
  ASSERT_THROW(doc.senses(), std::logic_error);

  doc.set_senses({4, 2});
  ASSERT_EQ(doc.sense_of(1), 2);
  ASSERT_THROW(doc.sense_of(2), std::logic_error);
}

/////////////////////////////////////////////////////////////////////////////
//                                 novelty                                 //
/////////////////////////////////////////////////////////////////////////////

TEST(Novelty, MaxOverObservedSenses) {
  snsd::Word w("bank", 0, 5);
  for (int i = 0; i < 3; ++i)
    w.add(1, snsd::Origin::reference);
  w.add(1, snsd::Origin::focus);
  w.add(3, snsd::Origin::focus);
  w.add(3, snsd::Origin::focus);

  ASSERT_EQ(w.total(), 6);
  ASSERT_EQ(w.count(1, snsd::Origin::reference), 3);
  auto n = w.calculate();
  ASSERT_DOUBLE_EQ(n.score, 1);
  ASSERT_EQ(n.sense, 3);
}

TEST(Novelty, EvenSplitIsZero) {
  snsd::Word w("cell", 0, 2);
  w.add(0, snsd::Origin::reference);
  w.add(0, snsd::Origin::focus);
  auto n = w.calculate();
  ASSERT_DOUBLE_EQ(n.score, 0);
  ASSERT_EQ(n.sense, 0);

  snsd::Word old("thou", 1, 3);
  old.add(2, snsd::Origin::reference);
  ASSERT_DOUBLE_EQ(old.calculate().score, -1);
}

TEST(Novelty, Bounds) {
  std::mt19937 gen(3);
  std::uniform_int_distribution<int> pick(0, 3);
  for (int k = 0; k < 100; ++k) {
    snsd::Word w("w", 0, 4);
    for (int i = 0; i < 10; ++i) {
      w.add(pick(gen), i % 3 ? snsd::Origin::reference : snsd::Origin::focus);
    }
    auto n = w.calculate();
    ASSERT_GE(n.score, -1);
    ASSERT_LE(n.score, 1);
    ASSERT_LT(n.sense, 4);
  }
}

TEST(Novelty, Errors) {
  snsd::Word w("ghost", 0, 3);
  ASSERT_THROW(w.calculate(), std::domain_error);
  ASSERT_THROW(w.add(3, snsd::Origin::focus), std::logic_error);

  // calculate не меняет слово, счетчики закрывает только freeze
  snsd::Word v("seen", 1, 3);
  v.add(0, snsd::Origin::focus);
  v.calculate();
  ASSERT_FALSE(v.is_frozen());
  v.add(1, snsd::Origin::reference);
  ASSERT_EQ(v.total(), 2);
  v.freeze();
  ASSERT_THROW(v.add(0, snsd::Origin::focus), std::logic_error);
  ASSERT_DOUBLE_EQ(v.calculate().score, 0);
}

TEST(Novelty, Divergence) {
  snsd::Word same("same", 0, 2);
  same.add(0, snsd::Origin::reference);
  same.add(1, snsd::Origin::reference);
  same.add(0, snsd::Origin::focus);
  same.add(1, snsd::Origin::focus);
  ASSERT_NEAR(*same.divergence(), 0, 1e-12);

  snsd::Word moved("moved", 1, 2);
  moved.add(0, snsd::Origin::reference);
  moved.add(1, snsd::Origin::focus);
  ASSERT_NEAR(*moved.divergence(), 1, 1e-12);

  snsd::Word fresh("fresh", 2, 2);
  fresh.add(1, snsd::Origin::focus);
  ASSERT_FALSE(fresh.divergence().has_value());
}

// все документы в смысле 0, кроме целевого "dog sat mat" в смысле 1
void assign_senses(snsd::Corpus &corpus) {
  for (auto &doc : corpus.docs()) {
    doc.partition() = {iota(static_cast<u32>(doc.size()))};
    bool moved = doc.origin() == snsd::Origin::focus && doc.index() == 1;
    doc.set_senses({moved ? 1u : 0u});
  }
}

TEST(Scoring, ScoreAndRank) {
  snsd::WordTokenizer tok;
  snsd::Corpus corpus(REFERENCE, FOCUS, small_config(), tok);
  assign_senses(corpus);

  ASSERT_EQ(snsd::count_senses(corpus), 2);
  auto words = snsd::score_words(corpus, 2);
  ASSERT_EQ(words.size(), 5);
  for (const auto &el : words) {
    ASSERT_EQ(el.second.total(),
              corpus.vocab().count(corpus.vocab().id(el.first)));
  }
  for (const auto &el : words) {
    ASSERT_TRUE(el.second.is_frozen()) << el.first;
  }
  ASSERT_THROW(words.at("cat").add(0, snsd::Origin::focus), std::logic_error);
  const auto &sat = words.at("sat");
  ASSERT_EQ(sat.count(0, snsd::Origin::reference), 2);
  ASSERT_EQ(sat.count(0, snsd::Origin::focus), 1);
  ASSERT_EQ(sat.count(1, snsd::Origin::focus), 1);

  auto ranked = snsd::rank(words, 50);
  std::vector<std::string> order;
  for (const auto &r : ranked)
    order.push_back(r.word);
  std::vector<std::string> expected = {"dog", "mat", "sat", "cat", "log"};
  ASSERT_EQ(order, expected);
  ASSERT_DOUBLE_EQ(ranked[0].novelty.score, 1);
  ASSERT_EQ(ranked[0].novelty.sense, 1);
  ASSERT_DOUBLE_EQ(ranked[3].novelty.score, 0);

  ASSERT_EQ(snsd::rank(words, 2).size(), 2);
  ASSERT_EQ(snsd::rank(words, 2)[1].word, "mat");

  auto targets = snsd::rank(words, 50, {"log", "sat", "zebra"});
  ASSERT_EQ(targets.size(), 2);
  ASSERT_EQ(targets[0].word, "sat");
  ASSERT_EQ(targets[1].word, "log");
}

TEST(Scoring, SensesRequired) {
  snsd::WordTokenizer tok;
  snsd::Corpus corpus(REFERENCE, FOCUS, small_config(), tok);
  corpus.init_partitions(1.0, 1);
  ASSERT_THROW(snsd::count_senses(corpus), std::logic_error);
  ASSERT_THROW(snsd::score_words(corpus, 3), std::logic_error);
}

TEST(Scoring, Targets) {
  auto fname = DSAVE + "targets.txt";
  write_lines(fname, {"bank", "  cell ", ""});
  auto targets = snsd::load_targets(fname);
  ASSERT_EQ(targets.size(), 2);
  ASSERT_EQ(targets.count("cell"), 1);
  ASSERT_THROW(snsd::load_targets(DSAVE + "nope.txt"), std::runtime_error);
}

/////////////////////////////////////////////////////////////////////////////
//                                 sampler                                 //
/////////////////////////////////////////////////////////////////////////////

// переносит каждый токен в первый кластер документа
class GatherSampler : public snsd::SenseSampler {
public:
  size_t calls = 0, context = 0;
  u32 vocab_size = 0;

  void init(u32 vsize, std::vector<snsd::Document> &docs) override {
    vocab_size = vsize;
    for (auto &doc : docs)
      doc.set_senses(iota(static_cast<u32>(doc.partition().size())));
  }

  void sample(snsd::Document &doc, u32 pos,
              absl::Span<const snsd::Cell> ctx) override {
    calls++;
    context += ctx.size();
    auto &partition = doc.partition();
    for (auto &table : partition) {
      table.erase(std::remove(table.begin(), table.end(), pos), table.end());
    }
    partition[0].push_back(pos);
  }

  u32 num_senses() const override { return 1; }
};

// теряет токены
class DropSampler : public GatherSampler {
public:
  void sample(snsd::Document &doc, u32 pos,
              absl::Span<const snsd::Cell>) override {
    for (auto &table : doc.partition()) {
      table.erase(std::remove(table.begin(), table.end(), pos), table.end());
    }
  }
};

TEST(Sampler, SweepsEveryToken) {
  snsd::WordTokenizer tok;
  auto config = small_config(DSAVE + "sampler");
  config.max_iters = 2;
  config.save_every = 1;
  snsd::Corpus corpus(REFERENCE, FOCUS, config, tok);
  corpus.init_partitions(config.alpha, config.seed);

  size_t expected_context = 0;
  for (const auto &doc : corpus.docs()) {
    for (auto id : doc.words())
      expected_context += corpus.association_row(id).size();
  }

  GatherSampler sampler;
  snsd::run_sampler(corpus, sampler, config);
  ASSERT_EQ(sampler.vocab_size, 5);
  ASSERT_EQ(sampler.calls, 2 * 12);
  ASSERT_EQ(sampler.context, 2 * expected_context);
  for (const auto &doc : corpus.docs()) {
    ASSERT_EQ(doc.partition()[0].size(), doc.size());
    ASSERT_TRUE(doc.has_senses());
  }

  auto dirs = snsd::list_dirs(config.output, "corpus_");
  ASSERT_EQ(dirs.size(), 2);
  ASSERT_EQ(dirs[1], config.output + "/corpus_2");
  ASSERT_EQ(corpus.saves(), 2);
}

TEST(Sampler, BrokenPartitionIsFatal) {
  snsd::WordTokenizer tok;
  auto config = small_config();
  config.save_every = 0;
  snsd::Corpus corpus(REFERENCE, FOCUS, config, tok);
  corpus.init_partitions(config.alpha, config.seed);

  DropSampler sampler;
  ASSERT_THROW(snsd::run_sampler(corpus, sampler, config), std::logic_error);
}

/////////////////////////////////////////////////////////////////////////////
//                                snapshots                                //
/////////////////////////////////////////////////////////////////////////////

TEST(Snapshot, SaveLoad) {
  snsd::WordTokenizer tok;
  auto config = small_config(DSAVE + "snapshots");
  config.weighting = snsd::Weighting::ppmi;
  snsd::Corpus corpus(REFERENCE, FOCUS, config, tok);
  corpus.init_partitions(1.0, 11);

  ASSERT_EQ(corpus.save(), config.output + "/corpus_1");
  corpus.docs()[0].set_senses(iota(corpus.docs()[0].partition().size()));
  auto dsave = corpus.save();
  ASSERT_EQ(dsave, config.output + "/corpus_2");

  auto loaded = snsd::Corpus::load(dsave);
  ASSERT_EQ(loaded.saves(), 2);
  ASSERT_EQ(loaded.floor(), 0);
  ASSERT_EQ(loaded.window_size(), 4);
  ASSERT_EQ(loaded.weighting(), snsd::Weighting::ppmi);
  ASSERT_EQ(loaded.vocab().size(), corpus.vocab().size());
  for (u32 id = 0; id < corpus.vocab().size(); ++id) {
    ASSERT_EQ(loaded.vocab().word(id), corpus.vocab().word(id));
    ASSERT_EQ(loaded.vocab().count(id), corpus.vocab().count(id));
  }
  ASSERT_TRUE(loaded.collocations() == corpus.collocations());
  ASSERT_TRUE(loaded.ppmi() == corpus.ppmi());

  ASSERT_EQ(loaded.docs().size(), corpus.docs().size());
  for (size_t i = 0; i < corpus.docs().size(); ++i) {
    const auto &l = loaded.docs()[i], &r = corpus.docs()[i];
    ASSERT_EQ(l.index(), r.index());
    ASSERT_EQ(l.origin(), r.origin());
    ASSERT_EQ(l.words(), r.words());
    ASSERT_EQ(l.partition(), r.partition());
    ASSERT_EQ(l.has_senses(), r.has_senses());
  }
  ASSERT_EQ(loaded.docs()[0].senses(), corpus.docs()[0].senses());

  // нумерация снимков продолжается
  ASSERT_EQ(loaded.save(), config.output + "/corpus_3");
}

TEST(Snapshot, Errors) {
  ASSERT_THROW(snsd::Corpus::load(DSAVE + "no_such_snapshot"),
               std::runtime_error);

  snsd::WordTokenizer tok;
  snsd::Corpus unsaved(REFERENCE, FOCUS, small_config(), tok);
  ASSERT_THROW(unsaved.save(), std::runtime_error);

  snsd::Corpus corpus(REFERENCE, FOCUS, small_config(DSAVE + "typed"), tok);
  auto dsave = corpus.save();
  ASSERT_EQ(snsd::get_data_type((dsave + "/uni.bin").c_str()), "Unigram");
  ASSERT_EQ(snsd::get_data_type((dsave + "/cooc.bin").c_str()), "Cell");
  ASSERT_EQ(snsd::read_total<sense::Cell>(dsave + "/cooc.bin"), 10);
  auto noop = [](sense::Cell *) {};
  ASSERT_THROW(snsd::read_apply<sense::Cell>(dsave + "/uni.bin", noop),
               std::runtime_error);
}

TEST(Snapshot, PathWithSpaces) {
  auto root = DSAVE + "spaces/";
  std::filesystem::create_directories(root + "victim/keep");
  std::filesystem::create_directories(root + "data");

  snsd::WordTokenizer tok;
  auto output = root + "victim data/saves";
  snsd::Corpus corpus(REFERENCE, FOCUS, small_config(output), tok);
  ASSERT_EQ(corpus.save(), output + "/corpus_1");
  ASSERT_EQ(corpus.save(), output + "/corpus_2");

  ASSERT_TRUE(std::filesystem::exists(root + "victim/keep"));
  ASSERT_TRUE(std::filesystem::exists(root + "data"));
  ASSERT_FALSE(std::filesystem::exists(root + "victim/saves"));
  ASSERT_TRUE(std::filesystem::exists(output + "/corpus_1/info.bin"));
  ASSERT_EQ(snsd::Corpus::load(output + "/corpus_2").vocab().size(), 5);
}

TEST(Snapshot, NumberingSkipsExisting) {
  snsd::WordTokenizer tok;
  auto output = DSAVE + "numbering";
  snsd::Corpus corpus(REFERENCE, FOCUS, small_config(output), tok);
  corpus.init_partitions(1.0, 5);
  for (int i = 0; i < 3; ++i)
    corpus.save();

  // снимок из середины истории не затирает более новые
  auto old = snsd::Corpus::load(output + "/corpus_1");
  ASSERT_EQ(old.saves(), 1);
  ASSERT_EQ(old.save(), output + "/corpus_4");
  ASSERT_EQ(old.saves(), 4);

  auto dirs = snsd::list_dirs(output, "corpus_");
  ASSERT_EQ(dirs.size(), 4);
  ASSERT_EQ(dirs.back(), output + "/corpus_4");
  ASSERT_EQ(snsd::Corpus::load(output + "/corpus_2").saves(), 2);
  ASSERT_EQ(snsd::Corpus::load(output + "/corpus_3").saves(), 3);

  // второй экземпляр, пишущий в тот же каталог
  ASSERT_EQ(corpus.save(), output + "/corpus_5");

  // недописанный снимок удаляется, на нумерацию не влияет
  std::filesystem::create_directories(output + "/corpus_6.tmp/junk");
  ASSERT_EQ(corpus.save(), output + "/corpus_6");
  ASSERT_FALSE(std::filesystem::exists(output + "/corpus_6/junk"));
}

TEST(Snapshot, UnknownWordIdFails) {
  snsd::WordTokenizer tok;
  auto output = DSAVE + "truncated";
  snsd::Corpus corpus(REFERENCE, FOCUS, small_config(output), tok);
  corpus.init_partitions(1.0, 2);
  auto dsave = corpus.save();

  // словарь из двух слов при документах с идентификаторами до 4
  {
    sense::CorpusInfo info;
    info.set_save_count(1);
    info.set_window_size(4);
    info.set_vocab_size(2);
    info.set_num_docs(corpus.docs().size());
    info.set_weighting("raw");
    snsd::OFStreamer<sense::CorpusInfo> os(dsave + "/info.bin", 1);
    os.write(info);
  }
  {
    snsd::OFStreamer<sense::Unigram> os(dsave + "/uni.bin", 2);
    sense::Unigram msg;
    for (u32 id = 0; id < 2; ++id) {
      msg.set_str(corpus.vocab().word(id));
      msg.set_id(id);
      msg.set_weight(corpus.vocab().count(id));
      os.write(msg);
    }
  }
  for (const char *fname : {"/cooc.bin", "/ppmi.bin"}) {
    snsd::OFStreamer<sense::Cell> os(dsave + fname, 0);
  }

  ASSERT_THROW(snsd::Corpus::load(dsave), std::logic_error);
}

TEST(Tools, ListDirs) {
  auto dir = DSAVE + "listing";
  snsd::system_exec("mkdir -p " + dir + "/corpus_2 " + dir + "/corpus_10 " +
                    dir + "/corpus_1 " + dir + "/corpus_3.tmp " + dir +
                    "/other");
  auto dirs = snsd::list_dirs(dir, "corpus_");
  std::vector<std::string> expected = {dir + "/corpus_1", dir + "/corpus_2",
                                       dir + "/corpus_10"};
  ASSERT_EQ(dirs, expected);
  ASSERT_THROW(snsd::list_dirs(dir + "/missing", "corpus_"),
               std::runtime_error);
}

/////////////////////////////////////////////////////////////////////////////
//                                 config                                  //
/////////////////////////////////////////////////////////////////////////////

TEST(Config, Validate) {
  snsd::Config config;
  ASSERT_NO_THROW(config.validate());
  config.alpha = 0;
  ASSERT_THROW(config.validate(), std::invalid_argument);
  config.alpha = 1;
  config.window_size = 0;
  ASSERT_THROW(config.validate(), std::invalid_argument);
}

TEST(Config, CommandLine) {
  const char *argv[] = {"sensediff_prepare", "ref.txt",     "focus.txt",
                        "out",               "--alpha",     "0.5",
                        "--window_size",     "6",           "--weighting",
                        "ppmi"};
  auto config = snsd::prepare_config(10, argv);
  ASSERT_TRUE(config.has_value());
  ASSERT_EQ(config->reference, "ref.txt");
  ASSERT_EQ(config->focus, "focus.txt");
  ASSERT_EQ(config->output, "out");
  ASSERT_DOUBLE_EQ(config->alpha, 0.5);
  ASSERT_EQ(config->window_size, 6);
  ASSERT_EQ(config->floor, 1);
  ASSERT_EQ(config->weighting, snsd::Weighting::ppmi);

  const char *help[] = {"sensediff_prepare", "--help"};
  ASSERT_FALSE(snsd::prepare_config(2, help).has_value());

  const char *missing[] = {"sensediff_prepare", "ref.txt"};
  ASSERT_THROW(snsd::prepare_config(2, missing), std::logic_error);

  // параметры сэмплера утилита подготовки не принимает
  for (const char *opt : {"--gamma", "--eta", "--max_iters", "--save_every"}) {
    const char *sampler[] = {"sensediff_prepare", "r", "f", "o", opt, "2"};
    ASSERT_THROW(snsd::prepare_config(6, sampler), std::logic_error) << opt;
  }

  const char *bad[] = {"sensediff_prepare", "r", "f", "o", "--weighting", "x"};
  ASSERT_THROW(snsd::prepare_config(6, bad), std::invalid_argument);

  const char *score[] = {"sensediff_score", "saves", "--top_k", "10"};
  auto sconfig = snsd::score_config(4, score);
  ASSERT_TRUE(sconfig.has_value());
  ASSERT_EQ(sconfig->snapshot, "saves");
  ASSERT_EQ(sconfig->top_k, 10);
}

int main(int argc, char **argv) {
  snsd::system_exec("rm -rf " + DSAVE);
  snsd::system_exec("mkdir -p " + DSAVE);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
