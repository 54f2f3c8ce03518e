#pragma once

#include <absl/random/distributions.h>
#include <absl/types/optional.h>
#include <absl/types/span.h>
#include <cstdint>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"
#include "matrix.hpp"
#include "tokenizer.hpp"
#include "vocab.hpp"

namespace snsd {

enum class Origin { reference, focus };

const char *origin_name(Origin o);

// позиции токенов документа, отнесенные к одному смыслу
using Cluster = std::vector<u32>;
using Partition = std::vector<Cluster>;

class Document {
  u32 idx;
  Origin origin_;
  std::vector<u32> words_;
  Partition partition_;
  // локальный кластер -> глобальный смысл, заполняется сэмплером
  absl::optional<std::vector<u32>> senses_;

public:
  Document(u32 idx, std::vector<u32> words, Origin origin)
      : idx{idx}, origin_{origin}, words_{std::move(words)} {}

  u32 index() const { return idx; }
  Origin origin() const { return origin_; }
  const std::vector<u32> &words() const { return words_; }
  std::size_t size() const { return words_.size(); }

  Partition &partition() { return partition_; }
  const Partition &partition() const { return partition_; }

  // Начальное разбиение по китайскому ресторану, токены обрабатываются по
  // порядку. gen - генератор, удовлетворяющий UniformRandomBitGenerator.
  template <class URBG> void init_partition(double alpha, URBG &gen);

  // бросает std::logic_error, если кластеры не покрывают все позиции ровно
  // по одному разу
  void check_partition() const;

  bool has_senses() const { return senses_.has_value(); }
  void set_senses(std::vector<u32> senses);
  // бросает std::logic_error, пока сэмплер не заполнил отображение
  u32 sense_of(std::size_t cluster) const;
  const std::vector<u32> &senses() const;
};

template <class URBG> void Document::init_partition(double alpha, URBG &gen) {
  if (!(alpha > 0)) {
    std::ostringstream ss;
    ss << "alpha must be positive, got " << alpha;
    throw std::invalid_argument(ss.str());
  }
  if (!partition_.empty()) {
    std::ostringstream ss;
    ss << "document " << idx << ": partition is already initialized";
    throw std::logic_error(ss.str());
  }

  std::vector<double> prior;
  double n = 0;
  for (u32 pos = 0; pos < words_.size(); ++pos) {
    n += 1;
    auto denom = n + alpha - 1;
    prior.clear();
    for (const auto &table : partition_) {
      prior.push_back(table.size() / denom);
    }
    // новый стол получает все, что выше суммы prior (alpha / denom)
    auto occupied = std::accumulate(prior.begin(), prior.end(), 0.0);
    auto r = absl::Uniform(absl::IntervalClosedOpen, gen, 0.0, 1.0);

    Cluster *table = nullptr;
    if (r <= occupied) {
      double curr = 0;
      for (std::size_t j = 0; j < prior.size(); ++j) {
        curr += prior[j];
        if (curr > r) {
          table = &partition_[j];
          break;
        }
      }
    }

    if (table == nullptr) {
      partition_.emplace_back(1, pos);
    } else {
      table->push_back(pos);
    }
  }
}

// Корпус: словарь, документы обоих подкорпусов, матрицы совместной
// встречаемости. Единица сохранения на диск.
class Corpus {
  Vocabulary vocab_;
  std::vector<Document> docs_;
  SparseMatrix cooc;
  SparseMatrix ppmi_;
  Weighting weighting_ = Weighting::raw;
  u32 floor_ = 0;
  u32 window_size_ = 0;
  u32 save_count = 0;
  std::string output;

  Corpus() = default;
  std::vector<Sentence> add_documents(const std::vector<std::string> &lines,
                                      Origin origin, const Tokenizer &tok);

public:
  // читает config.reference и, если задан, config.focus
  Corpus(const Config &config, const Tokenizer &tok);
  Corpus(const std::vector<std::string> &reference,
         const std::vector<std::string> &focus, const Config &config,
         const Tokenizer &tok);

  const Vocabulary &vocab() const { return vocab_; }
  std::vector<Document> &docs() { return docs_; }
  const std::vector<Document> &docs() const { return docs_; }

  // сырые счетчики и их PPMI
  const SparseMatrix &collocations() const { return cooc; }
  const SparseMatrix &ppmi() const { return ppmi_; }

  Weighting weighting() const { return weighting_; }
  // матрица, выбранная config.weighting
  const SparseMatrix &association() const;
  absl::Span<const Cell> association_row(u32 id) const;

  u32 floor() const { return floor_; }
  u32 window_size() const { return window_size_; }
  u32 saves() const { return save_count; }

  // у каждого документа свой генератор, посеянный (seed, номер документа)
  void init_partitions(double alpha, std::uint64_t seed);

  // сохраняет снимок в output/corpus_<n>, возвращает путь к нему
  std::string save();
  static Corpus load(const std::string &dsnapshot);
};

} // namespace snsd
