#pragma once

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <absl/types/optional.h>
#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "corpus.hpp"

namespace snsd {

struct Novelty {
  double score = 0;
  u32 sense = 0;
};

// Слово и число его употреблений в каждом смысле: [смысл][0] - в опорном
// корпусе, [смысл][1] - в целевом.
class Word {
  std::string word_;
  u32 idx;
  std::vector<std::array<u32, 2>> senses;
  bool frozen = false;

public:
  Word(std::string word, u32 idx, u32 num_senses);

  const std::string &word() const { return word_; }
  u32 index() const { return idx; }
  u32 num_senses() const { return static_cast<u32>(senses.size()); }
  u32 count(u32 sense, Origin origin) const;
  u32 total() const;

  // бросает std::logic_error после freeze()
  void add(u32 sense, Origin origin);
  // счетчики больше не меняются
  void freeze() { frozen = true; }
  bool is_frozen() const { return frozen; }

  // Максимальная по смыслам разность долей (целевой - опорный) и смысл, на
  // котором она достигается. Смыслы без употреблений пропускаются.
  Novelty calculate() const;

  // Расстояние Йенсена-Шеннона (по основанию 2) между распределениями смыслов
  // в опорном и целевом корпусах. Пусто, если в одном из них слова нет.
  absl::optional<double> divergence() const;
};

using Words = absl::flat_hash_map<std::string, Word>;

// число глобальных смыслов, упомянутых в отображениях документов
u32 count_senses(const Corpus &corpus);

// проходит по разбиениям всех документов и раскладывает употребления слов по
// смыслам и подкорпусам; возвращенные слова заморожены
Words score_words(const Corpus &corpus, u32 num_senses);

struct Ranked {
  std::string word;
  Novelty novelty;
};

// top_k слов по убыванию novelty, при равенстве - по алфавиту; если targets
// не пуст, рассматриваются только они
std::vector<Ranked> rank(const Words &words, std::size_t top_k,
                         const absl::flat_hash_set<std::string> &targets = {});

absl::flat_hash_set<std::string> load_targets(const std::string &fname);

} // namespace snsd
