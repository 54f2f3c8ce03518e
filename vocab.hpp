#pragma once

#include <absl/container/flat_hash_map.h>
#include <absl/strings/string_view.h>
#include <absl/types/optional.h>
#include <cstdint>
#include <string>
#include <vector>

#include "tokenizer.hpp"

using u32 = std::uint32_t;

namespace snsd {

using Sentence = std::vector<std::string>;

// Словарь корпуса: слово <-> плотный идентификатор в [0, size()) и частота
// слова после фильтрации. Идентификаторы выдаются в порядке первой встречи и
// никогда не перенумеровываются.
class Vocabulary {
  absl::flat_hash_map<std::string, u32> word_to_idx;
  std::vector<std::string> idx_to_word;
  std::vector<u32> counts;

public:
  u32 size() const { return static_cast<u32>(idx_to_word.size()); }
  bool empty() const { return idx_to_word.empty(); }

  absl::optional<u32> find(absl::string_view word) const;
  // бросает std::logic_error, если слова нет в словаре
  u32 id(absl::string_view word) const;
  const std::string &word(u32 id) const;
  u32 count(u32 id) const;

  // добавляет слово (если его еще нет) и увеличивает его частоту на n
  u32 add(absl::string_view word, u32 n = 1);
};

// Токенизирует строки, выбрасывает стоп-слова и слова, встретившиеся меньше
// floor + 1 раз, удаляет опустевшие предложения.
std::vector<Sentence> preprocess(const std::vector<std::string> &lines,
                                 const Tokenizer &tokenizer, u32 floor);

} // namespace snsd
