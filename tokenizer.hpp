#pragma once

#include <absl/container/flat_hash_set.h>
#include <absl/strings/string_view.h>
#include <string>
#include <vector>

namespace snsd {

// разбиение текста на слова и список стоп-слов языка
class Tokenizer {
public:
  virtual ~Tokenizer() = default;
  virtual std::vector<std::string> tokenize(absl::string_view text) const = 0;
  virtual const absl::flat_hash_set<std::string> &stopwords() const = 0;
};

// Режет по пробельным символам, знаки препинания выделяет в отдельные
// токены. По умолчанию использует английский список стоп-слов.
class WordTokenizer : public Tokenizer {
  absl::flat_hash_set<std::string> stops;

public:
  WordTokenizer();
  // стоп-слова из файла, по одному на строку
  explicit WordTokenizer(const std::string &fstopwords);

  std::vector<std::string> tokenize(absl::string_view text) const override;
  const absl::flat_hash_set<std::string> &stopwords() const override {
    return stops;
  }
};

} // namespace snsd
