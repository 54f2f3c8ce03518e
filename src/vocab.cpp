#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../vocab.hpp"

namespace snsd {

absl::optional<u32> Vocabulary::find(absl::string_view word) const {
  auto it = word_to_idx.find(word);
  if (it == word_to_idx.end())
    return absl::nullopt;
  return it->second;
}

u32 Vocabulary::id(absl::string_view word) const {
  auto res = find(word);
  if (!res.has_value()) {
    std::ostringstream ss;
    ss << "word '" << word << "' is not in the vocabulary";
    throw std::logic_error(ss.str());
  }
  return res.value();
}

const std::string &Vocabulary::word(u32 id) const {
  if (id >= idx_to_word.size()) {
    std::ostringstream ss;
    ss << "word id " << id << " is out of vocabulary of size " << size();
    throw std::logic_error(ss.str());
  }
  return idx_to_word[id];
}

u32 Vocabulary::count(u32 id) const {
  word(id); // проверка границ
  return counts[id];
}

u32 Vocabulary::add(absl::string_view word, u32 n) {
  auto p = word_to_idx.try_emplace(word, size());
  auto id = p.first->second;
  if (p.second) {
    idx_to_word.emplace_back(word);
    counts.push_back(0);
  }
  counts[id] += n;
  return id;
}

std::vector<Sentence> preprocess(const std::vector<std::string> &lines,
                                 const Tokenizer &tokenizer, u32 floor) {
  std::vector<Sentence> tokenized;
  tokenized.reserve(lines.size());
  absl::flat_hash_map<std::string, u32> freqs;
  for (const auto &line : lines) {
    tokenized.push_back(tokenizer.tokenize(line));
    for (const auto &token : tokenized.back()) {
      auto p = freqs.try_emplace(token, 0);
      p.first->second++;
    }
  }

  // стоп-слова и редкие слова (< floor + 1) выбрасываем
  auto removed = tokenizer.stopwords();
  for (const auto &el : freqs) {
    if (el.second < static_cast<std::uint64_t>(floor) + 1)
      removed.insert(el.first);
  }

  std::vector<Sentence> sentences;
  for (auto &tokens : tokenized) {
    Sentence s;
    for (auto &token : tokens) {
      if (removed.find(token) == removed.end())
        s.push_back(std::move(token));
    }
    if (!s.empty())
      sentences.push_back(std::move(s));
  }
  return sentences;
}

} // namespace snsd
