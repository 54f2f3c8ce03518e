#include <absl/strings/strip.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../scoring.hpp"
#include "../tools.hpp"

namespace snsd {

Word::Word(std::string word, u32 idx, u32 num_senses)
    : word_{std::move(word)}, idx{idx},
      senses(num_senses, std::array<u32, 2>{0, 0}) {}

u32 Word::count(u32 sense, Origin origin) const {
  return senses.at(sense)[origin == Origin::reference ? 0 : 1];
}

u32 Word::total() const {
  u32 sum = 0;
  for (const auto &row : senses) {
    sum += row[0] + row[1];
  }
  return sum;
}

void Word::add(u32 sense, Origin origin) {
  std::ostringstream ss;
  if (frozen) {
    ss << "word '" << word_ << "' is frozen";
    throw std::logic_error(ss.str());
  }
  if (sense >= senses.size()) {
    ss << "word '" << word_ << "': sense " << sense << " is out of "
       << senses.size() << " senses";
    throw std::logic_error(ss.str());
  }
  senses[sense][origin == Origin::reference ? 0 : 1]++;
}

Novelty Word::calculate() const {
  Novelty best{-std::numeric_limits<double>::infinity(), 0};
  bool found = false;
  for (u32 s = 0; s < senses.size(); ++s) {
    double ref = senses[s][0], focus = senses[s][1];
    auto sum = ref + focus;
    if (sum == 0)
      continue; // смысл, в котором слово не встречалось
    auto novelty = focus / sum - ref / sum;
    if (novelty > best.score) {
      best = Novelty{novelty, s};
    }
    found = true;
  }

  if (!found) {
    std::ostringstream ss;
    ss << "word '" << word_ << "' has no occurrences in any of "
       << senses.size() << " senses";
    throw std::domain_error(ss.str());
  }
  return best;
}

absl::optional<double> Word::divergence() const {
  double nref = 0, nfocus = 0;
  for (const auto &row : senses) {
    nref += row[0];
    nfocus += row[1];
  }
  if (nref == 0 || nfocus == 0)
    return absl::nullopt;

  // KL(p || m) по основанию 2, нулевые доли в сумму не входят
  auto kl = [](double p, double m) {
    return p > 0 ? p * std::log2(p / m) : 0.;
  };
  double js = 0;
  for (const auto &row : senses) {
    auto p = row[0] / nref, q = row[1] / nfocus;
    auto m = (p + q) / 2;
    js += (kl(p, m) + kl(q, m)) / 2;
  }
  return std::sqrt(std::max(0., std::min(1., js)));
}

u32 count_senses(const Corpus &corpus) {
  u32 n = 0;
  for (const auto &doc : corpus.docs()) {
    for (auto s : doc.senses()) {
      n = std::max(n, s + 1);
    }
  }
  return n;
}

Words score_words(const Corpus &corpus, u32 num_senses) {
  const auto &vocab = corpus.vocab();
  Words words;
  for (const auto &doc : corpus.docs()) {
    const auto &partition = doc.partition();
    for (size_t i = 0; i < partition.size(); ++i) {
      auto sense = doc.sense_of(i);
      for (auto pos : partition[i]) {
        auto id = doc.words().at(pos);
        const auto &w = vocab.word(id);
        auto it = words.find(w);
        if (it == words.end()) {
          it = words.try_emplace(w, w, id, num_senses).first;
        }
        it->second.add(sense, doc.origin());
      }
    }
  }
  for (auto &el : words) {
    el.second.freeze();
  }
  return words;
}

std::vector<Ranked> rank(const Words &words, std::size_t top_k,
                         const absl::flat_hash_set<std::string> &targets) {
  std::vector<Ranked> ranked;
  ranked.reserve(words.size());
  for (const auto &el : words) {
    if (!targets.empty() && targets.find(el.first) == targets.end())
      continue;
    ranked.push_back(Ranked{el.first, el.second.calculate()});
  }

  auto more = [](const Ranked &l, const Ranked &r) {
    if (l.novelty.score != r.novelty.score)
      return l.novelty.score > r.novelty.score;
    return l.word < r.word;
  };
  if (ranked.size() > top_k) {
    std::partial_sort(ranked.begin(), ranked.begin() + top_k, ranked.end(),
                      more);
    ranked.resize(top_k);
  } else {
    std::sort(ranked.begin(), ranked.end(), more);
  }
  return ranked;
}

absl::flat_hash_set<std::string> load_targets(const std::string &fname) {
  absl::flat_hash_set<std::string> targets;
  for (const auto &line : read_lines(fname)) {
    auto w = absl::StripAsciiWhitespace(line);
    if (!w.empty())
      targets.emplace(w);
  }
  return targets;
}

} // namespace snsd
