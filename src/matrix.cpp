#include <absl/container/flat_hash_map.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "../matrix.hpp"

namespace snsd {

SparseMatrix::SparseMatrix(u32 dim, const Counts &counts) : dim{dim} {
  std::vector<std::pair<Idd, double>> v;
  v.reserve(counts.size());
  for (const auto &el : counts) {
    if (el.first.first >= dim || el.first.second >= dim) {
      std::ostringstream ss;
      ss << "cell (" << el.first.first << ", " << el.first.second
         << ") is out of matrix of size " << dim;
      throw std::logic_error(ss.str());
    }
    if (el.second != 0)
      v.emplace_back(el);
  }
  std::sort(v.begin(), v.end(), [](const auto &l, const auto &r) {
    return l.first < r.first;
  });

  offsets.assign(dim + 1, 0);
  cells.reserve(v.size());
  for (const auto &el : v) {
    offsets[el.first.first + 1]++;
    cells.push_back(Cell{el.first.second, el.second});
  }
  for (u32 r = 0; r < dim; ++r) {
    offsets[r + 1] += offsets[r];
  }
}

double SparseMatrix::total() const {
  double sum = 0;
  for (const auto &c : cells) {
    sum += c.weight;
  }
  return sum;
}

absl::Span<const Cell> SparseMatrix::row(u32 row) const {
  if (row >= dim) {
    std::ostringstream ss;
    ss << "row " << row << " is out of matrix of size " << dim;
    throw std::out_of_range(ss.str());
  }
  return absl::MakeConstSpan(cells.data() + offsets[row],
                             offsets[row + 1] - offsets[row]);
}

double SparseMatrix::get(u32 r, u32 col) const {
  auto cs = row(r);
  auto it = std::lower_bound(
      cs.begin(), cs.end(), col,
      [](const Cell &c, u32 value) { return c.col < value; });
  if (it == cs.end() || it->col != col)
    return 0;
  return it->weight;
}

bool SparseMatrix::operator==(const SparseMatrix &rhs) const {
  if (dim != rhs.dim || offsets != rhs.offsets)
    return false;
  return std::equal(cells.begin(), cells.end(), rhs.cells.begin(),
                    rhs.cells.end(), [](const Cell &l, const Cell &r) {
                      return l.col == r.col && l.weight == r.weight;
                    });
}

SparseMatrix cooccurrences(const std::vector<Sentence> &sentences,
                           const Vocabulary &vocab, u32 window_size) {
  if (window_size < 1) {
    throw std::invalid_argument("window size must be at least 1");
  }

  Counts counts;
  std::size_t half = window_size / 2, i = 0;
  for (const auto &s : sentences) {
    for (std::size_t j = 0; j < s.size(); ++j) {
      auto center = vocab.find(s[j]);
      if (!center.has_value())
        continue;
      // конец окна не включается и не заходит дальше последнего токена
      auto start = j > half ? j - half : 0;
      auto end = std::min(s.size() - 1, j + half);
      for (auto k = start; k < end; ++k) {
        if (s[k] == s[j])
          continue;
        auto context = vocab.find(s[k]);
        if (!context.has_value())
          continue;
        auto p = counts.try_emplace(std::make_pair(*context, *center), 0);
        p.first->second++;
      }
    }
    if (++i % 10'000 == 0)
      std::cout << "\r" << i << ": " << counts.size() << std::flush;
  }
  if (i >= 10'000)
    std::cout << "\n";

  return SparseMatrix(vocab.size(), counts);
}

SparseMatrix ppmi(const SparseMatrix &cooc, const Vocabulary &vocab) {
  if (cooc.size() != vocab.size()) {
    std::ostringstream ss;
    ss << "matrix of size " << cooc.size() << " does not match vocabulary of "
       << vocab.size() << " words";
    throw std::logic_error(ss.str());
  }

  Counts weights;
  auto total = cooc.total();
  cooc.for_each([&](u32 i, u32 j, double freq) {
    auto joint = freq / total;
    auto pi = freq * vocab.count(i) / total;
    auto pj = freq * vocab.count(j) / total;
    auto denominator = pi * pj;
    if (denominator <= 0)
      return; // нулевая ячейка не хранится

    auto pmi = std::log2(joint / denominator);
    if (!std::isfinite(pmi)) {
      std::ostringstream ss;
      ss << "ppmi of cell (" << vocab.word(i) << ", " << vocab.word(j)
         << ") is not finite, frequency " << freq << ", total " << total;
      throw std::domain_error(ss.str());
    }
    if (pmi > 0)
      weights.try_emplace(std::make_pair(i, j), pmi);
  });

  return SparseMatrix(cooc.size(), weights);
}

} // namespace snsd
