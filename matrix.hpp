//!
//! @file matrix.hpp
//! Sparse word x word association matrices: raw windowed co-occurrence counts
//! and their PPMI weighting
//!

#pragma once

#include <absl/container/flat_hash_map.h>
#include <absl/types/span.h>
#include <cstddef>
#include <utility>
#include <vector>

#include "vocab.hpp"

namespace snsd {

using Idd = std::pair<u32, u32>;
using Counts = absl::flat_hash_map<Idd, double>;

struct Cell {
  u32 col = 0;
  double weight = 0;
};

/** @class SparseMatrix
 *
 * Read-only square matrix in row-compressed layout. Cells of a row are sorted
 * by column, zero cells are not stored.
 */
class SparseMatrix {
  u32 dim = 0;
  std::vector<std::size_t> offsets{0};
  std::vector<Cell> cells;

public:
  SparseMatrix() = default;
  SparseMatrix(u32 dim, const Counts &counts);

  u32 size() const { return dim; }
  std::size_t nonzeros() const { return cells.size(); }
  double total() const;

  double get(u32 row, u32 col) const;
  // бросает std::out_of_range для строки вне [0, size())
  absl::Span<const Cell> row(u32 row) const;

  // fn(row, col, weight) для каждой ненулевой ячейки, построчно
  template <class F> void for_each(F fn) const {
    for (u32 r = 0; r < dim; ++r) {
      for (auto i = offsets[r]; i < offsets[r + 1]; ++i) {
        fn(r, cells[i].col, cells[i].weight);
      }
    }
  }

  bool operator==(const SparseMatrix &rhs) const;
};

/** @fn cooccurrences
 *
 * @brief Counts (context, center) pairs inside a window of `window_size`
 * tokens around every center token. The end of the window is exclusive and
 * clipped to the last token of the sentence.
 */
SparseMatrix cooccurrences(const std::vector<Sentence> &sentences,
                           const Vocabulary &vocab, u32 window_size);

/** @fn ppmi
 *
 * @brief Positive PMI of every nonzero cell of `cooc`. Marginals are the
 * word counts of `vocab` scaled by the pair frequency.
 */
SparseMatrix ppmi(const SparseMatrix &cooc, const Vocabulary &vocab);

} // namespace snsd
