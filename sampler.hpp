#pragma once

#include <absl/types/span.h>
#include <vector>

#include "config.hpp"
#include "corpus.hpp"

namespace snsd {

/** @class SenseSampler
 *
 * Interface of the external clustering engine (an HDP Gibbs sampler).
 * The engine reads the initial partitions, moves tokens between clusters of a
 * document and owns the local cluster -> global sense mapping of every
 * document.
 */
class SenseSampler {
public:
  virtual ~SenseSampler() = default;

  // вызывается один раз после начального разбиения
  virtual void init(u32 vocab_size, std::vector<Document> &docs) = 0;
  // пересэмплирует смысл токена в позиции pos, context - строка матрицы
  // ассоциаций для его слова
  virtual void sample(Document &doc, u32 pos,
                      absl::Span<const Cell> context) = 0;
  virtual u32 num_senses() const = 0;
};

/** @fn run_sampler
 *
 * @brief Runs config.max_iters sweeps over every token of every document.
 * The partition of a document is checked after each call of the engine, the
 * corpus is saved every config.save_every sweeps.
 */
void run_sampler(Corpus &corpus, SenseSampler &sampler, const Config &config);

} // namespace snsd
