#pragma once

#include <absl/types/optional.h>
#include <cstdint>
#include <string>

namespace snsd {

// какую матрицу отдавать сэмплеру в качестве контекста слова
enum class Weighting { raw, ppmi };

const char *weighting_name(Weighting w);
Weighting parse_weighting(const std::string &name);

// Параметры запуска. Создается один раз при старте и передается явно во все
// компоненты, которым он нужен.
struct Config {
  std::string reference;
  std::string focus;
  std::string targets;
  std::string output;
  std::string stopwords;
  std::string snapshot;

  std::uint32_t floor = 1;
  std::uint32_t window_size = 10;
  double alpha = 1.0;
  // параметры внешнего сэмплера, задаются программой, которая его встраивает;
  // из командной строки утилит не читаются
  double gamma = 1.0;
  double eta = 0.1;
  std::uint32_t max_iters = 25;
  std::uint32_t save_every = 5;
  std::uint64_t seed = 1;
  std::uint32_t top_k = 50;
  Weighting weighting = Weighting::raw;

  // бросает std::invalid_argument
  void validate() const;
};

// Разбор аргументов командной строки утилит. absl::nullopt означает, что
// была напечатана справка и программу надо завершить.
absl::optional<Config> prepare_config(int argc, const char *const argv[]);
absl::optional<Config> score_config(int argc, const char *const argv[]);

} // namespace snsd
