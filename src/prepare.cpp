#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "../config.hpp"
#include "../corpus.hpp"
#include "../tokenizer.hpp"

using namespace snsd;

// Загружает оба корпуса, строит матрицы, делает начальное разбиение
// документов и сохраняет снимок в OUTPUT/saves для внешнего сэмплера.
int main(int argc, char *argv[]) {
  const char *stage = "parsing arguments";
  try {
    auto config = prepare_config(argc, argv);
    if (!config.has_value())
      return EXIT_SUCCESS;

    auto start = std::chrono::steady_clock::now();
    config->output += "/saves";
    std::filesystem::create_directories(config->output);

    stage = "loading words";
    std::cout << "Loading words..." << std::endl;
    std::unique_ptr<Tokenizer> tok;
    if (config->stopwords.empty())
      tok = std::make_unique<WordTokenizer>();
    else
      tok = std::make_unique<WordTokenizer>(config->stopwords);
    Corpus corpus(*config, *tok);

    stage = "setting up initial partition";
    std::cout << "Setting up initial partition..." << std::endl;
    corpus.init_partitions(config->alpha, config->seed);

    stage = "saving corpus";
    auto dsave = corpus.save();

    std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - start;
    printf("saved %s\nRan project in %.3f seconds\n", dsave.c_str(),
           elapsed.count());
  } catch (const std::exception &e) {
    std::cerr << stage << " failed: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
