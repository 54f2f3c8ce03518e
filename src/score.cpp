#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "../config.hpp"
#include "../corpus.hpp"
#include "../scoring.hpp"
#include "../streamer.hpp"
#include "../tools.hpp"

using namespace snsd;

// снимок или каталог saves, из которого берется последний снимок
std::string find_snapshot(const std::string &path) {
  if (std::filesystem::exists(path + "/info.bin"))
    return path;
  auto dirs = list_dirs(path, "corpus_");
  if (dirs.empty())
    throw std::runtime_error("no corpus snapshots in " + path);
  return dirs.back();
}

// Считает novelty слов по снимку, в котором сэмплер уже разметил смыслы, и
// печатает top_k слов.
int main(int argc, char *argv[]) {
  const char *stage = "parsing arguments";
  try {
    auto config = score_config(argc, argv);
    if (!config.has_value())
      return EXIT_SUCCESS;

    stage = "loading corpus";
    auto dsnapshot = find_snapshot(config->snapshot);
    std::cout << "Loading " << dsnapshot << "..." << std::endl;
    auto corpus = Corpus::load(dsnapshot);

    stage = "scoring word senses";
    std::cout << "Generating scores for word senses..." << std::endl;
    auto nsenses = count_senses(corpus);
    auto words = score_words(corpus, nsenses);
    absl::flat_hash_set<std::string> targets;
    if (!config->targets.empty())
      targets = load_targets(config->targets);
    auto ranked = rank(words, config->top_k, targets);

    stage = "writing scores";
    auto fout = dsnapshot + ".scores.bin";
    OFStreamer<sense::Score> os(fout, ranked.size());
    sense::Score msg;
    printf("Top %zu most differing words of %zu (%u senses):\n",
           ranked.size(), words.size(), nsenses);
    printf("%-30s\t%10s\t%6s\t%10s\n", "WORD", "NOVELTY", "SENSE", "JSD");
    for (const auto &r : ranked) {
      const auto &w = words.at(r.word);
      auto jsd = w.divergence();
      msg.set_str(r.word);
      msg.set_id(w.index());
      msg.set_novelty(r.novelty.score);
      msg.set_sense(r.novelty.sense);
      msg.set_has_divergence(jsd.has_value());
      msg.set_divergence(jsd.value_or(0));
      os.write(msg);
      if (jsd.has_value())
        printf("%-30s\t%10.6f\t%6u\t%10.6f\n", r.word.c_str(),
               r.novelty.score, r.novelty.sense, *jsd);
      else
        printf("%-30s\t%10.6f\t%6u\t%10s\n", r.word.c_str(), r.novelty.score,
               r.novelty.sense, "-");
    }
    std::cout << "scores saved to " << fout << std::endl;
  } catch (const std::exception &e) {
    std::cerr << stage << " failed: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
