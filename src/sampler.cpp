#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "../sampler.hpp"

namespace snsd {

void run_sampler(Corpus &corpus, SenseSampler &sampler, const Config &config) {
  auto &docs = corpus.docs();
  for (const auto &doc : docs) {
    doc.check_partition();
  }
  sampler.init(corpus.vocab().size(), docs);

  printf("Running Gibbs sampling for %u iterations...\n", config.max_iters);
  for (u32 it = 1; it <= config.max_iters; ++it) {
    for (auto &doc : docs) {
      for (u32 pos = 0; pos < doc.size(); ++pos) {
        sampler.sample(doc, pos, corpus.association_row(doc.words()[pos]));
        doc.check_partition();
      }
    }
    std::cout << "\r" << it << ": " << sampler.num_senses() << std::flush;
    if (config.save_every > 0 && it % config.save_every == 0) {
      auto dsave = corpus.save();
      std::cout << "\nFinished " << it << " iterations, saved " << dsave
                << std::endl;
    }
  }
  std::cout << "\n";

  // после сэмплирования у каждого документа должно быть отображение смыслов
  for (const auto &doc : docs) {
    if (!doc.has_senses()) {
      std::ostringstream ss;
      ss << "document " << doc.index() << " (" << origin_name(doc.origin())
         << ") has no senses after sampling";
      throw std::logic_error(ss.str());
    }
    doc.check_partition();
  }
}

} // namespace snsd
