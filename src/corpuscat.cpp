//!
//! @file corpuscat.cpp
//! Читает файл снимка корпуса и выводит на экран, например,
//! "corpuscat saves/corpus_5/cooc.bin saves/corpus_5/uni.bin | less"
//!

#include <absl/container/flat_hash_map.h>
#include <absl/strings/match.h>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

#include "../streamer.hpp"
#include "../tools.hpp"

using namespace snsd;

auto load_idmap(const std::string &fin) {
  absl::flat_hash_map<u32, std::string> idmap;
  auto set_one = [&](sense::Unigram *msg) {
    idmap.try_emplace(msg->id(), msg->str());
  };
  read_apply<sense::Unigram>(fin, set_one);
  return idmap;
}

void print_docs(const char *fname) {
  auto print_one = [](sense::DocRecord::Reader r) {
    printf("%u\t%s\t", r.getIdx(),
           r.getOrigin() == sense::Origin::REFERENCE ? "reference" : "focus");
    for (auto id : r.getIds()) {
      printf("%u ", id);
    }
    printf("\t|");
    for (auto table : r.getPartition()) {
      for (auto pos : table) {
        printf(" %u", pos);
      }
      printf(" |");
    }
    if (r.getHasSenses()) {
      printf("\tsenses:");
      for (auto s : r.getSenses()) {
        printf(" %u", s);
      }
    }
    printf("\n");
  };
  read_fn<sense::DocRecord>(fname, print_one);
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    fprintf(stderr, "usage: corpuscat FILE [uni.bin] | corpuscat -n FILE\n");
    return EXIT_FAILURE;
  }

  try {
    // только число записей из заголовка
    if (strcmp(argv[1], "-n") == 0) {
      if (argc != 3) {
        fprintf(stderr, "wrong number of arguments\n");
        return EXIT_FAILURE;
      }
      auto dtype = get_data_type(argv[2]);
      size_t total = 0;
      if (dtype == sense::Unigram::GetDescriptor()->name()) {
        total = read_total<sense::Unigram>(argv[2]);
      } else if (dtype == sense::Cell::GetDescriptor()->name()) {
        total = read_total<sense::Cell>(argv[2]);
      } else if (dtype == sense::Score::GetDescriptor()->name()) {
        total = read_total<sense::Score>(argv[2]);
      } else if (dtype == sense::CorpusInfo::GetDescriptor()->name()) {
        total = read_total<sense::CorpusInfo>(argv[2]);
      } else {
        std::cerr << "could't read data header\n";
        return EXIT_FAILURE;
      }
      printf("%zu\n", total);
      return EXIT_SUCCESS;
    }

    // документы хранятся в capnp и заголовка не имеют
    if (absl::EndsWith(argv[1], "docs.bin")) {
      printf("IDX\tORIGIN\tIDS\tPARTITION\n");
      print_docs(argv[1]);
      return EXIT_SUCCESS;
    }

    auto dtype = get_data_type(argv[1]);

    auto print_unigram = [](const sense::Unigram *msg) {
      printf("%s\t%50u\t%u\n", msg->str().data(), msg->id(), msg->weight());
    };
    auto print_cell = [](const sense::Cell *msg) {
      printf("%u\t\t%u\t\t%.9g\n", msg->row(), msg->col(), msg->weight());
    };
    auto print_cell_decode = [&](const sense::Cell *msg) {
      static auto uni = load_idmap(argv[2]);
      auto it1 = uni.find(msg->row());
      auto it2 = uni.find(msg->col());
      printf("%30s\t%-30s%16.9g\n",
             it1 != uni.end() ? it1->second.c_str() : "?",
             it2 != uni.end() ? it2->second.c_str() : "?", msg->weight());
    };
    auto print_info = [](const sense::CorpusInfo *msg) {
      printf("save_count: %u\nfloor: %u\nwindow_size: %u\nvocab_size: "
             "%u\nnum_docs: %lu\nweighting: %s\n",
             msg->save_count(), msg->floor(), msg->window_size(),
             msg->vocab_size(), static_cast<unsigned long>(msg->num_docs()),
             msg->weighting().c_str());
    };
    auto print_score = [](const sense::Score *msg) {
      printf("%-30s\t%10u\t%10.6f\t%6u", msg->str().c_str(), msg->id(),
             msg->novelty(), msg->sense());
      if (msg->has_divergence())
        printf("\t%10.6f\n", msg->divergence());
      else
        printf("\t%10s\n", "-");
    };

    if (dtype == sense::Unigram::GetDescriptor()->name()) {
      printf("%s\t%50s\t\t%s\n", "WORD", "ID", "COUNT");
      read_apply<sense::Unigram>(argv[1], print_unigram);
    } else if (dtype == sense::Cell::GetDescriptor()->name()) {
      if (argc == 2) {
        printf("ROW\t\tCOL\t\tWEIGHT\n");
        read_apply<sense::Cell>(argv[1], print_cell);
      } else if (argc == 3) {
        read_apply<sense::Cell>(argv[1], print_cell_decode);
      } else {
        std::cerr << dtype << ":wrong number of arguments\n";
        return EXIT_FAILURE;
      }
    } else if (dtype == sense::CorpusInfo::GetDescriptor()->name()) {
      read_apply<sense::CorpusInfo>(argv[1], print_info);
    } else if (dtype == sense::Score::GetDescriptor()->name()) {
      printf("%-30s\t%10s\t%10s\t%6s\t%10s\n", "WORD", "ID", "NOVELTY",
             "SENSE", "JSD");
      read_apply<sense::Score>(argv[1], print_score);
    } else if (dtype.empty()) {
      std::cerr << "could't read data header\n";
      return EXIT_FAILURE;
    } else {
      std::cerr << "data type not implemented\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
