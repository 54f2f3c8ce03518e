#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/string_view.h>
#include <absl/strings/strip.h>
#include <algorithm>
#include <capnp/message.h>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../corpus.hpp"
#include "../streamer.hpp"
#include "../tools.hpp"

namespace snsd {

const char *origin_name(Origin o) {
  return o == Origin::reference ? "reference" : "focus";
}

/////////////////////////////////////////////////////////////////////////////
//                                Document                                 //
/////////////////////////////////////////////////////////////////////////////

void Document::check_partition() const {
  std::vector<bool> seen(words_.size(), false);
  std::size_t covered = 0;
  for (const auto &table : partition_) {
    for (auto pos : table) {
      if (pos >= words_.size() || seen[pos]) {
        std::ostringstream ss;
        ss << "document " << idx << ": position " << pos
           << (pos >= words_.size() ? " is out of range" : " is duplicated")
           << " in partition";
        throw std::logic_error(ss.str());
      }
      seen[pos] = true;
      covered++;
    }
  }
  if (covered != words_.size()) {
    std::ostringstream ss;
    ss << "document " << idx << ": partition covers " << covered << " of "
       << words_.size() << " tokens";
    throw std::logic_error(ss.str());
  }
  if (senses_.has_value() && senses_->size() < partition_.size()) {
    std::ostringstream ss;
    ss << "document " << idx << ": " << partition_.size()
       << " clusters but only " << senses_->size() << " mapped to senses";
    throw std::logic_error(ss.str());
  }
}

void Document::set_senses(std::vector<u32> senses) {
  senses_ = std::move(senses);
}

const std::vector<u32> &Document::senses() const {
  if (!senses_.has_value()) {
    std::ostringstream ss;
    ss << "document " << idx << ": senses are not assigned yet";
    throw std::logic_error(ss.str());
  }
  return *senses_;
}

u32 Document::sense_of(std::size_t cluster) const {
  const auto &m = senses();
  if (cluster >= m.size()) {
    std::ostringstream ss;
    ss << "document " << idx << ": cluster " << cluster
       << " has no sense assigned";
    throw std::logic_error(ss.str());
  }
  return m[cluster];
}

/////////////////////////////////////////////////////////////////////////////
//                                 Corpus                                  //
/////////////////////////////////////////////////////////////////////////////

Corpus::Corpus(const Config &config, const Tokenizer &tok)
    : Corpus(read_lines(config.reference),
             config.focus.empty() ? std::vector<std::string>{}
                                  : read_lines(config.focus),
             config, tok) {}

Corpus::Corpus(const std::vector<std::string> &reference,
               const std::vector<std::string> &focus, const Config &config,
               const Tokenizer &tok)
    : weighting_{config.weighting}, floor_{config.floor},
      window_size_{config.window_size}, output{config.output} {
  auto sentences = add_documents(reference, Origin::reference, tok);
  if (!focus.empty()) {
    auto more = add_documents(focus, Origin::focus, tok);
    sentences.insert(sentences.end(), std::make_move_iterator(more.begin()),
                     std::make_move_iterator(more.end()));
  }

  if (vocab_.empty()) {
    throw std::runtime_error("vocabulary is empty after filtering");
  }

  std::cout << "Starting co-occurrence matrix build..." << std::endl;
  cooc = cooccurrences(sentences, vocab_, window_size_);
  std::cout << "Computing PPMI..." << std::endl;
  ppmi_ = snsd::ppmi(cooc, vocab_);
  printf("vocabulary: %u documents: %zu cells: %zu\n", vocab_.size(),
         docs_.size(), cooc.nonzeros());
}

std::vector<Sentence>
Corpus::add_documents(const std::vector<std::string> &lines, Origin origin,
                      const Tokenizer &tok) {
  auto sentences = preprocess(lines, tok, floor_);

  // словарь только дополняется, уже выданные идентификаторы не меняются
  for (const auto &s : sentences) {
    for (const auto &w : s) {
      vocab_.add(w);
    }
  }

  u32 i = 0;
  for (const auto &s : sentences) {
    std::vector<u32> ids;
    ids.reserve(s.size());
    for (const auto &w : s) {
      ids.push_back(vocab_.id(w));
    }
    docs_.emplace_back(i++, std::move(ids), origin);
  }
  return sentences;
}

const SparseMatrix &Corpus::association() const {
  return weighting_ == Weighting::ppmi ? ppmi_ : cooc;
}

absl::Span<const Cell> Corpus::association_row(u32 id) const {
  if (id >= vocab_.size()) {
    std::ostringstream ss;
    ss << "word id " << id << " is out of vocabulary of size "
       << vocab_.size();
    throw std::logic_error(ss.str());
  }
  return association().row(id);
}

void Corpus::init_partitions(double alpha, std::uint64_t seed) {
  std::uint64_t i = 0;
  for (auto &doc : docs_) {
    std::seed_seq seq{static_cast<std::uint32_t>(seed),
                      static_cast<std::uint32_t>(seed >> 32),
                      static_cast<std::uint32_t>(i),
                      static_cast<std::uint32_t>(i >> 32)};
    std::mt19937_64 gen(seq);
    doc.init_partition(alpha, gen);
    i++;
  }
}

/////////////////////////////////////////////////////////////////////////////
//                                snapshots                                //
/////////////////////////////////////////////////////////////////////////////

namespace {

void save_uni(const Vocabulary &vocab, const std::string &fout) {
  OFStreamer<sense::Unigram> os(fout, vocab.size());
  sense::Unigram msg;
  for (u32 id = 0; id < vocab.size(); ++id) {
    msg.set_str(vocab.word(id));
    msg.set_id(id);
    msg.set_weight(vocab.count(id));
    os.write(msg);
  }
}

void save_cells(const SparseMatrix &m, const std::string &fout) {
  OFStreamer<sense::Cell> os(fout, m.nonzeros());
  sense::Cell msg;
  m.for_each([&](u32 row, u32 col, double weight) {
    msg.set_row(row);
    msg.set_col(col);
    msg.set_weight(weight);
    os.write(msg);
  });
}

void save_docs(const std::vector<Document> &docs, const std::string &fout) {
  PackedWriter os(fout);
  for (const auto &doc : docs) {
    capnp::MallocMessageBuilder message;
    auto rec = message.initRoot<sense::DocRecord>();
    rec.setIdx(doc.index());
    rec.setOrigin(doc.origin() == Origin::reference ? sense::Origin::REFERENCE
                                                    : sense::Origin::FOCUS);
    auto ids = rec.initIds(doc.size());
    for (size_t i = 0; i < doc.size(); ++i) {
      ids.set(i, doc.words()[i]);
    }
    auto partition = rec.initPartition(doc.partition().size());
    for (size_t j = 0; j < doc.partition().size(); ++j) {
      const auto &table = doc.partition()[j];
      auto positions = partition.init(j, table.size());
      for (size_t k = 0; k < table.size(); ++k) {
        positions.set(k, table[k]);
      }
    }
    rec.setHasSenses(doc.has_senses());
    if (doc.has_senses()) {
      const auto &m = doc.senses();
      auto senses = rec.initSenses(m.size());
      for (size_t k = 0; k < m.size(); ++k) {
        senses.set(k, m[k]);
      }
    }
    os.write(message);
  }
}

SparseMatrix load_cells(const std::string &fin, u32 dim) {
  Counts counts;
  read_apply<sense::Cell>(fin, [&](sense::Cell *m) {
    counts.try_emplace(std::make_pair(m->row(), m->col()), m->weight());
  });
  return SparseMatrix(dim, counts);
}

// наибольший n среди output/corpus_<n>, 0 если снимков нет
u32 last_snapshot(const std::string &output) {
  auto dirs = list_dirs(output, "corpus_");
  if (dirs.empty())
    return 0;
  absl::string_view name(dirs.back());
  u32 n = 0;
  if (!absl::ConsumePrefix(&name, absl::StrCat(output, "/corpus_")) ||
      !absl::SimpleAtoi(name, &n)) {
    std::ostringstream ss;
    ss << "could't parse snapshot number of " << dirs.back();
    throw std::runtime_error(ss.str());
  }
  return n;
}

} // namespace

std::string Corpus::save() {
  if (output.empty()) {
    throw std::runtime_error("output directory is not set");
  }
  std::filesystem::create_directories(output);
  DirLock lock(output);

  // номер после последнего снимка в каталоге: готовые снимки не затираются,
  // даже если корпус загружен из старого снимка
  save_count = std::max(save_count, last_snapshot(output)) + 1;
  auto dsnapshot = absl::StrCat(output, "/corpus_", save_count);
  auto dtmp = dsnapshot + ".tmp";
  std::filesystem::remove_all(dtmp); // остаток прерванной записи
  std::filesystem::create_directory(dtmp);

  sense::CorpusInfo info;
  info.set_save_count(save_count);
  info.set_floor(floor_);
  info.set_window_size(window_size_);
  info.set_vocab_size(vocab_.size());
  info.set_num_docs(docs_.size());
  info.set_weighting(weighting_name(weighting_));
  {
    OFStreamer<sense::CorpusInfo> os(dtmp + "/info.bin", 1);
    os.write(info);
  }

  save_uni(vocab_, dtmp + "/uni.bin");
  save_cells(cooc, dtmp + "/cooc.bin");
  save_cells(ppmi_, dtmp + "/ppmi.bin");
  save_docs(docs_, dtmp + "/docs.bin");

  // снимок появляется целиком или не появляется вовсе
  if (std::rename(dtmp.c_str(), dsnapshot.c_str()) != 0) {
    std::ostringstream ss;
    ss << "could't rename " << dtmp << " to " << dsnapshot
       << ", error: " << strerror(errno);
    throw std::runtime_error(ss.str());
  }
  return dsnapshot;
}

Corpus Corpus::load(const std::string &dsnapshot) {
  Corpus corpus;

  sense::CorpusInfo info;
  size_t ninfo = 0;
  read_apply<sense::CorpusInfo>(dsnapshot + "/info.bin",
                                [&](sense::CorpusInfo *m) {
                                  info = *m;
                                  ninfo++;
                                });
  if (ninfo != 1) {
    std::ostringstream ss;
    ss << dsnapshot << ": expected one corpus info record, got " << ninfo;
    throw std::runtime_error(ss.str());
  }

  corpus.save_count = info.save_count();
  corpus.floor_ = info.floor();
  corpus.window_size_ = info.window_size();
  corpus.weighting_ = parse_weighting(info.weighting());
  auto path = std::filesystem::path(dsnapshot).lexically_normal();
  if (!path.has_filename())
    path = path.parent_path();
  corpus.output = path.parent_path().string();

  read_apply<sense::Unigram>(dsnapshot + "/uni.bin", [&](sense::Unigram *m) {
    if (m->id() != corpus.vocab_.size()) {
      std::ostringstream ss;
      ss << dsnapshot << ": word '" << m->str() << "' has id " << m->id()
         << ", expected " << corpus.vocab_.size();
      throw std::logic_error(ss.str());
    }
    corpus.vocab_.add(m->str(), m->weight());
  });
  if (corpus.vocab_.size() != info.vocab_size()) {
    std::ostringstream ss;
    ss << dsnapshot << ": vocabulary has " << corpus.vocab_.size()
       << " words, expected " << info.vocab_size();
    throw std::logic_error(ss.str());
  }

  corpus.cooc = load_cells(dsnapshot + "/cooc.bin", corpus.vocab_.size());
  corpus.ppmi_ = load_cells(dsnapshot + "/ppmi.bin", corpus.vocab_.size());

  read_fn<sense::DocRecord>(
      dsnapshot + "/docs.bin", [&](sense::DocRecord::Reader r) {
        std::vector<u32> ids;
        ids.reserve(r.getIds().size());
        for (auto id : r.getIds()) {
          corpus.vocab_.word(id); // бросает для чужого идентификатора
          ids.push_back(id);
        }
        auto origin = r.getOrigin() == sense::Origin::REFERENCE
                          ? Origin::reference
                          : Origin::focus;
        corpus.docs_.emplace_back(r.getIdx(), std::move(ids), origin);
        auto &doc = corpus.docs_.back();

        for (auto positions : r.getPartition()) {
          Cluster table;
          table.reserve(positions.size());
          for (auto pos : positions) {
            table.push_back(pos);
          }
          doc.partition().push_back(std::move(table));
        }
        if (r.getHasSenses()) {
          std::vector<u32> senses;
          for (auto sense : r.getSenses()) {
            senses.push_back(sense);
          }
          doc.set_senses(std::move(senses));
        }
        if (!doc.partition().empty())
          doc.check_partition();
      });
  if (corpus.docs_.size() != info.num_docs()) {
    std::ostringstream ss;
    ss << dsnapshot << ": " << corpus.docs_.size() << " documents, expected "
       << info.num_docs();
    throw std::logic_error(ss.str());
  }

  return corpus;
}

} // namespace snsd
