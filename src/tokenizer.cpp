#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <string>
#include <vector>

#include "../tokenizer.hpp"
#include "../tools.hpp"

namespace snsd {

namespace {

// английский список стоп-слов (тот же набор, что у NLTK)
const char *const kEnglishStopwords[] = {
    "i",          "me",       "my",         "myself",   "we",
    "our",        "ours",     "ourselves",  "you",      "you're",
    "you've",     "you'll",   "you'd",      "your",     "yours",
    "yourself",   "yourselves", "he",       "him",      "his",
    "himself",    "she",      "she's",      "her",      "hers",
    "herself",    "it",       "it's",       "its",      "itself",
    "they",       "them",     "their",      "theirs",   "themselves",
    "what",       "which",    "who",        "whom",     "this",
    "that",       "that'll",  "these",      "those",    "am",
    "is",         "are",      "was",        "were",     "be",
    "been",       "being",    "have",       "has",      "had",
    "having",     "do",       "does",       "did",      "doing",
    "a",          "an",       "the",        "and",      "but",
    "if",         "or",       "because",    "as",       "until",
    "while",      "of",       "at",         "by",       "for",
    "with",       "about",    "against",    "between",  "into",
    "through",    "during",   "before",     "after",    "above",
    "below",      "to",       "from",       "up",       "down",
    "in",         "out",      "on",         "off",      "over",
    "under",      "again",    "further",    "then",     "once",
    "here",       "there",    "when",       "where",    "why",
    "how",        "all",      "any",        "both",     "each",
    "few",        "more",     "most",       "other",    "some",
    "such",       "no",       "nor",        "not",      "only",
    "own",        "same",     "so",         "than",     "too",
    "very",       "s",        "t",          "can",      "will",
    "just",       "don",      "don't",      "should",   "should've",
    "now",        "d",        "ll",         "m",        "o",
    "re",         "ve",       "y",          "ain",      "aren",
    "aren't",     "couldn",   "couldn't",   "didn",     "didn't",
    "doesn",      "doesn't",  "hadn",       "hadn't",   "hasn",
    "hasn't",     "haven",    "haven't",    "isn",      "isn't",
    "ma",         "mightn",   "mightn't",   "mustn",    "mustn't",
    "needn",      "needn't",  "shan",       "shan't",   "shouldn",
    "shouldn't",  "wasn",     "wasn't",     "weren",    "weren't",
    "won",        "won't",    "wouldn",     "wouldn't",
};

// буквы, цифры, апостроф, дефис и любые байты UTF-8 вне ASCII
bool is_word_char(char c) {
  auto uc = static_cast<unsigned char>(c);
  return uc >= 0x80 || absl::ascii_isalnum(uc) || c == '\'' || c == '-';
}

} // namespace

WordTokenizer::WordTokenizer() {
  for (auto w : kEnglishStopwords) {
    stops.emplace(w);
  }
}

WordTokenizer::WordTokenizer(const std::string &fstopwords) {
  for (const auto &line : read_lines(fstopwords)) {
    auto w = absl::StripAsciiWhitespace(line);
    if (!w.empty())
      stops.emplace(w);
  }
}

std::vector<std::string>
WordTokenizer::tokenize(absl::string_view text) const {
  std::vector<std::string> tokens;
  for (absl::string_view chunk :
       absl::StrSplit(text, absl::ByAnyChar(" \t\r\n\f\v"), absl::SkipEmpty())) {
    // "mat." -> "mat" "."; подряд идущие знаки препинания - один токен
    size_t start = 0;
    while (start < chunk.size()) {
      bool word = is_word_char(chunk[start]);
      size_t end = start + 1;
      while (end < chunk.size() && is_word_char(chunk[end]) == word)
        ++end;
      tokens.emplace_back(chunk.substr(start, end - start));
      start = end;
    }
  }
  return tokens;
}

} // namespace snsd
