#include <boost/program_options.hpp>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../config.hpp"

namespace po = boost::program_options;

namespace snsd {

const char *weighting_name(Weighting w) {
  return w == Weighting::ppmi ? "ppmi" : "raw";
}

Weighting parse_weighting(const std::string &name) {
  if (name == "raw")
    return Weighting::raw;
  if (name == "ppmi")
    return Weighting::ppmi;
  std::ostringstream ss;
  ss << "unknown weighting '" << name << "', expected raw or ppmi";
  throw std::invalid_argument(ss.str());
}

void Config::validate() const {
  std::ostringstream ss;
  if (!(alpha > 0)) {
    ss << "alpha must be positive, got " << alpha;
  } else if (!(gamma > 0)) {
    ss << "gamma must be positive, got " << gamma;
  } else if (!(eta > 0)) {
    ss << "eta must be positive, got " << eta;
  } else if (window_size < 1) {
    ss << "window size must be at least 1";
  } else if (top_k < 1) {
    ss << "top_k must be at least 1";
  }
  if (!ss.str().empty())
    throw std::invalid_argument(ss.str());
}

namespace {

po::options_description model_options(Config &config, std::string &weighting) {
  po::options_description desc("Model options");
  desc.add_options()
      ("floor", po::value<std::uint32_t>(&config.floor)->default_value(config.floor),
       "minimum number of occurrences to be considered")
      ("window_size", po::value<std::uint32_t>(&config.window_size)
           ->default_value(config.window_size),
       "size of context window")
      ("alpha", po::value<double>(&config.alpha)->default_value(config.alpha),
       "CRP concentration parameter")
      ("seed", po::value<std::uint64_t>(&config.seed)->default_value(config.seed),
       "random seed for the initial partition")
      ("weighting", po::value<std::string>(&weighting)->default_value("raw"),
       "association matrix handed to the sampler: raw or ppmi")
      ("stopwords", po::value<std::string>(&config.stopwords),
       "stopword file, one word per line (default: built-in English list)");
  return desc;
}

// false, если напечатана справка
bool parse(int argc, const char *const argv[],
           const po::options_description &desc,
           const po::positional_options_description &pos, const char *usage) {
  po::variables_map vm;
  po::store(
      po::command_line_parser(argc, argv).options(desc).positional(pos).run(),
      vm);
  if (vm.count("help")) {
    std::cout << usage << "\n" << desc << std::endl;
    return false;
  }
  po::notify(vm);
  return true;
}

} // namespace

absl::optional<Config> prepare_config(int argc, const char *const argv[]) {
  Config config;
  std::string weighting;

  po::options_description desc("Options");
  desc.add_options()("help,h", "print help")
      ("reference", po::value<std::string>(&config.reference)->required(),
       "address of the older (reference) corpus")
      ("focus", po::value<std::string>(&config.focus)->required(),
       "address of the newer (focus) corpus")
      ("output", po::value<std::string>(&config.output)->required(),
       "directory to write output to");
  desc.add(model_options(config, weighting));

  po::positional_options_description pos;
  pos.add("reference", 1).add("focus", 1).add("output", 1);

  if (!parse(argc, argv, desc, pos,
             "Usage: sensediff_prepare REFERENCE FOCUS OUTPUT [options]"))
    return absl::nullopt;

  config.weighting = parse_weighting(weighting);
  config.validate();
  return config;
}

absl::optional<Config> score_config(int argc, const char *const argv[]) {
  Config config;

  po::options_description desc("Options");
  desc.add_options()("help,h", "print help")
      ("snapshot", po::value<std::string>(&config.snapshot)->required(),
       "corpus snapshot directory, or the saves directory to take the "
       "latest snapshot from")
      ("targets", po::value<std::string>(&config.targets),
       "file with target words, one per line")
      ("top_k", po::value<std::uint32_t>(&config.top_k)
           ->default_value(config.top_k),
       "number of words to print");

  po::positional_options_description pos;
  pos.add("snapshot", 1);

  if (!parse(argc, argv, desc, pos,
             "Usage: sensediff_score SNAPSHOT [options]"))
    return absl::nullopt;

  config.validate();
  return config;
}

} // namespace snsd
