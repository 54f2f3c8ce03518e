#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/string_view.h>
#include <absl/strings/strip.h>
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/util/delimited_message_util.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/file.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

#include "../tools.hpp"
#include "sense.pb.h"

namespace snsd {

void system_exec(const std::string &command) {
  std::ostringstream ss;
  int status = system(command.c_str());
  if (status < 0) {
    ss << "Error: " << strerror(errno);
    throw std::runtime_error(ss.str());
  } else if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    ss << "Error " << command;
    throw std::runtime_error(ss.str());
  }
}

std::vector<std::string> read_lines(const std::string &fname) {
  std::ifstream fin(fname);
  if (!fin.is_open()) {
    std::ostringstream ss;
    ss << "could't open file " << fname << ", error: " << strerror(errno);
    throw std::runtime_error(ss.str());
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(fin, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(std::move(line));
  }
  if (fin.bad()) {
    std::ostringstream ss;
    ss << "error reading " << fname;
    throw std::runtime_error(ss.str());
  }
  if (lines.empty()) {
    std::ostringstream ss;
    ss << fname << ": file is empty";
    throw std::runtime_error(ss.str());
  }
  return lines;
}

std::vector<std::string> list_dirs(const std::string &path,
                                   const std::string &prefix) {
  std::vector<std::pair<std::uint64_t, std::string>> found;
  auto dir = opendir(path.c_str());
  if (dir == nullptr) {
    std::ostringstream ss;
    ss << "could't open directory " << path << ", error: " << strerror(errno);
    throw std::runtime_error(ss.str());
  }

  while (auto f = readdir(dir)) {
    if (f->d_name[0] == '.')
      continue;
    if (f->d_type != DT_DIR && f->d_type != DT_UNKNOWN)
      continue;
    absl::string_view name(f->d_name);
    if (!absl::ConsumePrefix(&name, prefix))
      continue;
    std::uint64_t n = 0;
    // незаконченные снимки (corpus_3.tmp) пропускаем
    if (!absl::SimpleAtoi(name, &n))
      continue;
    found.emplace_back(n, path + "/" + f->d_name);
  }
  closedir(dir);

  std::sort(found.begin(), found.end());
  std::vector<std::string> dirs;
  for (auto &el : found) {
    dirs.push_back(std::move(el.second));
  }
  return dirs;
}

std::string get_data_type(const char *fname) {
  int fd = open(fname, O_RDONLY);

  std::ostringstream ss;
  if (fd < 0) {
    ss << "could't open file " << fname << ", error: " << strerror(errno);
    throw std::runtime_error(ss.str());
  }

  google::protobuf::io::FileInputStream fin(fd);

  auto parse = google::protobuf::util::ParseDelimitedFromZeroCopyStream;

  sense::Header h;
  bool keep = parse(&h, &fin, nullptr);

  fin.Close();

  if (keep)
    return h.msg_type();
  else
    return "";
}

DirLock::DirLock(const std::string &dir) {
  auto fname = dir + "/.lock";
  fd = open(fname.c_str(), O_RDWR | O_CREAT, 0600);
  if (fd < 0) {
    std::ostringstream ss;
    ss << "could't open lock file " << fname << ", error: " << strerror(errno);
    throw std::runtime_error(ss.str());
  }
  if (flock(fd, LOCK_EX) != 0) {
    std::ostringstream ss;
    ss << "could't lock " << dir << ", error: " << strerror(errno);
    close(fd);
    throw std::runtime_error(ss.str());
  }
}

DirLock::~DirLock() {
  flock(fd, LOCK_UN);
  close(fd);
}

} // namespace snsd
