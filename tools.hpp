#pragma once

#include <string>
#include <vector>

namespace snsd {

// выполняет системную команду
void system_exec(const std::string &command);

// Читает текстовый файл построчно. Бросает std::runtime_error, если файл не
// открывается или пуст.
std::vector<std::string> read_lines(const std::string &fname);

// подкаталоги @path, имена которых начинаются с @prefix, отсортированные по
// числовому суффиксу (corpus_2 раньше corpus_10)
std::vector<std::string> list_dirs(const std::string &path,
                                   const std::string &prefix);

// тип сообщений protobuf файла по его заголовку, пустая строка если
// заголовок не читается
std::string get_data_type(const char *fname);

// Эксклюзивная блокировка каталога (flock на файле .lock внутри него) на
// время жизни объекта.
class DirLock {
  int fd;

public:
  explicit DirLock(const std::string &dir);
  DirLock(const DirLock &) = delete;
  DirLock &operator=(const DirLock &) = delete;
  ~DirLock();
};

} // namespace snsd
