//!
//! @file streamer.hpp
//! Последовательная запись/чтение сообщений снимка корпуса: protobuf с
//! заголовком sense.Header и упакованные сообщения capnp
//!

#pragma once

#include <capnp/message.h>
#include <capnp/serialize-packed.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/message.h>
#include <google/protobuf/util/delimited_message_util.h>
#include <kj/io.h>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "sense.capnp.h"
#include "sense.pb.h"

namespace snsd {

// открывает файл, бросает std::runtime_error с текстом errno
inline int open_or_throw(const std::string &fname, int flags) {
  int fd = open(fname.c_str(), flags, 0600);
  if (fd < 0) {
    std::ostringstream ss;
    ss << "could't open file " << fname << ", error: " << strerror(errno);
    throw std::runtime_error(ss.str());
  }
  return fd;
}

// потоковое чтение сообщений из protobuf файла
template <class M> class IFStreamer {
  static constexpr auto parse =
      google::protobuf::util::ParseDelimitedFromZeroCopyStream;
  using FileInputStream = google::protobuf::io::FileInputStream;
  int fd;
  std::unique_ptr<FileInputStream> stream;

public:
  using value_type = M;
  IFStreamer(const std::string &fname, std::uint64_t *total = nullptr)
      : fd{open_or_throw(fname, O_RDONLY)},
        stream{std::make_unique<FileInputStream>(fd)} {
    std::ostringstream ss;
    sense::Header h;
    if (!parse(&h, stream.get(), nullptr)) {
      Close();
      ss << fname << ": could't read file header";
      throw std::runtime_error(ss.str());
    }
    if (h.msg_type() != M::GetDescriptor()->name()) {
      Close();
      ss << fname << ": file type " << h.msg_type() << " does not match "
         << M::GetDescriptor()->name();
      throw std::runtime_error(ss.str());
    }

    if (total != nullptr)
      *total = h.total();
  }

  IFStreamer() = delete;
  IFStreamer(const IFStreamer &) = delete;
  IFStreamer(IFStreamer &&rhs) : fd{rhs.fd}, stream{std::move(rhs.stream)} {}

  ~IFStreamer() { Close(); }

  bool read(M &msg) { return parse(&msg, stream.get(), nullptr); }
  void Close() {
    if (stream != nullptr) {
      stream->Close(); // закрывает и fd
      stream = nullptr;
    }
  }
};

// потоковая запись сообщений в protobuf файл
template <class M> class OFStreamer {
  static constexpr auto serialize =
      google::protobuf::util::SerializeDelimitedToZeroCopyStream;
  using FileOutputStream = google::protobuf::io::FileOutputStream;
  int fd;
  std::unique_ptr<FileOutputStream> stream;
  std::string fname;

public:
  using value_type = M;

  OFStreamer(const std::string &fname, std::uint64_t total = 0)
      : fd{open_or_throw(fname, O_WRONLY | O_CREAT | O_TRUNC)},
        stream{std::make_unique<FileOutputStream>(fd)}, fname{fname} {
    sense::Header h;
    h.set_msg_type(M::GetDescriptor()->name());
    h.set_total(total);

    if (!serialize(h, stream.get())) {
      Close();
      std::ostringstream ss;
      ss << fname << ": header writing failed";
      throw std::runtime_error(ss.str());
    }
  }

  OFStreamer() = delete;
  OFStreamer(const OFStreamer &) = delete;
  OFStreamer(OFStreamer &&rhs)
      : fd{rhs.fd}, stream{std::move(rhs.stream)}, fname{std::move(rhs.fname)} {
  }

  ~OFStreamer() { Close(); }

  void write(const M &msg) {
    if (!serialize(msg, stream.get())) {
      std::ostringstream ss;
      ss << fname << ": writing failed";
      throw std::runtime_error(ss.str());
    }
  }

  void Close() {
    if (stream != nullptr) {
      stream->Close(); // закрывает и fd
      stream = nullptr;
    }
  }
};

// запись упакованных сообщений capnp одно за другим
class PackedWriter {
  int fd;
  std::unique_ptr<kj::FdOutputStream> fdStream;
  std::unique_ptr<kj::BufferedOutputStreamWrapper> bufferedOut;

public:
  explicit PackedWriter(const std::string &fname)
      : fd{open_or_throw(fname, O_WRONLY | O_CREAT | O_TRUNC)},
        fdStream{std::make_unique<kj::FdOutputStream>(fd)},
        bufferedOut{
            std::make_unique<kj::BufferedOutputStreamWrapper>(*fdStream)} {}

  PackedWriter(const PackedWriter &) = delete;

  void write(capnp::MessageBuilder &message) {
    capnp::writePackedMessage(*bufferedOut, message);
  }

  ~PackedWriter() {
    bufferedOut->flush();
    bufferedOut = nullptr;
    fdStream = nullptr;
    close(fd);
  }
};

template <class M> size_t read_total(const std::string &fname) {
  std::uint64_t total = 0;
  IFStreamer<M> is(fname, &total);
  return total;
}

template <class M, class F> void read_apply(const std::string &fname, F fn) {
  IFStreamer<M> is(fname);
  bool keep = true;
  M msg;
  while (keep) {
    msg.Clear();
    keep = is.read(msg);
    if (keep)
      fn(&msg);
  }
}

// читает упакованные сообщения capnp до конца файла
template <class M, class F> void read_fn(const std::string &fname, F fn) {
  kj::AutoCloseFd fd(open_or_throw(fname, O_RDONLY));
  kj::FdInputStream fdStream(fd.get());
  kj::BufferedInputStreamWrapper bufferedStream(fdStream);
  while (bufferedStream.tryGetReadBuffer() != nullptr) {
    capnp::PackedMessageReader reader(bufferedStream);
    fn(reader.getRoot<M>());
  }
}

} // namespace snsd
