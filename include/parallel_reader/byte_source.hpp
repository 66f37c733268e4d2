#pragma once
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

namespace pr {

struct ReadResult {
  enum class Status { Ok, Eof, Error };

  Status status = Status::Ok;
  std::size_t bytes = 0;  // may be > 0 together with Eof
  int sys_errno = 0;
};

// Sequential, non-rewindable byte stream consumed by ParallelReader.
// read() may return fewer bytes than asked for; Eof means no more data will
// ever follow, Error is any other fault.
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual ReadResult read(char* dst, std::size_t n) = 0;
};

// In-memory source. Optional knobs simulate short reads and a fault
// injected once `fail_after` bytes have been handed out.
class StringSource : public ByteSource {
public:
  struct Config {
    std::size_t max_read   = 0;  // 0 = unlimited
    std::size_t fail_after = 0;  // 0 = never
    int fail_errno = 5;          // EIO
  };

  explicit StringSource(std::string data);
  StringSource(std::string data, Config cfg);

  ReadResult read(char* dst, std::size_t n) override;
  std::size_t consumed() const noexcept { return pos_; }

private:
  std::string data_;
  Config cfg_;
  std::size_t pos_{0};
};

// stdio-backed source. Owns the handle when opened from a path.
class FileSource : public ByteSource {
public:
  FileSource() = default;
  explicit FileSource(std::FILE* f);        // borrowed, e.g. stdin
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  // Opens `path` for binary reading; returns false and sets last_error().
  bool open(const std::string& path);
  ReadResult read(char* dst, std::size_t n) override;

  int last_error() const noexcept { return last_errno_; }
  std::size_t bytes_read() const noexcept { return bytes_; }

private:
  std::FILE* f_{nullptr};
  bool owned_{false};
  int last_errno_{0};
  std::size_t bytes_{0};
};

}
