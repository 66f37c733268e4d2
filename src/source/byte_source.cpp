#include "parallel_reader/byte_source.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace pr {

StringSource::StringSource(std::string data)
  : StringSource(std::move(data), Config{}) {}

StringSource::StringSource(std::string data, Config cfg)
  : data_(std::move(data)), cfg_(cfg) {}

ReadResult StringSource::read(char* dst, std::size_t n) {
  ReadResult r;
  if (cfg_.fail_after && pos_ >= cfg_.fail_after) {
    r.status = ReadResult::Status::Error;
    r.sys_errno = cfg_.fail_errno;
    return r;
  }

  std::size_t want = n;
  if (cfg_.max_read) want = std::min(want, cfg_.max_read);
  if (cfg_.fail_after) want = std::min(want, cfg_.fail_after - pos_);
  want = std::min(want, data_.size() - pos_);

  if (want) std::memcpy(dst, data_.data() + pos_, want);
  pos_ += want;
  r.bytes = want;
  if (pos_ == data_.size() && !(cfg_.fail_after && pos_ >= cfg_.fail_after))
    r.status = ReadResult::Status::Eof;
  return r;
}

FileSource::FileSource(std::FILE* f) : f_(f), owned_(false) {}

FileSource::~FileSource() {
  if (owned_ && f_) std::fclose(f_);
}

bool FileSource::open(const std::string& path) {
  if (owned_ && f_) std::fclose(f_);
  f_ = std::fopen(path.c_str(), "rb");
  owned_ = (f_ != nullptr);
  if (!f_) { last_errno_ = errno; return false; }
  return true;
}

ReadResult FileSource::read(char* dst, std::size_t n) {
  ReadResult r;
  if (!f_) {
    r.status = ReadResult::Status::Error;
    r.sys_errno = EBADF;
    return r;
  }
  r.bytes = std::fread(dst, 1, n, f_);
  bytes_ += r.bytes;
  if (r.bytes < n) {
    if (std::ferror(f_)) {
      last_errno_ = errno;
      r.status = ReadResult::Status::Error;
      r.sys_errno = last_errno_;
    } else if (std::feof(f_)) {
      r.status = ReadResult::Status::Eof;
    }
  }
  return r;
}

}
