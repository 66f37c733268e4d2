#pragma once
#include <string>

namespace pr {

enum class ReadErrc {
  None,
  InvalidConfig,
  SourceReadFault,
  ScanOverflow,
  CallbackFault,
};

struct ReadError {
  ReadErrc code = ReadErrc::None;
  std::string message;
  int sys_errno = 0;   // set for SourceReadFault

  explicit operator bool() const noexcept { return code != ReadErrc::None; }
};

const char* to_string(ReadErrc c) noexcept;

}
