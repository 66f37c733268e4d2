#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace pr {

// "64KiB", "1.5M", "4096", "2g" -> bytes. Suffixes are binary multiples and
// case-insensitive: B, K/KB/KiB, M/MB/MiB, G/GB/GiB. Rejects zero, negative
// and non-finite values.
std::optional<std::size_t> parse_size(std::string_view s);

// Decode \n \r \t \0 \\ in a command-line boundary string. Unknown escapes
// are kept verbatim.
std::string unescape(std::string_view s);

}
