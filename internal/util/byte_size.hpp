#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sbomgraph::util {

/*
  Human byte sizes, as written in configuration files.

    "4096"  "512B"  "64KB"  "200MiB"  "1.5 GiB"

  Decimal units (KB, MB, GB, TB) are powers of 1000, binary units
  (KiB, MiB, GiB, TiB) powers of 1024. Units are case-insensitive.
  Throws util::InvalidArgument on anything else.
*/
std::uint64_t ParseByteSize(std::string_view text);

// "200.0 MiB", for logs
std::string FormatByteSize(std::uint64_t bytes);

} // namespace sbomgraph::util
