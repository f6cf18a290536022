#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace gogsync
{
  // Format a byte count for display.
  //
  // Values above 1024 are scaled to kB, above 1024^2 to MB and above 1024^3
  // to GB. The number always has two decimals and a grouped integer part
  // (1,023.00 B, 1.50 MB). If raw is true, the value is never scaled.
  //
  std::string
  format_bytes (std::uint64_t n, bool raw = false);

  // Render a bar of width cells for a completion ratio in [0, 1]:
  // [=====>    ].
  //
  std::string
  format_bar (double ratio, std::size_t width);

  // Completion percentage, right-aligned in three columns.
  //
  std::string
  format_percent (std::uint64_t current, std::uint64_t total);
}
