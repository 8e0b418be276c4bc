#pragma once

#include <cstddef>
#include <cstdint>

namespace ustar_view {
/// Size of every header and data block.
inline constexpr std::size_t block_size = 512;

/// Smallest accepted archive: one header block plus one zero block.
inline constexpr std::size_t min_archive_size = 2 * block_size;

/// Largest entry size accepted from the size field (8 GiB - 1).
inline constexpr std::uint64_t max_entry_size = (std::uint64_t{1} << 33) - 1;

/// Longest resolved path: 155 bytes of prefix, a separator and 100 of name.
inline constexpr std::size_t max_path_length = 256;

/// Round a byte count up to the next block boundary.
constexpr std::uint64_t round_up_to_block(std::uint64_t n) noexcept {
  return (n + block_size - 1) / block_size * block_size;
}
} // namespace ustar_view
