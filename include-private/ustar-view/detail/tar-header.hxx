#pragma once

#include <ustar-view/constants.hxx>

#include <cstddef>
#include <span>

namespace ustar_view::detail {
/**
 * @struct TarHeader
 * @brief On-disk layout of a POSIX/USTAR header block (512 bytes).
 *
 * Fields are fixed-size character arrays and are only NUL-terminated when the
 * value is shorter than the field. The GNU format reuses the prefix region for
 * access/change times and sparse maps.
 *
 * Note: Every member is a char array, so the struct has no padding and
 * alignment 1; the static_assert below pins the 512-byte layout.
 */
struct TarHeader {
  char name[100];     /**< @brief File name (may be NUL-terminated). */
  char mode[8];       /**< @brief File mode (octal ASCII). */
  char uid[8];        /**< @brief Owner user ID (octal ASCII). */
  char gid[8];        /**< @brief Owner group ID (octal ASCII). */
  char size[12];      /**< @brief File size (octal ASCII). */
  char mtime[12];     /**< @brief Modification time (octal ASCII). */
  char chksum[8];     /**< @brief Header checksum field (octal ASCII). */
  char typeflag[1];   /**< @brief Type flag ('0' regular file, '5' directory,
                         etc.). */
  char linkname[100]; /**< @brief Name of linked file for links. */
  char magic[6];      /**< @brief "ustar\0" (POSIX) or "ustar " (GNU). */
  char version[2];    /**< @brief "00" (POSIX) or " \0" (GNU). */
  char uname[32];     /**< @brief Owner user name. */
  char gname[32];     /**< @brief Owner group name. */
  char devmajor[8];   /**< @brief Device major number for special files. */
  char devminor[8];   /**< @brief Device minor number for special files. */
  char prefix[155];   /**< @brief Prefix for long file names. */
  char padding[12];   /**< @brief Padding to make the header 512 bytes. */
};

static_assert(sizeof(TarHeader) == block_size, "TarHeader must be 512 bytes");

/// Offset of the checksum field inside a header block.
inline constexpr std::size_t checksum_offset = 148;
static_assert(offsetof(TarHeader, chksum) == checksum_offset);

/**
 * @brief Interpret a block as a TarHeader without copying it.
 */
inline const TarHeader *as_tar_header(std::span<const char, block_size> block) {
  return reinterpret_cast<const TarHeader *>(block.data());
}

/**
 * @brief View a whole header field as a span of its bytes.
 */
template <std::size_t N>
constexpr std::span<const char, N> field(const char (&f)[N]) noexcept {
  return std::span<const char, N>(f);
}
} // namespace ustar_view::detail
