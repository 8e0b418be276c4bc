#pragma once

#include <ustar-view/constants.hxx>
#include <ustar-view/detail/name-resolver.hxx>
#include <ustar-view/error.hxx>

#include <cstdint>
#include <span>
#include <string_view>

namespace ustar_view {
/**
 * @enum TypeFlag
 * @brief Raw value of the typeflag byte.
 *
 * Any byte is representable; the named values are the ones defined by POSIX
 * and the PAX extension.
 */
enum class TypeFlag : char {
  regular = '0',
  regular_legacy = '\0', /**< @brief Pre-POSIX regular file. */
  hard_link = '1',
  symlink = '2',
  char_device = '3',
  block_device = '4',
  directory = '5',
  fifo = '6',
  contiguous = '7',
  pax_extended = 'x',
  pax_global = 'g',
};

/**
 * @enum EntryKind
 * @brief Classification of an entry. Only regular files carry data that is
 * exposed to callers.
 */
enum class EntryKind { regular_file, directory, other };

/**
 * @enum HeaderFormat
 * @brief Header flavour, identified by the magic and version fields.
 */
enum class HeaderFormat {
  ustar, /**< @brief POSIX "ustar\0" "00". */
  gnu,   /**< @brief GNU "ustar  \0"; the prefix region holds other data. */
  v7,    /**< @brief Anything else, normally a blank magic. */
};

/// Permission bits of the mode field.
namespace mode_bits {
inline constexpr std::uint32_t set_uid = 04000;
inline constexpr std::uint32_t set_gid = 02000;
inline constexpr std::uint32_t sticky = 01000;
inline constexpr std::uint32_t owner_read = 0400;
inline constexpr std::uint32_t owner_write = 0200;
inline constexpr std::uint32_t owner_exec = 0100;
inline constexpr std::uint32_t group_read = 0040;
inline constexpr std::uint32_t group_write = 0020;
inline constexpr std::uint32_t group_exec = 0010;
inline constexpr std::uint32_t others_read = 0004;
inline constexpr std::uint32_t others_write = 0002;
inline constexpr std::uint32_t others_exec = 0001;
} // namespace mode_bits

/**
 * @struct Header
 * @brief Decoded contents of one header block.
 *
 * The text views point into the block the header was decoded from and are
 * only valid while that buffer is alive.
 */
struct Header {
  path_string path;       /**< @brief prefix + '/' + name, or name alone. */
  std::uint64_t size = 0; /**< @brief Data length in bytes. */
  std::uint32_t mode = 0; /**< @brief Permission bits, see mode_bits. */
  std::uint64_t uid = 0;
  std::uint64_t gid = 0;
  std::uint64_t mtime = 0; /**< @brief Seconds since the epoch. */
  TypeFlag typeflag = TypeFlag::regular;
  EntryKind kind = EntryKind::regular_file;
  HeaderFormat format = HeaderFormat::ustar;
  std::string_view linkname;
  std::string_view uname;
  std::string_view gname;
  std::uint32_t devmajor = 0;
  std::uint32_t devminor = 0;
  bool legacy_checksum = false; /**< @brief Only the signed sum matched. */
};

/**
 * @brief Map a typeflag (and, for the legacy regular flag, the name) to an
 * EntryKind.
 *
 * A legacy regular file whose name ends in '/' is a directory.
 */
EntryKind classify(TypeFlag typeflag, std::string_view path) noexcept;

/**
 * @class HeaderView
 * @brief Read-only interpretation of one 512-byte block as a header.
 *
 * The view does not copy the block; it must outlive the view and any Header
 * decoded from it.
 */
class HeaderView {
public:
  explicit HeaderView(std::span<const char, block_size> block) noexcept
      : block_(block) {}

  /**
   * @brief Check whether the block is entirely zeros.
   *
   * TAR archives are terminated by one or two such blocks.
   */
  bool is_zero_block() const noexcept;

  /**
   * @brief Validate the checksum and decode every header field.
   *
   * Only size, mode and path are fatal when malformed. uid, gid, mtime and
   * the device numbers decode to 0 with a logged warning instead.
   *
   * @return The decoded header, or errc::end_of_archive for a zero block,
   * errc::checksum_mismatch, errc::number_format, errc::number_overflow,
   * errc::filename_too_long or errc::invalid_name.
   */
  result<Header> decode() const;

  /**
   * @brief Format of the header, from the magic and version fields.
   */
  HeaderFormat format() const noexcept;

private:
  std::span<const char, block_size> block_;
};
} // namespace ustar_view
