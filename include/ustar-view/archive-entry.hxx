#pragma once

#include <ustar-view/error.hxx>
#include <ustar-view/header.hxx>

#include <boost/iostreams/device/array.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace ustar_view {
/**
 * @class ArchiveEntry
 * @brief Immutable view of one regular file: its header and a zero-copy slice
 * of its content.
 *
 * The slice references the archive buffer, so an entry must not outlive the
 * buffer of a borrowed Archive or the OwnedArchive it came from.
 */
class ArchiveEntry {
public:
  ArchiveEntry(const Header &header, std::span<const char> data) noexcept
      : header_(header), data_(data) {}

  /// Resolved path of the file.
  std::string_view path() const noexcept {
    return {header_.path.data(), header_.path.size()};
  }

  /// Size in bytes; always equal to data().size().
  std::size_t size() const noexcept { return data_.size(); }

  std::uint32_t mode() const noexcept { return header_.mode; }

  std::uint64_t mtime() const noexcept { return header_.mtime; }

  const Header &header() const noexcept { return header_; }

  /// File content, exactly size() bytes.
  std::span<const char> data() const noexcept { return data_; }

  /**
   * @brief File content as text.
   *
   * @return The content, or errc::utf8_decode when it is not valid UTF-8.
   */
  result<std::string_view> text() const noexcept;

  /**
   * @brief Boost.Iostreams source device over the file content.
   *
   * Reading from the device does not copy the archive; it can be pushed into
   * a filtering_istream or wrapped in boost::iostreams::stream.
   */
  boost::iostreams::array_source source() const noexcept {
    return {data_.data(), data_.size()};
  }

private:
  Header header_;
  std::span<const char> data_;
};
} // namespace ustar_view
