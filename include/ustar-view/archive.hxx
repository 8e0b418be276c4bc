#pragma once

#include <ustar-view/constants.hxx>
#include <ustar-view/entry-iterator.hxx>
#include <ustar-view/error.hxx>

#include <cstddef>
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace ustar_view {
namespace detail {
/**
 * @brief Check the shape of an archive buffer.
 *
 * @return errc::invalid_size unless the length is a multiple of block_size
 * and at least min_archive_size.
 */
result<void> validate_archive_size(std::size_t length) noexcept;
} // namespace detail

template <typename Alloc> class BasicOwnedArchive;

/**
 * @class Archive
 * @brief Borrowed, zero-copy view of a tar archive held in memory.
 *
 * The caller keeps the buffer alive for as long as the Archive, its
 * iterators and its entries are in use. Nothing is allocated.
 *
 * @code{.cpp}
 * auto archive = ustar_view::Archive::create(bytes);
 * if (!archive)
 *   return archive.error();
 * auto it = archive.value().entries();
 * while (auto entry = it.next())
 *   std::cout << entry->path() << '\n';
 * @endcode
 */
class Archive {
public:
  /**
   * @brief Validate a buffer and wrap it.
   *
   * @param buffer Archive bytes, already decompressed.
   * @return The archive, or errc::invalid_size.
   */
  static result<Archive> create(std::span<const char> buffer) noexcept;

  /// A fresh iterator positioned on the first header.
  EntryIterator entries() const noexcept { return EntryIterator(buffer_); }

  std::span<const char> data() const noexcept { return buffer_; }

private:
  template <typename Alloc> friend class BasicOwnedArchive;

  explicit Archive(std::span<const char> buffer) noexcept : buffer_(buffer) {}

  std::span<const char> buffer_;
};

/**
 * @class BasicOwnedArchive
 * @brief Archive that keeps a private copy of its bytes.
 *
 * The source buffer may be released once create() returns. Decoding is
 * delegated to Archive over the copy.
 *
 * @tparam Alloc Allocator used for the copy (default: std::allocator<char>).
 */
template <typename Alloc = std::allocator<char>> class BasicOwnedArchive {
public:
  using allocator_type = Alloc;

  /**
   * @brief Validate a buffer and copy it with the given allocator.
   *
   * @return The archive, or errc::invalid_size. Allocation failure
   * propagates as the allocator's exception.
   */
  static result<BasicOwnedArchive> create(std::span<const char> buffer,
                                          const Alloc &alloc = Alloc()) {
    if (auto valid = detail::validate_archive_size(buffer.size()); !valid)
      return valid.error();
    return BasicOwnedArchive(
        std::vector<char, Alloc>(buffer.begin(), buffer.end(), alloc));
  }

  /// Borrowed view over the private copy.
  Archive archive() const noexcept { return Archive(storage_); }

  EntryIterator entries() const noexcept { return archive().entries(); }

  std::span<const char> data() const noexcept { return storage_; }

private:
  explicit BasicOwnedArchive(std::vector<char, Alloc> storage)
      : storage_(std::move(storage)) {}

  std::vector<char, Alloc> storage_;
};

using OwnedArchive = BasicOwnedArchive<>;
} // namespace ustar_view
