#pragma once

#include <ustar-view/archive-entry.hxx>

#include <cstddef>
#include <optional>
#include <span>
#include <system_error>

namespace ustar_view {
/**
 * @class EntryIterator
 * @brief Lazy walk over the blocks of an archive buffer, yielding regular
 * files.
 *
 * The iterator holds only a view of the buffer and a block-aligned offset, so
 * several iterators over the same buffer are independent. Directories and
 * other entry kinds are consumed without being yielded.
 *
 * Iteration is fail-stop: block boundaries derive from each header's size
 * field, so after a corrupt header nothing that follows can be located.
 *
 * @code{.cpp}
 * auto it = archive.entries();
 * while (auto entry = it.next())
 *   use(entry->path(), entry->data());
 * if (it.state() == ustar_view::EntryIterator::State::Errored)
 *   report(it.error());
 * @endcode
 */
class EntryIterator {
public:
  /** @enum State Iteration states; Ended and Errored are terminal. */
  enum class State { Positioned, Ended, Errored };

  explicit EntryIterator(std::span<const char> buffer) noexcept
      : buffer_(buffer) {}

  /**
   * @brief Advance to the next regular file.
   *
   * @return The next entry, or std::nullopt once the iterator is in a
   * terminal state. When iteration stopped on a failure, error() holds the
   * cause.
   */
  std::optional<ArchiveEntry> next();

  State state() const noexcept { return state_; }

  /// Failure that moved the iterator to Errored; empty otherwise.
  std::error_code error() const noexcept { return error_; }

  /// Offset of the next header block to read.
  std::size_t offset() const noexcept { return offset_; }

private:
  void end_at_zero_block();
  void fail(std::error_code ec);

  std::span<const char> buffer_;
  std::size_t offset_ = 0;
  State state_ = State::Positioned;
  std::error_code error_;
};
} // namespace ustar_view
