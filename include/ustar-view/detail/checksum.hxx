#pragma once

#include <ustar-view/constants.hxx>

#include <cstdint>
#include <span>

namespace ustar_view::detail {
/**
 * @brief Sum a header block as unsigned bytes, counting the checksum field as
 * eight ASCII spaces.
 */
std::uint32_t unsigned_checksum(std::span<const char, block_size> block) noexcept;

/**
 * @brief Same as unsigned_checksum() but with bytes read as signed 8-bit
 * values, as some historical encoders computed it.
 */
std::int32_t signed_checksum(std::span<const char, block_size> block) noexcept;

/** @enum ChecksumStatus Outcome of verify_checksum(). */
enum class ChecksumStatus { valid, valid_legacy, mismatch };

/**
 * @brief Compare the stored checksum field against the recomputed sums.
 *
 * The unsigned sum is the primary rule; the signed sum is only consulted when
 * the unsigned comparison fails. A checksum field that does not decode as an
 * octal number is a mismatch.
 */
ChecksumStatus verify_checksum(std::span<const char, block_size> block) noexcept;
} // namespace ustar_view::detail
