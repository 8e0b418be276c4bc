#pragma once

#include <ustar-view/error.hxx>

#include <cstdint>
#include <limits>
#include <span>

namespace ustar_view::detail {
/**
 * @brief Parse an octal ASCII integer from a fixed-width header field.
 *
 * Leading spaces are skipped, then octal digits are consumed up to the first
 * NUL or space, or to the end of the field. An empty digit run decodes to 0.
 * Bytes after the terminator are ignored.
 *
 * @param field Bytes of the header field.
 * @param max_value Largest value accepted.
 * @return The decoded value, errc::number_format when a byte before the
 * terminator is neither an octal digit nor a terminator, or
 * errc::number_overflow when the value exceeds max_value.
 */
result<std::uint64_t>
parse_octal(std::span<const char> field,
            std::uint64_t max_value =
                std::numeric_limits<std::uint64_t>::max()) noexcept;
} // namespace ustar_view::detail
