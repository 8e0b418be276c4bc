#pragma once

#include <ustar-view/constants.hxx>
#include <ustar-view/error.hxx>

#include <boost/static_string/static_string.hpp>

#include <span>
#include <string_view>

namespace ustar_view {
/// Fixed-capacity path storage; never allocates.
using path_string = boost::static_string<max_path_length>;
} // namespace ustar_view

namespace ustar_view::detail {
/**
 * @brief Extract a possibly non-NUL-terminated text field from the header.
 *
 * @return The bytes up to the first NUL, or the full field when it contains
 * no NUL.
 */
std::string_view trim_field(std::span<const char> field) noexcept;

/**
 * @brief Check that a byte sequence is well-formed UTF-8.
 */
bool is_valid_utf8(std::string_view text) noexcept;

/**
 * @brief Build the logical path from the name and prefix fields.
 *
 * Both fields are trimmed with trim_field(). A non-empty prefix is joined to
 * the name with a single '/'.
 *
 * @param name Name field (100 bytes in a header block).
 * @param prefix Prefix field (155 bytes in a header block), may be empty.
 * @return The joined path, errc::filename_too_long when it would exceed
 * max_path_length, or errc::invalid_name when it is empty or not valid
 * UTF-8.
 */
result<path_string> resolve_path(std::span<const char> name,
                                 std::span<const char> prefix) noexcept;
} // namespace ustar_view::detail
