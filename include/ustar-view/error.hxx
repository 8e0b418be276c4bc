#pragma once

#include <boost/outcome/std_result.hpp>

#include <string>
#include <system_error>

namespace ustar_view {
/**
 * @enum errc
 * @brief Failure conditions reported while validating and decoding an
 * archive.
 *
 * end_of_archive is not a failure: it marks the zero block that terminates
 * the entry sequence and is consumed by the iterator.
 */
enum class errc {
  end_of_archive = 1,
  invalid_size,
  checksum_mismatch,
  number_format,
  number_overflow,
  filename_too_long,
  invalid_name,
  truncated_data,
  utf8_decode,
};

/**
 * @brief Error category shared by every ustar_view::errc value.
 */
const std::error_category &error_category() noexcept;

/**
 * @brief Wrap an errc value into a std::error_code of error_category().
 */
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief Value-or-error return type used by every fallible operation.
 *
 * @tparam T Type of the successful value.
 */
template <typename T>
using result = boost::outcome_v2::std_result<T>;
} // namespace ustar_view

namespace std {
template <> struct is_error_code_enum<ustar_view::errc> : true_type {};
} // namespace std
