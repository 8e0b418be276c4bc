#include <ustar-view/detail/numeric-field.hxx>

#include <cstddef>

namespace ustar_view::detail {
result<std::uint64_t> parse_octal(std::span<const char> field,
                                  std::uint64_t max_value) noexcept {
  std::size_t i = 0;
  while (i < field.size() && field[i] == ' ')
    ++i;

  std::uint64_t value = 0;
  for (; i < field.size(); ++i) {
    const char c = field[i];
    if (c == '\0' || c == ' ')
      break;
    if (c < '0' || c > '7')
      return make_error_code(errc::number_format);

    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (digit > max_value || value > (max_value - digit) / 8)
      return make_error_code(errc::number_overflow);
    value = value * 8 + digit;
  }
  return value;
}
} // namespace ustar_view::detail
