#include <ustar-view/detail/name-resolver.hxx>

#include <boost/locale/utf.hpp>

#include <algorithm>

namespace ustar_view::detail {
std::string_view trim_field(std::span<const char> field) noexcept {
  const auto end = std::find(field.begin(), field.end(), '\0');
  return {field.data(), static_cast<std::size_t>(end - field.begin())};
}

bool is_valid_utf8(std::string_view text) noexcept {
  using traits = boost::locale::utf::utf_traits<char>;
  auto it = text.begin();
  while (it != text.end()) {
    const auto code_point = traits::decode(it, text.end());
    if (code_point == boost::locale::utf::illegal ||
        code_point == boost::locale::utf::incomplete)
      return false;
  }
  return true;
}

result<path_string> resolve_path(std::span<const char> name,
                                 std::span<const char> prefix) noexcept {
  const auto name_text = trim_field(name);
  const auto prefix_text = trim_field(prefix);

  const std::size_t length =
      prefix_text.empty() ? name_text.size()
                          : prefix_text.size() + 1 + name_text.size();
  if (length > max_path_length)
    return make_error_code(errc::filename_too_long);
  if (length == 0)
    return make_error_code(errc::invalid_name);

  path_string path;
  if (!prefix_text.empty()) {
    path.append(prefix_text.data(), prefix_text.size());
    path.push_back('/');
  }
  path.append(name_text.data(), name_text.size());

  if (!is_valid_utf8(std::string_view(path.data(), path.size())))
    return make_error_code(errc::invalid_name);
  return path;
}
} // namespace ustar_view::detail
