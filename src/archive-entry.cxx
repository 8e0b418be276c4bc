#include <ustar-view/archive-entry.hxx>
#include <ustar-view/detail/name-resolver.hxx>

namespace ustar_view {
result<std::string_view> ArchiveEntry::text() const noexcept {
  const std::string_view content(data_.data(), data_.size());
  if (!detail::is_valid_utf8(content))
    return make_error_code(errc::utf8_decode);
  return content;
}
} // namespace ustar_view
