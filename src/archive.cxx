#include <ustar-view/archive.hxx>

#include <boost/log/trivial.hpp>

namespace ustar_view {
namespace detail {
result<void> validate_archive_size(std::size_t length) noexcept {
  if (length < min_archive_size || length % block_size != 0) {
    BOOST_LOG_TRIVIAL(error) << "rejecting tar buffer of " << length
                             << " bytes: expected a multiple of " << block_size
                             << " of at least " << min_archive_size;
    return make_error_code(errc::invalid_size);
  }
  return boost::outcome_v2::success();
}
} // namespace detail

result<Archive> Archive::create(std::span<const char> buffer) noexcept {
  if (auto valid = detail::validate_archive_size(buffer.size()); !valid)
    return valid.error();
  return Archive(buffer);
}
} // namespace ustar_view
