#include <ustar-view/detail/checksum.hxx>
#include <ustar-view/detail/numeric-field.hxx>
#include <ustar-view/detail/tar-header.hxx>
#include <ustar-view/header.hxx>

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cstring>
#include <limits>

namespace ustar_view {
namespace {

constexpr char posix_magic[] = {'u', 's', 't', 'a', 'r', '\0'};
constexpr char posix_version[] = {'0', '0'};
constexpr char gnu_magic[] = {'u', 's', 't', 'a', 'r', ' '};
constexpr char gnu_version[] = {' ', '\0'};

constexpr auto u32_max = std::numeric_limits<std::uint32_t>::max();

/**
 * @brief Decode an octal field into a 32-bit value.
 */
result<std::uint32_t> parse_octal_u32(std::span<const char> field) noexcept {
  const auto value = detail::parse_octal(field, u32_max);
  if (!value)
    return value.error();
  return static_cast<std::uint32_t>(value.value());
}

/**
 * @brief Decode an octal field that only carries metadata.
 *
 * Entry boundaries do not depend on these fields, so a value that is not
 * plain octal (a GNU base-256 id, junk device numbers) decodes to 0 with a
 * warning instead of stopping iteration.
 */
template <typename T>
T parse_metadata(std::span<const char> field, const char *field_name,
                 const path_string &path) {
  const auto value =
      detail::parse_octal(field, std::numeric_limits<T>::max());
  if (!value) {
    BOOST_LOG_TRIVIAL(warning) << "ignoring " << field_name << " of " << path
                               << ": " << value.error().message();
    return 0;
  }
  return static_cast<T>(value.value());
}

} // unnamed namespace

EntryKind classify(TypeFlag typeflag, std::string_view path) noexcept {
  switch (typeflag) {
  case TypeFlag::regular:
    return EntryKind::regular_file;
  case TypeFlag::regular_legacy:
    return !path.empty() && path.back() == '/' ? EntryKind::directory
                                               : EntryKind::regular_file;
  case TypeFlag::directory:
    return EntryKind::directory;
  default:
    return EntryKind::other;
  }
}

bool HeaderView::is_zero_block() const noexcept {
  return std::all_of(block_.begin(), block_.end(),
                     [](char c) { return c == '\0'; });
}

HeaderFormat HeaderView::format() const noexcept {
  const auto *tar = detail::as_tar_header(block_);
  if (std::memcmp(tar->magic, posix_magic, sizeof(posix_magic)) == 0 &&
      std::memcmp(tar->version, posix_version, sizeof(posix_version)) == 0)
    return HeaderFormat::ustar;
  if (std::memcmp(tar->magic, gnu_magic, sizeof(gnu_magic)) == 0 &&
      std::memcmp(tar->version, gnu_version, sizeof(gnu_version)) == 0)
    return HeaderFormat::gnu;
  // Some writers emit "ustar\0" with a blank version.
  if (std::memcmp(tar->magic, posix_magic, sizeof(posix_magic)) == 0)
    return HeaderFormat::ustar;
  return HeaderFormat::v7;
}

result<Header> HeaderView::decode() const {
  // A zero block carries a zero checksum field, so it is recognised first.
  if (is_zero_block())
    return make_error_code(errc::end_of_archive);

  const auto checksum = detail::verify_checksum(block_);
  if (checksum == detail::ChecksumStatus::mismatch)
    return make_error_code(errc::checksum_mismatch);

  const auto *tar = detail::as_tar_header(block_);
  Header header;
  header.legacy_checksum = checksum == detail::ChecksumStatus::valid_legacy;
  header.format = format();
  header.typeflag = static_cast<TypeFlag>(tar->typeflag[0]);

  const auto size = detail::parse_octal(detail::field(tar->size), max_entry_size);
  if (!size)
    return size.error();
  header.size = size.value();

  const auto mode = parse_octal_u32(detail::field(tar->mode));
  if (!mode)
    return mode.error();
  header.mode = mode.value();

  // GNU headers store atime/ctime and sparse data where POSIX puts the prefix.
  const auto prefix = header.format == HeaderFormat::gnu
                          ? std::span<const char>()
                          : std::span<const char>(detail::field(tar->prefix));
  auto path = detail::resolve_path(detail::field(tar->name), prefix);
  if (!path)
    return path.error();
  header.path = path.value();

  header.uid = parse_metadata<std::uint64_t>(detail::field(tar->uid), "uid",
                                             header.path);
  header.gid = parse_metadata<std::uint64_t>(detail::field(tar->gid), "gid",
                                             header.path);
  header.mtime = parse_metadata<std::uint64_t>(detail::field(tar->mtime),
                                               "mtime", header.path);
  header.devmajor = parse_metadata<std::uint32_t>(
      detail::field(tar->devmajor), "devmajor", header.path);
  header.devminor = parse_metadata<std::uint32_t>(
      detail::field(tar->devminor), "devminor", header.path);

  header.kind = classify(header.typeflag,
                         std::string_view(header.path.data(), header.path.size()));
  header.linkname = detail::trim_field(detail::field(tar->linkname));
  header.uname = detail::trim_field(detail::field(tar->uname));
  header.gname = detail::trim_field(detail::field(tar->gname));
  return header;
}
} // namespace ustar_view
