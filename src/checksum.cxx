#include <ustar-view/detail/checksum.hxx>
#include <ustar-view/detail/numeric-field.hxx>
#include <ustar-view/detail/tar-header.hxx>

namespace ustar_view::detail {
namespace {

constexpr std::size_t checksum_width = sizeof(TarHeader::chksum);

/// Contribution of the checksum field itself: eight spaces.
constexpr std::uint32_t checksum_field_as_spaces = checksum_width * ' ';

inline bool in_checksum_field(std::size_t i) {
  return i >= checksum_offset && i < checksum_offset + checksum_width;
}

} // unnamed namespace

std::uint32_t unsigned_checksum(std::span<const char, block_size> block) noexcept {
  std::uint32_t sum = checksum_field_as_spaces;
  for (std::size_t i = 0; i < block.size(); ++i)
    if (!in_checksum_field(i))
      sum += static_cast<unsigned char>(block[i]);
  return sum;
}

std::int32_t signed_checksum(std::span<const char, block_size> block) noexcept {
  std::int32_t sum = checksum_field_as_spaces;
  for (std::size_t i = 0; i < block.size(); ++i)
    if (!in_checksum_field(i))
      sum += static_cast<signed char>(block[i]);
  return sum;
}

ChecksumStatus verify_checksum(std::span<const char, block_size> block) noexcept {
  const auto stored =
      parse_octal(block.subspan<checksum_offset, checksum_width>());
  if (!stored)
    return ChecksumStatus::mismatch;

  if (stored.value() == unsigned_checksum(block))
    return ChecksumStatus::valid;
  if (static_cast<std::int64_t>(stored.value()) == signed_checksum(block))
    return ChecksumStatus::valid_legacy;
  return ChecksumStatus::mismatch;
}
} // namespace ustar_view::detail
