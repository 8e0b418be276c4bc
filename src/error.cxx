#include <ustar-view/error.hxx>

namespace ustar_view {
namespace {

class UstarErrorCategory final : public std::error_category {
public:
  const char *name() const noexcept override { return "ustar_view"; }

  std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
    case errc::end_of_archive:
      return "end of archive";
    case errc::invalid_size:
      return "archive size is not a multiple of 512 of at least 1024 bytes";
    case errc::checksum_mismatch:
      return "header checksum mismatch";
    case errc::number_format:
      return "invalid character in octal header field";
    case errc::number_overflow:
      return "octal header field exceeds its bound";
    case errc::filename_too_long:
      return "file name exceeds 256 characters";
    case errc::invalid_name:
      return "file name is empty or not valid UTF-8";
    case errc::truncated_data:
      return "entry data extends past the end of the archive";
    case errc::utf8_decode:
      return "entry data is not valid UTF-8";
    }
    return "unknown ustar_view error";
  }
};

} // unnamed namespace

const std::error_category &error_category() noexcept {
  static const UstarErrorCategory category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}
} // namespace ustar_view
