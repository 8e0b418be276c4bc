#include <ustar-view/entry-iterator.hxx>

#include <boost/log/trivial.hpp>

#include <cstdint>

namespace ustar_view {
std::optional<ArchiveEntry> EntryIterator::next() {
  while (state_ == State::Positioned) {
    if (buffer_.size() - offset_ < block_size) {
      BOOST_LOG_TRIVIAL(warning)
          << "reached end of tar data at offset " << offset_
          << " without finding a zero block";
      state_ = State::Ended;
      break;
    }

    const HeaderView view(buffer_.subspan(offset_).first<block_size>());
    const auto decoded = view.decode();
    if (!decoded) {
      if (decoded.error() == errc::end_of_archive)
        end_at_zero_block();
      else
        fail(decoded.error());
      break;
    }
    const Header &header = decoded.value();

    if (header.legacy_checksum)
      BOOST_LOG_TRIVIAL(warning) << "header at offset " << offset_
                                 << " only matches the signed checksum";

    const std::uint64_t data_begin = offset_ + block_size;
    const std::uint64_t padded_len = round_up_to_block(header.size);
    if (padded_len > buffer_.size() - data_begin) {
      BOOST_LOG_TRIVIAL(error)
          << "entry " << header.path << " needs " << padded_len
          << " data bytes at offset " << data_begin << ", only "
          << buffer_.size() - data_begin << " available";
      fail(make_error_code(errc::truncated_data));
      break;
    }

    offset_ = static_cast<std::size_t>(data_begin + padded_len);

    if (header.kind != EntryKind::regular_file)
      continue;

    return ArchiveEntry(
        header, buffer_.subspan(static_cast<std::size_t>(data_begin),
                                static_cast<std::size_t>(header.size)));
  }
  return std::nullopt;
}

void EntryIterator::end_at_zero_block() {
  state_ = State::Ended;

  const auto following = offset_ + block_size;
  if (buffer_.size() - following < block_size ||
      !HeaderView(buffer_.subspan(following).first<block_size>())
           .is_zero_block())
    BOOST_LOG_TRIVIAL(warning)
        << "end of tar archive with a single zero block at offset " << offset_;
}

void EntryIterator::fail(std::error_code ec) {
  BOOST_LOG_TRIVIAL(error) << "tar iteration stopped at offset " << offset_
                           << ": " << ec.message();
  state_ = State::Errored;
  error_ = ec;
}
} // namespace ustar_view
