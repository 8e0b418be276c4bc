#include "tar-builder.hxx"

#include <ustar-view/ustar-view.hxx>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace io = boost::iostreams;

using ustar_view::Archive;
using ustar_view::block_size;
using ustar_view::errc;
using ustar_view::OwnedArchive;
using ustar_view::test::TarBuilder;

namespace {
std::span<const char> view_of(const std::vector<char> &bytes) {
  return {bytes.data(), bytes.size()};
}

/**
 * @brief Allocator that counts the bytes it hands out.
 */
template <typename T> struct CountingAllocator {
  using value_type = T;

  explicit CountingAllocator(std::shared_ptr<std::size_t> counter)
      : allocated(std::move(counter)) {}
  template <typename U>
  CountingAllocator(const CountingAllocator<U> &other)
      : allocated(other.allocated) {}

  T *allocate(std::size_t n) {
    *allocated += n * sizeof(T);
    return std::allocator<T>().allocate(n);
  }
  void deallocate(T *p, std::size_t n) { std::allocator<T>().deallocate(p, n); }

  template <typename U> bool operator==(const CountingAllocator<U> &o) const {
    return allocated == o.allocated;
  }

  std::shared_ptr<std::size_t> allocated;
};

std::vector<char> sample_archive() {
  TarBuilder tar;
  tar.directory("etc/")
      .file("etc/motd", "Welcome\n")
      .file("bin/data", std::string("\x00\xff\x10", 3))
      .end();
  return tar.bytes();
}
} // namespace

TEST(ArchiveTest, RejectsInvalidSizes) {
  const std::vector<char> zeros(4096, '\0');
  for (std::size_t size : {std::size_t{0}, std::size_t{512}, std::size_t{1000},
                           std::size_t{1025}, std::size_t{1536 + 1}}) {
    const auto archive = Archive::create(std::span<const char>(zeros.data(), size));
    ASSERT_FALSE(archive) << "size " << size;
    EXPECT_EQ(archive.error(), errc::invalid_size);
  }
}

TEST(ArchiveTest, AcceptsMinimalArchive) {
  const std::vector<char> zeros(1024, '\0');
  const auto archive = Archive::create(view_of(zeros));
  ASSERT_TRUE(archive);

  auto it = archive.value().entries();
  EXPECT_FALSE(it.next());
  EXPECT_EQ(it.state(), ustar_view::EntryIterator::State::Ended);
}

TEST(ArchiveTest, EntriesAreRestartable) {
  const auto bytes = sample_archive();
  const auto archive = Archive::create(view_of(bytes));
  ASSERT_TRUE(archive);

  for (int pass = 0; pass < 2; ++pass) {
    auto it = archive.value().entries();
    auto motd = it.next();
    ASSERT_TRUE(motd);
    EXPECT_EQ(motd->path(), "etc/motd");
    auto data = it.next();
    ASSERT_TRUE(data);
    EXPECT_EQ(data->path(), "bin/data");
    EXPECT_EQ(data->size(), 3u);
    EXPECT_FALSE(it.next());
  }
}

TEST(ArchiveTest, BorrowedArchiveDoesNotCopy) {
  const auto bytes = sample_archive();
  const auto archive = Archive::create(view_of(bytes));
  ASSERT_TRUE(archive);
  EXPECT_EQ(archive.value().data().data(), bytes.data());

  auto it = archive.value().entries();
  auto motd = it.next();
  ASSERT_TRUE(motd);
  EXPECT_GT(motd->data().data(), bytes.data());
  EXPECT_LT(motd->data().data(), bytes.data() + bytes.size());
}

TEST(ArchiveTest, OwnedArchiveOutlivesSource) {
  auto source = std::make_unique<std::vector<char>>(sample_archive());
  const auto archive = OwnedArchive::create(view_of(*source));
  ASSERT_TRUE(archive);
  EXPECT_NE(archive.value().data().data(), source->data());

  source.reset();

  auto it = archive.value().entries();
  auto motd = it.next();
  ASSERT_TRUE(motd);
  EXPECT_EQ(motd->path(), "etc/motd");
  const auto text = motd->text();
  ASSERT_TRUE(text);
  EXPECT_EQ(text.value(), "Welcome\n");
}

TEST(ArchiveTest, OwnedArchiveRejectsInvalidSize) {
  const std::vector<char> bytes(700, '\0');
  const auto archive = OwnedArchive::create(view_of(bytes));
  ASSERT_FALSE(archive);
  EXPECT_EQ(archive.error(), errc::invalid_size);
}

TEST(ArchiveTest, OwnedArchiveUsesCallerAllocator) {
  const auto bytes = sample_archive();
  auto counter = std::make_shared<std::size_t>(0);
  using CountedArchive =
      ustar_view::BasicOwnedArchive<CountingAllocator<char>>;

  const auto archive =
      CountedArchive::create(view_of(bytes), CountingAllocator<char>(counter));
  ASSERT_TRUE(archive);
  EXPECT_GE(*counter, bytes.size());

  auto it = archive.value().entries();
  ASSERT_TRUE(it.next());
  ASSERT_TRUE(it.next());
  EXPECT_FALSE(it.next());
}

TEST(ArchiveEntryTest, TextRejectsInvalidUtf8) {
  const auto bytes = sample_archive();
  const auto archive = Archive::create(view_of(bytes));
  ASSERT_TRUE(archive);

  auto it = archive.value().entries();
  ASSERT_TRUE(it.next());
  auto binary = it.next();
  ASSERT_TRUE(binary);

  const auto text = binary->text();
  ASSERT_FALSE(text);
  EXPECT_EQ(text.error(), errc::utf8_decode);
  // Binary access is always available.
  EXPECT_EQ(std::string(binary->data().begin(), binary->data().end()),
            std::string("\x00\xff\x10", 3));
}

TEST(ArchiveEntryTest, SourceStreamsContent) {
  const auto bytes = sample_archive();
  const auto archive = Archive::create(view_of(bytes));
  ASSERT_TRUE(archive);

  auto it = archive.value().entries();
  auto motd = it.next();
  ASSERT_TRUE(motd);

  io::stream<io::array_source> in(motd->source());
  std::string line;
  ASSERT_TRUE(std::getline(in, line));
  EXPECT_EQ(line, "Welcome");
  EXPECT_FALSE(std::getline(in, line));
}

TEST(ErrorCategoryTest, NamesAndMessages) {
  const std::error_code ec = errc::checksum_mismatch;
  EXPECT_STREQ(ec.category().name(), "ustar_view");
  EXPECT_EQ(ec.message(), "header checksum mismatch");
  EXPECT_EQ(ec, errc::checksum_mismatch);
  EXPECT_NE(ec, errc::truncated_data);
}
