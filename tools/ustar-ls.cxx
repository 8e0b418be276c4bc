/**
 * @file ustar-ls.cxx
 * @brief List the regular files of a tar archive, optionally gzip-compressed.
 *
 * Usage: ustar-ls [--verbose] [--gzip] <archive>
 */

#include <ustar-view/ustar-view.hxx>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include <exception>
#include <iomanip>
#include <ios>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace io = boost::iostreams;
namespace logging = boost::log;

namespace {

constexpr int exit_ok = 0;
constexpr int exit_archive_error = 1;
constexpr int exit_usage = 2;

struct Options {
  bool verbose = false;
  bool gzip = false;
  std::string path;
};

void print_usage(std::ostream &out) {
  out << "usage: ustar-ls [--verbose] [--gzip] <archive>\n";
}

bool parse_options(int argc, char **argv, Options &options) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--verbose" || arg == "-v")
      options.verbose = true;
    else if (arg == "--gzip" || arg == "-z")
      options.gzip = true;
    else if (!arg.empty() && arg.front() == '-')
      return false;
    else if (options.path.empty())
      options.path = arg;
    else
      return false;
  }
  if (options.path.size() > 3 &&
      options.path.compare(options.path.size() - 3, 3, ".gz") == 0)
    options.gzip = true;
  return !options.path.empty();
}

/**
 * @brief Read the whole archive into memory, decompressing when asked.
 */
std::vector<char> read_archive(const Options &options) {
  io::file_source file(options.path, std::ios::binary);
  if (!file.is_open())
    throw std::ios_base::failure("cannot open file");

  io::filtering_istream in;
  if (options.gzip)
    in.push(io::gzip_decompressor());
  in.push(file);

  std::vector<char> bytes;
  io::copy(in, io::back_inserter(bytes));
  return bytes;
}

} // unnamed namespace

int main(int argc, char **argv) {
  Options options;
  if (!parse_options(argc, argv, options)) {
    print_usage(std::cerr);
    return exit_usage;
  }

  logging::core::get()->set_filter(
      logging::trivial::severity >= (options.verbose
                                         ? logging::trivial::warning
                                         : logging::trivial::error));

  std::vector<char> bytes;
  try {
    bytes = read_archive(options);
  } catch (const std::exception &e) {
    std::cerr << "ustar-ls: " << options.path << ": " << e.what() << '\n';
    return exit_usage;
  }

  auto archive = ustar_view::OwnedArchive::create(bytes);
  if (!archive) {
    std::cerr << "ustar-ls: " << options.path << ": "
              << archive.error().message() << '\n';
    return exit_archive_error;
  }
  // The archive holds its own copy from here on.
  bytes.clear();
  bytes.shrink_to_fit();

  auto it = archive.value().entries();
  while (auto entry = it.next()) {
    std::cout << std::oct << std::setfill('0') << std::setw(6)
              << entry->mode() << std::dec << std::setfill(' ') << ' '
              << std::setw(10) << entry->size() << ' ' << entry->path()
              << '\n';
  }

  if (it.state() == ustar_view::EntryIterator::State::Errored) {
    std::cerr << "ustar-ls: " << options.path << ": " << it.error().message()
              << '\n';
    return exit_archive_error;
  }
  return exit_ok;
}
