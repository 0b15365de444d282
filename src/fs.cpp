#include "gitling/fs.hpp"

#include "gitling/error.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <unistd.h>
#include <zlib.h>

namespace gitling::fs {

namespace {

constexpr std::size_t kInflateChunk = 16 * 1024;

// ".tmp-<pid>-<random>" so concurrent writers of one path never share a temp file.
std::string temp_suffix() {
  static std::mt19937_64 gen{std::random_device{}()};
  std::ostringstream os;
  os << ".tmp-" << ::getpid() << '-' << std::hex << gen();
  return os.str();
}

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) {
    throw Error(ErrorCode::NotFound, "no such file: " + p.string());
  }
  if (std::filesystem::is_directory(p, ec)) {
    throw Error(ErrorCode::NotAFile, "is a directory: " + p.string());
  }
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw Error(ErrorCode::Io, "open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  const auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n != 0U) {
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  }
  if (!ifs) {
    throw Error(ErrorCode::Io, "read failed: " + p.string());
  }
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec) {
    throw Error(ErrorCode::Io, "mkdir -p failed: " + ec.message());
  }
  auto tmp = p;
  tmp += temp_suffix();
  bool written = false;
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw Error(ErrorCode::Io, "open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.close();
    written = !ofs.fail();
  }
  if (!written) {
    std::filesystem::remove(tmp, ec);
    throw Error(ErrorCode::Io, "write failed: " + p.string());
  }
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw Error(ErrorCode::Io, "atomic replace failed: " + p.string());
  }
}

void write_file_atomic(const std::filesystem::path &p, std::string_view text) {
  write_file_atomic(p, as_bytes(text));
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_DEFAULT_COMPRESSION);
  if (rc != Z_OK) {
    throw Error(ErrorCode::Io, "zlib compress failed");
  }
  out.resize(bound);
  return out;
}

// Streams through inflate() so the output size need not be guessed up front.
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK) {
    throw Error(ErrorCode::DecompressionError, "zlib inflateInit failed");
  }
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::vector<std::uint8_t> out;
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    const std::size_t used = out.size();
    out.resize(used + kInflateChunk);
    zs.next_out = out.data() + used;
    zs.avail_out = static_cast<uInt>(kInflateChunk);
    rc = inflate(&zs, Z_NO_FLUSH);
    out.resize(used + (kInflateChunk - zs.avail_out));
    if (rc == Z_STREAM_END) {
      break;
    }
    if (rc != Z_OK || (zs.avail_in == 0 && zs.avail_out != 0)) {
      // Z_OK with input exhausted and spare output room means a truncated stream.
      const std::string why = zs.msg != nullptr ? zs.msg : "truncated stream";
      inflateEnd(&zs);
      throw Error(ErrorCode::DecompressionError, "zlib inflate failed: " + why);
    }
  }
  inflateEnd(&zs);
  return out;
}

} // namespace gitling::fs
