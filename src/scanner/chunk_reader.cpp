#include "csv2json/chunk_reader.hpp"
#include <cerrno>
#include <cstring>
#include <string_view>
#include <vector>

namespace c2j {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  std::FILE* f{nullptr};
  bool owns{false};
  bool eof{false};
  bool finished{false};
  Errc err{Errc::Ok};
  int last_errno{0};
  std::uint64_t bytes{0};
  std::uint64_t lines{0};

  std::vector<char> buf;
  std::size_t buf_len{0};
  std::size_t buf_pos{0};
  std::string carry;

  Impl(std::string p, Config c) : path(std::move(p)), cfg(c), owns(true) {}
  Impl(std::FILE* s, Config c) : cfg(c), f(s), owns(false) {}

  ~Impl() { if (owns && f) std::fclose(f); }

  bool fail(Errc e, int errnum) {
    err = e;
    last_errno = errnum;
    finished = true;
    return false;
  }

  bool open() {
    if (f) return true;
    f = std::fopen(path.c_str(), "rb");
    if (!f) return fail(Errc::ReadFailed, errno);
    return true;
  }

  std::string_view finish_line(std::string_view s) {
    if (cfg.strip_cr && !s.empty() && s.back() == '\r') s.remove_suffix(1);
    ++lines;
    return s;
  }

  bool read_next(std::string_view& out) {
    if (finished) return false;
    if (!open()) return false;
    if (buf.empty()) buf.resize(cfg.chunk_bytes ? cfg.chunk_bytes : 1);

    carry.clear();
    while (true) {
      if (buf_pos == buf_len) {
        if (eof) {
          finished = true;
          if (carry.empty()) return false;
          out = finish_line(carry);
          return true;
        }
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
        if (n == 0) {
          if (std::ferror(f)) return fail(Errc::ReadFailed, errno);
          eof = true;
          continue;
        }
        bytes += n;
        buf_len = n;
        buf_pos = 0;
      }

      std::string_view block(buf.data() + buf_pos, buf_len - buf_pos);
      const std::size_t nl = block.find('\n');
      const bool hit_nl = (nl != std::string_view::npos);
      std::string_view slice = hit_nl ? block.substr(0, nl) : block;

      if (cfg.max_record_bytes && carry.size() + slice.size() > cfg.max_record_bytes) {
        return fail(Errc::LineTooLong, 0);
      }

      if (!hit_nl) {
        carry.append(slice);
        buf_pos = buf_len;
        continue;
      }

      buf_pos += nl + 1;
      if (carry.empty()) {
        out = finish_line(slice);
      } else {
        carry.append(slice);
        out = finish_line(carry);
      }
      return true;
    }
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl(std::move(path), cfg)) {}

ChunkReader::ChunkReader(std::FILE* stream, Config cfg)
  : p_(new Impl(stream, cfg)) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::read_next(std::string_view& out) { return p_->read_next(out); }

bool ChunkReader::for_each_line(const LineCallback& cb) {
  std::string_view line;
  while (p_->read_next(line)) {
    if (!cb(line)) return true;
  }
  return p_->err == Errc::Ok;
}

Errc ChunkReader::error() const noexcept { return p_->err; }
int  ChunkReader::last_errno() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::lines_read() const noexcept { return p_->lines; }

}
