#pragma once
#include "csv2json/errc.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <string_view>

namespace c2j {

// Splits a byte stream into physical lines (without '\n'), reading it in
// fixed-size chunks. A final unterminated line is emitted as well.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 64 * 1024;
    std::size_t max_record_bytes = 4096;  // 0 disables the guard
    bool        strip_cr         = true;  // trim trailing '\r' (CRLF)
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // opened lazily, closed by the reader
  ChunkReader(std::FILE* stream, Config cfg);  // borrowed, e.g. stdin
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Next line; the view stays valid until the following call. Returns false
  // at end of input or on error (see error()).
  bool read_next(std::string_view& out);

  // Return false from the callback to stop early.
  using LineCallback = std::function<bool(std::string_view)>;

  // Returns false only on a reader error.
  bool for_each_line(const LineCallback& cb);

  Errc error() const noexcept;
  int  last_errno() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
