#pragma once
#include "csv2json/errc.hpp"
#include "csv2json/row_builder.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace c2j {

// Converts one CSV line into one JSON line. Holds the optional header and a
// row builder whose storage is recycled on every line.
class LineConverter {
public:
  LineConverter() = default;
  LineConverter(const LineConverter&) = delete;
  LineConverter& operator=(const LineConverter&) = delete;

  // Build the header from `line`; every field is kept as text. On error no
  // header is installed.
  Errc build_header(std::string_view line);

  const Header* header() const noexcept { return header_ ? &*header_ : nullptr; }

  // Tokenize, type and serialize `line` into `out`. A tokenizer error fails
  // the whole line; `out` is left empty.
  Errc convert(std::string_view line, std::string& out);

  std::uint64_t rows() const noexcept { return rows_; }

private:
  std::optional<Header> header_;
  RowBuilder row_;
  std::uint64_t rows_{0};
};

}
