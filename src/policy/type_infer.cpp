#include "csv2json/value.hpp"
#include "csv2json/arena.hpp"
#include "csv2json/field_iterator.hpp"
#include <charconv>
#include <cmath>
#include <system_error>
#include <fast_float/fast_float.h>

namespace c2j {

std::string_view canonicalize_field(Arena& arena, std::string_view raw) {
  if (raw.empty()) return {};
  // output never exceeds the input
  char* dst = static_cast<char*>(arena.alloc(raw.size()));
  std::size_t n = 0;
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    dst[n++] = c;
    if (c == CsvDialect::quote && i + 1 < raw.size() && raw[i + 1] == CsvDialect::quote) ++i;
  }
  return std::string_view(dst, n);
}

bool is_maybe_number(std::string_view s) noexcept {
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || c == '.')) return false;
  }
  return true;
}

std::optional<std::int64_t> parse_int(std::string_view s) noexcept {
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<double> parse_float(std::string_view s) noexcept {
  double out = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  // overflow becomes inf with no error on some fast_float releases
  if (ec != std::errc() || ptr != s.data() + s.size() || !std::isfinite(out)) return std::nullopt;
  return out;
}

FieldValue parse_field(Arena& arena, std::string_view raw) {
  if (raw.empty()) return FieldValue{Value{std::monostate{}}};

  // Canonical text of maybe-numeric content equals the raw bytes (no quotes
  // in it), so the numeric path parses `raw` and skips the copy.
  if (!is_maybe_number(raw)) return string_field(arena, raw);

  if (auto i = parse_int(raw)) return FieldValue{Value{*i}};
  if (auto f = parse_float(raw)) return FieldValue{Value{*f}};

  // ".", "..", "1.2.3": looked numeric, parsed as neither
  return string_field(arena, raw);
}

FieldValue string_field(Arena& arena, std::string_view raw) {
  return FieldValue{Value{canonicalize_field(arena, raw)}};
}

}
