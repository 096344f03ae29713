#pragma once
#include "csv2json/value.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace c2j {

// Appends RFC 8259 JSON tokens to a string buffer.
class JsonWriter {
public:
  static void write_string(std::string& out, std::string_view s);
  static void write_int(std::string& out, std::int64_t v);

  // Shortest round-trip digits in scientific form with at least one
  // fractional digit: 12.8 -> 1.28e+01, 1.0 -> 1.0e+00. Non-finite -> null.
  static void write_double(std::string& out, double v);

  static void write_null(std::string& out) { out += "null"; }
  static void write_value(std::string& out, const Value& v);
};

}
