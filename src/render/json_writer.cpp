#include "csv2json/json_writer.hpp"
#include <charconv>
#include <cmath>

namespace c2j {

void JsonWriter::write_string(std::string& out, std::string_view s) {
  static const char hex[] = "0123456789abcdef";
  out += '"';
  for (char ch : s) {
    const unsigned char c = static_cast<unsigned char>(ch);
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\b': out += "\\b";  break;
      case '\f': out += "\\f";  break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        if (c < 0x20) {
          out += "\\u00";
          out += hex[c >> 4];
          out += hex[c & 0xF];
        } else {
          out += ch;
        }
        break;
    }
  }
  out += '"';
}

void JsonWriter::write_int(std::string& out, std::int64_t v) {
  char buf[24];
  auto res = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, res.ptr);
}

void JsonWriter::write_double(std::string& out, double v) {
  if (!std::isfinite(v)) { write_null(out); return; }
  char buf[64];
  auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
  std::string_view s(buf, static_cast<std::size_t>(res.ptr - buf));
  const std::size_t e = s.find('e');
  std::string_view mantissa = s.substr(0, e);
  out.append(mantissa.data(), mantissa.size());
  if (mantissa.find('.') == std::string_view::npos) out += ".0";
  out.append(s.data() + e, s.size() - e);
}

void JsonWriter::write_value(std::string& out, const Value& v) {
  switch (kind_of(v)) {
    case ValueKind::Null:    write_null(out); break;
    case ValueKind::String:  write_string(out, std::get<std::string_view>(v)); break;
    case ValueKind::Integer: write_int(out, std::get<std::int64_t>(v)); break;
    case ValueKind::Float:   write_double(out, std::get<double>(v)); break;
  }
}

}
