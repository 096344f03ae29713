#include "csv2json/line_converter.hpp"
#include "csv2json/arena.hpp"
#include "csv2json/field_iterator.hpp"

namespace c2j {

Errc LineConverter::build_header(std::string_view line) {
  header_.reset();
  row_.set_header(nullptr);

  Header h;
  Arena scratch(256);
  FieldIterator it(line);
  std::optional<Field> f;
  for (Errc e = it.next(f); ; e = it.next(f)) {
    if (!ok(e)) return e;
    if (!f) break;
    const Errc ae = h.append(string_field(scratch, f->raw).value);
    if (!ok(ae)) return ae;
  }

  header_.emplace(std::move(h));
  row_.set_header(&*header_);
  return Errc::Ok;
}

Errc LineConverter::convert(std::string_view line, std::string& out) {
  out.clear();
  row_.reset();

  FieldIterator it(line);
  std::optional<Field> f;
  for (Errc e = it.next(f); ; e = it.next(f)) {
    if (!ok(e)) {
      row_.reset();
      return e;
    }
    if (!f) break;
    row_.append(parse_field(row_.arena(), f->raw));
  }

  row_.dump(out);
  row_.reset();
  ++rows_;
  return Errc::Ok;
}

}
