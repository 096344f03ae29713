#include "csv2json/field_iterator.hpp"

namespace c2j {

Errc FieldIterator::next(std::optional<Field>& out) {
  out.reset();
  if (exhausted()) return Errc::Ok;

  const std::size_t start = pos_;
  if (start >= buf_.size()) {
    // empty line, or a trailing delimiter: one empty field is still owed
    if (expect_field_) out = Field{buf_.substr(buf_.size(), 0)};
    state_ = State::Done;
    return Errc::Ok;
  }

  if (buf_[start] == CsvDialect::quote) return next_quoted(start, out);
  return next_raw(start, out);
}

Errc FieldIterator::next_raw(std::size_t start, std::optional<Field>& out) {
  for (std::size_t p = start; p < buf_.size(); ++p) {
    const char c = buf_[p];
    if (c == CsvDialect::quote) return fail(Errc::QuoteInTheMiddle);
    if (c == CsvDialect::delimiter) {
      emit(out, start, p, p + 1, true);
      return Errc::Ok;
    }
  }
  emit(out, start, buf_.size(), buf_.size(), false);
  return Errc::Ok;
}

Errc FieldIterator::next_quoted(std::size_t start, std::optional<Field>& out) {
  state_ = State::InQuotes;
  std::size_t p = start + 1;
  while (p < buf_.size()) {
    if (buf_[p] != CsvDialect::quote) { ++p; continue; }

    if (p + 1 == buf_.size()) {             // closed by end of line
      emit(out, start + 1, p, buf_.size(), false);
      return Errc::Ok;
    }
    const char d = buf_[p + 1];
    if (d == CsvDialect::quote) { p += 2; continue; }   // escaped quote
    if (d == CsvDialect::delimiter) {
      emit(out, start + 1, p, p + 2, true);
      return Errc::Ok;
    }
    return fail(Errc::QuoteUnbalanced);
  }
  return fail(Errc::QuoteUnbalanced);       // closing quote never found
}

void FieldIterator::emit(std::optional<Field>& out, std::size_t start, std::size_t end,
                         std::size_t resume, bool after_delim) noexcept {
  out = Field{buf_.substr(start, end - start)};
  pos_ = resume;
  expect_field_ = after_delim;
  state_ = State::Scanning;
}

Errc FieldIterator::fail(Errc e) noexcept {
  state_ = State::Failed;
  failure_ = e;
  pos_ = buf_.size();
  return e;
}

}
