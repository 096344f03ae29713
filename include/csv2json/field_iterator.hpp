#pragma once
#include "csv2json/errc.hpp"
#include <cstddef>
#include <optional>
#include <string_view>

namespace c2j {

struct CsvDialect {
  static constexpr char delimiter = ',';
  static constexpr char quote     = '"';
};

// One CSV field as it appears in the line: outer quotes stripped, doubled
// quotes still present. Borrows the line buffer.
struct Field {
  std::string_view raw;
};

// Pull-based splitter over one line. Never allocates.
//
//   FieldIterator it(line);
//   std::optional<Field> f;
//   for (Errc e = it.next(f); ; e = it.next(f)) {
//     if (!ok(e)) return e;   // fields seen so far stay valid
//     if (!f) break;
//     use(f->raw);
//   }
//
// next() returns Errc::Ok with `out` set to a field, Errc::Ok with `out`
// empty at end of input, or an error exactly once. After an error the
// iterator is exhausted and keeps reporting end of input.
class FieldIterator {
public:
  enum class State { Scanning, InQuotes, Done, Failed };

  explicit FieldIterator(std::string_view line) noexcept : buf_(line) {}

  Errc next(std::optional<Field>& out);

  State state() const noexcept { return state_; }
  bool exhausted() const noexcept { return state_ == State::Done || state_ == State::Failed; }
  // Kind of the error that terminated the iterator; Errc::Ok otherwise.
  Errc failure() const noexcept { return failure_; }

private:
  Errc next_raw(std::size_t start, std::optional<Field>& out);
  Errc next_quoted(std::size_t start, std::optional<Field>& out);
  Errc fail(Errc e) noexcept;
  void emit(std::optional<Field>& out, std::size_t start, std::size_t end,
            std::size_t resume, bool after_delim) noexcept;

  std::string_view buf_;
  std::size_t pos_{0};
  // A field is still owed: at line start, and after every delimiter.
  bool expect_field_{true};
  State state_{State::Scanning};
  Errc failure_{Errc::Ok};
};

}
