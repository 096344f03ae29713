#pragma once
#include <string_view>

namespace c2j {

// Error kinds shared by the tokenizer, header construction and the line runner.
enum class Errc {
  Ok = 0,
  QuoteInTheMiddle,  // unescaped '"' inside an unquoted field
  QuoteUnbalanced,   // missing closing quote, or closing quote not followed by ',' / EOL
  AppendFailed,      // non-string value offered as a header name
  LineTooLong,       // reader guard (ChunkReader::Config::max_record_bytes)
  ReadFailed,
  WriteFailed,
};

// Stable printable name, e.g. "QuoteInTheMiddle".
std::string_view errc_name(Errc e) noexcept;

inline bool ok(Errc e) noexcept { return e == Errc::Ok; }

}
