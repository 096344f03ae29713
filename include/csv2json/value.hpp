#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace c2j {

class Arena;

enum class ValueKind { Null, String, Integer, Float };

// Typed field content. Alternative order matches ValueKind.
using Value = std::variant<std::monostate, std::string_view, std::int64_t, double>;

inline ValueKind kind_of(const Value& v) noexcept { return static_cast<ValueKind>(v.index()); }

// A Value whose String text (if any) lives in the Arena it was parsed into.
// The arena belongs to the row; resetting the row releases the text.
struct FieldValue {
  Value value;

  ValueKind kind() const noexcept { return kind_of(value); }
};

// Collapse every doubled quote ("" -> ") into `arena`. A lone quote cannot
// come out of FieldIterator; if one is passed it is copied unchanged.
std::string_view canonicalize_field(Arena& arena, std::string_view raw);

// Every byte is an ASCII digit or '.'. Over-approximates: "..", "1.2.3" pass.
bool is_maybe_number(std::string_view s) noexcept;

// Whole-text parses; nullopt on syntax error, trailing bytes or overflow.
std::optional<std::int64_t> parse_int(std::string_view s) noexcept;
std::optional<double> parse_float(std::string_view s) noexcept;

// Null for empty content, Integer/Float for maybe-numeric content that
// parses, String otherwise.
FieldValue parse_field(Arena& arena, std::string_view raw);

// Always String, numeric-looking or empty content included. Header names.
FieldValue string_field(Arena& arena, std::string_view raw);

}
