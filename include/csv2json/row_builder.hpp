#pragma once
#include "csv2json/arena.hpp"
#include "csv2json/errc.hpp"
#include "csv2json/value.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace c2j {

// Ordered column names. Names are copied into the header's own arena, so the
// header outlives every line it was built from.
//
// Duplicate names are accepted. They collapse into one object key that keeps
// the position of its first occurrence and takes the value of its last
// column, the way an insertion-ordered map behaves on overwrite.
class Header {
public:
  struct Key {
    std::string_view name;
    std::size_t column;  // row index whose value is emitted for `name`
  };

  Header() : arena_(1024) {}

  // Errc::AppendFailed (header unchanged) unless `v` is a String.
  Errc append(const Value& v);

  std::size_t size() const noexcept { return names_.size(); }
  bool empty() const noexcept { return names_.empty(); }
  std::string_view at(std::size_t i) const {
    return i < names_.size() ? names_[i] : std::string_view{};
  }
  const std::vector<Key>& keys() const noexcept { return keys_; }

private:
  Arena arena_;
  std::vector<std::string_view> names_;
  std::vector<Key> keys_;
  std::unordered_map<std::string_view, std::size_t> key_pos_;
};

// Accumulates the typed values of one line and serializes them.
//
// Without a header dump() emits an array with one element per value. With a
// header it emits an object keyed by header order: missing values become
// null, values past the last header column are dropped.
class RowBuilder {
public:
  explicit RowBuilder(const Header* header = nullptr);

  // Storage for the current row's String values; cleared by reset().
  Arena& arena() noexcept { return arena_; }

  void set_header(const Header* header) noexcept { header_ = header; }
  const Header* header() const noexcept { return header_; }

  void append(const FieldValue& v) { values_.push_back(v); }

  std::size_t size() const noexcept { return values_.size(); }
  const FieldValue& at(std::size_t i) const { return values_.at(i); }

  // Replaces the contents of `out` with one JSON line (no newline).
  void dump(std::string& out) const;
  std::string dump() const;

  // Drop the row's values and their strings; the header is untouched. Blocks
  // grown past kKeepBytes by an oversized line are freed.
  void reset();

  static constexpr std::size_t kKeepBytes = 64 * 1024;

private:
  const Header* header_;
  Arena arena_;
  std::vector<FieldValue> values_;
};

}
