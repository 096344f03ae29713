#include "csv2json/field_iterator.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

static int failures = 0;

static std::string show(const std::vector<std::string>& v) {
  std::string s = "[";
  for (size_t i = 0; i < v.size(); ++i) { if (i) s += ","; s += "\"" + v[i] + "\""; }
  return s + "]";
}

// Drain the iterator; returns the fields and the first error seen.
static c2j::Errc split(std::string_view line, std::vector<std::string>& fields) {
  fields.clear();
  c2j::FieldIterator it(line);
  std::optional<c2j::Field> f;
  while (true) {
    c2j::Errc e = it.next(f);
    if (!c2j::ok(e)) return e;
    if (!f) return c2j::Errc::Ok;
    fields.emplace_back(f->raw);
  }
}

static void expect_split(const char* name, std::string_view line,
                         const std::vector<std::string>& want, c2j::Errc want_err) {
  std::vector<std::string> got;
  c2j::Errc e = split(line, got);
  if (got != want || e != want_err) {
    ++failures;
    std::cerr << "[FAIL] " << name << ": got " << show(got) << " " << c2j::errc_name(e)
              << ", want " << show(want) << " " << c2j::errc_name(want_err) << "\n";
    return;
  }
  std::cout << "[PASS] " << name << "\n";
}

static void expect_true(const char* name, bool cond) {
  if (!cond) { ++failures; std::cerr << "[FAIL] " << name << "\n"; return; }
  std::cout << "[PASS] " << name << "\n";
}

int main() {
  using c2j::Errc;
  expect_split("split fields", "aaa,10,c", {"aaa", "10", "c"}, Errc::Ok);
  expect_split("split quoted fields", "\"aaa,10,c\",X", {"aaa,10,c", "X"}, Errc::Ok);
  expect_split("split empty line", "", {""}, Errc::Ok);
  expect_split("split empty fields", "a,,b,", {"a", "", "b", ""}, Errc::Ok);
  expect_split("split only delimiter", ",", {"", ""}, Errc::Ok);
  expect_split("split quoted empty fields", "a,\"\",b,\"\"", {"a", "", "b", ""}, Errc::Ok);
  expect_split("split quoted line", "\"a,b,c\"", {"a,b,c"}, Errc::Ok);
  expect_split("split quoted then trailing delimiter", "\"a\",", {"a", ""}, Errc::Ok);
  expect_split("split escaped quote field", "\"a,\"\"b,c\"", {"a,\"\"b,c"}, Errc::Ok);
  expect_split("split only escaped quotes", "\"\"\"\"", {"\"\""}, Errc::Ok);
  expect_split("split keeps spaces", " a , b ", {" a ", " b "}, Errc::Ok);
  expect_split("error quote in the middle", "a,b\"d,c", {"a"}, Errc::QuoteInTheMiddle);
  expect_split("error unbalanced quote", "a,\"z\"x,c", {"a"}, Errc::QuoteUnbalanced);
  expect_split("error unclosed quote", "a,\"zz", {"a"}, Errc::QuoteUnbalanced);
  expect_split("error escaped quote at end", "\"ab\"\"", {}, Errc::QuoteUnbalanced);
  expect_split("error quote first field", "x\"", {}, Errc::QuoteInTheMiddle);

  {
    // terminal after error: the error is reported once, then end of input
    c2j::FieldIterator it("a,b\"d,c");
    std::optional<c2j::Field> f;
    bool okseq = c2j::ok(it.next(f)) && f && f->raw == "a";
    okseq = okseq && it.next(f) == Errc::QuoteInTheMiddle && !f;
    okseq = okseq && it.state() == c2j::FieldIterator::State::Failed;
    okseq = okseq && it.failure() == Errc::QuoteInTheMiddle;
    for (int i = 0; i < 3; ++i) okseq = okseq && c2j::ok(it.next(f)) && !f;
    expect_true("exhausted after error", okseq);
  }
  {
    c2j::FieldIterator it("x");
    std::optional<c2j::Field> f;
    bool okseq = c2j::ok(it.next(f)) && f && f->raw == "x";
    okseq = okseq && c2j::ok(it.next(f)) && !f && it.state() == c2j::FieldIterator::State::Done;
    okseq = okseq && c2j::ok(it.next(f)) && !f;
    expect_true("exhausted after end", okseq);
  }
  {
    // fields borrow the line buffer
    std::string line = "abc,\"de\"";
    c2j::FieldIterator it(line);
    std::optional<c2j::Field> f;
    (void)it.next(f);
    bool inside = f && f->raw.data() == line.data();
    (void)it.next(f);
    inside = inside && f && f->raw.data() == line.data() + 5 && f->raw.size() == 2;
    expect_true("fields are views into the line", inside);
  }
  {
    // plain text without delimiters or quotes comes back unchanged
    const char* samples[] = {"hello", "12.5", "with space", "ünïcödé", "tab\there"};
    bool all = true;
    for (const char* s : samples) {
      std::vector<std::string> got;
      all = all && c2j::ok(split(s, got)) && got.size() == 1 && got[0] == s;
    }
    expect_true("single field passthrough", all);
  }

  if (failures) { std::cerr << failures << " failure(s)\n"; return 1; }
  return 0;
}
