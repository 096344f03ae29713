#include "csv2json/row_builder.hpp"
#include "csv2json/json_writer.hpp"

namespace c2j {

Errc Header::append(const Value& v) {
  const auto* s = std::get_if<std::string_view>(&v);
  if (!s) return Errc::AppendFailed;
  const std::string_view name = arena_.copy(*s);
  const std::size_t column = names_.size();
  names_.push_back(name);
  auto it = key_pos_.find(name);
  if (it != key_pos_.end()) {
    keys_[it->second].column = column;
  } else {
    key_pos_.emplace(name, keys_.size());
    keys_.push_back(Key{name, column});
  }
  return Errc::Ok;
}

RowBuilder::RowBuilder(const Header* header) : header_(header), arena_(4096) {
  values_.reserve(32);
}

void RowBuilder::dump(std::string& out) const {
  out.clear();
  if (!header_) {
    out += '[';
    for (std::size_t i = 0; i < values_.size(); ++i) {
      if (i) out += ',';
      JsonWriter::write_value(out, values_[i].value);
    }
    out += ']';
    return;
  }

  out += '{';
  const auto& keys = header_->keys();
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i) out += ',';
    JsonWriter::write_string(out, keys[i].name);
    out += ':';
    if (keys[i].column < values_.size()) JsonWriter::write_value(out, values_[keys[i].column].value);
    else JsonWriter::write_null(out);
  }
  out += '}';
}

std::string RowBuilder::dump() const {
  std::string out;
  dump(out);
  return out;
}

void RowBuilder::reset() {
  values_.clear();
  if (arena_.capacity() > kKeepBytes) arena_.reset_and_shrink();
  else arena_.reset();
}

}
