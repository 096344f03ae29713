#include "csv2json/arena.hpp"
#include <algorithm>
#include <cstring>

namespace c2j {

Arena::Arena(std::size_t block_bytes) : block_bytes_(std::max<std::size_t>(block_bytes, 64)) {}

void* Arena::alloc(std::size_t n) {
  while (true) {
    if (cur_ < blocks_.size() && head_ + n <= blocks_[cur_].size) break;
    if (cur_ + 1 < blocks_.size()) { ++cur_; head_ = 0; continue; }
    // chain a new block; oversized requests get a block of their own size
    const std::size_t last = blocks_.empty() ? 0 : blocks_.back().size;
    const std::size_t grow = std::max({n, block_bytes_, last + last / 2});
    blocks_.push_back(Block{std::unique_ptr<char[]>(new char[grow]), grow});
    cur_ = blocks_.size() - 1;
    head_ = 0;
  }
  void* p = blocks_[cur_].data.get() + head_;
  head_ += n;
  used_ += n;
  return p;
}

std::string_view Arena::copy(std::string_view s) {
  if (s.empty()) return {};
  void* p = alloc(s.size());
  std::memcpy(p, s.data(), s.size());
  return std::string_view(static_cast<const char*>(p), s.size());
}

void Arena::reset() noexcept { cur_ = 0; head_ = 0; used_ = 0; }

void Arena::reset_and_shrink() {
  reset();
  if (blocks_.size() > 1) blocks_.erase(blocks_.begin() + 1, blocks_.end());
  // an oversized first block is not worth keeping either
  if (!blocks_.empty() && blocks_.front().size > block_bytes_) blocks_.clear();
}

std::size_t Arena::used() const noexcept { return used_; }

std::size_t Arena::capacity() const noexcept {
  std::size_t total = 0;
  for (const auto& b : blocks_) total += b.size;
  return total;
}

}
