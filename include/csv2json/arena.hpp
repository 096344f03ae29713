#pragma once
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace c2j {

// Bump allocator over a chain of blocks. Pointers and views handed out stay
// valid until reset(); growing the arena never moves earlier allocations.
class Arena {
public:
  explicit Arena(std::size_t block_bytes = 4096);

  void* alloc(std::size_t n);
  std::string_view copy(std::string_view s);

  // Reset head to the first block; blocks stay allocated for reuse.
  void reset() noexcept;

  // Reset and free every block beyond one of the configured block size.
  void reset_and_shrink();

  std::size_t used() const noexcept;
  std::size_t capacity() const noexcept;

private:
  struct Block {
    std::unique_ptr<char[]> data;
    std::size_t size;
  };

  std::vector<Block> blocks_;
  std::size_t block_bytes_;
  std::size_t cur_{0};   // index of the block being filled
  std::size_t head_{0};  // offset inside blocks_[cur_]
  std::size_t used_{0};
};

}
