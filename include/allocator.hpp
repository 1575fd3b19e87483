#pragma once

#include <cstddef>
#include <memory_resource>

namespace syncore {

// PMR memory_resource backed by mimalloc (mi_malloc_aligned / mi_free_aligned)
class mi_memory_resource : public std::pmr::memory_resource {
  void* do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) override;
  bool do_is_equal(const memory_resource& other) const noexcept override;
};

// Global mimalloc-backed PMR resource (singleton). Default storage for
// channel buffers.
std::pmr::memory_resource* mi_resource() noexcept;

// Install mimalloc as the process-wide default PMR resource. Idempotent.
void init_allocator();

}  // namespace syncore
