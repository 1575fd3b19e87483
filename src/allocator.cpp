#include "allocator.hpp"

#include <mimalloc.h>

#include <atomic>
#include <new>

namespace syncore {

// --- mi_memory_resource ---

void* mi_memory_resource::do_allocate(std::size_t bytes, std::size_t alignment) {
  void* p = mi_malloc_aligned(bytes, alignment);
  if (!p)
    throw std::bad_alloc();
  return p;
}

void mi_memory_resource::do_deallocate(void* p, std::size_t /*bytes*/,
                                       std::size_t alignment) {
  mi_free_aligned(p, alignment);
}

bool mi_memory_resource::do_is_equal(
    const std::pmr::memory_resource& other) const noexcept {
  return this == &other;
}

// --- Singleton resource ---

std::pmr::memory_resource* mi_resource() noexcept {
  // Function-local so channels with static storage duration can use it
  static mi_memory_resource resource;
  return &resource;
}

// --- init_allocator ---

static std::atomic<bool> g_allocator_initialized{false};

void init_allocator() {
  bool expected = false;
  if (g_allocator_initialized.compare_exchange_strong(expected, true)) {
    std::pmr::set_default_resource(mi_resource());
  }
}

}  // namespace syncore
