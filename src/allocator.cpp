#include "ringchan/allocator.hpp"

#include <new>

namespace ringchan {

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
  // Must be usable from other translation units' static initialisers.
  static mi_memory_resource resource;
  return &resource;
}

}  // namespace ringchan
