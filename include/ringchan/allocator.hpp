#pragma once

#include <mimalloc.h>
#include <cstddef>
#include <memory_resource>

namespace ringchan {

// PMR memory_resource backed by mimalloc (mi_malloc_aligned / mi_free_aligned)
class mi_memory_resource : public std::pmr::memory_resource {
  void* do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) override;
  bool do_is_equal(const memory_resource& other) const noexcept override;
};

// Global mimalloc-backed PMR resource (singleton). Ring buffer slot storage
// is taken from here unless the caller supplies another resource.
std::pmr::memory_resource* mi_resource() noexcept;

// Raw, uninitialized storage for `count` objects of `T`. Nothing is
// constructed; the owner decides which slots hold live objects.
template <typename T>
T* allocate_slots(std::pmr::memory_resource* resource, std::size_t count) {
  return static_cast<T*>(resource->allocate(count * sizeof(T), alignof(T)));
}

template <typename T>
void deallocate_slots(std::pmr::memory_resource* resource, T* slots,
                      std::size_t count) noexcept {
  resource->deallocate(slots, count * sizeof(T), alignof(T));
}

}  // namespace ringchan
