#ifndef MEMALLOCHEAP_HPP
#define MEMALLOCHEAP_HPP

#include "Common.hpp"

namespace hs
{

// malloc with bookkeeping. Allocation failure is fatal, so callers never see
// a null result. Safe to share between threads.
struct MemAllocHeap
{
  uint64_t m_LiveAllocations;
};

void HeapInit(MemAllocHeap* heap);

// Logs (at debug level) any allocations that were never freed.
void HeapDestroy(MemAllocHeap* heap);

void* HeapAllocate(MemAllocHeap* heap, size_t size);
void* HeapAllocateZeroed(MemAllocHeap* heap, size_t size);

// `ptr` may be null, in which case this is HeapAllocate.
void* HeapReallocate(MemAllocHeap* heap, void* ptr, size_t size);

void HeapFree(MemAllocHeap* heap, const void* ptr);

template <typename T>
T* HeapAllocateArrayZeroed(MemAllocHeap* heap, size_t count)
{
  return static_cast<T*>(HeapAllocateZeroed(heap, sizeof(T) * count));
}

}

#endif
