#include "MemAllocHeap.hpp"
#include "Atomic.hpp"

#include <stdlib.h>

namespace hs
{

void HeapInit(MemAllocHeap* heap)
{
  heap->m_LiveAllocations = 0;
}

void HeapDestroy(MemAllocHeap* heap)
{
  if (uint64_t leaked = heap->m_LiveAllocations)
    Log(kDebug, "heap destroyed with %llu live allocations", (unsigned long long) leaked);
}

static void* CheckedResult(MemAllocHeap* heap, void* ptr, size_t size)
{
  if (!ptr)
    Croak("out of memory allocating %llu bytes", (unsigned long long) size);
  AtomicIncrement(&heap->m_LiveAllocations);
  return ptr;
}

void* HeapAllocate(MemAllocHeap* heap, size_t size)
{
  return CheckedResult(heap, malloc(size ? size : 1), size);
}

void* HeapAllocateZeroed(MemAllocHeap* heap, size_t size)
{
  return CheckedResult(heap, calloc(1, size ? size : 1), size);
}

void* HeapReallocate(MemAllocHeap* heap, void* ptr, size_t size)
{
  if (!ptr)
    return HeapAllocate(heap, size);

  void* moved = realloc(ptr, size ? size : 1);
  if (!moved)
    Croak("out of memory growing a block to %llu bytes", (unsigned long long) size);
  return moved;
}

void HeapFree(MemAllocHeap* heap, const void* ptr)
{
  if (!ptr)
    return;

  AtomicDecrement(&heap->m_LiveAllocations);
  free(const_cast<void*>(ptr));
}

}
