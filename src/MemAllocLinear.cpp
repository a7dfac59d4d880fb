#include "MemAllocLinear.hpp"
#include "MemAllocHeap.hpp"
#include "Common.hpp"

#define CHECK_THREAD_OWNERSHIP(alloc) \
  CHECK(0 == alloc->m_OwnerThread || ThreadCurrent() == alloc->m_OwnerThread)

namespace hs
{

static MemAllocLinearChunk* NewChunk(MemAllocLinear* self, size_t min_size)
{
  size_t size       = min_size > self->m_ChunkSize ? min_size : self->m_ChunkSize;
  size_t alloc_size = sizeof(MemAllocLinearChunk) + size + MemAllocLinear::kMaxAlignment - 1;
  char*  base       = static_cast<char*>(HeapAllocate(self->m_BackingHeap, alloc_size));

  uintptr_t data    = uintptr_t(base + sizeof(MemAllocLinearChunk));
  uintptr_t aligned = (data + MemAllocLinear::kMaxAlignment - 1) & ~uintptr_t(MemAllocLinear::kMaxAlignment - 1);

  MemAllocLinearChunk* chunk = reinterpret_cast<MemAllocLinearChunk*>(base);
  chunk->m_Prev    = self->m_Chunk;
  chunk->m_Pointer = reinterpret_cast<char*>(aligned);
  chunk->m_Size    = size;

  return chunk;
}

static void FreeChunksAbove(MemAllocLinear* self, MemAllocLinearChunk* keep)
{
  while (self->m_Chunk != keep)
  {
    MemAllocLinearChunk* chunk = self->m_Chunk;
    CHECK(chunk != nullptr);
    self->m_Chunk = chunk->m_Prev;
    HeapFree(self->m_BackingHeap, chunk);
  }
}

void LinearAllocInit(MemAllocLinear* self, MemAllocHeap* heap, size_t chunk_size, const char* debug_name)
{
  self->m_Chunk       = nullptr;
  self->m_Offset      = 0;
  self->m_ChunkSize   = chunk_size;
  self->m_BackingHeap = heap;
  self->m_DebugName   = debug_name;
  self->m_OwnerThread = 0;

  self->m_Chunk = NewChunk(self, chunk_size);
}

void LinearAllocDestroy(MemAllocLinear* self)
{
  FreeChunksAbove(self, nullptr);
  self->m_Offset = 0;
}

void LinearAllocSetOwner(MemAllocLinear* allocator, ThreadId thread_id)
{
  allocator->m_OwnerThread = thread_id;
}

void* LinearAllocate(MemAllocLinear* self, size_t size, size_t align)
{
  CHECK_THREAD_OWNERSHIP(self);

  // Alignment must be a non-zero power of two
  CHECK(align > 0);
  CHECK(0 == (align & (align - 1)));
  CHECK(align <= MemAllocLinear::kMaxAlignment);

  size_t offset = (self->m_Offset + align - 1) & ~(align - 1);

  if (offset + size > self->m_Chunk->m_Size)
  {
    Log(kSpam, "linear allocator %s: new chunk for %d bytes", self->m_DebugName, (int) size);
    self->m_Chunk = NewChunk(self, size);
    offset = 0;
  }

  char* ptr = self->m_Chunk->m_Pointer + offset;
  self->m_Offset = offset + size;
  return ptr;
}

void LinearAllocRewind(MemAllocLinear* self, MemAllocLinearChunk* chunk, size_t offset)
{
  CHECK_THREAD_OWNERSHIP(self);
  FreeChunksAbove(self, chunk);
  self->m_Offset = offset;
}

}
