#ifndef BUFFER_HPP
#define BUFFER_HPP

#include "Common.hpp"
#include "MemAllocHeap.hpp"

#include <cstring>
#include <type_traits>

namespace hs
{
  // Growable array of POD elements. The buffer doesn't keep a heap pointer;
  // every call that may allocate takes the heap explicitly, so a Buffer can
  // live inside other POD records.
  template <typename T>
  struct Buffer
  {
    T      *m_Storage;
    size_t  m_Size;
    size_t  m_Capacity;

    T* begin() { return m_Storage; }
    T* end() { return m_Storage + m_Size; }
    const T* begin() const { return m_Storage; }
    const T* end() const { return m_Storage + m_Size; }

    T& operator[](size_t index) { CHECK(index < m_Size); return m_Storage[index]; }
    const T& operator[](size_t index) const { CHECK(index < m_Size); return m_Storage[index]; }
  };

  template <typename T>
  void BufferInit(Buffer<T>* buffer)
  {
    static_assert(std::is_pod<T>::value, "Buffer elements are moved with memcpy");
    memset(buffer, 0, sizeof *buffer);
  }

  template <typename T>
  void BufferDestroy(Buffer<T>* buffer, MemAllocHeap* heap)
  {
    HeapFree(heap, buffer->m_Storage);
    BufferInit(buffer);
  }

  // Keeps the storage for reuse.
  template <typename T>
  void BufferClear(Buffer<T>* buffer)
  {
    buffer->m_Size = 0;
  }

  // Makes room for at least `extra` more elements, doubling as it grows.
  template <typename T>
  void BufferGrow(Buffer<T>* buffer, MemAllocHeap* heap, size_t extra)
  {
    size_t needed = buffer->m_Size + extra;
    if (needed <= buffer->m_Capacity)
      return;

    size_t capacity = buffer->m_Capacity < 8 ? 8 : buffer->m_Capacity;
    while (capacity < needed)
      capacity *= 2;

    buffer->m_Storage  = static_cast<T*>(HeapReallocate(heap, buffer->m_Storage, capacity * sizeof(T)));
    buffer->m_Capacity = capacity;
  }

  // Extends the buffer by `count` uninitialized elements and returns the first.
  template <typename T>
  T* BufferAlloc(Buffer<T>* buffer, MemAllocHeap* heap, size_t count)
  {
    BufferGrow(buffer, heap, count);
    T* first = buffer->m_Storage + buffer->m_Size;
    buffer->m_Size += count;
    return first;
  }

  template <typename T>
  T* BufferAllocZero(Buffer<T>* buffer, MemAllocHeap* heap, size_t count)
  {
    T* first = BufferAlloc(buffer, heap, count);
    memset(first, 0, count * sizeof(T));
    return first;
  }

  template <typename T>
  void BufferAppend(Buffer<T>* buffer, MemAllocHeap* heap, const T* elems, size_t count)
  {
    if (count > 0)
      memcpy(BufferAlloc(buffer, heap, count), elems, count * sizeof(T));
  }

  template <typename T, typename U>
  void BufferAppendOne(Buffer<T>* buffer, MemAllocHeap* heap, U elem)
  {
    *BufferAlloc(buffer, heap, 1) = T(elem);
  }

  // Appends printf-style output. No terminator is counted in m_Size.
  void BufferAppendFormat(Buffer<char>* buffer, MemAllocHeap* heap, const char* fmt, ...) HS_PRINTF_LIKE(3);

  // Writes a nul after the last element (without counting it) and returns
  // the storage as a C string.
  inline const char* BufferTerminate(Buffer<char>* buffer, MemAllocHeap* heap)
  {
    BufferGrow(buffer, heap, 1);
    buffer->m_Storage[buffer->m_Size] = '\0';
    return buffer->m_Storage;
  }
}

#endif
