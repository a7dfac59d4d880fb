#include "Buffer.hpp"

#include <stdarg.h>
#include <stdio.h>

namespace hs
{

void BufferAppendFormat(Buffer<char>* buffer, MemAllocHeap* heap, const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  va_list retry;
  va_copy(retry, args);

  // Try the spare capacity first; most fields fit.
  size_t spare = buffer->m_Capacity - buffer->m_Size;
  char*  tail  = buffer->m_Storage ? buffer->m_Storage + buffer->m_Size : nullptr;
  int    len   = vsnprintf(tail, spare, fmt, args);
  va_end(args);

  if (len > 0 && size_t(len) >= spare)
  {
    BufferGrow(buffer, heap, size_t(len) + 1);
    vsnprintf(buffer->m_Storage + buffer->m_Size, size_t(len) + 1, fmt, retry);
  }
  va_end(retry);

  if (len > 0)
    buffer->m_Size += size_t(len);
}

}
