#ifndef ATOMIC_HPP
#define ATOMIC_HPP

#include "Common.hpp"

namespace hs
{
  // Full-barrier counters shared by the worker threads.
  template <typename T>
  inline T AtomicAdd(T* ptr, T value)
  {
    return __sync_add_and_fetch(ptr, value);
  }

  template <typename T>
  inline T AtomicIncrement(T* ptr)
  {
    return __sync_add_and_fetch(ptr, T(1));
  }

  template <typename T>
  inline T AtomicDecrement(T* ptr)
  {
    return __sync_sub_and_fetch(ptr, T(1));
  }

  inline uint32_t AtomicLoad(uint32_t* ptr)
  {
    return __sync_fetch_and_or(ptr, 0u);
  }

  // Stores `value` and returns what was there before.
  inline uint32_t AtomicExchange(uint32_t* ptr, uint32_t value)
  {
    __sync_synchronize();
    return __sync_lock_test_and_set(ptr, value);
  }
}

#endif
