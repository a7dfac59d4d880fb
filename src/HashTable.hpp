#ifndef HASHTABLE_HPP
#define HASHTABLE_HPP

#include "Common.hpp"
#include "MemAllocHeap.hpp"

#include <string.h>

namespace hs
{
  // String-keyed table with open addressing. Keys are compared exactly and
  // are not copied; they have to outlive the table. Slots with a zero hash
  // are empty, which is why Djb2Hash never returns zero.
  template <typename T>
  struct HashTable
  {
    struct Slot
    {
      uint32_t    m_Hash;
      const char* m_Key;
      T           m_Value;
    };

    Slot*         m_Slots;
    uint32_t      m_Capacity;   // zero or a power of two
    uint32_t      m_Count;
    MemAllocHeap* m_Heap;
  };

  template <typename T>
  void HashTableInit(HashTable<T>* self, MemAllocHeap* heap)
  {
    self->m_Slots    = nullptr;
    self->m_Capacity = 0;
    self->m_Count    = 0;
    self->m_Heap     = heap;
  }

  template <typename T>
  void HashTableDestroy(HashTable<T>* self)
  {
    HeapFree(self->m_Heap, self->m_Slots);
    HashTableInit(self, self->m_Heap);
  }

  // The slot holding `key`, or the empty slot where it would go.
  template <typename T>
  typename HashTable<T>::Slot* HashTableProbe(HashTable<T>* self, uint32_t hash, const char* key)
  {
    const uint32_t mask = self->m_Capacity - 1;

    for (uint32_t i = hash & mask; ; i = (i + 1) & mask)
    {
      typename HashTable<T>::Slot* slot = self->m_Slots + i;
      if (0 == slot->m_Hash)
        return slot;
      if (hash == slot->m_Hash && 0 == strcmp(slot->m_Key, key))
        return slot;
    }
  }

  template <typename T>
  void HashTableRehash(HashTable<T>* self, uint32_t new_capacity)
  {
    typename HashTable<T>::Slot* old_slots = self->m_Slots;
    uint32_t old_capacity = self->m_Capacity;

    self->m_Slots    = HeapAllocateArrayZeroed<typename HashTable<T>::Slot>(self->m_Heap, new_capacity);
    self->m_Capacity = new_capacity;

    for (uint32_t i = 0; i < old_capacity; ++i)
    {
      if (old_slots[i].m_Hash)
        *HashTableProbe(self, old_slots[i].m_Hash, old_slots[i].m_Key) = old_slots[i];
    }

    HeapFree(self->m_Heap, old_slots);
  }

  template <typename T>
  T* HashTableFind(HashTable<T>* self, const char* key)
  {
    if (0 == self->m_Count)
      return nullptr;

    typename HashTable<T>::Slot* slot = HashTableProbe(self, Djb2Hash(key), key);
    return slot->m_Hash ? &slot->m_Value : nullptr;
  }

  // Adds `key` unless it is already present. Returns the value stored for an
  // existing key, or null when `value` was inserted.
  template <typename T>
  T* HashTableInsertIfMissing(HashTable<T>* self, const char* key, const T& value)
  {
    // Stay at or below three quarters full.
    if (4 * uint64_t(self->m_Count + 1) > 3 * uint64_t(self->m_Capacity))
      HashTableRehash(self, self->m_Capacity ? self->m_Capacity * 2 : 32);

    uint32_t hash = Djb2Hash(key);
    typename HashTable<T>::Slot* slot = HashTableProbe(self, hash, key);
    if (slot->m_Hash)
      return &slot->m_Value;

    slot->m_Hash  = hash;
    slot->m_Key   = key;
    slot->m_Value = value;
    ++self->m_Count;
    return nullptr;
  }
}

#endif
