#ifndef MUTEX_HPP
#define MUTEX_HPP

#include "Common.hpp"

#include <pthread.h>

namespace hs
{

// pthread calls return their error instead of setting errno.
#define HS_PTHREAD_CHECK(call) \
  do { int hs_rc_ = (call); if (0 != hs_rc_) ::hs::CroakError(hs_rc_, "%s failed", #call); } while (0)

struct Mutex
{
  pthread_mutex_t m_Impl;
};

inline void MutexInit(Mutex* self)
{
  HS_PTHREAD_CHECK(pthread_mutex_init(&self->m_Impl, nullptr));
}

inline void MutexDestroy(Mutex* self)
{
  HS_PTHREAD_CHECK(pthread_mutex_destroy(&self->m_Impl));
}

inline void MutexLock(Mutex* self)
{
  HS_PTHREAD_CHECK(pthread_mutex_lock(&self->m_Impl));
}

inline void MutexUnlock(Mutex* self)
{
  HS_PTHREAD_CHECK(pthread_mutex_unlock(&self->m_Impl));
}

// Holds a mutex for the lifetime of the scope.
class MutexScope
{
  Mutex* m_Mutex;

public:
  explicit MutexScope(Mutex* mutex)
  : m_Mutex(mutex)
  {
    MutexLock(m_Mutex);
  }

  ~MutexScope()
  {
    MutexUnlock(m_Mutex);
  }

private:
  MutexScope(const MutexScope&);
  MutexScope& operator=(const MutexScope&);
};

// Waiters always hold the paired mutex; wakeups go to everyone.
struct ConditionVariable
{
  pthread_cond_t m_Impl;
};

inline void CondInit(ConditionVariable* self)
{
  HS_PTHREAD_CHECK(pthread_cond_init(&self->m_Impl, nullptr));
}

inline void CondDestroy(ConditionVariable* self)
{
  HS_PTHREAD_CHECK(pthread_cond_destroy(&self->m_Impl));
}

inline void CondWait(ConditionVariable* self, Mutex* mutex)
{
  HS_PTHREAD_CHECK(pthread_cond_wait(&self->m_Impl, &mutex->m_Impl));
}

inline void CondBroadcast(ConditionVariable* self)
{
  HS_PTHREAD_CHECK(pthread_cond_broadcast(&self->m_Impl));
}

}

#endif
