#include "Thread.hpp"
#include "Mutex.hpp"

#include <pthread.h>
#include <string.h>

namespace hs
{

static_assert(sizeof(pthread_t) <= sizeof(ThreadId), "pthread_t doesn't fit in a ThreadId");

ThreadId ThreadCurrent()
{
  return (ThreadId) pthread_self();
}

ThreadId ThreadStart(ThreadRoutine routine, void* param, const char* name)
{
  pthread_t thread;
  HS_PTHREAD_CHECK(pthread_create(&thread, nullptr, routine, param));

  char short_name[16];
  strncpy(short_name, name, sizeof short_name - 1);
  short_name[sizeof short_name - 1] = '\0';

  if (0 != pthread_setname_np(thread, short_name))
    Log(kDebug, "couldn't name thread %s", short_name);

  return (ThreadId) thread;
}

void ThreadJoin(ThreadId thread_id)
{
  HS_PTHREAD_CHECK(pthread_join((pthread_t) thread_id, nullptr));
}

void ThreadDetach(ThreadId thread_id)
{
  HS_PTHREAD_CHECK(pthread_detach((pthread_t) thread_id));
}

}
