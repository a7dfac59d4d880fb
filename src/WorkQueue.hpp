#ifndef WORKQUEUE_HPP
#define WORKQUEUE_HPP

#include "Common.hpp"
#include "Mutex.hpp"
#include "Thread.hpp"
#include "MemAllocLinear.hpp"

namespace hs
{
  struct MemAllocHeap;
  struct RunContext;
  struct WorkQueue;

  enum
  {
    kMaxWorkerThreads = 64
  };

  struct WorkerState
  {
    MemAllocLinear    m_ScratchAlloc;
    int               m_ThreadIndex;
    WorkQueue*        m_Queue;
  };

  // Processes item `index` of the current batch. Runs without the queue lock held.
  typedef void (*WorkFunction)(void* user_data, WorkerState* worker, size_t index);

  // Fixed pool of threads working through batches of independent items. The
  // calling thread acts as worker 0 while a batch runs. Items are handed out
  // in index order; once the run context stops, no further items start.
  struct WorkQueue
  {
    Mutex              m_Lock;
    ConditionVariable  m_WorkAvailable;
    ConditionVariable  m_WorkDone;
    MemAllocHeap      *m_Heap;
    RunContext        *m_Run;
    int                m_ThreadCount;
    ThreadId           m_Threads[kMaxWorkerThreads];
    WorkerState        m_WorkerState[kMaxWorkerThreads];
    bool               m_QuitSignalled;

    WorkFunction       m_Function;
    void*              m_UserData;
    size_t             m_ItemCount;
    size_t             m_NextItem;
    int                m_BusyCount;
  };

  // Worker threads are named after `name` and their index.
  void WorkQueueInit(WorkQueue* queue, MemAllocHeap* heap, RunContext* run, int thread_count, const char* name);

  // Returns false when the batch was cut short by cancellation.
  bool WorkQueueRun(WorkQueue* queue, size_t item_count, WorkFunction function, void* user_data);

  void WorkQueueDestroy(WorkQueue* queue);
}

#endif
