#include "WorkQueue.hpp"
#include "RunContext.hpp"
#include "SignalHandler.hpp"

#include <stdio.h>

namespace hs
{
  // Caller holds the lock.
  static bool HasClaimableItem(WorkQueue* queue)
  {
    return queue->m_Function &&
           queue->m_NextItem < queue->m_ItemCount &&
           RunContextShouldContinue(queue->m_Run);
  }

  // Runs one item with the lock released. Caller holds the lock.
  static void ProcessOne(WorkQueue* queue, WorkerState* worker)
  {
    size_t       index     = queue->m_NextItem++;
    WorkFunction function  = queue->m_Function;
    void*        user_data = queue->m_UserData;

    queue->m_BusyCount++;
    MutexUnlock(&queue->m_Lock);

    {
      MemAllocLinearScope scratch_scope(&worker->m_ScratchAlloc);
      function(user_data, worker, index);
    }

    MutexLock(&queue->m_Lock);
    queue->m_BusyCount--;

    if (0 == queue->m_BusyCount && !HasClaimableItem(queue))
      CondBroadcast(&queue->m_WorkDone);
  }

  static void WorkLoop(WorkerState* worker)
  {
    WorkQueue* queue = worker->m_Queue;

    MutexLock(&queue->m_Lock);

    while (!queue->m_QuitSignalled)
    {
      if (HasClaimableItem(queue))
        ProcessOne(queue, worker);
      else
        CondWait(&queue->m_WorkAvailable, &queue->m_Lock);
    }

    MutexUnlock(&queue->m_Lock);

    Log(kSpam, "worker thread %d exiting", worker->m_ThreadIndex);
  }

  static void* WorkerThreadRoutine(void* param)
  {
    WorkerState* worker = static_cast<WorkerState*>(param);

    SignalBlockThread(true);
    LinearAllocSetOwner(&worker->m_ScratchAlloc, ThreadCurrent());

    WorkLoop(worker);

    return nullptr;
  }

  void WorkQueueInit(WorkQueue* queue, MemAllocHeap* heap, RunContext* run, int thread_count, const char* name)
  {
    if (thread_count < 1)
      thread_count = 1;

    if (thread_count > kMaxWorkerThreads)
    {
      Log(kWarning, "too many threads (%d), clamping to %d", thread_count, (int) kMaxWorkerThreads);
      thread_count = kMaxWorkerThreads;
    }

    MutexInit(&queue->m_Lock);
    CondInit(&queue->m_WorkAvailable);
    CondInit(&queue->m_WorkDone);

    queue->m_Heap          = heap;
    queue->m_Run           = run;
    queue->m_ThreadCount   = thread_count;
    queue->m_QuitSignalled = false;
    queue->m_Function      = nullptr;
    queue->m_UserData      = nullptr;
    queue->m_ItemCount     = 0;
    queue->m_NextItem      = 0;
    queue->m_BusyCount     = 0;

    for (int i = 0; i < thread_count; ++i)
    {
      WorkerState* worker = &queue->m_WorkerState[i];
      LinearAllocInit(&worker->m_ScratchAlloc, heap, MB(1), "worker scratch");
      worker->m_ThreadIndex = i;
      worker->m_Queue       = queue;
    }

    // Worker 0 is whoever calls WorkQueueRun.
    queue->m_Threads[0] = 0;

    for (int i = 1; i < thread_count; ++i)
    {
      char thread_name[16];
      snprintf(thread_name, sizeof thread_name, "%s-%d", name, i);
      Log(kDebug, "starting worker thread %s", thread_name);
      queue->m_Threads[i] = ThreadStart(WorkerThreadRoutine, &queue->m_WorkerState[i], thread_name);
    }
  }

  bool WorkQueueRun(WorkQueue* queue, size_t item_count, WorkFunction function, void* user_data)
  {
    WorkerState* worker = &queue->m_WorkerState[0];

    MutexLock(&queue->m_Lock);

    CHECK(nullptr == queue->m_Function);

    queue->m_Function  = function;
    queue->m_UserData  = user_data;
    queue->m_ItemCount = item_count;
    queue->m_NextItem  = 0;

    CondBroadcast(&queue->m_WorkAvailable);

    while (HasClaimableItem(queue))
      ProcessOne(queue, worker);

    while (queue->m_BusyCount > 0)
      CondWait(&queue->m_WorkDone, &queue->m_Lock);

    bool completed = queue->m_NextItem >= queue->m_ItemCount;

    queue->m_Function  = nullptr;
    queue->m_UserData  = nullptr;
    queue->m_ItemCount = 0;
    queue->m_NextItem  = 0;

    MutexUnlock(&queue->m_Lock);

    return completed && !RunContextWasCancelled(queue->m_Run);
  }

  void WorkQueueDestroy(WorkQueue* queue)
  {
    Log(kDebug, "destroying work queue");

    MutexLock(&queue->m_Lock);
    queue->m_QuitSignalled = true;
    MutexUnlock(&queue->m_Lock);

    CondBroadcast(&queue->m_WorkAvailable);

    for (int i = 0, thread_count = queue->m_ThreadCount; i < thread_count; ++i)
    {
      if (i > 0)
      {
        Log(kDebug, "joining with worker thread %d", i);
        ThreadJoin(queue->m_Threads[i]);
      }

      LinearAllocDestroy(&queue->m_WorkerState[i].m_ScratchAlloc);
    }

    CondDestroy(&queue->m_WorkDone);
    CondDestroy(&queue->m_WorkAvailable);
    MutexDestroy(&queue->m_Lock);
  }
}
