#ifndef THREAD_HPP
#define THREAD_HPP

#include "Common.hpp"

namespace hs
{

typedef uintptr_t ThreadId;

typedef void* (*ThreadRoutine)(void*);

// Start `routine` on a new thread. `name` shows up in debuggers and `top -H`;
// the kernel keeps at most 15 characters of it.
ThreadId ThreadStart(ThreadRoutine routine, void* param, const char* name);

void ThreadJoin(ThreadId thread_id);

// Let a thread run to completion on its own; it can't be joined afterwards.
void ThreadDetach(ThreadId thread_id);

ThreadId ThreadCurrent();

}

#endif
