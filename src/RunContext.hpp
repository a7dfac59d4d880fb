#ifndef RUNCONTEXT_HPP
#define RUNCONTEXT_HPP

#include "Common.hpp"
#include "Stats.hpp"
#include "Progress.hpp"

namespace hs
{

namespace RunResult
{
  enum Enum
  {
    kOk          = 0,
    kSetupError  = 1,
    kInterrupted = 2
  };

  extern const char* const Names[];
}

// Per-invocation state shared by every stage: statistics, progress and
// cancellation. Passed by pointer; nothing here is global.
struct RunContext
{
  RunStats           m_Stats;
  ProgressEstimator  m_Progress;
  uint32_t           m_Cancelled;
  const char*        m_CancelReason;
  uint64_t           m_Deadline;      // TimerGet() value, 0 for none
};

void RunContextInit(RunContext* self, double timeout_seconds, ProgressCallback progress_callback, void* progress_data);
void RunContextDestroy(RunContext* self);

// Stop starting new work. Safe to call from any thread, and more than once.
void RunContextCancel(RunContext* self, const char* reason);

// False once the run was cancelled, the process was signalled or the
// deadline passed.
bool RunContextShouldContinue(RunContext* self);

bool RunContextWasCancelled(RunContext* self);

// Marks the end of the run for the statistics and picks the result code.
RunResult::Enum RunContextFinish(RunContext* self);

}

#endif
