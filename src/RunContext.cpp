#include "RunContext.hpp"
#include "Atomic.hpp"
#include "SignalHandler.hpp"

namespace hs
{

const char* const RunResult::Names[] =
{
  "ok",
  "setup error",
  "interrupted"
};

void RunContextInit(RunContext* self, double timeout_seconds, ProgressCallback progress_callback, void* progress_data)
{
  RunStatsInit(&self->m_Stats);
  ProgressInit(&self->m_Progress, progress_callback, progress_data);
  self->m_Cancelled    = 0;
  self->m_CancelReason = nullptr;
  self->m_Deadline     = 0;

  if (timeout_seconds > 0.0)
    self->m_Deadline = self->m_Stats.m_StartTime + uint64_t(timeout_seconds * 1000000.0);
}

void RunContextDestroy(RunContext* self)
{
  ProgressDestroy(&self->m_Progress);
}

void RunContextCancel(RunContext* self, const char* reason)
{
  if (0 == AtomicExchange(&self->m_Cancelled, 1))
  {
    self->m_CancelReason = reason;
    Log(kInfo, "cancelling run: %s", reason);
  }
}

bool RunContextShouldContinue(RunContext* self)
{
  if (AtomicLoad(&self->m_Cancelled))
    return false;

  if (const char* reason = SignalGetReason())
  {
    RunContextCancel(self, reason);
    return false;
  }

  if (self->m_Deadline && TimerGet() >= self->m_Deadline)
  {
    RunContextCancel(self, "run timeout");
    return false;
  }

  return true;
}

bool RunContextWasCancelled(RunContext* self)
{
  return 0 != AtomicLoad(&self->m_Cancelled);
}

RunResult::Enum RunContextFinish(RunContext* self)
{
  self->m_Stats.m_EndTime = TimerGet();
  return RunContextWasCancelled(self) ? RunResult::kInterrupted : RunResult::kOk;
}

}
