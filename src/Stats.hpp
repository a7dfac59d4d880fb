#ifndef STATS_HPP
#define STATS_HPP

#include "Common.hpp"
#include "Atomic.hpp"

namespace hs
{

// Counters for one invocation. Updated from worker threads with the atomic
// helpers; read once the pools have drained.
struct RunStats
{
  uint32_t m_FilesProcessed;
  uint32_t m_FilesSkipped;

  uint32_t m_FileDigestCount;
  uint64_t m_FileDigestTimeUs;
  uint64_t m_BytesHashed;

  uint32_t m_RepositoryRequests;
  uint32_t m_RepositoryFailures;
  uint64_t m_RepositoryTimeUs;

  uint64_t m_StartTime;
  uint64_t m_EndTime;
};

void RunStatsInit(RunStats* stats);

// Elapsed wall time in seconds; uses the current time if the run hasn't ended.
double RunStatsElapsedSeconds(const RunStats* stats);

// Average seconds per processed file, 0 when nothing was processed.
double RunStatsAverageFileSeconds(const RunStats* stats);

void RunStatsPrint(const RunStats* stats);

struct TimingScope
{
  uint32_t* m_CountPtr;
  uint64_t* m_TimePtr;
  uint64_t  m_StartTime;

  TimingScope(uint32_t* count_ptr, uint64_t* time_ptr)
  {
    m_CountPtr  = count_ptr;
    m_TimePtr   = time_ptr;
    m_StartTime = TimerGet();
  }

  ~TimingScope()
  {
    uint64_t micros = TimerGet() - m_StartTime;
    if (uint32_t *ptr = m_CountPtr)
      AtomicIncrement(ptr);
    AtomicAdd(m_TimePtr, micros);
  }
};

}

#endif
