#include "Stats.hpp"

#include <stdio.h>
#include <string.h>

namespace hs
{

void RunStatsInit(RunStats* stats)
{
  memset(stats, 0, sizeof *stats);
  stats->m_StartTime = TimerGet();
}

double RunStatsElapsedSeconds(const RunStats* stats)
{
  uint64_t end = stats->m_EndTime ? stats->m_EndTime : TimerGet();
  if (end < stats->m_StartTime)
    return 0.0;
  return TimerDiffSeconds(stats->m_StartTime, end);
}

double RunStatsAverageFileSeconds(const RunStats* stats)
{
  if (0 == stats->m_FilesProcessed)
    return 0.0;
  return RunStatsElapsedSeconds(stats) / stats->m_FilesProcessed;
}

void RunStatsPrint(const RunStats* stats)
{
  double digest_time = TimerToSeconds(stats->m_FileDigestTimeUs);
  double mb_hashed   = stats->m_BytesHashed / (1024.0 * 1024.0);

  // stdout may be carrying the exported table
  fprintf(stderr, "files:\n");
  fprintf(stderr, "  processed:       %10u\n", stats->m_FilesProcessed);
  fprintf(stderr, "  skipped:         %10u\n", stats->m_FilesSkipped);
  fprintf(stderr, "  avg per file:    %10.2f ms\n", RunStatsAverageFileSeconds(stats) * 1000.0);
  fprintf(stderr, "digests:\n");
  fprintf(stderr, "  count:           %10u\n", stats->m_FileDigestCount);
  fprintf(stderr, "  time:            %10.2f ms\n", digest_time * 1000.0);
  fprintf(stderr, "  hashed:          %10.2f MB\n", mb_hashed);
  if (digest_time > 0.0)
    fprintf(stderr, "  throughput:      %10.2f MB/s\n", mb_hashed / digest_time);
  fprintf(stderr, "repository:\n");
  fprintf(stderr, "  requests:        %10u\n", stats->m_RepositoryRequests);
  fprintf(stderr, "  failures:        %10u\n", stats->m_RepositoryFailures);
  fprintf(stderr, "  request time:    %10.2f ms\n", TimerToSeconds(stats->m_RepositoryTimeUs) * 1000.0);
  fprintf(stderr, "total time:        %10.2f s\n", RunStatsElapsedSeconds(stats));
}

}
