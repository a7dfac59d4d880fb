#ifndef PROGRESS_HPP
#define PROGRESS_HPP

#include "Common.hpp"
#include "Mutex.hpp"

namespace hs
{

namespace ProgressPhase
{
  enum Enum
  {
    kDigest,      // one per requested algorithm
    kMetadata     // attributes, version and certificate data
  };
}

typedef void (*ProgressCallback)(void* user_data, const char* root, double percent_complete);

// Completion estimate for one search root at a time. Each file's megabytes
// are split across phases: 96% shared evenly by the requested digest
// algorithms and 4% for metadata. The reported value never decreases within
// a root and never exceeds 100.
struct ProgressEstimator
{
  Mutex            m_Lock;
  const char*      m_Root;
  double           m_TotalMB;
  double           m_ProcessedMB;
  double           m_LastPercent;
  double           m_DigestWeight;
  ProgressCallback m_Callback;
  void*            m_UserData;
};

void ProgressInit(ProgressEstimator* self, ProgressCallback callback, void* user_data);
void ProgressDestroy(ProgressEstimator* self);

// Start a new root. Emits 100% straight away when there is nothing to process.
void ProgressBeginRoot(ProgressEstimator* self, const char* root, uint64_t total_bytes, int algorithm_count);

// Credit one phase of a file and emit the new estimate, which is returned.
double ProgressAdvance(ProgressEstimator* self, uint64_t file_bytes, ProgressPhase::Enum phase);

// Credit every phase of a file that won't be processed, so a root with
// skipped files still ends at 100%.
double ProgressSkip(ProgressEstimator* self, uint64_t file_bytes);

double ProgressPercent(ProgressEstimator* self);

double ProgressPhaseWeight(const ProgressEstimator* self, ProgressPhase::Enum phase);

}

#endif
