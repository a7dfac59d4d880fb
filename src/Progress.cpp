#include "Progress.hpp"

namespace hs
{

static const double kDigestShare   = 0.96;
static const double kMetadataShare = 0.04;

static double BytesToMB(uint64_t bytes)
{
  return double(bytes) / (1024.0 * 1024.0);
}

// Caller holds the lock.
static double Emit(ProgressEstimator* self)
{
  double percent = 100.0;

  if (self->m_TotalMB > 0.0)
  {
    percent = self->m_ProcessedMB / self->m_TotalMB * 100.0;
    if (percent > 100.0)
      percent = 100.0;
  }

  if (percent < self->m_LastPercent)
    percent = self->m_LastPercent;

  self->m_LastPercent = percent;

  if (self->m_Callback)
    self->m_Callback(self->m_UserData, self->m_Root, percent);

  return percent;
}

void ProgressInit(ProgressEstimator* self, ProgressCallback callback, void* user_data)
{
  MutexInit(&self->m_Lock);
  self->m_Root         = "";
  self->m_TotalMB      = 0.0;
  self->m_ProcessedMB  = 0.0;
  self->m_LastPercent  = 0.0;
  self->m_DigestWeight = kDigestShare / 4;
  self->m_Callback     = callback;
  self->m_UserData     = user_data;
}

void ProgressDestroy(ProgressEstimator* self)
{
  MutexDestroy(&self->m_Lock);
}

void ProgressBeginRoot(ProgressEstimator* self, const char* root, uint64_t total_bytes, int algorithm_count)
{
  MutexScope lock(&self->m_Lock);

  self->m_Root         = root;
  self->m_TotalMB      = BytesToMB(total_bytes);
  self->m_ProcessedMB  = 0.0;
  self->m_LastPercent  = 0.0;
  self->m_DigestWeight = kDigestShare / (algorithm_count > 0 ? algorithm_count : 1);

  if (0 == total_bytes)
    Emit(self);
}

double ProgressAdvance(ProgressEstimator* self, uint64_t file_bytes, ProgressPhase::Enum phase)
{
  MutexScope lock(&self->m_Lock);

  self->m_ProcessedMB += BytesToMB(file_bytes) * ProgressPhaseWeight(self, phase);
  return Emit(self);
}

double ProgressSkip(ProgressEstimator* self, uint64_t file_bytes)
{
  MutexScope lock(&self->m_Lock);

  self->m_ProcessedMB += BytesToMB(file_bytes);
  return Emit(self);
}

double ProgressPercent(ProgressEstimator* self)
{
  MutexScope lock(&self->m_Lock);
  return self->m_LastPercent;
}

double ProgressPhaseWeight(const ProgressEstimator* self, ProgressPhase::Enum phase)
{
  return ProgressPhase::kDigest == phase ? self->m_DigestWeight : kMetadataShare;
}

}
