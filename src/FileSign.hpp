#ifndef FILESIGN_HPP
#define FILESIGN_HPP

#include "Common.hpp"
#include "Signature.hpp"
#include "RunContext.hpp"

namespace hs
{

struct MemAllocHeap;

struct SignOptions
{
  bool              m_Recurse;
  bool              m_IncludeHiddenAndSystem;
  bool              m_IncludeVersionData;
  bool              m_IncludeCertificateData;
  bool              m_IncludeRootPath;
  uint32_t          m_Algorithms;
  int               m_ThreadCount;
  MetadataProviders m_Providers;
};

void SignOptionsInit(SignOptions* options);

// Hash every regular file under `paths` and append one record per file to
// `out`, in enumeration order. Missing, unreadable, empty and unhashable
// files are skipped with a warning. Returns kSetupError when none of the
// paths exist and kInterrupted when the run was cancelled part way; the
// records gathered so far are kept either way.
RunResult::Enum ComputeSignatures(
    RunContext*         run,
    MemAllocHeap*       heap,
    const char* const*  paths,
    int                 path_count,
    const SignOptions&  options,
    SignatureSet*       out);

}

#endif
