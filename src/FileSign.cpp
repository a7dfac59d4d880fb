#include "FileSign.hpp"
#include "FileInfo.hpp"
#include "PathUtil.hpp"
#include "Progress.hpp"
#include "WorkQueue.hpp"
#include "Atomic.hpp"
#include "Buffer.hpp"
#include "MemAllocHeap.hpp"
#include "MemAllocLinear.hpp"

#include <string.h>

namespace hs
{

void SignOptionsInit(SignOptions* options)
{
  memset(options, 0, sizeof *options);
  options->m_Algorithms  = kAllHashAlgorithms;
  options->m_ThreadCount = GetCpuCount();
}

struct SignRootState
{
  RunContext*              m_Run;
  const SignOptions*       m_Options;
  SignatureSet*            m_Output;
  const char*              m_NormalizedRoot;
  Buffer<FileEntry>        m_Files;
  const SignatureRecord**  m_Slots;
  MemAllocHeap*            m_Heap;
  MemAllocLinear*          m_Alloc;
};

static void CollectEntry(void* user_data, const FileEntry& entry)
{
  SignRootState* state = static_cast<SignRootState*>(user_data);

  // Directories only matter for traversal; system entries never get records.
  if (entry.m_IsDirectory || entry.m_IsSystem)
    return;

  BufferAppendOne(&state->m_Files, state->m_Heap, entry);
}

static bool KeepDigesting(void* user_data)
{
  return RunContextShouldContinue(static_cast<RunContext*>(user_data));
}

static void SkipFile(RunContext* run, const FileEntry* file, const char* why)
{
  AtomicIncrement(&run->m_Stats.m_FilesSkipped);
  Log(kWarning, "skipping %s: %s", file->m_FullPath, why);

  if (file->m_SizeBytes)
    ProgressSkip(&run->m_Progress, file->m_SizeBytes);
}

static void SignOneFile(void* user_data, WorkerState* worker, size_t index)
{
  SignRootState*     state   = static_cast<SignRootState*>(user_data);
  RunContext*        run     = state->m_Run;
  const SignOptions* options = state->m_Options;
  const FileEntry*   file    = &state->m_Files[index];
  const char*        path    = file->m_FullPath;

  if (!file->m_IsReadable)
  {
    SkipFile(run, file, "not readable");
    return;
  }

  if (0 == file->m_SizeBytes)
  {
    SkipFile(run, file, "zero length");
    return;
  }

  DigestResult       digests;
  DigestStatus::Enum status;
  char               error[256];

  {
    TimingScope timing_scope(&run->m_Stats.m_FileDigestCount, &run->m_Stats.m_FileDigestTimeUs);
    status = DigestFile(path, options->m_Algorithms, &digests, error, sizeof error, KeepDigesting, run);
  }

  if (DigestStatus::kCancelled == status)
  {
    Log(kDebug, "dropped %s: run cancelled", path);
    return;
  }

  if (DigestStatus::kOk != status)
  {
    SkipFile(run, file, error);
    return;
  }

  AtomicAdd(&run->m_Stats.m_BytesHashed, digests.m_BytesHashed);

  for (int i = 0, count = HashAlgorithmCount(options->m_Algorithms); i < count; ++i)
    ProgressAdvance(&run->m_Progress, file->m_SizeBytes, ProgressPhase::kDigest);

  const MetadataProviders& providers = options->m_Providers;
  VersionInfo              version_info;
  CertificateInfo          cert_info;
  const VersionInfo*       version_ptr = nullptr;
  const CertificateInfo*   cert_ptr    = nullptr;

  if (options->m_IncludeVersionData && providers.m_GetVersionInfo)
  {
    memset(&version_info, 0, sizeof version_info);
    if (providers.m_GetVersionInfo(providers.m_UserData, path, &worker->m_ScratchAlloc, &version_info))
      version_ptr = &version_info;
  }

  if (options->m_IncludeCertificateData && providers.m_GetCertificateInfo)
  {
    memset(&cert_info, 0, sizeof cert_info);
    if (providers.m_GetCertificateInfo(providers.m_UserData, path, &worker->m_ScratchAlloc, &cert_info))
      cert_ptr = &cert_info;
  }

  ProgressAdvance(&run->m_Progress, file->m_SizeBytes, ProgressPhase::kMetadata);

  SignatureInput input;
  input.m_File            = file;
  input.m_NormalizedRoot  = state->m_NormalizedRoot;
  input.m_Digests         = &digests;
  input.m_VersionInfo     = version_ptr;
  input.m_CertificateInfo = cert_ptr;
  input.m_IncludeRootPath = options->m_IncludeRootPath;
  input.m_EntryTimestamp  = WallClockNow();

  // Each file owns its slot, so no lock is needed here.
  state->m_Slots[index] = SignatureBuild(state->m_Output, run, input);
}

static void SignRoot(
    RunContext*        run,
    MemAllocHeap*      heap,
    MemAllocLinear*    alloc,
    WorkQueue*         queue,
    const char*        root,
    const FileInfo&    root_info,
    const SignOptions& options,
    SignatureSet*      out)
{
  SignRootState state;
  state.m_Run     = run;
  state.m_Options = &options;
  state.m_Output  = out;
  state.m_Heap    = heap;
  state.m_Alloc   = alloc;
  state.m_Slots   = nullptr;
  BufferInit(&state.m_Files);

  // A file argument is identified relative to its own directory.
  if (root_info.IsDirectory())
    state.m_NormalizedRoot = PathNormalizeRoot(alloc, root, true);
  else
    state.m_NormalizedRoot = PathNormalizeRoot(alloc, PathParent(alloc, root), true);

  EnumerateFiles(root, options.m_Recurse, options.m_IncludeHiddenAndSystem, heap, alloc, &state, CollectEntry);

  uint64_t total_bytes = 0;
  for (const FileEntry& entry : state.m_Files)
    total_bytes += entry.m_SizeBytes;

  Log(kInfo, "%s: %d files, %.2f MB", root, (int) state.m_Files.m_Size, total_bytes / (1024.0 * 1024.0));

  ProgressBeginRoot(&run->m_Progress, state.m_NormalizedRoot, total_bytes, HashAlgorithmCount(options.m_Algorithms));

  size_t file_count = state.m_Files.m_Size;
  if (file_count > 0)
  {
    state.m_Slots = HeapAllocateArrayZeroed<const SignatureRecord*>(heap, file_count);

    if (!WorkQueueRun(queue, file_count, SignOneFile, &state))
      Log(kInfo, "%s: hashing stopped early", root);

    // Compact in enumeration order; skipped and dropped files left their slot empty.
    for (size_t i = 0; i < file_count; ++i)
    {
      if (const SignatureRecord* record = state.m_Slots[i])
        SignatureSetAppend(out, record);
    }

    HeapFree(heap, state.m_Slots);
  }

  BufferDestroy(&state.m_Files, heap);
}

RunResult::Enum ComputeSignatures(
    RunContext*         run,
    MemAllocHeap*       heap,
    const char* const*  paths,
    int                 path_count,
    const SignOptions&  options,
    SignatureSet*       out)
{
  CHECK(0 != options.m_Algorithms);
  CHECK(0 == (options.m_Algorithms & ~uint32_t(kAllHashAlgorithms)));

  if ((options.m_IncludeVersionData && !options.m_Providers.m_GetVersionInfo) ||
      (options.m_IncludeCertificateData && !options.m_Providers.m_GetCertificateInfo))
  {
    Log(kWarning, "no version/certificate provider is available on " HASHSIG_PLATFORM_STRING "; those columns stay empty");
  }

  MemAllocLinear alloc;
  LinearAllocInit(&alloc, heap, MB(4), "enumeration");

  WorkQueue queue;
  WorkQueueInit(&queue, heap, run, options.m_ThreadCount, "hash");

  int valid_paths = 0;

  for (int i = 0; i < path_count; ++i)
  {
    if (!RunContextShouldContinue(run))
      break;

    const char* root      = paths[i];
    FileInfo    root_info = GetFileInfo(root);

    if (!root_info.Exists())
    {
      AtomicIncrement(&run->m_Stats.m_FilesSkipped);
      Log(kWarning, "skipping %s: no such file or directory", root);
      continue;
    }

    ++valid_paths;

    MemAllocLinearScope root_scope(&alloc);
    SignRoot(run, heap, &alloc, &queue, root, root_info, options, out);
  }

  WorkQueueDestroy(&queue);
  LinearAllocDestroy(&alloc);

  if (RunContextWasCancelled(run))
    return RunResult::kInterrupted;

  if (0 == valid_paths)
  {
    Log(kError, "none of the %d given paths exist", path_count);
    return RunResult::kSetupError;
  }

  return RunResult::kOk;
}

}
