#include "Driver.hpp"
#include "FileSign.hpp"
#include "ReferenceMatch.hpp"
#include "Repository.hpp"

#include <errno.h>
#include <math.h>
#include <stdio.h>
#include <string.h>

namespace hs
{

const char* const DriverMode::Names[] =
{
  "hash",
  "verify",
  "repository",
  "reference-template"
};

void DriverOptionsInit(DriverOptions* self)
{
  self->m_ShowHelp          = false;
  self->m_Recurse           = false;
  self->m_IncludeAll        = false;
  self->m_VersionInfo       = false;
  self->m_CertificateInfo   = false;
  self->m_RootPath          = false;
  self->m_ReferenceTemplate = false;
  self->m_ShowProgress      = false;
  self->m_DisplayStats      = false;
  self->m_Verbose           = false;
  self->m_DebugMessages     = false;
  self->m_Quiet             = false;
  self->m_ThreadCount       = GetCpuCount();
  self->m_MaxRequests       = 4;
  self->m_RequestTimeout    = 30;
  self->m_Timeout           = 0;
  self->m_Algorithms        = nullptr;
  self->m_Placeholder       = HASHSIG_DEFAULT_MISSING_PLACEHOLDER;
  self->m_Format            = "csv";
  self->m_OutputFile        = nullptr;
  self->m_ReferenceFile     = nullptr;
  self->m_RepositoryUri     = nullptr;
}

static void PrintProgress(void* user_data, const char* root, double percent)
{
  Driver* self = static_cast<Driver*>(user_data);

  // Called with the estimator locked; one line per whole percent.
  int whole = int(floor(percent));
  if (root != self->m_ProgressRoot)
  {
    self->m_ProgressRoot  = root;
    self->m_ProgressShown = -1;
  }

  if (whole > self->m_ProgressShown)
  {
    self->m_ProgressShown = whole;
    fprintf(stderr, "[%3d%%] %s\n", whole, root);
  }
}

bool DriverInit(Driver* self, const DriverOptions* options)
{
  self->m_Options       = *options;
  self->m_ProgressRoot  = nullptr;
  self->m_ProgressShown = -1;

  if (options->m_ReferenceTemplate)
    self->m_Mode = DriverMode::kReferenceTemplate;
  else if (options->m_ReferenceFile)
    self->m_Mode = DriverMode::kVerify;
  else if (options->m_RepositoryUri)
    self->m_Mode = DriverMode::kRepository;
  else
    self->m_Mode = DriverMode::kHash;

  if (options->m_ReferenceFile && options->m_RepositoryUri)
  {
    Log(kError, "--reference and --repository can't be combined");
    return false;
  }

  if (!ExportFormatFromName(options->m_Format, &self->m_Format))
  {
    Log(kError, "unsupported output format: %s", options->m_Format);
    return false;
  }

  self->m_HashAlgorithms   = kAllHashAlgorithms;
  self->m_LookupAlgorithms = HashAlgorithmBit(HashAlgorithm::kMd5);

  if (options->m_Algorithms)
  {
    char error[256];
    uint32_t algorithms;
    if (!HashAlgorithmParseList(options->m_Algorithms, &algorithms, error, sizeof error))
    {
      Log(kError, "%s", error);
      return false;
    }

    // In repository mode the list picks what to look up; everything is still hashed.
    if (DriverMode::kRepository == self->m_Mode)
      self->m_LookupAlgorithms = algorithms;
    else
      self->m_HashAlgorithms = algorithms;
  }

  if (options->m_MaxRequests < 1 || options->m_RequestTimeout < 0 || options->m_Timeout < 0)
  {
    Log(kError, "request limits and timeouts must be positive");
    return false;
  }

  HeapInit(&self->m_Heap);
  RunContextInit(&self->m_Run, double(options->m_Timeout),
                 options->m_ShowProgress ? PrintProgress : nullptr, self);
  SignatureSetInit(&self->m_Signatures, &self->m_Heap);
  ReferenceSetInit(&self->m_References, &self->m_Heap);
  OutputTableInit(&self->m_Output, &self->m_Heap, options->m_Placeholder);

  Log(kDebug, "mode: %s", DriverMode::Names[self->m_Mode]);
  return true;
}

void DriverDestroy(Driver* self)
{
  OutputTableDestroy(&self->m_Output);
  ReferenceSetDestroy(&self->m_References);
  SignatureSetDestroy(&self->m_Signatures);
  RunContextDestroy(&self->m_Run);
  HeapDestroy(&self->m_Heap);
}

RunResult::Enum DriverRun(Driver* self, const char** paths, int path_count)
{
  const DriverOptions& opts = self->m_Options;

  if (DriverMode::kReferenceTemplate == self->m_Mode)
    return RunContextFinish(&self->m_Run);

  if (DriverMode::kVerify == self->m_Mode)
  {
    char error[1024];
    if (!ReferenceSetLoadFile(&self->m_References, opts.m_ReferenceFile, error, sizeof error))
    {
      Log(kError, "couldn't load reference data: %s", error);
      return RunResult::kSetupError;
    }
  }

  SignOptions sign_options;
  SignOptionsInit(&sign_options);
  sign_options.m_Recurse                = opts.m_Recurse;
  sign_options.m_IncludeHiddenAndSystem = opts.m_IncludeAll;
  sign_options.m_IncludeVersionData     = opts.m_VersionInfo;
  sign_options.m_IncludeCertificateData = opts.m_CertificateInfo;
  sign_options.m_IncludeRootPath        = opts.m_RootPath;
  sign_options.m_Algorithms             = self->m_HashAlgorithms;
  sign_options.m_ThreadCount            = opts.m_ThreadCount;

  RunResult::Enum result = ComputeSignatures(&self->m_Run, &self->m_Heap, paths, path_count,
                                             sign_options, &self->m_Signatures);

  if (RunResult::kSetupError == result)
    return result;

  const SignatureRecord* const* records = self->m_Signatures.m_Records.m_Storage;
  size_t record_count = self->m_Signatures.m_Records.m_Size;

  switch (self->m_Mode)
  {
    case DriverMode::kVerify:
      VerifySignatures(records, record_count,
                       self->m_References.m_Records.m_Storage, self->m_References.m_Records.m_Size,
                       opts.m_Placeholder, &self->m_Output);
      break;

    case DriverMode::kRepository:
      if (RunResult::kOk == result)
      {
        RepositoryOptions repo_options;
        RepositoryOptionsInit(&repo_options);
        if (opts.m_RepositoryUri[0])
          repo_options.m_RootUri = opts.m_RepositoryUri;
        repo_options.m_Algorithms            = self->m_LookupAlgorithms;
        repo_options.m_MaxRequests           = opts.m_MaxRequests;
        repo_options.m_RequestTimeoutSeconds = double(opts.m_RequestTimeout);

        result = LookupRepository(&self->m_Run, &self->m_Heap, records, record_count, repo_options, &self->m_Output);
      }
      else
      {
        // Interrupted before any lookup; report what was hashed.
        OutputTableAddSignatures(&self->m_Output, &self->m_Signatures);
      }
      break;

    default:
      OutputTableAddSignatures(&self->m_Output, &self->m_Signatures);
      break;
  }

  RunResult::Enum finish = RunContextFinish(&self->m_Run);
  return RunResult::kOk == result ? finish : result;
}

bool DriverExport(Driver* self)
{
  const char* path = self->m_Options.m_OutputFile;
  FILE*       out  = stdout;

  if (path)
  {
    out = fopen(path, "wb");
    if (!out)
    {
      Log(kError, "couldn't open %s for writing: %s", path, strerror(errno));
      return false;
    }
  }

  bool ok;
  if (DriverMode::kReferenceTemplate == self->m_Mode)
  {
    ReferenceRecord record;
    ReferenceTemplate(&record);
    ok = ExportReferenceRecords(&self->m_Heap, &record, 1, self->m_Format, out);
  }
  else
  {
    ok = ExportTable(&self->m_Output, self->m_Format, out);
  }

  if (path && 0 != fclose(out))
    ok = false;

  if (!ok)
    Log(kError, "couldn't write output to %s", path ? path : "stdout");
  else
    Log(kInfo, "wrote %d rows to %s", int(self->m_Output.m_Rows.m_Size), path ? path : "stdout");

  return ok;
}

void DriverShowStats(Driver* self)
{
  RunStatsPrint(&self->m_Run.m_Stats);
}

}
