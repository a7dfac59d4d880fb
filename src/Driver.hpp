#ifndef DRIVER_HPP
#define DRIVER_HPP

#include "MemAllocHeap.hpp"
#include "RunContext.hpp"
#include "Signature.hpp"
#include "ReferenceData.hpp"
#include "OutputTable.hpp"
#include "Export.hpp"

namespace hs
{

struct DriverOptions
{
  bool        m_ShowHelp;
  bool        m_Recurse;
  bool        m_IncludeAll;
  bool        m_VersionInfo;
  bool        m_CertificateInfo;
  bool        m_RootPath;
  bool        m_ReferenceTemplate;
  bool        m_ShowProgress;
  bool        m_DisplayStats;
  bool        m_Verbose;
  bool        m_DebugMessages;
  bool        m_Quiet;
  int         m_ThreadCount;
  int         m_MaxRequests;
  int         m_RequestTimeout;     // seconds
  int         m_Timeout;            // seconds, 0 for none
  const char *m_Algorithms;         // null picks the mode's default
  const char *m_Placeholder;
  const char *m_Format;
  const char *m_OutputFile;         // null writes to stdout
  const char *m_ReferenceFile;
  const char *m_RepositoryUri;      // empty selects the default endpoint
};

void DriverOptionsInit(DriverOptions* self);

namespace DriverMode
{
  enum Enum
  {
    kHash,
    kVerify,
    kRepository,
    kReferenceTemplate
  };

  extern const char* const Names[];
}

struct Driver
{
  MemAllocHeap       m_Heap;
  DriverOptions      m_Options;
  DriverMode::Enum   m_Mode;
  ExportFormat::Enum m_Format;
  uint32_t           m_HashAlgorithms;
  uint32_t           m_LookupAlgorithms;

  RunContext         m_Run;
  SignatureSet       m_Signatures;
  ReferenceSet       m_References;
  OutputTable        m_Output;

  const char*        m_ProgressRoot;
  int                m_ProgressShown;
};

// Validates the options. Logs and returns false on a configuration error,
// in which case there is nothing to destroy.
bool DriverInit(Driver* self, const DriverOptions* options);

void DriverDestroy(Driver* self);

RunResult::Enum DriverRun(Driver* self, const char** paths, int path_count);

// Writes the output table, or the reference template, to the chosen sink.
bool DriverExport(Driver* self);

void DriverShowStats(Driver* self);

}

#endif
