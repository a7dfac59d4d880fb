#ifndef SIGNATURE_HPP
#define SIGNATURE_HPP

#include "Common.hpp"
#include "Hash.hpp"
#include "Buffer.hpp"
#include "MemAllocLinear.hpp"
#include "Mutex.hpp"

namespace hs
{

struct FileEntry;
struct RunContext;

// Version resource strings. Any field may be null.
struct VersionInfo
{
  const char* m_InternalName;
  const char* m_OriginalFilename;
  const char* m_FileVersion;
  const char* m_FileDescription;
  const char* m_Product;
  const char* m_ProductVersion;
};

struct CertificateIdentity
{
  const char* m_Subject;
  const char* m_Issuer;
  const char* m_SerialNumber;
  const char* m_Thumbprint;
  uint64_t    m_NotBefore;      // seconds since the epoch, 0 if unknown
  uint64_t    m_NotAfter;
};

struct CertificateInfo
{
  CertificateIdentity m_Signer;
  CertificateIdentity m_Timestamper;
  const char*         m_Status;
};

// Sources of version and certificate data. A provider returns false when
// the file has none; allocations go to `alloc`. Either callback may be null.
struct MetadataProviders
{
  bool (*m_GetVersionInfo)(void* user_data, const char* path, MemAllocLinear* alloc, VersionInfo* out);
  bool (*m_GetCertificateInfo)(void* user_data, const char* path, MemAllocLinear* alloc, CertificateInfo* out);
  void* m_UserData;
};

// Immutable once built. Absent data is a null pointer, never an empty string.
struct SignatureRecord
{
  const char*             m_Filename;             // lowercased base name; the match key
  const char*             m_FullPath;             // only with root path disclosure
  const char*             m_PathRelativeToRoot;
  const char*             m_RootPath;
  uint64_t                m_SizeBytes;
  uint64_t                m_CreatedUtc;
  uint64_t                m_ModifiedUtc;
  uint64_t                m_EntryTimestamp;
  const char*             m_Digests[HashAlgorithm::kCount];
  const VersionInfo*      m_VersionInfo;
  const CertificateInfo*  m_CertificateInfo;
};

// Owns every record of a run; they are released together.
struct SignatureSet
{
  MemAllocHeap*                  m_Heap;
  MemAllocLinear                 m_Allocator;
  Mutex                          m_Lock;
  Buffer<const SignatureRecord*> m_Records;
};

void SignatureSetInit(SignatureSet* set, MemAllocHeap* heap);
void SignatureSetDestroy(SignatureSet* set);

void SignatureSetAppend(SignatureSet* set, const SignatureRecord* record);

struct SignatureInput
{
  const FileEntry*        m_File;
  const char*             m_NormalizedRoot;
  const DigestResult*     m_Digests;
  const VersionInfo*      m_VersionInfo;          // null when absent
  const CertificateInfo*  m_CertificateInfo;      // null when absent
  bool                    m_IncludeRootPath;
  uint64_t                m_EntryTimestamp;
};

// Deep-copies the input into the set's arena and counts the file as
// processed. The record is not appended; callers place it. Thread safe.
const SignatureRecord* SignatureBuild(SignatureSet* set, RunContext* run, const SignatureInput& input);

}

#endif
