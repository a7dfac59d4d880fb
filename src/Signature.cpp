#include "Signature.hpp"
#include "FileInfo.hpp"
#include "PathUtil.hpp"
#include "RunContext.hpp"
#include "Atomic.hpp"

namespace hs
{

void SignatureSetInit(SignatureSet* set, MemAllocHeap* heap)
{
  set->m_Heap = heap;
  LinearAllocInit(&set->m_Allocator, heap, MB(1), "signatures");
  MutexInit(&set->m_Lock);
  BufferInit(&set->m_Records);
}

void SignatureSetDestroy(SignatureSet* set)
{
  BufferDestroy(&set->m_Records, set->m_Heap);
  MutexDestroy(&set->m_Lock);
  LinearAllocDestroy(&set->m_Allocator);
}

void SignatureSetAppend(SignatureSet* set, const SignatureRecord* record)
{
  MutexScope lock(&set->m_Lock);
  BufferAppendOne(&set->m_Records, set->m_Heap, record);
}

static const char* CopyOptional(MemAllocLinear* alloc, const char* str)
{
  return str ? StrDup(alloc, str) : nullptr;
}

static void CopyIdentity(MemAllocLinear* alloc, CertificateIdentity* dest, const CertificateIdentity& src)
{
  dest->m_Subject      = CopyOptional(alloc, src.m_Subject);
  dest->m_Issuer       = CopyOptional(alloc, src.m_Issuer);
  dest->m_SerialNumber = CopyOptional(alloc, src.m_SerialNumber);
  dest->m_Thumbprint   = CopyOptional(alloc, src.m_Thumbprint);
  dest->m_NotBefore    = src.m_NotBefore;
  dest->m_NotAfter     = src.m_NotAfter;
}

const SignatureRecord* SignatureBuild(SignatureSet* set, RunContext* run, const SignatureInput& input)
{
  const FileEntry* file = input.m_File;
  SignatureRecord* record;

  {
    MutexScope lock(&set->m_Lock);
    MemAllocLinear* alloc = &set->m_Allocator;

    record = LinearAllocate<SignatureRecord>(alloc);

    record->m_Filename           = PathBaseNameLower(alloc, file->m_FullPath);
    record->m_FullPath           = input.m_IncludeRootPath ? StrDup(alloc, file->m_FullPath) : nullptr;
    record->m_PathRelativeToRoot = StrDup(alloc, PathRelativeToRoot(file->m_FullPath, input.m_NormalizedRoot));
    record->m_RootPath           = StrDup(alloc, input.m_NormalizedRoot);
    record->m_SizeBytes          = file->m_SizeBytes;
    record->m_CreatedUtc         = file->m_CreatedUtc;
    record->m_ModifiedUtc        = file->m_ModifiedUtc;
    record->m_EntryTimestamp     = input.m_EntryTimestamp;

    for (int i = 0; i < HashAlgorithm::kCount; ++i)
      record->m_Digests[i] = CopyOptional(alloc, DigestResultGet(input.m_Digests, HashAlgorithm::Enum(i)));

    record->m_VersionInfo = nullptr;
    if (const VersionInfo* src = input.m_VersionInfo)
    {
      VersionInfo* info = LinearAllocate<VersionInfo>(alloc);
      info->m_InternalName     = CopyOptional(alloc, src->m_InternalName);
      info->m_OriginalFilename = CopyOptional(alloc, src->m_OriginalFilename);
      info->m_FileVersion      = CopyOptional(alloc, src->m_FileVersion);
      info->m_FileDescription  = CopyOptional(alloc, src->m_FileDescription);
      info->m_Product          = CopyOptional(alloc, src->m_Product);
      info->m_ProductVersion   = CopyOptional(alloc, src->m_ProductVersion);
      record->m_VersionInfo    = info;
    }

    record->m_CertificateInfo = nullptr;
    if (const CertificateInfo* src = input.m_CertificateInfo)
    {
      CertificateInfo* info = LinearAllocate<CertificateInfo>(alloc);
      CopyIdentity(alloc, &info->m_Signer, src->m_Signer);
      CopyIdentity(alloc, &info->m_Timestamper, src->m_Timestamper);
      info->m_Status = CopyOptional(alloc, src->m_Status);
      record->m_CertificateInfo = info;
    }
  }

  AtomicIncrement(&run->m_Stats.m_FilesProcessed);
  return record;
}

}
