#include "OutputTable.hpp"
#include "Signature.hpp"
#include "HashTable.hpp"
#include "MemAllocHeap.hpp"

#include <string.h>

namespace hs
{

const char* const MatchState::Names[] =
{
  "missing",
  "matched",
  "mismatched"
};

const char* const OutputColumn::Names[OutputColumn::kCount] =
{
  "Filename",
  "FullPath",
  "PathRelativeToRoot",
  "RootPath",
  "SizeBytes",
  "CreatedUtc",
  "ModifiedUtc",
  "MD5",
  "SHA1",
  "SHA256",
  "SHA512",
  "InternalName",
  "OriginalFilename",
  "FileVersion",
  "FileDescription",
  "Product",
  "ProductVersion",
  "SignerSubject",
  "SignerIssuer",
  "SignerSerialNumber",
  "SignerThumbprint",
  "SignerNotBefore",
  "SignerNotAfter",
  "TimestamperSubject",
  "TimestamperIssuer",
  "TimestamperSerialNumber",
  "TimestamperThumbprint",
  "TimestamperNotBefore",
  "TimestamperNotAfter",
  "SignatureStatus",
  "EntryTimestamp",
  "MD5HashMatch",
  "SHA1HashMatch",
  "SHA256HashMatch",
  "SHA512HashMatch",
  "LookupHashAlgorithm"
};

void OutputTableInit(OutputTable* table, MemAllocHeap* heap, const char* missing_placeholder)
{
  table->m_Heap               = heap;
  table->m_MissingPlaceholder = missing_placeholder;
  LinearAllocInit(&table->m_Allocator, heap, KB(256), "output rows");
  BufferInit(&table->m_Rows);
}

void OutputTableDestroy(OutputTable* table)
{
  BufferDestroy(&table->m_Rows, table->m_Heap);
  LinearAllocDestroy(&table->m_Allocator);
}

OutputRow* OutputTableAddRow(OutputTable* table, const SignatureRecord* signature)
{
  OutputRow* row = BufferAllocZero(&table->m_Rows, table->m_Heap, 1);
  row->m_Signature = signature;
  return row;
}

void OutputTableAddSignatures(OutputTable* table, const SignatureSet* signatures)
{
  for (const SignatureRecord* record : signatures->m_Records)
    OutputTableAddRow(table, record);
}

void OutputTableSetExtensions(OutputTable* table, OutputRow* row, const OutputAttribute* attributes, size_t count)
{
  MemAllocLinear*  alloc  = &table->m_Allocator;
  OutputAttribute* copies = LinearAllocateArray<OutputAttribute>(alloc, count);

  for (size_t i = 0; i < count; ++i)
  {
    copies[i].m_Key   = StrDup(alloc, attributes[i].m_Key);
    copies[i].m_Value = attributes[i].m_Value ? StrDup(alloc, attributes[i].m_Value) : nullptr;
  }

  row->m_Extensions     = copies;
  row->m_ExtensionCount = uint32_t(count);
}

static void MarkRange(OutputSchema* schema, OutputColumn::Enum first, OutputColumn::Enum last)
{
  for (int c = first; c <= last; ++c)
    schema->m_Columns[c] = true;
}

void OutputSchemaBuild(OutputSchema* schema, const OutputTable* table)
{
  MemAllocHeap* heap = table->m_Heap;

  memset(schema->m_Columns, 0, sizeof schema->m_Columns);
  BufferInit(&schema->m_ExtensionKeys);

  // Identity columns appear even for an empty table so the header is never blank.
  schema->m_Columns[OutputColumn::kFilename]           = true;
  schema->m_Columns[OutputColumn::kPathRelativeToRoot] = true;
  schema->m_Columns[OutputColumn::kRootPath]           = true;
  schema->m_Columns[OutputColumn::kSizeBytes]          = true;
  schema->m_Columns[OutputColumn::kCreatedUtc]         = true;
  schema->m_Columns[OutputColumn::kModifiedUtc]        = true;
  schema->m_Columns[OutputColumn::kEntryTimestamp]     = true;

  HashTable<uint32_t> seen_keys;
  HashTableInit(&seen_keys, heap);

  for (const OutputRow& row : table->m_Rows)
  {
    const SignatureRecord* sig = row.m_Signature;

    if (sig->m_FullPath)
      schema->m_Columns[OutputColumn::kFullPath] = true;

    for (int i = 0; i < HashAlgorithm::kCount; ++i)
    {
      if (sig->m_Digests[i])
        schema->m_Columns[OutputColumn::kMd5 + i] = true;
    }

    if (sig->m_VersionInfo)
      MarkRange(schema, OutputColumn::kInternalName, OutputColumn::kProductVersion);

    if (sig->m_CertificateInfo)
      MarkRange(schema, OutputColumn::kSignerSubject, OutputColumn::kSignatureStatus);

    if (row.m_Flags & OutputRow::kFlagHasMatchResults)
      MarkRange(schema, OutputColumn::kMd5HashMatch, OutputColumn::kSha512HashMatch);

    if (row.m_Flags & OutputRow::kFlagHasLookupAlgorithm)
      schema->m_Columns[OutputColumn::kLookupHashAlgorithm] = true;

    for (uint32_t i = 0; i < row.m_ExtensionCount; ++i)
    {
      const char* key = row.m_Extensions[i].m_Key;
      if (!HashTableInsertIfMissing(&seen_keys, key, uint32_t(schema->m_ExtensionKeys.m_Size)))
        BufferAppendOne(&schema->m_ExtensionKeys, heap, key);
    }
  }

  HashTableDestroy(&seen_keys);

  size_t count = schema->m_ExtensionKeys.m_Size;
  for (int c = 0; c < OutputColumn::kCount; ++c)
  {
    if (schema->m_Columns[c])
      ++count;
  }
  schema->m_ColumnCount = count;
}

void OutputSchemaDestroy(OutputSchema* schema, MemAllocHeap* heap)
{
  BufferDestroy(&schema->m_ExtensionKeys, heap);
}

static void SetString(OutputCell* cell, const char* value)
{
  if (value)
  {
    cell->m_Type   = CellType::kString;
    cell->m_String = value;
  }
}

static void SetTimestamp(OutputCell* cell, uint64_t epoch_seconds)
{
  FormatUtcTimestamp(cell->m_Buffer, epoch_seconds);
  SetString(cell, cell->m_Buffer);
}

static void SetOptionalTimestamp(OutputCell* cell, uint64_t epoch_seconds)
{
  if (epoch_seconds)
    SetTimestamp(cell, epoch_seconds);
}

static void GetCertificateCell(const CertificateInfo* cert, OutputColumn::Enum column, OutputCell* cell)
{
  if (!cert)
    return;

  const CertificateIdentity* id = column < OutputColumn::kTimestamperSubject ? &cert->m_Signer : &cert->m_Timestamper;

  switch (column)
  {
    case OutputColumn::kSignerSubject:
    case OutputColumn::kTimestamperSubject:
      SetString(cell, id->m_Subject);
      break;
    case OutputColumn::kSignerIssuer:
    case OutputColumn::kTimestamperIssuer:
      SetString(cell, id->m_Issuer);
      break;
    case OutputColumn::kSignerSerialNumber:
    case OutputColumn::kTimestamperSerialNumber:
      SetString(cell, id->m_SerialNumber);
      break;
    case OutputColumn::kSignerThumbprint:
    case OutputColumn::kTimestamperThumbprint:
      SetString(cell, id->m_Thumbprint);
      break;
    case OutputColumn::kSignerNotBefore:
    case OutputColumn::kTimestamperNotBefore:
      SetOptionalTimestamp(cell, id->m_NotBefore);
      break;
    case OutputColumn::kSignerNotAfter:
    case OutputColumn::kTimestamperNotAfter:
      SetOptionalTimestamp(cell, id->m_NotAfter);
      break;
    case OutputColumn::kSignatureStatus:
      SetString(cell, cert->m_Status);
      break;
    default:
      break;
  }
}

void OutputRowGetCell(const OutputTable* table, const OutputRow& row, OutputColumn::Enum column, OutputCell* cell)
{
  const SignatureRecord* sig     = row.m_Signature;
  const VersionInfo*     version = sig->m_VersionInfo;

  cell->m_Type      = CellType::kNull;
  cell->m_String    = nullptr;
  cell->m_Integer   = 0;
  cell->m_Boolean   = false;
  cell->m_Buffer[0] = '\0';

  switch (column)
  {
    case OutputColumn::kFilename:           SetString(cell, sig->m_Filename); break;
    case OutputColumn::kFullPath:           SetString(cell, sig->m_FullPath); break;
    case OutputColumn::kPathRelativeToRoot: SetString(cell, sig->m_PathRelativeToRoot); break;
    case OutputColumn::kRootPath:           SetString(cell, sig->m_RootPath); break;

    case OutputColumn::kSizeBytes:
      cell->m_Type    = CellType::kInteger;
      cell->m_Integer = sig->m_SizeBytes;
      break;

    case OutputColumn::kCreatedUtc:         SetTimestamp(cell, sig->m_CreatedUtc); break;
    case OutputColumn::kModifiedUtc:        SetTimestamp(cell, sig->m_ModifiedUtc); break;
    case OutputColumn::kEntryTimestamp:     SetTimestamp(cell, sig->m_EntryTimestamp); break;

    case OutputColumn::kMd5:
    case OutputColumn::kSha1:
    case OutputColumn::kSha256:
    case OutputColumn::kSha512:
      SetString(cell, sig->m_Digests[column - OutputColumn::kMd5]);
      break;

    case OutputColumn::kInternalName:       if (version) SetString(cell, version->m_InternalName); break;
    case OutputColumn::kOriginalFilename:   if (version) SetString(cell, version->m_OriginalFilename); break;
    case OutputColumn::kFileVersion:        if (version) SetString(cell, version->m_FileVersion); break;
    case OutputColumn::kFileDescription:    if (version) SetString(cell, version->m_FileDescription); break;
    case OutputColumn::kProduct:            if (version) SetString(cell, version->m_Product); break;
    case OutputColumn::kProductVersion:     if (version) SetString(cell, version->m_ProductVersion); break;

    case OutputColumn::kMd5HashMatch:
    case OutputColumn::kSha1HashMatch:
    case OutputColumn::kSha256HashMatch:
    case OutputColumn::kSha512HashMatch:
      if (row.m_Flags & OutputRow::kFlagHasMatchResults)
      {
        MatchState::Enum state = MatchState::Enum(row.m_Match[column - OutputColumn::kMd5HashMatch]);
        if (MatchState::kMissing == state)
        {
          SetString(cell, table->m_MissingPlaceholder);
        }
        else
        {
          cell->m_Type    = CellType::kBoolean;
          cell->m_Boolean = MatchState::kMatched == state;
        }
      }
      break;

    case OutputColumn::kLookupHashAlgorithm:
      if (row.m_Flags & OutputRow::kFlagHasLookupAlgorithm)
        SetString(cell, HashAlgorithm::Names[row.m_LookupAlgorithm]);
      break;

    default:
      GetCertificateCell(sig->m_CertificateInfo, column, cell);
      break;
  }
}

const OutputAttribute* OutputRowFindExtension(const OutputRow& row, const char* key)
{
  for (uint32_t i = 0; i < row.m_ExtensionCount; ++i)
  {
    if (0 == strcmp(row.m_Extensions[i].m_Key, key))
      return &row.m_Extensions[i];
  }
  return nullptr;
}

}
