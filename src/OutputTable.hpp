#ifndef OUTPUTTABLE_HPP
#define OUTPUTTABLE_HPP

#include "Common.hpp"
#include "Hash.hpp"
#include "Buffer.hpp"
#include "MemAllocLinear.hpp"

namespace hs
{

struct SignatureRecord;
struct SignatureSet;

namespace MatchState
{
  enum Enum
  {
    kMissing,
    kMatched,
    kMismatched
  };

  extern const char* const Names[];
}

// Free-form attribute attached to a row, such as a repository field. A null
// value is exported as null/empty.
struct OutputAttribute
{
  const char* m_Key;
  const char* m_Value;
};

// A signature plus whatever a verification or lookup added to it.
struct OutputRow
{
  enum
  {
    kFlagHasMatchResults    = 1 << 0,
    kFlagHasLookupAlgorithm = 1 << 1
  };

  const SignatureRecord*  m_Signature;
  uint32_t                m_Flags;
  uint8_t                 m_Match[HashAlgorithm::kCount];   // MatchState::Enum
  uint8_t                 m_LookupAlgorithm;                // HashAlgorithm::Enum
  const OutputAttribute*  m_Extensions;
  uint32_t                m_ExtensionCount;
};

struct OutputTable
{
  MemAllocHeap*      m_Heap;
  MemAllocLinear     m_Allocator;
  Buffer<OutputRow>  m_Rows;
  const char*        m_MissingPlaceholder;
};

void OutputTableInit(OutputTable* table, MemAllocHeap* heap, const char* missing_placeholder);
void OutputTableDestroy(OutputTable* table);

// The returned row is valid until the next row is added.
OutputRow* OutputTableAddRow(OutputTable* table, const SignatureRecord* signature);

// One plain row per record.
void OutputTableAddSignatures(OutputTable* table, const SignatureSet* signatures);

// Copies `attributes` into the table's arena and attaches them to `row`.
void OutputTableSetExtensions(OutputTable* table, OutputRow* row, const OutputAttribute* attributes, size_t count);

namespace OutputColumn
{
  enum Enum
  {
    kFilename,
    kFullPath,
    kPathRelativeToRoot,
    kRootPath,
    kSizeBytes,
    kCreatedUtc,
    kModifiedUtc,
    kMd5,
    kSha1,
    kSha256,
    kSha512,
    kInternalName,
    kOriginalFilename,
    kFileVersion,
    kFileDescription,
    kProduct,
    kProductVersion,
    kSignerSubject,
    kSignerIssuer,
    kSignerSerialNumber,
    kSignerThumbprint,
    kSignerNotBefore,
    kSignerNotAfter,
    kTimestamperSubject,
    kTimestamperIssuer,
    kTimestamperSerialNumber,
    kTimestamperThumbprint,
    kTimestamperNotBefore,
    kTimestamperNotAfter,
    kSignatureStatus,
    kEntryTimestamp,
    kMd5HashMatch,
    kSha1HashMatch,
    kSha256HashMatch,
    kSha512HashMatch,
    kLookupHashAlgorithm,
    kCount
  };

  extern const char* const Names[kCount];
}

namespace CellType
{
  enum Enum
  {
    kNull,
    kString,
    kInteger,
    kBoolean
  };
}

struct OutputCell
{
  CellType::Enum m_Type;
  const char*    m_String;
  uint64_t       m_Integer;
  bool           m_Boolean;
  char           m_Buffer[kTimestampStringSize];
};

// Columns present in at least one row: the fixed columns in declaration
// order, then extension keys in order of first appearance.
struct OutputSchema
{
  bool                m_Columns[OutputColumn::kCount];
  Buffer<const char*> m_ExtensionKeys;
  size_t              m_ColumnCount;
};

void OutputSchemaBuild(OutputSchema* schema, const OutputTable* table);
void OutputSchemaDestroy(OutputSchema* schema, MemAllocHeap* heap);

void OutputRowGetCell(const OutputTable* table, const OutputRow& row, OutputColumn::Enum column, OutputCell* cell);

// First attribute named `key`, or null if the row has none.
const OutputAttribute* OutputRowFindExtension(const OutputRow& row, const char* key);

}

#endif
