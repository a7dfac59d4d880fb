#include "Repository.hpp"
#include "Signature.hpp"
#include "JsonParse.hpp"
#include "JsonWriter.hpp"
#include "WorkQueue.hpp"
#include "Atomic.hpp"
#include "Buffer.hpp"
#include "Mutex.hpp"
#include "MemAllocHeap.hpp"
#include "MemAllocLinear.hpp"

#include <stdio.h>
#include <string.h>

namespace hs
{

static const char s_AttributePrefix[] = "Repository";

void RepositoryOptionsInit(RepositoryOptions* options)
{
  options->m_RootUri               = HASHSIG_DEFAULT_REPOSITORY_URI;
  options->m_Algorithms            = HashAlgorithmBit(HashAlgorithm::kMd5);
  options->m_MaxRequests           = 4;
  options->m_RequestTimeoutSeconds = 30.0;
  options->m_MaxResponseBytes      = MB(16);
  options->m_Transport             = HttpDefaultTransport();
}

static const char* FlattenValue(const JsonValue* value, MemAllocLinear* alloc)
{
  switch (value->m_Type)
  {
    case JsonValue::kNull:
      return nullptr;
    case JsonValue::kString:
      return StrDup(alloc, value->GetString());
    case JsonValue::kBoolean:
      return value->GetBoolean() ? "true" : "false";
    case JsonValue::kNumber:
      return StrDup(alloc, value->AsNumber()->m_Text);
    case JsonValue::kArray:
    case JsonValue::kObject:
      break;
  }

  JsonWriter writer;
  JsonWriteInit(&writer, alloc);
  JsonWriteValue(&writer, value);
  return JsonWriteToString(&writer, alloc);
}

bool RepositoryFlattenMatch(
    const JsonValue*   match,
    MemAllocLinear*    alloc,
    OutputAttribute**  attributes_out,
    size_t*            count_out)
{
  const JsonObjectValue* obj = match->AsObject();
  if (!obj)
    return false;

  OutputAttribute* attributes = LinearAllocateArray<OutputAttribute>(alloc, obj->m_Count);

  for (size_t i = 0; i < obj->m_Count; ++i)
  {
    const char* name     = obj->m_Names[i];
    size_t      name_len = strlen(name);
    char*       key      = static_cast<char*>(LinearAllocate(alloc, sizeof s_AttributePrefix + name_len, 1));

    memcpy(key, s_AttributePrefix, sizeof s_AttributePrefix - 1);
    memcpy(key + sizeof s_AttributePrefix - 1, name, name_len + 1);

    attributes[i].m_Key   = key;
    attributes[i].m_Value = FlattenValue(obj->m_Values[i], alloc);
  }

  *attributes_out = attributes;
  *count_out      = obj->m_Count;
  return true;
}

namespace SlotState
{
  enum Enum
  {
    kPending,       // never finished; the run was cancelled
    kNoMatch,
    kMatched
  };
}

struct RepositoryMatchRow
{
  const OutputAttribute* m_Attributes;
  size_t                 m_Count;
};

struct RepositoryTask
{
  uint32_t                  m_Record;
  uint32_t                  m_Algorithm;
  SlotState::Enum           m_State;
  const RepositoryMatchRow* m_Matches;
  size_t                    m_MatchCount;
};

struct LookupState
{
  RunContext*                   m_Run;
  const SignatureRecord* const* m_Signatures;
  const RepositoryOptions*      m_Options;
  MemAllocHeap*                 m_Heap;
  Buffer<RepositoryTask>        m_Tasks;
  Mutex                         m_Lock;         // guards m_Results
  MemAllocLinear                m_Results;
};

static bool KeepRequesting(void* user_data)
{
  return RunContextShouldContinue(static_cast<RunContext*>(user_data));
}

static void RequestFailed(LookupState* state, const RepositoryTask* task, const char* filename, const char* why)
{
  AtomicIncrement(&state->m_Run->m_Stats.m_RepositoryFailures);
  Log(kWarning, "repository lookup of %s (%s) failed: %s",
      filename, HashAlgorithm::Names[task->m_Algorithm], why);
}

// Parses a 200 response into rows allocated from `alloc`. Returns the
// number of match objects, or -1 when the body isn't a usable JSON array.
static int ParseMatches(const HttpResponse& response, MemAllocHeap* heap, MemAllocLinear* alloc,
                        RepositoryMatchRow** rows_out, char* error, size_t error_size)
{
  char json_error[1024];
  const char* body = response.m_Body.m_Storage ? response.m_Body.m_Storage : "";

  MemAllocLinear parse_scratch;
  LinearAllocInit(&parse_scratch, heap, KB(64), "repository json");
  const JsonValue* root = JsonParseText(body, response.m_Body.m_Size, alloc, &parse_scratch, json_error);
  LinearAllocDestroy(&parse_scratch);

  if (!root)
  {
    snprintf(error, error_size, "invalid JSON: %s", json_error);
    return -1;
  }

  const JsonArrayValue* array = root->AsArray();
  if (!array)
  {
    snprintf(error, error_size, "response is not a JSON array");
    return -1;
  }

  RepositoryMatchRow* rows = LinearAllocateArray<RepositoryMatchRow>(alloc, array->m_Count);
  int count = 0;

  for (size_t i = 0; i < array->m_Count; ++i)
  {
    OutputAttribute* attributes;
    size_t           attribute_count;

    if (!RepositoryFlattenMatch(array->m_Values[i], alloc, &attributes, &attribute_count))
    {
      Log(kWarning, "ignoring repository match %d: not an object", int(i));
      continue;
    }

    rows[count].m_Attributes = attributes;
    rows[count].m_Count      = attribute_count;
    ++count;
  }

  *rows_out = rows;
  return count;
}

// Copies parsed rows out of worker scratch into the shared result arena.
static const RepositoryMatchRow* PublishMatches(LookupState* state, const RepositoryMatchRow* rows, size_t count)
{
  MutexScope lock(&state->m_Lock);
  MemAllocLinear* alloc = &state->m_Results;

  RepositoryMatchRow* copies = LinearAllocateArray<RepositoryMatchRow>(alloc, count);

  for (size_t r = 0; r < count; ++r)
  {
    OutputAttribute* attributes = LinearAllocateArray<OutputAttribute>(alloc, rows[r].m_Count);
    for (size_t i = 0; i < rows[r].m_Count; ++i)
    {
      const OutputAttribute& src = rows[r].m_Attributes[i];
      attributes[i].m_Key   = StrDup(alloc, src.m_Key);
      attributes[i].m_Value = src.m_Value ? StrDup(alloc, src.m_Value) : nullptr;
    }

    copies[r].m_Attributes = attributes;
    copies[r].m_Count      = rows[r].m_Count;
  }

  return copies;
}

static void LookupOne(void* user_data, WorkerState* worker, size_t index)
{
  LookupState*             state   = static_cast<LookupState*>(user_data);
  RunContext*              run     = state->m_Run;
  const RepositoryOptions* options = state->m_Options;
  RepositoryTask*          task    = &state->m_Tasks[index];
  const SignatureRecord*   sig     = state->m_Signatures[task->m_Record];
  const char*              digest  = sig->m_Digests[task->m_Algorithm];
  MemAllocLinear*          scratch = &worker->m_ScratchAlloc;

  size_t url_size = strlen(options->m_RootUri) + strlen(digest) + 1;
  char*  url      = static_cast<char*>(LinearAllocate(scratch, url_size, 1));
  snprintf(url, url_size, "%s%s", options->m_RootUri, digest);

  HttpRequestOptions request;
  request.m_TimeoutSeconds = options->m_RequestTimeoutSeconds;
  request.m_MaxBodyBytes   = options->m_MaxResponseBytes;
  request.m_KeepGoing      = KeepRequesting;
  request.m_KeepGoingData  = run;

  HttpResponse response;
  HttpResponseInit(&response);

  char error[512];
  bool transferred;

  Log(kDebug, "GET %s", url);

  {
    TimingScope timing_scope(&run->m_Stats.m_RepositoryRequests, &run->m_Stats.m_RepositoryTimeUs);
    transferred = options->m_Transport.m_Get(options->m_Transport.m_UserData, url, request,
                                             state->m_Heap, &response, error, sizeof error);
  }

  if (!transferred)
  {
    if (RunContextShouldContinue(run))
    {
      RequestFailed(state, task, sig->m_Filename, error);
      task->m_State = SlotState::kNoMatch;
    }
    else
    {
      Log(kDebug, "dropped lookup of %s: run cancelled", sig->m_Filename);
    }
  }
  else if (200 != response.m_Status)
  {
    snprintf(error, sizeof error, "HTTP status %ld", response.m_Status);
    RequestFailed(state, task, sig->m_Filename, error);
    task->m_State = SlotState::kNoMatch;
  }
  else
  {
    RepositoryMatchRow* rows = nullptr;
    int match_count = ParseMatches(response, state->m_Heap, scratch, &rows, error, sizeof error);

    if (match_count < 0)
    {
      RequestFailed(state, task, sig->m_Filename, error);
      task->m_State = SlotState::kNoMatch;
    }
    else if (0 == match_count)
    {
      Log(kDebug, "%s: no repository match for %s", sig->m_Filename, HashAlgorithm::Names[task->m_Algorithm]);
      task->m_State = SlotState::kNoMatch;
    }
    else
    {
      task->m_Matches    = PublishMatches(state, rows, size_t(match_count));
      task->m_MatchCount = size_t(match_count);
      task->m_State      = SlotState::kMatched;
    }
  }

  HttpResponseDestroy(&response, state->m_Heap);
}

static OutputRow* AddLookupRow(OutputTable* out, const SignatureRecord* sig, uint32_t algorithm)
{
  OutputRow* row = OutputTableAddRow(out, sig);
  row->m_Flags          |= OutputRow::kFlagHasLookupAlgorithm;
  row->m_LookupAlgorithm = uint8_t(algorithm);
  return row;
}

RunResult::Enum LookupRepository(
    RunContext*                   run,
    MemAllocHeap*                 heap,
    const SignatureRecord* const* signatures,
    size_t                        signature_count,
    const RepositoryOptions&      options,
    OutputTable*                  out)
{
  CHECK(options.m_Transport.m_Get);

  LookupState state;
  state.m_Run        = run;
  state.m_Signatures = signatures;
  state.m_Options    = &options;
  state.m_Heap       = heap;
  BufferInit(&state.m_Tasks);
  MutexInit(&state.m_Lock);
  LinearAllocInit(&state.m_Results, heap, KB(256), "repository results");

  // Records with nothing to look up go straight to the no-match rows.
  Buffer<uint32_t> unqueryable;
  BufferInit(&unqueryable);

  for (size_t r = 0; r < signature_count; ++r)
  {
    bool queued = false;

    for (int a = 0; a < HashAlgorithm::kCount; ++a)
    {
      const char* digest = signatures[r]->m_Digests[a];
      if (!HashAlgorithmInSet(options.m_Algorithms, HashAlgorithm::Enum(a)) || !digest || !digest[0])
        continue;

      RepositoryTask* task = BufferAllocZero(&state.m_Tasks, heap, 1);
      task->m_Record    = uint32_t(r);
      task->m_Algorithm = uint32_t(a);
      task->m_State     = SlotState::kPending;
      queued = true;
    }

    if (!queued)
    {
      Log(kWarning, "%s has no digest for the requested algorithms; reporting it unmatched", signatures[r]->m_Filename);
      BufferAppendOne(&unqueryable, heap, uint32_t(r));
    }
  }

  Log(kInfo, "repository %s: %d lookups for %d records", options.m_RootUri,
      int(state.m_Tasks.m_Size), int(signature_count));

  if (state.m_Tasks.m_Size > 0)
  {
    WorkQueue queue;
    WorkQueueInit(&queue, heap, run, options.m_MaxRequests, "lookup");

    if (!WorkQueueRun(&queue, state.m_Tasks.m_Size, LookupOne, &state))
      Log(kInfo, "repository lookups stopped early");

    WorkQueueDestroy(&queue);
  }

  // Single-threaded from here on.
  for (const RepositoryTask& task : state.m_Tasks)
  {
    if (SlotState::kMatched != task.m_State)
      continue;

    const SignatureRecord* sig = signatures[task.m_Record];
    for (size_t m = 0; m < task.m_MatchCount; ++m)
    {
      OutputRow* row = AddLookupRow(out, sig, task.m_Algorithm);
      OutputTableSetExtensions(out, row, task.m_Matches[m].m_Attributes, task.m_Matches[m].m_Count);
    }
  }

  size_t next_unqueryable = 0;
  for (const RepositoryTask& task : state.m_Tasks)
  {
    // Keep record order across both kinds of no-match rows.
    while (next_unqueryable < unqueryable.m_Size && unqueryable[next_unqueryable] < task.m_Record)
      OutputTableAddRow(out, signatures[unqueryable[next_unqueryable++]]);

    if (SlotState::kNoMatch == task.m_State)
      AddLookupRow(out, signatures[task.m_Record], task.m_Algorithm);
  }

  while (next_unqueryable < unqueryable.m_Size)
    OutputTableAddRow(out, signatures[unqueryable[next_unqueryable++]]);

  BufferDestroy(&unqueryable, heap);
  BufferDestroy(&state.m_Tasks, heap);
  LinearAllocDestroy(&state.m_Results);
  MutexDestroy(&state.m_Lock);

  return RunContextWasCancelled(run) ? RunResult::kInterrupted : RunResult::kOk;
}

}
