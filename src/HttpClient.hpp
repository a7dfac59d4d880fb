#ifndef HTTPCLIENT_HPP
#define HTTPCLIENT_HPP

#include "Common.hpp"
#include "Buffer.hpp"

namespace hs
{

struct MemAllocHeap;

struct HttpResponse
{
  long         m_Status;
  Buffer<char> m_Body;      // nul-terminated after a successful request
};

void HttpResponseInit(HttpResponse* response);
void HttpResponseDestroy(HttpResponse* response, MemAllocHeap* heap);

// Polled while a transfer is in flight; returning false aborts it.
typedef bool (*HttpKeepGoingFn)(void* user_data);

struct HttpRequestOptions
{
  double          m_TimeoutSeconds;
  uint64_t        m_MaxBodyBytes;     // 0 means unbounded
  HttpKeepGoingFn m_KeepGoing;
  void*           m_KeepGoingData;
};

// Appends a chunk of response body. Returns false, leaving the body as it
// was, when the chunk would take it past `max_body_bytes`.
bool HttpAppendBody(HttpResponse* response, MemAllocHeap* heap, const char* data, size_t size,
                    uint64_t max_body_bytes);

// GET seam. Returns false on transport failure with `error` filled; any
// HTTP status, including errors, is a successful transfer.
struct HttpTransport
{
  bool (*m_Get)(void* user_data, const char* url, const HttpRequestOptions& options,
                MemAllocHeap* heap, HttpResponse* response, char* error, size_t error_size);
  void* m_UserData;
};

// Process-wide setup for the default transport. Call once from the main
// thread before any worker starts.
bool HttpGlobalInit(char* error, size_t error_size);
void HttpGlobalShutdown();

bool HttpGet(const char* url, const HttpRequestOptions& options, MemAllocHeap* heap,
             HttpResponse* response, char* error, size_t error_size);

// libcurl-backed transport.
HttpTransport HttpDefaultTransport();

}

#endif
