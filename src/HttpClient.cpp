#include "HttpClient.hpp"
#include "MemAllocHeap.hpp"

#include <curl/curl.h>
#include <stdio.h>
#include <string.h>

namespace hs
{

void HttpResponseInit(HttpResponse* response)
{
  response->m_Status = 0;
  BufferInit(&response->m_Body);
}

void HttpResponseDestroy(HttpResponse* response, MemAllocHeap* heap)
{
  BufferDestroy(&response->m_Body, heap);
}

bool HttpGlobalInit(char* error, size_t error_size)
{
  CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (CURLE_OK != rc)
  {
    snprintf(error, error_size, "curl_global_init failed: %s", curl_easy_strerror(rc));
    return false;
  }

  Log(kDebug, "http: %s", curl_version());
  return true;
}

void HttpGlobalShutdown()
{
  curl_global_cleanup();
}

struct HttpTransfer
{
  MemAllocHeap*             m_Heap;
  HttpResponse*             m_Response;
  const HttpRequestOptions* m_Options;
  bool                      m_BodyTooLarge;
};

bool HttpAppendBody(HttpResponse* response, MemAllocHeap* heap, const char* data, size_t size,
                    uint64_t max_body_bytes)
{
  uint64_t have = response->m_Body.m_Size;
  if (max_body_bytes && (size > max_body_bytes || have > max_body_bytes - size))
    return false;

  BufferAppend(&response->m_Body, heap, data, size);
  return true;
}

// Returning short of `bytes` makes libcurl fail the transfer with CURLE_WRITE_ERROR.
static size_t WriteBody(char* data, size_t size, size_t count, void* user_data)
{
  HttpTransfer* transfer = static_cast<HttpTransfer*>(user_data);
  size_t        bytes    = size * count;

  if (!HttpAppendBody(transfer->m_Response, transfer->m_Heap, data, bytes, transfer->m_Options->m_MaxBodyBytes))
  {
    transfer->m_BodyTooLarge = true;
    return 0;
  }

  return bytes;
}

static int TransferProgress(void* user_data, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
  HttpTransfer* transfer = static_cast<HttpTransfer*>(user_data);
  const HttpRequestOptions* options = transfer->m_Options;

  if (options->m_KeepGoing && !options->m_KeepGoing(options->m_KeepGoingData))
    return 1;

  return 0;
}

bool HttpGet(const char* url, const HttpRequestOptions& options, MemAllocHeap* heap,
             HttpResponse* response, char* error, size_t error_size)
{
  CURL* curl = curl_easy_init();
  if (!curl)
  {
    snprintf(error, error_size, "couldn't create HTTP handle");
    return false;
  }

  HttpTransfer transfer = { heap, response, &options, false };
  char curl_error[CURL_ERROR_SIZE];
  curl_error[0] = '\0';

  struct curl_slist* headers = curl_slist_append(nullptr, "Accept: application/json");

  curl_easy_setopt(curl, CURLOPT_URL, url);
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "hashsig/" HASHSIG_VERSION_STRING);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, curl_error);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, TransferProgress);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);

  if (options.m_TimeoutSeconds > 0.0)
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, long(options.m_TimeoutSeconds * 1000.0));

  if (options.m_MaxBodyBytes)
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, curl_off_t(options.m_MaxBodyBytes));

  CURLcode rc = curl_easy_perform(curl);

  bool ok = CURLE_OK == rc;
  if (ok)
  {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response->m_Status);
    BufferTerminate(&response->m_Body, heap);
  }
  else if (CURLE_ABORTED_BY_CALLBACK == rc)
  {
    snprintf(error, error_size, "request cancelled");
  }
  else if (transfer.m_BodyTooLarge || CURLE_FILESIZE_EXCEEDED == rc)
  {
    snprintf(error, error_size, "response body larger than %llu bytes",
             (unsigned long long) options.m_MaxBodyBytes);
  }
  else
  {
    snprintf(error, error_size, "%s", curl_error[0] ? curl_error : curl_easy_strerror(rc));
  }

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return ok;
}

static bool DefaultGet(void*, const char* url, const HttpRequestOptions& options,
                       MemAllocHeap* heap, HttpResponse* response, char* error, size_t error_size)
{
  return HttpGet(url, options, heap, response, error, error_size);
}

HttpTransport HttpDefaultTransport()
{
  HttpTransport transport = { DefaultGet, nullptr };
  return transport;
}

}
