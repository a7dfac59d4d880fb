#include "SignalHandler.hpp"
#include "Common.hpp"
#include "Mutex.hpp"
#include "Thread.hpp"

#include <signal.h>

namespace hs
{

static Mutex       s_ReasonLock = { PTHREAD_MUTEX_INITIALIZER };
static const char* s_Reason;

static const struct
{
  int         m_Signal;
  const char* m_Name;
} s_StopSignals[] =
{
  { SIGINT,  "SIGINT"  },
  { SIGTERM, "SIGTERM" },
  { SIGQUIT, "SIGQUIT" },
};

static void GetStopSignals(sigset_t* set)
{
  sigemptyset(set);
  for (size_t i = 0; i < ARRAY_SIZE(s_StopSignals); ++i)
    sigaddset(set, s_StopSignals[i].m_Signal);
}

const char* SignalGetReason()
{
  MutexScope lock(&s_ReasonLock);
  return s_Reason;
}

void SignalSet(const char* reason)
{
  MutexScope lock(&s_ReasonLock);
  if (!s_Reason)
    s_Reason = reason;
}

static void* WaitForStopSignal(void*)
{
  sigset_t set;
  GetStopSignals(&set);

  int sig;
  int rc = sigwait(&set, &sig);
  if (0 != rc)
    CroakError(rc, "sigwait() failed");

  const char* reason = "signal";
  for (size_t i = 0; i < ARRAY_SIZE(s_StopSignals); ++i)
  {
    if (s_StopSignals[i].m_Signal == sig)
      reason = s_StopSignals[i].m_Name;
  }

  Log(kInfo, "%s received, stopping", reason);
  SignalSet(reason);
  return nullptr;
}

void SignalHandlerInit()
{
  SignalBlockThread(true);
  ThreadDetach(ThreadStart(WaitForStopSignal, nullptr, "signals"));
}

void SignalBlockThread(bool block)
{
  sigset_t set;
  GetStopSignals(&set);
  HS_PTHREAD_CHECK(pthread_sigmask(block ? SIG_BLOCK : SIG_UNBLOCK, &set, nullptr));
}

}
