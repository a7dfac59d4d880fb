#ifndef SIGNALHANDLER_HPP
#define SIGNALHANDLER_HPP

#include "Config.hpp"

namespace hs
{
  // Name of the first stop request (such as "SIGINT"), or null while the
  // process may keep running.
  const char* SignalGetReason();

  // Record a stop request. Only the first reason is kept.
  void SignalSet(const char* reason);

  // Route SIGINT, SIGTERM and SIGQUIT to a dedicated thread that turns them
  // into a stop request. Call once from the main thread before any other
  // thread starts, so they all inherit the blocked mask.
  void SignalHandlerInit();

  // Mask (or unmask) the stop signals for the calling thread.
  void SignalBlockThread(bool block);
}

#endif
