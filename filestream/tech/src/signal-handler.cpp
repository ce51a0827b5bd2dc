#include "filestream/signal-handler.hpp"

#include <csignal>

#include "filestream/log.hpp"

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

extern "C" void FilestreamSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace filestream {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::FilestreamSignalHandler);
  std::signal(SIGTERM, ::FilestreamSignalHandler);
  std::signal(SIGPIPE, SIG_IGN);
  log::debug("Signal handlers installed for SIGINT and SIGTERM");
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  std::signal(SIGPIPE, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace filestream
