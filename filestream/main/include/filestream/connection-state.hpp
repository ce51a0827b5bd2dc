#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "filestream/chunk-generator.hpp"
#include "filestream/connection.hpp"
#include "filestream/timedef.hpp"

namespace filestream {

// Per-connection state owned by the server event loop.
struct ConnectionState {
  [[nodiscard]] bool outputDrained() const noexcept { return outOffset == outBuffer.size(); }

  [[nodiscard]] bool isStreaming() const noexcept { return bodyStream.valid(); }

  [[nodiscard]] std::size_t pendingOutputBytes() const noexcept { return outBuffer.size() - outOffset; }

  // Stops the streamed body (if any), releasing the producer and everything it holds.
  void cancelStream() noexcept {
    bodyStream.reset();
    streamRemaining = 0;
  }

  Connection connection;
  std::string inBuffer;       // received bytes not yet consumed
  std::string outBuffer;      // bytes queued for the client
  std::size_t outOffset{0};   // number of bytes of outBuffer already sent
  ChunkGenerator bodyStream;  // producer of the body of the response being sent, if streamed
  std::uint64_t streamRemaining{0};
  std::size_t bodyBytesToDiscard{0};
  SteadyTimePoint lastActivity;
  uint32_t requestsServed{0};
  bool closeAfterFlush{false};
  bool writableInterest{false};
  bool readPaused{false};  // input is not polled until the streamed body is complete
};

}  // namespace filestream
