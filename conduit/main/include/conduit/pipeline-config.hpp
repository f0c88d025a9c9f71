#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace conduit {

struct PipelineConfig {
  // ===========================
  // Response framing
  // ===========================

  // When true, a 200 response without Content-Length whose body turns out to be a single chunk (or empty)
  // is sent with a computed Content-Length instead of chunked encoding. Event streams are never optimized.
  // Default: true.
  bool lengthOptimization{true};

  // When true, a chunked response whose producer fails ends with the trailers stream-status and stream-result
  // describing the error. When false, the terminal chunk carries no trailers. Default: true.
  bool errorTrailers{true};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================

  // When true, a request body the handler did not consume (nor started to consume) is drained before the
  // connection is kept alive. When false, such connections are closed after the response. Default: true.
  bool drainUnconsumedEntity{true};

  // Maximum number of responses served over a single connection. The last one carries "Connection: close".
  uint32_t maxRequestsPerConnection{100};

  // ============================
  // Channel I/O
  // ============================

  // Maximum number of bytes queued in a channel and not yet accepted by the kernel. Writes beyond this limit
  // fail immediately. Default: 4 MiB.
  std::size_t maxOutboundBufferBytes{4UL * 1024UL * 1024UL};

  // Number of queued bytes from which a channel flushes on its own, without waiting for an explicit flush.
  // Below it, a response producer is granted more credit as soon as its chunk is queued; above it, credit is only
  // renewed once the chunk reached the kernel. Default: 64 KiB.
  std::size_t flushThresholdBytes{64UL * 1024UL};

  // Number of bytes read from the socket per inbound read cycle. Default: 16 KiB.
  std::size_t readChunkSize{16UL * 1024UL};

  // Maximum duration of a single event loop poll. Default: 500 ms.
  std::chrono::milliseconds pollInterval{500};

  // ============================
  // Body buffers
  // ============================

  // Capacity of a pooled body buffer. Default: 16 KiB.
  std::size_t bufferPoolSlotSize{16UL * 1024UL};

  // Maximum number of released body buffers kept for reuse. Default: 64.
  std::size_t bufferPoolMaxCached{64};

  PipelineConfig& withLengthOptimization(bool on = true);

  PipelineConfig& withErrorTrailers(bool on = true);

  PipelineConfig& withDrainUnconsumedEntity(bool on = true);

  PipelineConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  PipelineConfig& withMaxOutboundBufferBytes(std::size_t maxBytes);

  PipelineConfig& withFlushThresholdBytes(std::size_t nbBytes);

  PipelineConfig& withReadChunkSize(std::size_t nbBytes);

  PipelineConfig& withPollInterval(std::chrono::milliseconds interval);

  PipelineConfig& withBufferPool(std::size_t slotSize, std::size_t maxCached);

  // Throws std::invalid_argument on inconsistent values.
  void validate() const;

  bool operator==(const PipelineConfig&) const noexcept = default;
};

}  // namespace conduit
