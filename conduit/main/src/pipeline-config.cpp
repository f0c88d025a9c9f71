#include "conduit/pipeline-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace conduit {

PipelineConfig& PipelineConfig::withLengthOptimization(bool on) {
  this->lengthOptimization = on;
  return *this;
}

PipelineConfig& PipelineConfig::withErrorTrailers(bool on) {
  this->errorTrailers = on;
  return *this;
}

PipelineConfig& PipelineConfig::withDrainUnconsumedEntity(bool on) {
  this->drainUnconsumedEntity = on;
  return *this;
}

PipelineConfig& PipelineConfig::withMaxRequestsPerConnection(uint32_t maxRequests) {
  this->maxRequestsPerConnection = maxRequests;
  return *this;
}

PipelineConfig& PipelineConfig::withMaxOutboundBufferBytes(std::size_t maxBytes) {
  this->maxOutboundBufferBytes = maxBytes;
  return *this;
}

PipelineConfig& PipelineConfig::withFlushThresholdBytes(std::size_t nbBytes) {
  this->flushThresholdBytes = nbBytes;
  return *this;
}

PipelineConfig& PipelineConfig::withReadChunkSize(std::size_t nbBytes) {
  this->readChunkSize = nbBytes;
  return *this;
}

PipelineConfig& PipelineConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

PipelineConfig& PipelineConfig::withBufferPool(std::size_t slotSize, std::size_t maxCached) {
  this->bufferPoolSlotSize = slotSize;
  this->bufferPoolMaxCached = maxCached;
  return *this;
}

void PipelineConfig::validate() const {
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection must be > 0");
  }
  if (maxOutboundBufferBytes == 0) {
    throw std::invalid_argument("maxOutboundBufferBytes must be > 0");
  }
  if (flushThresholdBytes == 0) {
    throw std::invalid_argument("flushThresholdBytes must be > 0");
  }
  if (readChunkSize == 0) {
    throw std::invalid_argument("readChunkSize must be > 0");
  }
  if (bufferPoolSlotSize == 0) {
    throw std::invalid_argument("bufferPoolSlotSize must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
}

}  // namespace conduit
