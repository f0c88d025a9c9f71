#pragma once

#include <functional>
#include <mutex>
#include <utility>

#include "conduit/completion.hpp"

namespace conduit {

// Submission-order sequencer shared by the successive responses of a connection.
//
// orderedWrite(action) runs 'action' once every previously registered action has run (successfully or not),
// immediately when nothing is pending. Actions only submit work (typically channel writes): the chain orders
// submissions, not I/O completions, so it never waits for bytes to reach the wire.
class PendingWriteChain {
 public:
  PendingWriteChain() : PendingWriteChain(Completion::Completed()) {}

  // Chains the first action behind 'previous', typically the previous response's last submission.
  explicit PendingWriteChain(Completion previous) : _tail(std::move(previous)) {}

  PendingWriteChain(const PendingWriteChain&) = delete;
  PendingWriteChain& operator=(const PendingWriteChain&) = delete;

  // Returns a Completion settled once 'action' ran, failed with its exception if it threw.
  Completion orderedWrite(std::function<void()> action);

  // Completion of the last registered action.
  [[nodiscard]] Completion tail() const;

 private:
  mutable std::mutex _mutex;
  Completion _tail;
};

}  // namespace conduit
