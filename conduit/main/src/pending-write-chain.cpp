#include "conduit/pending-write-chain.hpp"

#include <functional>
#include <mutex>
#include <utility>

#include "conduit/completion.hpp"

namespace conduit {

Completion PendingWriteChain::orderedWrite(std::function<void()> action) {
  Completion previous;
  Completion next;
  {
    std::lock_guard lock(_mutex);
    previous = std::exchange(_tail, next);
  }
  previous.then(std::move(action)).forwardTo(next);
  return next;
}

Completion PendingWriteChain::tail() const {
  std::lock_guard lock(_mutex);
  return _tail;
}

}  // namespace conduit
