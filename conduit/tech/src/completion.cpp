#include "conduit/completion.hpp"

#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "conduit/log.hpp"

namespace conduit {

struct Completion::State {
  std::mutex mutex;
  std::vector<Listener> listeners;
  std::exception_ptr error;
  bool done{false};
  bool dispatching{false};
};

namespace {

// Settling a Completion from one of its listeners dispatches inline up to this depth. Deeper settlements are queued
// on the settling thread and dispatched once the outermost dispatch unwinds, so that a long chain of pending
// Completions resolves with bounded stack usage.
constexpr int kMaxInlineDispatchDepth = 32;

thread_local int tDispatchDepth = 0;
thread_local bool tDrainingDeferred = false;
thread_local std::deque<std::function<void()>> tDeferredDispatches;

void Invoke(Completion::Listener& listener, const std::exception_ptr& error) {
  try {
    listener(error);
  } catch (const std::exception& ex) {
    log::error("Completion listener threw: {}", ex.what());
  }
}

}  // namespace

Completion::Completion() : _state(std::make_shared<State>()) {}

Completion Completion::Completed() {
  Completion ret;
  ret._state->done = true;
  return ret;
}

Completion Completion::Failed(std::exception_ptr error) {
  Completion ret;
  ret._state->done = true;
  ret._state->error = std::move(error);
  return ret;
}

bool Completion::complete() const { return settle(nullptr); }

bool Completion::fail(std::exception_ptr error) const { return settle(std::move(error)); }

bool Completion::settle(std::exception_ptr error) const {
  State& state = *_state;
  std::unique_lock lock(state.mutex);
  if (state.done) {
    return false;
  }
  state.done = true;
  state.error = std::move(error);
  state.dispatching = true;
  lock.unlock();

  if (tDispatchDepth >= kMaxInlineDispatchDepth) {
    // Listeners registered meanwhile are queued since 'dispatching' is set.
    tDeferredDispatches.emplace_back([deferredState = _state] { Dispatch(*deferredState); });
    return true;
  }
  Dispatch(state);
  if (tDispatchDepth == 0 && !tDrainingDeferred) {
    struct DrainGuard {
      DrainGuard() noexcept { tDrainingDeferred = true; }
      DrainGuard(const DrainGuard&) = delete;
      DrainGuard& operator=(const DrainGuard&) = delete;
      ~DrainGuard() { tDrainingDeferred = false; }
    } drainGuard;
    while (!tDeferredDispatches.empty()) {
      std::function<void()> deferred = std::move(tDeferredDispatches.front());
      tDeferredDispatches.pop_front();
      deferred();
    }
  }
  return true;
}

void Completion::Dispatch(State& state) {
  struct DepthGuard {
    DepthGuard() noexcept { ++tDispatchDepth; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;
    ~DepthGuard() { --tDispatchDepth; }
  } depthGuard;

  // Listeners registered while we dispatch are appended to the (now empty) vector by whenDone,
  // and picked up by the next round, preserving registration order.
  std::unique_lock lock(state.mutex);
  while (!state.listeners.empty()) {
    std::vector<Listener> batch = std::exchange(state.listeners, {});
    lock.unlock();
    for (Listener& listener : batch) {
      Invoke(listener, state.error);
    }
    lock.lock();
  }
  state.dispatching = false;
}

void Completion::whenDone(Listener listener) const {
  State& state = *_state;
  std::unique_lock lock(state.mutex);
  if (!state.done || state.dispatching) {
    state.listeners.push_back(std::move(listener));
    return;
  }
  std::exception_ptr error = state.error;
  lock.unlock();
  Invoke(listener, error);
}

Completion Completion::then(std::function<void()> fn) const {
  Completion next;
  whenDone([fn = std::move(fn), next](std::exception_ptr) {
    try {
      fn();
      next.complete();
    } catch (const std::exception&) {
      next.fail(std::current_exception());
    }
  });
  return next;
}

void Completion::forwardTo(const Completion& other) const {
  whenDone([other](std::exception_ptr error) {
    if (error) {
      other.fail(std::move(error));
    } else {
      other.complete();
    }
  });
}

bool Completion::isDone() const {
  std::lock_guard lock(_state->mutex);
  return _state->done;
}

bool Completion::isFailed() const {
  std::lock_guard lock(_state->mutex);
  return _state->done && _state->error != nullptr;
}

std::exception_ptr Completion::error() const {
  std::lock_guard lock(_state->mutex);
  return _state->error;
}

}  // namespace conduit
