#pragma once

#include <exception>
#include <functional>
#include <memory>

namespace conduit {

// One-shot, thread-safe completion signal carrying either success or an exception.
//
// A Completion is a cheap handle on a shared state: copies observe and settle the same outcome.
// The first call to complete() or fail() wins; later calls are ignored and return false.
//
// Listeners registered with whenDone() are invoked exactly once, after settlement, in registration order.
// A listener registered on an already settled Completion runs inline on the calling thread, unless another
// thread is currently dispatching listeners, in which case it is queued behind them so that FIFO order holds.
// Listeners are never invoked while an internal lock is held.
// A Completion settled from within a deeply nested listener has its listeners run by the settling thread once the
// outer dispatch returns, rather than inline: resolving a long chain of Completions does not grow the stack.
class Completion {
 public:
  // Receives a null exception_ptr on success.
  using Listener = std::function<void(std::exception_ptr)>;

  // Creates a new pending Completion.
  Completion();

  // Creates an already completed Completion.
  [[nodiscard]] static Completion Completed();

  // Creates an already failed Completion.
  [[nodiscard]] static Completion Failed(std::exception_ptr error);

  // Settles this Completion successfully. Returns false if it was already settled.
  bool complete() const;

  // Settles this Completion with given error. Returns false if it was already settled.
  bool fail(std::exception_ptr error) const;

  // Registers a listener to be called once settled.
  void whenDone(Listener listener) const;

  // Runs 'fn' after this Completion settles, whatever its outcome.
  // The returned Completion succeeds when 'fn' returns, and fails with the exception thrown by 'fn' otherwise.
  [[nodiscard]] Completion then(std::function<void()> fn) const;

  // Settles 'other' with the outcome of this Completion once known.
  void forwardTo(const Completion& other) const;

  [[nodiscard]] bool isDone() const;

  [[nodiscard]] bool isFailed() const;

  // Returns the failure cause, or nullptr if pending or successful.
  [[nodiscard]] std::exception_ptr error() const;

  // Tells whether both handles share the same state.
  bool operator==(const Completion&) const noexcept = default;

 private:
  struct State;

  bool settle(std::exception_ptr error) const;

  static void Dispatch(State& state);

  std::shared_ptr<State> _state;
};

}  // namespace conduit
