#pragma once

#include <sys/epoll.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "conduit/base-fd.hpp"
#include "conduit/event-fd.hpp"
#include "conduit/event.hpp"
#include "conduit/timedef.hpp"

namespace conduit {

// Single threaded I/O event loop over epoll, with a cross-thread task queue.
//
// The thread currently inside runOnce() / run() is the loop thread: I/O handlers and tasks always execute there.
// post() and execute() may be called from any thread. Registered fds are level-triggered.
//
// The event buffer starts with kInitialCapacity slots and doubles each time a poll saturates it.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  using Task = std::function<void()>;
  using IoHandler = std::function<void(EventBmp)>;

  explicit EventLoop(SysDuration pollTimeout = std::chrono::milliseconds{500},
                     uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) = delete;

  ~EventLoop();

  // Register fd with given events and handler.
  // On error, throws std::system_error.
  void addOrThrow(int fd, EventBmp eventBmp, IoHandler handler);

  // Register fd with given events and handler.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(int fd, EventBmp eventBmp, IoHandler handler);

  // Modify the interest set of a registered fd.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(int fd, EventBmp eventBmp) const;

  // Stop monitoring fd and forget its handler. Should be called before the fd is closed.
  void del(int fd);

  // Enqueue a task to be run on the loop thread, even if called from it.
  void post(Task task);

  // Run task immediately if called from the loop thread, otherwise post it.
  void execute(Task task);

  [[nodiscard]] bool inEventLoop() const noexcept { return _loopThread.load() == std::this_thread::get_id(); }

  // Waits for I/O events up to the poll timeout (returns immediately if tasks are pending),
  // dispatches them, then runs the queued tasks.
  // Returns the number of dispatched events and tasks.
  std::size_t runOnce();

  // Calls runOnce() until stop() is requested.
  void run();

  // Request run() to return. Thread safe.
  void stop() noexcept;

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_events.size()); }

  [[nodiscard]] std::size_t nbPendingTasks() const;

  [[nodiscard]] std::size_t nbRegisteredFds() const;

  void updatePollTimeout(SysDuration pollTimeout);

 private:
  std::size_t runTasks();

  BaseFd _baseFd;
  EventFd _wakeupFd;
  int _pollTimeoutMs;
  std::vector<epoll_event> _events;
  mutable std::mutex _mutex;
  std::vector<Task> _tasks;
  std::unordered_map<int, std::shared_ptr<IoHandler>> _handlers;
  std::atomic<std::thread::id> _loopThread;
  std::atomic<bool> _stopRequested{false};
};

}  // namespace conduit
