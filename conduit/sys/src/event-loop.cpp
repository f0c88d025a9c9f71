#include "conduit/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "conduit/errno-throw.hpp"
#include "conduit/event.hpp"
#include "conduit/log.hpp"
#include "conduit/timedef.hpp"

namespace conduit {

namespace {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");

int ToMs(SysDuration duration) {
  return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

// Marks the calling thread as the loop thread for the duration of a runOnce() call.
class LoopThreadGuard {
 public:
  explicit LoopThreadGuard(std::atomic<std::thread::id>& loopThread) : _loopThread(loopThread) {
    _loopThread.store(std::this_thread::get_id());
  }

  LoopThreadGuard(const LoopThreadGuard&) = delete;
  LoopThreadGuard& operator=(const LoopThreadGuard&) = delete;

  ~LoopThreadGuard() { _loopThread.store(std::thread::id{}); }

 private:
  std::atomic<std::thread::id>& _loopThread;
};

}  // namespace

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _pollTimeoutMs(ToMs(pollTimeout)),
      _events(std::max(1U, initialCapacity)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  if (initialCapacity == 0) {
    log::warn("EventLoop constructed with initialCapacity=0; promoting to 1");
  }
  epoll_event ev{EPOLLIN, epoll_data_t{.fd = _wakeupFd.fd()}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, _wakeupFd.fd(), &ev) != 0) {
    throw_errno("epoll_ctl ADD failed for wakeup fd # {}", _wakeupFd.fd());
  }
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

EventLoop::~EventLoop() {
  std::lock_guard lock(_mutex);
  if (!_tasks.empty()) {
    log::warn("EventLoop fd # {} destroyed with {} pending task(s)", _baseFd.fd(), _tasks.size());
  }
}

void EventLoop::addOrThrow(int fd, EventBmp eventBmp, IoHandler handler) {
  if (!add(fd, eventBmp, std::move(handler))) [[unlikely]] {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", fd, eventBmp);
  }
}

bool EventLoop::add(int fd, EventBmp eventBmp, IoHandler handler) {
  {
    std::lock_guard lock(_mutex);
    _handlers.insert_or_assign(fd, std::make_shared<IoHandler>(std::move(handler)));
  }
  epoll_event ev{eventBmp, epoll_data_t{.fd = fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", fd, eventBmp, err,
               std::strerror(err));
    std::lock_guard lock(_mutex);
    _handlers.erase(fd);
    errno = err;
    return false;
  }
  return true;
}

bool EventLoop::mod(int fd, EventBmp eventBmp) const {
  epoll_event ev{eventBmp, epoll_data_t{.fd = fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    // EBADF or ENOENT can occur when a channel was concurrently closed; downgrade severity.
    if (err == EBADF || err == ENOENT) {
      log::warn("epoll_ctl MOD benign failure (fd # {}, events=0x{:x}, errno={}, msg={})", fd, eventBmp, err,
                std::strerror(err));
    } else {
      log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", fd, eventBmp, err,
                 std::strerror(err));
    }
    return false;
  }
  return true;
}

void EventLoop::del(int fd) {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
  std::lock_guard lock(_mutex);
  _handlers.erase(fd);
}

void EventLoop::post(Task task) {
  bool wasEmpty;
  {
    std::lock_guard lock(_mutex);
    wasEmpty = _tasks.empty();
    _tasks.push_back(std::move(task));
  }
  if (wasEmpty) {
    _wakeupFd.send();
  }
}

void EventLoop::execute(Task task) {
  if (inEventLoop()) {
    task();
  } else {
    post(std::move(task));
  }
}

std::size_t EventLoop::runOnce() {
  LoopThreadGuard guard(_loopThread);

  const int timeoutMs = nbPendingTasks() == 0 ? _pollTimeoutMs : 0;
  const int capacityBeforePoll = static_cast<int>(_events.size());
  const int nbReadyFds = ::epoll_wait(_baseFd.fd(), _events.data(), capacityBeforePoll, timeoutMs);

  std::size_t nbProcessed = 0;
  if (nbReadyFds == -1) {
    if (errno != EINTR) {
      const auto err = errno;
      log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", timeoutMs, err, std::strerror(err));
    }
  } else {
    for (int idx = 0; idx < nbReadyFds; ++idx) {
      const int fd = _events[static_cast<std::size_t>(idx)].data.fd;
      const auto eventBmp = static_cast<EventBmp>(_events[static_cast<std::size_t>(idx)].events);
      if (fd == _wakeupFd.fd()) {
        _wakeupFd.read();
        continue;
      }
      std::shared_ptr<IoHandler> handler;
      {
        std::lock_guard lock(_mutex);
        auto it = _handlers.find(fd);
        if (it != _handlers.end()) {
          handler = it->second;
        }
      }
      // A handler of the same batch may have deleted this fd.
      if (handler) {
        try {
          (*handler)(eventBmp);
        } catch (const std::exception& ex) {
          log::error("EventLoop fd # {} handler of fd # {} threw: {}", _baseFd.fd(), fd, ex.what());
        }
        ++nbProcessed;
      }
    }
    if (nbReadyFds == capacityBeforePoll) {
      _events.resize(_events.size() * 2U);
    }
  }

  return nbProcessed + runTasks();
}

std::size_t EventLoop::runTasks() {
  std::vector<Task> tasks;
  {
    std::lock_guard lock(_mutex);
    tasks.swap(_tasks);
  }
  // Tasks posted while running these are picked up by the next round.
  for (Task& task : tasks) {
    try {
      task();
    } catch (const std::exception& ex) {
      // The rest of the batch still runs.
      log::error("EventLoop fd # {} task threw: {}", _baseFd.fd(), ex.what());
    }
  }
  return tasks.size();
}

void EventLoop::run() {
  log::debug("EventLoop fd # {} running", _baseFd.fd());
  while (!_stopRequested.load()) {
    runOnce();
  }
  _stopRequested.store(false);
  log::debug("EventLoop fd # {} stopped", _baseFd.fd());
}

void EventLoop::stop() noexcept {
  _stopRequested.store(true);
  _wakeupFd.send();
}

std::size_t EventLoop::nbPendingTasks() const {
  std::lock_guard lock(_mutex);
  return _tasks.size();
}

std::size_t EventLoop::nbRegisteredFds() const {
  std::lock_guard lock(_mutex);
  return _handlers.size();
}

void EventLoop::updatePollTimeout(SysDuration pollTimeout) { _pollTimeoutMs = ToMs(pollTimeout); }

}  // namespace conduit
