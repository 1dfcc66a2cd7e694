#include "ifx/SignalRouter.hpp"

#include <sys/epoll.h>

#include <stdexcept>

#include "ifx/compositelogger.hpp"

namespace ifx {

SignalRouter::SignalRouter() {
  sigemptyset(&blocked_mask_);
  if (sigprocmask(SIG_SETMASK, nullptr, &original_mask_) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "sigprocmask(GET) failed");
  }
  if ((signal_fd_ = signalfd(-1, &blocked_mask_, SFD_NONBLOCK | SFD_CLOEXEC)) ==
      -1)
    throw std::system_error(errno, std::system_category(),
                            "signalfd create failed");
}

void SignalRouter::registerHandler(int signum, Handler handler) {
  if (signum <= 0 || signum >= NSIG || signum == SIGKILL ||
      signum == SIGSTOP) {
    throw std::invalid_argument("Invalid signal number: " +
                                std::to_string(signum));
  }
  if (!handler) {
    throw std::invalid_argument("Empty handler for signal " +
                                std::to_string(signum));
  }

  std::lock_guard<std::mutex> lock(handlers_mutex_);

  sigaddset(&blocked_mask_, signum);
  if (pthread_sigmask(SIG_BLOCK, &blocked_mask_, nullptr) != 0) {
    throw std::system_error(errno, std::system_category(),
                            "pthread_sigmask failed");
  }

  if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "signalfd configure failed");
  }

  handlers_[signum].push_back(std::move(handler));
}

void SignalRouter::unregisterHandler(int signum) {
  if (signum <= 0 || signum >= NSIG) {
    throw std::invalid_argument("Invalid signal number: " +
                                std::to_string(signum));
  }
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_.erase(signum);
}

void SignalRouter::start() {
  if (running_.exchange(true)) return;

  int epoll_fd = epoll_create1(EPOLL_CLOEXEC);
  if (epoll_fd == -1) {
    running_ = false;
    throw std::system_error(errno, std::system_category(),
                            "epoll_create1 failed");
  }

  struct epoll_event ev {};
  ev.events = EPOLLIN;
  ev.data.fd = signal_fd_;
  if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, signal_fd_, &ev) == -1) {
    const int err = errno;
    close(epoll_fd);
    running_ = false;
    throw std::system_error(err, std::system_category(), "epoll_ctl failed");
  }

  worker_thread_ = std::thread([this, epoll_fd] { processSignals(epoll_fd); });
}

void SignalRouter::processSignals(int epollFd) {
  constexpr int MAX_EVENTS = 10;
  struct epoll_event events[MAX_EVENTS];

  while (running_) {
    int nfds = epoll_wait(epollFd, events, MAX_EVENTS, 100);
    if (nfds == -1) {
      if (errno == EINTR) continue;
      CompositeLogger::instance().error("SignalRouter: epoll_wait failed, errno " +
                                        std::to_string(errno));
      break;
    }

    for (int i = 0; i < nfds; ++i) {
      if (events[i].data.fd != signal_fd_) continue;
      struct signalfd_siginfo fdsi;
      while (read(signal_fd_, &fdsi, sizeof(fdsi)) ==
             static_cast<ssize_t>(sizeof(fdsi))) {
        dispatch(static_cast<int>(fdsi.ssi_signo));
      }
    }
  }

  close(epollFd);
}

void SignalRouter::dispatch(int signum) {
  std::vector<Handler> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    if (auto it = handlers_.find(signum); it != handlers_.end()) {
      handlers = it->second;
    }
  }
  for (auto& handler : handlers) {
    try {
      handler(signum);
    } catch (const std::exception& e) {
      CompositeLogger::instance().error("SignalRouter: handler for signal " +
                                        std::to_string(signum) +
                                        " failed: " + e.what());
    }
  }
}

void SignalRouter::stop() noexcept {
  running_ = false;
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
}

SignalRouter::~SignalRouter() {
  stop();
  close(signal_fd_);
  sigprocmask(SIG_SETMASK, &original_mask_, nullptr);
}

}  // namespace ifx
