#include "platform/linux/event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

EventLoop::EventLoop() {
    sigemptyset(&old_mask_);
}

EventLoop::~EventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (mask_saved_) ::sigprocmask(SIG_SETMASK, &old_mask_, nullptr);
}

bool EventLoop::init(const std::vector<int>& signals) {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    for (int signo : signals) sigaddset(&mask, signo);
    if (::sigprocmask(SIG_BLOCK, &mask, &old_mask_) < 0) {
        std::println(stderr, "sigprocmask failed: {}", std::strerror(errno));
        return false;
    }
    mask_saved_ = true;

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    epoll_event ev{.events = EPOLLIN, .data = {.fd = signal_fd_}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, signal_fd_, &ev) < 0) {
        std::println(stderr, "epoll_ctl(signalfd) failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

bool EventLoop::watch(int fd, Handler on_readable) {
    if (epoll_fd_ < 0 || fd < 0) return false;

    epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        std::println(stderr, "epoll_ctl({}) failed: {}", fd, std::strerror(errno));
        return false;
    }
    fd_handlers_[fd] = std::move(on_readable);
    return true;
}

void EventLoop::unwatch(int fd) {
    if (fd_handlers_.erase(fd) == 0) return;
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
}

void EventLoop::on_signal(int signo, Handler handler) {
    signal_handlers_[signo] = std::move(handler);
}

void EventLoop::run() {
    while (running_.load(std::memory_order_relaxed)) {
        if (!run_once(-1)) break;
    }
}

bool EventLoop::run_once(int timeout_ms) {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) return true;
        std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
        return false;
    }

    for (int i = 0; i < n; i++) {
        int fd = events[i].data.fd;

        if (fd == signal_fd_) {
            dispatch_signals();
            continue;
        }

        // A handler earlier in this batch may have unwatched this fd.
        auto it = fd_handlers_.find(fd);
        if (it == fd_handlers_.end()) continue;

        // Copy: the handler is allowed to unwatch itself.
        auto handler = it->second;
        handler();
    }

    if (post_dispatch_) post_dispatch_();
    return true;
}

void EventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void EventLoop::dispatch_signals() {
    signalfd_siginfo info;
    while (::read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
        int signo = static_cast<int>(info.ssi_signo);

        auto it = signal_handlers_.find(signo);
        if (it != signal_handlers_.end()) {
            auto handler = it->second;
            handler();
            continue;
        }

        if (signo == SIGINT || signo == SIGTERM) {
            request_stop();
        }
    }
}
