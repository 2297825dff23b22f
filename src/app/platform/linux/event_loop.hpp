#pragma once

#include "platform/fd_watcher.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <signal.h>
#include <vector>

// Single-threaded epoll reactor. Signals listed in init() are blocked and
// delivered through a signalfd, so every callback runs on the loop thread.
class EventLoop : public FdWatcher {
public:
    using Handler = std::function<void()>;

    EventLoop();
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    bool init(const std::vector<int>& signals);

    bool watch(int fd, Handler on_readable) override;
    void unwatch(int fd) override;

    // SIGINT/SIGTERM without a handler stop the loop.
    void on_signal(int signo, Handler handler);

    // Runs after each batch of dispatched events (e.g. to redraw once).
    void set_post_dispatch(Handler handler) { post_dispatch_ = std::move(handler); }

    void run();

    // Wait up to timeout_ms (-1 = forever) and dispatch one batch.
    // Returns false on an unrecoverable epoll error.
    bool run_once(int timeout_ms);

    void request_stop();
    bool running() const { return running_.load(std::memory_order_acquire); }

private:
    void dispatch_signals();

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    sigset_t old_mask_;
    bool mask_saved_ = false;

    std::map<int, Handler> fd_handlers_;
    std::map<int, Handler> signal_handlers_;
    Handler post_dispatch_;

    std::atomic<bool> running_{false};
};
