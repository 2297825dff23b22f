#pragma once

#include <functional>

// Readiness notification for file descriptors owned by someone else.
class FdWatcher {
public:
    using Handler = std::function<void()>;

    virtual ~FdWatcher() = default;
    virtual bool watch(int fd, Handler on_readable) = 0;
    virtual void unwatch(int fd) = 0;
};
