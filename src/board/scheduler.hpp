#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "board/refresh.hpp"

namespace board {

// How the UI asks for refresh cycles without doing I/O itself.
class RefreshTrigger {
public:
    virtual ~RefreshTrigger() = default;

    virtual void request_full() = 0;
    virtual void request_symbol(const std::string& symbol) = 0;
};

// Runs a cycle at startup and then at every top of the hour, plus any cycle
// requested through RefreshTrigger. Timer and requested cycles may overlap;
// commits are idempotent merges.
class Scheduler : public RefreshTrigger {
public:
    using Notify = std::function<void()>;

    Scheduler(RefreshCoordinator& coordinator, Notify on_commit);
    ~Scheduler() override;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void start();

    // Sets the stop flag and wakes both threads without waiting for them.
    void request_stop();
    // Joins both threads if they leave their loops within grace. Returns false
    // while a cycle is still blocked in fetches; the threads stay running.
    bool wait_idle(std::chrono::milliseconds grace);
    // request_stop() and join. Fetches already in flight are not cancelled;
    // they finish or hit the HTTP timeout first.
    void stop();

    void request_full() override;
    void request_symbol(const std::string& symbol) override;

private:
    struct Request {
        std::optional<std::string> symbol; // nullopt = full cycle
    };

    void timer_loop_();
    void worker_loop_();
    void run_guarded_(const Request& request);

    RefreshCoordinator& coordinator_;
    Notify on_commit_;

    std::mutex mu_;
    std::condition_variable timer_cv_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    int running_ = 0; // loops not yet left
    std::deque<Request> queue_;
    bool stopping_ = false;

    std::thread timer_;
    std::thread worker_;
};

} // namespace board
