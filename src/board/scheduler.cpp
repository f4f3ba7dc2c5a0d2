#include "board/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace board {

Scheduler::Scheduler(RefreshCoordinator& coordinator, Notify on_commit)
    : coordinator_(coordinator), on_commit_(std::move(on_commit))
{
}

Scheduler::~Scheduler()
{
    stop();
}

void Scheduler::start()
{
    if (timer_.joinable() || worker_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = false;
        running_ = 2;
    }
    timer_ = std::thread([this] { timer_loop_(); });
    worker_ = std::thread([this] { worker_loop_(); });
}

void Scheduler::request_stop()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
        queue_.clear();
    }
    timer_cv_.notify_all();
    work_cv_.notify_all();
}

bool Scheduler::wait_idle(std::chrono::milliseconds grace)
{
    {
        std::unique_lock<std::mutex> lock(mu_);
        if (!idle_cv_.wait_for(lock, grace, [this] { return running_ == 0; })) {
            return false;
        }
    }
    if (timer_.joinable()) timer_.join();
    if (worker_.joinable()) worker_.join();
    return true;
}

void Scheduler::stop()
{
    request_stop();
    if (timer_.joinable()) timer_.join();
    if (worker_.joinable()) worker_.join();
}

void Scheduler::request_full()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_) return;
        queue_.push_back(Request{});
    }
    work_cv_.notify_one();
}

void Scheduler::request_symbol(const std::string& symbol)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_) return;
        queue_.push_back(Request{symbol});
    }
    work_cv_.notify_one();
}

void Scheduler::run_guarded_(const Request& request)
{
    try {
        if (request.symbol) {
            coordinator_.run_incremental(*request.symbol);
        }
        else {
            coordinator_.run_cycle();
        }
    }
    catch (const std::exception& e) {
        spdlog::error("refresh cycle aborted: {}", e.what());
    }

    if (on_commit_) on_commit_();
}

void Scheduler::timer_loop_()
{
    run_guarded_(Request{});

    std::unique_lock<std::mutex> lock(mu_);
    while (!stopping_) {
        // recomputed after every fire so the schedule does not drift
        const auto next = market::next_top_of_hour(market::Clock::now());
        spdlog::debug("next scheduled refresh at {}",
                      market::format_refresh_time(next));

        if (timer_cv_.wait_until(lock, next, [this] { return stopping_; })) {
            break;
        }

        lock.unlock();
        run_guarded_(Request{});
        lock.lock();
    }

    --running_;
    lock.unlock();
    idle_cv_.notify_all();
}

void Scheduler::worker_loop_()
{
    std::unique_lock<std::mutex> lock(mu_);
    while (true) {
        work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (stopping_) break;

        Request request = std::move(queue_.front());
        queue_.pop_front();

        lock.unlock();
        run_guarded_(request);
        lock.lock();
    }

    --running_;
    lock.unlock();
    idle_cv_.notify_all();
}

} // namespace board
