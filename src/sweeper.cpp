#include "sweeper.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace parley {

namespace {
constexpr std::chrono::milliseconds kWaitStep{100};
} // namespace

Sweeper::Sweeper(std::chrono::milliseconds interval, Task task)
    : interval_(std::max(interval, std::chrono::milliseconds(1))), task_(std::move(task))
{}

Sweeper::~Sweeper() { stop(); }

void Sweeper::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this]() { run_loop(); });
}

void Sweeper::stop() {
    running_.store(false);
    if (thread_.joinable()) thread_.join();
}

void Sweeper::run_loop() {
    auto elapsed = std::chrono::milliseconds::zero();
    while (running_.load()) {
        // Sleep in short steps so stop() returns promptly
        auto step = std::min(kWaitStep, interval_ - elapsed);
        std::this_thread::sleep_for(step);
        elapsed += step;
        if (elapsed < interval_) continue;
        elapsed = std::chrono::milliseconds::zero();
        if (!running_.load()) break;

        try {
            task_();
        } catch (const std::exception& e) {
            std::cerr << "[sweeper] Task failed: " << e.what() << "\n";
        }
        runs_.fetch_add(1);
    }
}

} // namespace parley
