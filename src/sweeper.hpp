#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace parley {

// Runs a task on a background thread at a fixed interval until stopped.
// The first run happens one interval after start().
class Sweeper {
public:
    using Task = std::function<void()>;

    Sweeper(std::chrono::milliseconds interval, Task task);
    ~Sweeper();

    Sweeper(const Sweeper&) = delete;
    Sweeper& operator=(const Sweeper&) = delete;

    void start();

    // Signal the thread to stop and join it. Safe to call repeatedly.
    void stop();

    bool is_running() const { return running_.load(); }

    // Completed task runs since construction
    uint64_t runs() const { return runs_.load(); }

private:
    void run_loop();

    std::chrono::milliseconds interval_;
    Task task_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runs_{0};
};

} // namespace parley
