#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace nle::core {

// Small FIFO worker pool. Audio buffer decoding runs here so the UI thread never waits on it.
class JobSystem {
public:
    using Job = std::function<void()>;

    JobSystem() = default;
    ~JobSystem();
    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    // Process-wide pool used when no explicit executor is supplied
    static JobSystem& instance();

    void start(unsigned threads = std::thread::hardware_concurrency());
    // Drains queued jobs, then joins the workers
    void stop();
    void enqueue(Job job);
    // Blocks until the queue is empty and no job is running
    void wait_idle();

    bool running() const { return running_.load(); }
    size_t pending() const;
    size_t thread_count() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<Job> queue_;
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::atomic<bool> running_{false};
    size_t active_ = 0;
};

} // namespace nle::core
