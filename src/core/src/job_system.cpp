#include "core/job_system.hpp"
#include "core/log.hpp"
#include <exception>
#include <string>

namespace nle::core {

JobSystem& JobSystem::instance() { static JobSystem js; return js; }

JobSystem::~JobSystem() { stop(); }

void JobSystem::start(unsigned threads) {
    std::lock_guard<std::mutex> lk(m_);
    if(running_) return;
    running_ = true;
    if(threads==0) threads = 1;
    workers_.reserve(threads);
    for(unsigned i=0;i<threads;++i){
        workers_.emplace_back([this]{ worker_loop(); });
    }
    nle::log::debug("JobSystem started with " + std::to_string(threads) + " workers");
}

void JobSystem::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        if(!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    for(auto& w : workers_) if(w.joinable()) w.join();
    workers_.clear();
}

void JobSystem::enqueue(Job job) {
    if(!job) return;
    if(!running_) start(2);
    {
        std::lock_guard<std::mutex> lk(m_);
        queue_.push(std::move(job));
    }
    cv_.notify_one();
}

void JobSystem::wait_idle() {
    std::unique_lock<std::mutex> lk(m_);
    idle_cv_.wait(lk, [&]{ return queue_.empty() && active_ == 0; });
}

size_t JobSystem::pending() const {
    std::lock_guard<std::mutex> lk(m_);
    return queue_.size();
}

void JobSystem::worker_loop() {
    while(true){
        Job job;
        {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [&]{ return !running_ || !queue_.empty(); });
            if(!running_ && queue_.empty()) break;
            job = std::move(queue_.front()); queue_.pop();
            ++active_;
        }
        try {
            job();
        } catch(const std::exception& e) {
            nle::log::error(std::string("JobSystem job threw: ") + e.what());
        }
        {
            std::lock_guard<std::mutex> lk(m_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace nle::core
