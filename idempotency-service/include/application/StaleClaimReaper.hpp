#pragma once

#include "ports/input/IIdempotencyService.hpp"
#include "settings/IdempotencySettings.hpp"
#include "domain/IdempotencyErrors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace idempotency::application {

/**
 * @brief Фоновый поток, снимающий брошенные захваты
 *
 * Раз в interval удаляет незавершённые строки старше ttl.
 * Выключен, если ttl == 0.
 */
class StaleClaimReaper {
public:
    StaleClaimReaper(
        std::shared_ptr<ports::input::IIdempotencyService> service,
        std::shared_ptr<settings::IdempotencySettings> settings)
        : service_(std::move(service))
        , ttl_(settings->getStaleClaimTtl())
        , interval_(settings->getReaperInterval())
        , running_(false)
        , sweepCount_(0)
        , releasedTotal_(0)
    {}

    ~StaleClaimReaper() {
        stop();
    }

    // Non-copyable, non-movable
    StaleClaimReaper(const StaleClaimReaper&) = delete;
    StaleClaimReaper& operator=(const StaleClaimReaper&) = delete;

    bool isEnabled() const { return ttl_.count() > 0; }

    void start() {
        if (!isEnabled()) {
            std::cout << "[StaleClaimReaper] Disabled (stale claim TTL is 0)" << std::endl;
            return;
        }
        if (running_.exchange(true)) return;

        std::cout << "[StaleClaimReaper] Started: ttl=" << ttl_.count()
                  << "s interval=" << interval_.count() << "s" << std::endl;

        thread_ = std::thread([this]() {
            std::unique_lock<std::mutex> lock(mutex_);
            while (running_) {
                lock.unlock();
                runOnce();
                lock.lock();
                wakeup_.wait_for(lock, interval_, [this]() { return !running_; });
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        wakeup_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool isRunning() const { return running_; }

    uint64_t sweepCount() const { return sweepCount_; }

    uint64_t releasedTotal() const { return releasedTotal_; }

    /**
     * @brief Один проход очистки (для тестов и ручного запуска)
     * @return сколько захватов снято
     */
    std::size_t runOnce() {
        std::size_t released = 0;
        try {
            released = service_->releaseStaleClaims(ttl_);
            releasedTotal_ += released;
        } catch (const domain::StorageUnavailable& e) {
            std::cerr << "[StaleClaimReaper] Sweep failed: " << e.what() << std::endl;
        }
        ++sweepCount_;
        return released;
    }

private:
    std::shared_ptr<ports::input::IIdempotencyService> service_;
    std::chrono::seconds ttl_;
    std::chrono::seconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> sweepCount_;
    std::atomic<uint64_t> releasedTotal_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wakeup_;
};

} // namespace idempotency::application
