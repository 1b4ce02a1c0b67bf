#pragma once

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace idempotency::settings {

/**
 * @brief Политика ожидания чужого выполнения и очистки брошенных захватов
 *
 * Читает из ENV:
 * - IDEMPOTENCY_WAIT_INITIAL_BACKOFF_MS (default: 25)
 * - IDEMPOTENCY_WAIT_MAX_BACKOFF_MS (default: 500)
 * - IDEMPOTENCY_WAIT_TIMEOUT_MS (default: 10000, 0 = не ждать)
 * - IDEMPOTENCY_STALE_CLAIM_TTL_SECONDS (default: 0 = очистка выключена)
 * - IDEMPOTENCY_REAPER_INTERVAL_SECONDS (default: 60)
 */
class IdempotencySettings {
public:
    IdempotencySettings() {
        initialBackoff_ = std::chrono::milliseconds(
            readNonNegative("IDEMPOTENCY_WAIT_INITIAL_BACKOFF_MS", initialBackoff_.count()));
        maxBackoff_ = std::chrono::milliseconds(
            readNonNegative("IDEMPOTENCY_WAIT_MAX_BACKOFF_MS", maxBackoff_.count()));
        waitTimeout_ = std::chrono::milliseconds(
            readNonNegative("IDEMPOTENCY_WAIT_TIMEOUT_MS", waitTimeout_.count()));
        staleClaimTtl_ = std::chrono::seconds(
            readNonNegative("IDEMPOTENCY_STALE_CLAIM_TTL_SECONDS", staleClaimTtl_.count()));
        reaperInterval_ = std::chrono::seconds(
            readNonNegative("IDEMPOTENCY_REAPER_INTERVAL_SECONDS", reaperInterval_.count()));
        validate();
    }

    IdempotencySettings(std::chrono::milliseconds initialBackoff,
                        std::chrono::milliseconds maxBackoff,
                        std::chrono::milliseconds waitTimeout,
                        std::chrono::seconds staleClaimTtl = std::chrono::seconds{0},
                        std::chrono::seconds reaperInterval = std::chrono::seconds{60})
        : initialBackoff_(initialBackoff)
        , maxBackoff_(maxBackoff)
        , waitTimeout_(waitTimeout)
        , staleClaimTtl_(staleClaimTtl)
        , reaperInterval_(reaperInterval)
    {
        validate();
    }

    std::chrono::milliseconds getInitialBackoff() const { return initialBackoff_; }
    std::chrono::milliseconds getMaxBackoff() const { return maxBackoff_; }
    std::chrono::milliseconds getWaitTimeout() const { return waitTimeout_; }
    std::chrono::seconds getStaleClaimTtl() const { return staleClaimTtl_; }
    std::chrono::seconds getReaperInterval() const { return reaperInterval_; }

    bool isFailFast() const { return waitTimeout_.count() == 0; }
    bool isReaperEnabled() const { return staleClaimTtl_.count() > 0; }

private:
    std::chrono::milliseconds initialBackoff_{25};
    std::chrono::milliseconds maxBackoff_{500};
    std::chrono::milliseconds waitTimeout_{10000};
    std::chrono::seconds staleClaimTtl_{0};
    std::chrono::seconds reaperInterval_{60};

    void validate() const {
        if (initialBackoff_.count() < 0 || maxBackoff_.count() < 0 || waitTimeout_.count() < 0 ||
            staleClaimTtl_.count() < 0 || reaperInterval_.count() < 0) {
            throw std::invalid_argument("Idempotency settings cannot be negative");
        }
        if (initialBackoff_.count() == 0 && !isFailFast()) {
            throw std::invalid_argument("Initial backoff must be positive when waiting is enabled");
        }
        if (maxBackoff_ < initialBackoff_) {
            throw std::invalid_argument("Max backoff must not be less than initial backoff");
        }
        if (isReaperEnabled() && reaperInterval_.count() == 0) {
            throw std::invalid_argument("Reaper interval must be positive when stale claim TTL is set");
        }
    }

    static long long readNonNegative(const char* name, long long defaultValue) {
        const char* val = std::getenv(name);
        if (!val) {
            return defaultValue;
        }
        try {
            std::size_t pos = 0;
            long long parsed = std::stoll(val, &pos);
            if (pos != std::string(val).size() || parsed < 0) {
                throw std::invalid_argument(name);
            }
            return parsed;
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got: " + val);
        }
    }
};

} // namespace idempotency::settings
