#pragma once

#include <chrono>
#include <cstdint>

namespace idempotency::domain {

/**
 * @brief Временная метка (UTC)
 *
 * В БД хранится как timestamptz, между адаптером и доменом передаётся
 * через epoch-микросекунды.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromEpochMicros(int64_t micros) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(micros))));
    }
};

} // namespace idempotency::domain
