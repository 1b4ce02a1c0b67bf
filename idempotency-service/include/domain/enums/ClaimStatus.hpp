#pragma once

#include <string>

namespace idempotency::domain {

/**
 * @brief Результат одной попытки захватить ключ в хранилище
 */
enum class ClaimStatus {
    CLAIMED,    // вставили placeholder, выполняем мы
    COMPLETED,  // есть сохранённый ответ
    IN_FLIGHT   // placeholder чужой, ответа ещё нет
};

inline std::string toString(ClaimStatus status) {
    switch (status) {
        case ClaimStatus::CLAIMED: return "CLAIMED";
        case ClaimStatus::COMPLETED: return "COMPLETED";
        case ClaimStatus::IN_FLIGHT: return "IN_FLIGHT";
        default: return "UNKNOWN";
    }
}

} // namespace idempotency::domain
