#pragma once

#include "domain/IdempotencyKey.hpp"
#include "domain/IdempotencyRecord.hpp"
#include "domain/ClaimResult.hpp"
#include "domain/HttpResponse.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace idempotency::ports::output {

/**
 * @brief Хранилище сохранённых ответов, ключ - (ownerId, key)
 *
 * Все операции атомарны на уровне хранилища; сбои инфраструктуры
 * пробрасываются как domain::StorageUnavailable.
 */
class IIdempotencyRepository {
public:
    virtual ~IIdempotencyRepository() = default;

    /**
     * @brief Условная вставка placeholder + чтение существующей строки, одной транзакцией
     */
    virtual domain::ClaimResult tryClaim(const std::string& ownerId,
                                         const domain::IdempotencyKey& key) = 0;

    /**
     * @brief Заполнить ответ у незавершённой строки
     * @return false, если незавершённого захвата нет
     */
    virtual bool saveResponse(const std::string& ownerId,
                              const domain::IdempotencyKey& key,
                              const domain::HttpResponse& response) = 0;

    /**
     * @brief Удалить строку, только если она не завершена
     */
    virtual bool releaseClaim(const std::string& ownerId,
                              const domain::IdempotencyKey& key) = 0;

    virtual std::optional<domain::IdempotencyRecord> find(const std::string& ownerId,
                                                          const domain::IdempotencyKey& key) = 0;

    /**
     * @brief Удалить незавершённые захваты старше olderThan
     * @return количество удалённых строк
     */
    virtual std::size_t releaseStaleClaims(std::chrono::seconds olderThan) = 0;
};

} // namespace idempotency::ports::output
