#pragma once

#include "domain/IdempotencyKey.hpp"
#include "domain/IdempotencyRecord.hpp"
#include "domain/HttpResponse.hpp"
#include "domain/NextAction.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace idempotency::ports::input {

/**
 * @brief Побочная операция, которую ядро выполняет не более одного раза
 *
 * Всё нужное ей захвачено замыканием; ошибка - исключение.
 */
using Operation = std::function<domain::HttpResponse()>;

/**
 * @brief Интерфейс идемпотентной обработки запросов
 */
class IIdempotencyService {
public:
    virtual ~IIdempotencyService() = default;

    /**
     * @brief Полный цикл: захват, выполнение, сохранение или воспроизведение
     * @throws DuplicateKeyInFlight, EffectExecutionFailed, StorageUnavailable, MalformedResponse
     */
    virtual domain::HttpResponse execute(const std::string& ownerId,
                                         const domain::IdempotencyKey& key,
                                         const Operation& operation) = 0;

    /**
     * @brief Concurrency Gate
     * @throws DuplicateKeyInFlight если ключ занят дольше таймаута ожидания
     */
    virtual domain::NextAction tryStart(const std::string& ownerId,
                                        const domain::IdempotencyKey& key) = 0;

    /**
     * @brief Завершить захват после START_PROCESSING
     */
    virtual domain::HttpResponse saveResponse(const std::string& ownerId,
                                              const domain::IdempotencyKey& key,
                                              domain::HttpResponse response) = 0;

    /**
     * @brief Освободить захват после неудачной попытки
     */
    virtual void abandon(const std::string& ownerId, const domain::IdempotencyKey& key) = 0;

    /**
     * @brief Принудительно снять незавершённый захват (для reaper)
     */
    virtual bool forceRelease(const std::string& ownerId, const domain::IdempotencyKey& key) = 0;

    virtual std::size_t releaseStaleClaims(std::chrono::seconds olderThan) = 0;

    virtual std::optional<domain::IdempotencyRecord> findRecord(const std::string& ownerId,
                                                                const domain::IdempotencyKey& key) = 0;
};

} // namespace idempotency::ports::input
