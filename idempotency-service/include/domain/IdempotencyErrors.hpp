#pragma once

#include <stdexcept>
#include <string>

/**
 * @file IdempotencyErrors.hpp
 * @brief Исключения ядра идемпотентной обработки запросов
 */
namespace idempotency::domain {

/**
 * @brief Базовое исключение
 */
class IdempotencyException : public std::runtime_error {
public:
    explicit IdempotencyException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Клиент прислал пустой или слишком длинный ключ (HTTP 400)
 */
class InvalidIdempotencyKey : public IdempotencyException {
public:
    explicit InvalidIdempotencyKey(const std::string& message)
        : IdempotencyException(message) {}
};

/**
 * @brief Ключ занят другим выполнением, ждать дальше не стали
 *
 * Клиент может повторить запрос позже.
 */
class DuplicateKeyInFlight : public IdempotencyException {
public:
    DuplicateKeyInFlight(const std::string& ownerId, const std::string& key)
        : IdempotencyException("Request with idempotency key '" + key +
                               "' is already in progress for owner " + ownerId)
        , ownerId_(ownerId)
        , key_(key) {}

    const std::string& ownerId() const { return ownerId_; }
    const std::string& key() const { return key_; }

private:
    std::string ownerId_;
    std::string key_;
};

/**
 * @brief Операция упала; исходное исключение вложено (std::rethrow_if_nested)
 */
class EffectExecutionFailed : public IdempotencyException {
public:
    explicit EffectExecutionFailed(const std::string& message)
        : IdempotencyException(message) {}
};

/**
 * @brief Хранилище недоступно или транзакция не закоммитилась
 */
class StorageUnavailable : public IdempotencyException {
public:
    explicit StorageUnavailable(const std::string& message)
        : IdempotencyException(message) {}
};

/**
 * @brief Ответ нельзя сохранить или восстановить (ошибка программиста)
 */
class MalformedResponse : public IdempotencyException {
public:
    explicit MalformedResponse(const std::string& message)
        : IdempotencyException(message) {}
};

} // namespace idempotency::domain
