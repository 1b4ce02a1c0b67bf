#pragma once

#include "HttpResponse.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

/**
 * Идемпотентность запросов
 */
namespace idempotency::domain
{

    /**
     * @brief Строка таблицы idempotency
     *
     * Пока response пуст - ключ захвачен, но не завершён.
     * createdAt - время захвата, после завершения - время завершения.
     */
    struct IdempotencyRecord
    {
        std::string ownerId;
        std::string key;
        std::optional<HttpResponse> response;
        Timestamp createdAt;

        bool isComplete() const { return response.has_value(); }
    };

} // namespace idempotency::domain
