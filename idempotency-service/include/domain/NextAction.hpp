#pragma once

#include "HttpResponse.hpp"
#include "enums/NextActionType.hpp"
#include <optional>

namespace idempotency::domain {

/**
 * @brief Решение Concurrency Gate для текущего запроса
 *
 * START_PROCESSING - вызывающий единолично владеет ключом и обязан
 * завершить его (saveResponse) или освободить (abandon).
 * RETURN_SAVED_RESPONSE - вернуть savedResponse как есть.
 */
struct NextAction {
    NextActionType type = NextActionType::START_PROCESSING;
    std::optional<HttpResponse> savedResponse;

    static NextAction startProcessing() {
        return {NextActionType::START_PROCESSING, std::nullopt};
    }

    static NextAction returnSavedResponse(HttpResponse response) {
        return {NextActionType::RETURN_SAVED_RESPONSE, std::move(response)};
    }
};

} // namespace idempotency::domain
