#pragma once

#include "HttpResponse.hpp"
#include "enums/ClaimStatus.hpp"
#include <optional>

namespace idempotency::domain {

/**
 * @brief Что увидело хранилище при попытке захвата
 *
 * response заполнен только для COMPLETED.
 */
struct ClaimResult {
    ClaimStatus status = ClaimStatus::IN_FLIGHT;
    std::optional<HttpResponse> response;

    static ClaimResult claimed() { return {ClaimStatus::CLAIMED, std::nullopt}; }
    static ClaimResult inFlight() { return {ClaimStatus::IN_FLIGHT, std::nullopt}; }
    static ClaimResult completed(HttpResponse response) {
        return {ClaimStatus::COMPLETED, std::move(response)};
    }
};

} // namespace idempotency::domain
