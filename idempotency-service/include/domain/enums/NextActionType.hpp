#pragma once

namespace idempotency::domain {

enum class NextActionType {
    START_PROCESSING,
    RETURN_SAVED_RESPONSE
};

} // namespace idempotency::domain
