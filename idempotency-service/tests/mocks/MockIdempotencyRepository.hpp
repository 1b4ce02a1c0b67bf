#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include <gmock/gmock.h>

namespace idempotency::tests {

class MockIdempotencyRepository : public ports::output::IIdempotencyRepository {
public:
    MOCK_METHOD(domain::ClaimResult, tryClaim,
                (const std::string& ownerId, const domain::IdempotencyKey& key), (override));
    MOCK_METHOD(bool, saveResponse,
                (const std::string& ownerId, const domain::IdempotencyKey& key,
                 const domain::HttpResponse& response), (override));
    MOCK_METHOD(bool, releaseClaim,
                (const std::string& ownerId, const domain::IdempotencyKey& key), (override));
    MOCK_METHOD(std::optional<domain::IdempotencyRecord>, find,
                (const std::string& ownerId, const domain::IdempotencyKey& key), (override));
    MOCK_METHOD(std::size_t, releaseStaleClaims, (std::chrono::seconds olderThan), (override));
};

} // namespace idempotency::tests
