/**
 * @file InMemoryIdempotencyRepositoryTest.cpp
 * @brief Unit tests for InMemoryIdempotencyRepository
 */

#include <gtest/gtest.h>
#include "adapters/secondary/InMemoryIdempotencyRepository.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace idempotency::domain;
using namespace idempotency::adapters::secondary;

class InMemoryIdempotencyRepositoryTest : public ::testing::Test {
protected:
    InMemoryIdempotencyRepository repo_;
    const std::string owner_ = "owner-001";
    const IdempotencyKey key_ = IdempotencyKey::parse("abc");
    const HttpResponse response_{200, {{"X-Msg", "Sent"}}, "ok"};
};

TEST_F(InMemoryIdempotencyRepositoryTest, TryClaim_FirstAttempt_Claims) {
    auto result = repo_.tryClaim(owner_, key_);

    EXPECT_EQ(result.status, ClaimStatus::CLAIMED);
    EXPECT_FALSE(result.response.has_value());

    auto record = repo_.find(owner_, key_);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->isComplete());
}

TEST_F(InMemoryIdempotencyRepositoryTest, TryClaim_WhileIncomplete_InFlight) {
    repo_.tryClaim(owner_, key_);

    auto result = repo_.tryClaim(owner_, key_);

    EXPECT_EQ(result.status, ClaimStatus::IN_FLIGHT);
}

TEST_F(InMemoryIdempotencyRepositoryTest, TryClaim_AfterSave_ReturnsSavedResponse) {
    repo_.tryClaim(owner_, key_);
    ASSERT_TRUE(repo_.saveResponse(owner_, key_, response_));

    auto result = repo_.tryClaim(owner_, key_);

    EXPECT_EQ(result.status, ClaimStatus::COMPLETED);
    ASSERT_TRUE(result.response.has_value());
    EXPECT_EQ(*result.response, response_);
}

TEST_F(InMemoryIdempotencyRepositoryTest, SaveResponse_WithoutClaim_ReturnsFalse) {
    EXPECT_FALSE(repo_.saveResponse(owner_, key_, response_));
    EXPECT_FALSE(repo_.find(owner_, key_).has_value());
}

TEST_F(InMemoryIdempotencyRepositoryTest, SaveResponse_Twice_SecondIsRejected) {
    repo_.tryClaim(owner_, key_);
    ASSERT_TRUE(repo_.saveResponse(owner_, key_, response_));

    HttpResponse other(500, {}, "boom");
    EXPECT_FALSE(repo_.saveResponse(owner_, key_, other));

    // сохранённый ответ неизменен
    EXPECT_EQ(*repo_.find(owner_, key_)->response, response_);
}

TEST_F(InMemoryIdempotencyRepositoryTest, SaveResponse_OutOfRangeStatus_RejectedAndClaimKept) {
    repo_.tryClaim(owner_, key_);

    EXPECT_THROW(repo_.saveResponse(owner_, key_, HttpResponse(70000, {}, "ok")), MalformedResponse);

    auto record = repo_.find(owner_, key_);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->isComplete());
    EXPECT_EQ(repo_.tryClaim(owner_, key_).status, ClaimStatus::IN_FLIGHT);
}

TEST_F(InMemoryIdempotencyRepositoryTest, ReleaseClaim_OnlyRemovesIncompleteRows) {
    repo_.tryClaim(owner_, key_);
    EXPECT_TRUE(repo_.releaseClaim(owner_, key_));
    EXPECT_FALSE(repo_.find(owner_, key_).has_value());

    repo_.tryClaim(owner_, key_);
    repo_.saveResponse(owner_, key_, response_);
    EXPECT_FALSE(repo_.releaseClaim(owner_, key_));
    EXPECT_TRUE(repo_.find(owner_, key_).has_value());
}

TEST_F(InMemoryIdempotencyRepositoryTest, Keys_AreScopedByOwner) {
    repo_.tryClaim(owner_, key_);
    repo_.saveResponse(owner_, key_, response_);

    auto result = repo_.tryClaim("owner-002", key_);

    EXPECT_EQ(result.status, ClaimStatus::CLAIMED);
    EXPECT_EQ(repo_.size(), 2u);
}

TEST_F(InMemoryIdempotencyRepositoryTest, ReleaseStaleClaims_KeepsCompletedAndFreshRows) {
    auto done = IdempotencyKey::parse("done");
    repo_.tryClaim(owner_, done);
    repo_.saveResponse(owner_, done, response_);
    repo_.tryClaim(owner_, key_);

    EXPECT_EQ(repo_.releaseStaleClaims(std::chrono::seconds{3600}), 0u);
    EXPECT_EQ(repo_.releaseStaleClaims(std::chrono::seconds{0}), 1u);

    EXPECT_FALSE(repo_.find(owner_, key_).has_value());
    EXPECT_TRUE(repo_.find(owner_, done).has_value());
}

TEST_F(InMemoryIdempotencyRepositoryTest, ConcurrentClaims_ExactlyOneClaimed) {
    const int NUM_THREADS = 12;
    std::atomic<int> claimed(0);
    std::atomic<int> inFlight(0);
    std::vector<std::thread> threads;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&]() {
            auto result = repo_.tryClaim(owner_, key_);
            if (result.status == ClaimStatus::CLAIMED) claimed++;
            if (result.status == ClaimStatus::IN_FLIGHT) inFlight++;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(claimed, 1);
    EXPECT_EQ(inFlight, NUM_THREADS - 1);
}
