/**
 * @file IdempotencyKeyTest.cpp
 * @brief Unit tests for IdempotencyKey
 */

#include <gtest/gtest.h>
#include "domain/IdempotencyKey.hpp"

using namespace idempotency::domain;

TEST(IdempotencyKeyTest, Parse_ValidKey_KeepsValue) {
    auto key = IdempotencyKey::parse("5f0c6a8e-2d4b-4b61-9d57-0b8f4d1e2a33");
    EXPECT_EQ(key.value(), "5f0c6a8e-2d4b-4b61-9d57-0b8f4d1e2a33");
}

TEST(IdempotencyKeyTest, Parse_EmptyKey_Throws) {
    EXPECT_THROW(IdempotencyKey::parse(""), InvalidIdempotencyKey);
}

TEST(IdempotencyKeyTest, Parse_KeyOfMaxLength_Throws) {
    EXPECT_THROW(IdempotencyKey::parse(std::string(IdempotencyKey::MAX_LENGTH, 'k')), InvalidIdempotencyKey);
}

TEST(IdempotencyKeyTest, Parse_KeyJustBelowMaxLength_Accepted) {
    auto raw = std::string(IdempotencyKey::MAX_LENGTH - 1, 'k');
    EXPECT_EQ(IdempotencyKey::parse(raw).value(), raw);
}

TEST(IdempotencyKeyTest, InvalidKey_IsIdempotencyException) {
    try {
        IdempotencyKey::parse("");
        FAIL() << "expected InvalidIdempotencyKey";
    } catch (const IdempotencyException& e) {
        EXPECT_NE(std::string(e.what()).find("empty"), std::string::npos);
    }
}

TEST(IdempotencyKeyTest, Equality_ByValue) {
    EXPECT_EQ(IdempotencyKey::parse("abc"), IdempotencyKey::parse("abc"));
    EXPECT_NE(IdempotencyKey::parse("abc"), IdempotencyKey::parse("ABC"));
}

TEST(IdempotencyKeyTest, Parse_KeyWithNul_Throws) {
    EXPECT_THROW(IdempotencyKey::parse(std::string("ab\0c", 4)), InvalidIdempotencyKey);
}

TEST(IdempotencyKeyTest, Parse_InvalidUtf8_Throws) {
    EXPECT_THROW(IdempotencyKey::parse("caf\xe9"), InvalidIdempotencyKey);        // latin-1
    EXPECT_THROW(IdempotencyKey::parse("\xc3"), InvalidIdempotencyKey);           // обрыв
    EXPECT_THROW(IdempotencyKey::parse("\xc0\xaf"), InvalidIdempotencyKey);       // overlong
    EXPECT_THROW(IdempotencyKey::parse("\xed\xa0\x80"), InvalidIdempotencyKey);   // суррогат
}

TEST(IdempotencyKeyTest, Parse_MultibyteUtf8_Accepted) {
    auto raw = std::string("ключ-\xe2\x82\xac-\xf0\x9f\x94\x91");
    EXPECT_EQ(IdempotencyKey::parse(raw).value(), raw);
}
