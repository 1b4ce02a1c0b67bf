/**
 * @file ResponseMaterializerTest.cpp
 * @brief Unit tests for ResponseMaterializer (storage row format)
 */

#include <gtest/gtest.h>
#include "adapters/secondary/ResponseMaterializer.hpp"

using namespace idempotency::domain;
using namespace idempotency::adapters::secondary;

namespace {

HttpResponse roundTrip(const HttpResponse& response) {
    return ResponseMaterializer::decode(ResponseMaterializer::encode(response));
}

} // namespace

TEST(ResponseMaterializerTest, RoundTrip_SimpleResponse) {
    HttpResponse res(200, {{"X-Msg", "Sent"}}, "ok");
    EXPECT_EQ(roundTrip(res), res);
}

TEST(ResponseMaterializerTest, RoundTrip_RepeatedHeadersKeepOrder) {
    HttpResponse res(303, {
        {"Set-Cookie", "_flash=1"},
        {"Location", "/admin/newsletters"},
        {"Set-Cookie", "id=42"},
        {"Set-Cookie", "_flash=1"}
    }, "");

    auto decoded = roundTrip(res);

    ASSERT_EQ(decoded.headers.size(), 4u);
    EXPECT_EQ(decoded.headers, res.headers);
}

TEST(ResponseMaterializerTest, RoundTrip_ZeroHeadersEmptyBody) {
    HttpResponse res(204, {}, "");

    auto stored = ResponseMaterializer::encode(res);
    auto decoded = ResponseMaterializer::decode(stored);

    EXPECT_EQ(stored.statusCode, 204);
    EXPECT_TRUE(stored.body.empty());
    EXPECT_EQ(decoded, res);
}

TEST(ResponseMaterializerTest, RoundTrip_BinaryBodyAndNonUtf8HeaderValue) {
    std::string body;
    for (int i = 0; i < 256; ++i) {
        body.push_back(static_cast<char>(i));
    }
    HttpResponse res(201, {{"X-Latin1", std::string("caf\xe9")}, {"X-Raw", std::string("\xff\xfe", 2)}}, body);

    auto stored = ResponseMaterializer::encode(res);
    auto decoded = ResponseMaterializer::decode(stored);

    EXPECT_EQ(stored.body, body);
    EXPECT_EQ(decoded.body.size(), 256u);
    EXPECT_EQ(decoded, res);
}

TEST(ResponseMaterializerTest, Encode_KeepsEachHeaderAsSeparatePair) {
    HttpResponse res(200, {{"Set-Cookie", "a=1"}, {"Set-Cookie", "b=2"}}, "ok");

    auto stored = ResponseMaterializer::encode(res);

    ASSERT_EQ(stored.headers.size(), 2u);
    EXPECT_EQ(stored.headers[0], (HeaderPair{"Set-Cookie", "a=1"}));
    EXPECT_EQ(stored.headers[1], (HeaderPair{"Set-Cookie", "b=2"}));
}

TEST(ResponseMaterializerTest, Encode_StatusOutsideSmallintRange_ThrowsMalformedResponse) {
    // 70000 молча превратился бы в 4464 при записи в SMALLINT
    EXPECT_THROW(ResponseMaterializer::encode(HttpResponse(70000, {}, "")), MalformedResponse);
    EXPECT_THROW(ResponseMaterializer::encode(HttpResponse(-200, {}, "")), MalformedResponse);
}

TEST(ResponseMaterializerTest, Decode_CorruptRow_ThrowsMalformedResponse) {
    StoredResponse badStatus;
    badStatus.statusCode = 42;
    EXPECT_THROW(ResponseMaterializer::decode(badStatus), MalformedResponse);

    StoredResponse badHeader;
    badHeader.statusCode = 200;
    badHeader.headers = {{"Bad Name", "x"}};
    EXPECT_THROW(ResponseMaterializer::decode(badHeader), MalformedResponse);
}
