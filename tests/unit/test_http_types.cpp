#include <gtest/gtest.h>
#include "graphlink/http/http_types.hpp"

using namespace graphlink::http;

// ============================================================================
// Headers
// ============================================================================

TEST(HttpRequestTest, HeaderLookupIsCaseInsensitive) {
    HttpRequest request;
    request.set_header("Content-Type", "application/json");

    EXPECT_TRUE(request.has_header("content-type"));
    EXPECT_TRUE(request.has_header("CONTENT-TYPE"));
    EXPECT_EQ(request.header("Content-type"), "application/json");
    EXPECT_FALSE(request.has_header("Accept"));
}

TEST(HttpRequestTest, SetHeaderReplacesExistingValue) {
    HttpRequest request;
    request.set_header("X-Stream", "true");
    request.set_header("x-stream", "false");

    ASSERT_EQ(request.headers.size(), 1u);
    EXPECT_EQ(request.headers[0].name, "X-Stream");
    EXPECT_EQ(request.headers[0].value, "false");
}

TEST(HttpResponseTest, SuccessRange) {
    HttpResponse response;
    response.status_code = 200;
    EXPECT_TRUE(response.is_success());
    response.status_code = 299;
    EXPECT_TRUE(response.is_success());
    response.status_code = 199;
    EXPECT_FALSE(response.is_success());
    response.status_code = 300;
    EXPECT_FALSE(response.is_success());
    response.status_code = 500;
    EXPECT_FALSE(response.is_success());
}

TEST(HttpResponseTest, HeaderLookup) {
    HttpResponse response;
    response.headers.push_back(Header{"Content-Type", "application/json"});
    EXPECT_EQ(response.header("content-type"), "application/json");
    EXPECT_FALSE(response.header("Location").has_value());
}

// ============================================================================
// Names
// ============================================================================

TEST(HttpStatusNameTest, KnownCodes) {
    EXPECT_EQ(http_status_name(200), "OK");
    EXPECT_EQ(http_status_name(401), "Unauthorized");
    EXPECT_EQ(http_status_name(404), "NotFound");
    EXPECT_EQ(http_status_name(500), "InternalServerError");
    EXPECT_EQ(http_status_name(503), "ServiceUnavailable");
}

TEST(HttpStatusNameTest, UnknownCodeRendersAsNumber) {
    EXPECT_EQ(http_status_name(599), "599");
    EXPECT_EQ(http_status_name(299), "299");
}

TEST(HttpMethodTest, MethodToString) {
    EXPECT_STREQ(http_method_to_string(HttpMethod::Get), "GET");
    EXPECT_STREQ(http_method_to_string(HttpMethod::Post), "POST");
    EXPECT_STREQ(http_method_to_string(HttpMethod::Put), "PUT");
    EXPECT_STREQ(http_method_to_string(HttpMethod::Delete), "DELETE");
}
