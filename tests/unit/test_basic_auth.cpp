#include <gtest/gtest.h>
#include "graphlink/http/basic_auth.hpp"

using namespace graphlink::http;

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, LongInputHasNoLineBreaks) {
    const std::string input(200, 'x');
    const std::string encoded = base64_encode(input);
    EXPECT_EQ(encoded.size(), 4u * ((input.size() + 2) / 3));
    EXPECT_EQ(encoded.find('\n'), std::string::npos);
}

TEST(BasicAuthTest, BuildsAuthorizationValue) {
    EXPECT_EQ(basic_authorization("username", "password"), "Basic dXNlcm5hbWU6cGFzc3dvcmQ=");
    EXPECT_EQ(basic_authorization("user", "password"), "Basic dXNlcjpwYXNzd29yZA==");
}

TEST(BasicAuthTest, EmptyPasswordKeepsSeparator) {
    // base64("user:")
    EXPECT_EQ(basic_authorization("user", ""), "Basic dXNlcjo=");
}
