#include <gtest/gtest.h>
#include <quotaguard/quotaguard.hpp>

using namespace quotaguard;

TEST(CredentialsTest, ExtractsBearerToken) {
    auto check = parse_bearer_token("Bearer sk-test-123");
    ASSERT_TRUE(check.ok());
    EXPECT_EQ(check.token.value(), "sk-test-123");
    EXPECT_FALSE(check.error.has_value());
}

TEST(CredentialsTest, MissingHeader) {
    auto check = parse_bearer_token("");
    EXPECT_FALSE(check.ok());
    EXPECT_EQ(check.error, CredentialError::Missing);
}

TEST(CredentialsTest, WrongScheme) {
    EXPECT_EQ(parse_bearer_token("Basic dXNlcjpwYXNz").error, CredentialError::BadScheme);
    EXPECT_EQ(parse_bearer_token("sk-test-123").error, CredentialError::BadScheme);
    EXPECT_EQ(parse_bearer_token("bearer sk-test").error, CredentialError::BadScheme);
    EXPECT_EQ(parse_bearer_token("Bearer").error, CredentialError::BadScheme);
}

TEST(CredentialsTest, EmptyToken) {
    EXPECT_EQ(parse_bearer_token("Bearer ").error, CredentialError::EmptyToken);
    EXPECT_EQ(parse_bearer_token("Bearer    ").error, CredentialError::EmptyToken);
}

TEST(CredentialsTest, TokenWithWhitespaceIsRejected) {
    EXPECT_EQ(parse_bearer_token("Bearer sk test").error, CredentialError::BadScheme);
    EXPECT_EQ(parse_bearer_token("Bearer  sk-test").error, CredentialError::BadScheme);
}

TEST(CredentialsTest, ErrorMessagesNameTheExpectedFormat) {
    for (auto e : {CredentialError::Missing, CredentialError::BadScheme, CredentialError::EmptyToken}) {
        std::string msg = to_string(e);
        EXPECT_NE(msg.find("Bearer"), std::string::npos) << msg;
    }
}
