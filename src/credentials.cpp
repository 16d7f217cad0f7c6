#include "quotaguard/credentials.hpp"

#include <algorithm>
#include <cctype>

namespace quotaguard {

namespace {

const std::string BEARER_PREFIX = "Bearer ";

} // anonymous namespace

const char* to_string(CredentialError e) {
    switch (e) {
        case CredentialError::Missing:
            return "Missing Authorization header. Use: Authorization: Bearer your-api-key";
        case CredentialError::BadScheme:
            return "Invalid Authorization header format. Use: Authorization: Bearer your-api-key";
        case CredentialError::EmptyToken:
            return "Empty API key. Use: Authorization: Bearer your-api-key";
    }
    return "Invalid credential";
}

CredentialCheck parse_bearer_token(const std::string& authorization) {
    CredentialCheck check;
    if (authorization.empty()) {
        check.error = CredentialError::Missing;
        return check;
    }
    if (authorization.compare(0, BEARER_PREFIX.size(), BEARER_PREFIX) != 0) {
        check.error = CredentialError::BadScheme;
        return check;
    }

    std::string token = authorization.substr(BEARER_PREFIX.size());
    if (token.empty()) {
        check.error = CredentialError::EmptyToken;
        return check;
    }
    bool has_space = std::any_of(token.begin(), token.end(),
        [](unsigned char c) { return std::isspace(c); });
    if (has_space) {
        // "Bearer    " and "Bearer a b" are both malformed
        bool all_space = std::all_of(token.begin(), token.end(),
            [](unsigned char c) { return std::isspace(c); });
        check.error = all_space ? CredentialError::EmptyToken : CredentialError::BadScheme;
        return check;
    }

    check.token = std::move(token);
    return check;
}

} // namespace quotaguard
