#pragma once

#include <optional>
#include <string>

namespace quotaguard {

enum class CredentialError {
    Missing,       // no Authorization value at all
    BadScheme,     // not "Bearer <token>"
    EmptyToken     // "Bearer " with nothing usable after it
};

const char* to_string(CredentialError e);

struct CredentialCheck {
    std::optional<std::string> token;
    std::optional<CredentialError> error;

    bool ok() const noexcept { return token.has_value(); }
};

// Extracts the API key from an Authorization header value of the form
// "Bearer <token>". The token may not be empty or contain whitespace.
CredentialCheck parse_bearer_token(const std::string& authorization);

} // namespace quotaguard
