#pragma once

#include "quotaguard/types.hpp"
#include <stdexcept>
#include <string>

namespace quotaguard {

class QuotaGuardException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Pricing source could not be opened, read, or has too few records
class PricingLoadException : public QuotaGuardException {
public:
    PricingLoadException(std::string source, const std::string& what)
        : QuotaGuardException("Cannot load pricing from " + source + ": " + what)
        , source_(std::move(source)) {}

    const std::string& source() const noexcept { return source_; }

private:
    std::string source_;
};

// Request body does not decode into a chat request
class MalformedRequestException : public QuotaGuardException {
public:
    using QuotaGuardException::QuotaGuardException;
};

// Upstream completion call failed or answered with a non-success status
class UpstreamException : public QuotaGuardException {
public:
    explicit UpstreamException(const std::string& what, int status_code = 0)
        : QuotaGuardException(what)
        , status_code_(status_code) {}

    int status_code() const noexcept { return status_code_; }

private:
    int status_code_;
};

class InvalidTransitionException : public QuotaGuardException {
public:
    InvalidTransitionException(AdmissionState from, AdmissionState to)
        : QuotaGuardException(std::string("Invalid admission transition: ") +
                              to_string(from) + " -> " + to_string(to))
        , from_(from)
        , to_(to) {}

    AdmissionState from() const noexcept { return from_; }
    AdmissionState to() const noexcept { return to_; }

private:
    AdmissionState from_;
    AdmissionState to_;
};

class InvalidConfigException : public QuotaGuardException {
public:
    using QuotaGuardException::QuotaGuardException;
};

} // namespace quotaguard
