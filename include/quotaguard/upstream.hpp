#pragma once

#include "quotaguard/types.hpp"
#include <string>

namespace quotaguard {

// The metered completion API behind the gate. Implementations signal any
// failure (transport error, non-success status, undecodable body) by
// throwing, preferably UpstreamException.
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    virtual ChatResponse complete(const ChatRequest& request,
                                  const std::string& api_key) = 0;
};

// Turns a raw request body into a ChatRequest. Throws
// MalformedRequestException when the body has the wrong shape.
class RequestDecoder {
public:
    virtual ~RequestDecoder() = default;

    virtual ChatRequest decode(const std::string& body) const = 0;
};

} // namespace quotaguard
