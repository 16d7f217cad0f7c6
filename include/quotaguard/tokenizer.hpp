#pragma once

#include "quotaguard/types.hpp"
#include <string>
#include <vector>

namespace quotaguard {

// Abstract token counter. Implementations must be deterministic and total:
// an encoding problem falls back to some count, never to an error.
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    virtual TokenCount count_tokens(const std::string& text,
                                    const std::string& model) const = 0;

    virtual std::string name() const = 0;
};

// Approximation of a BPE vocabulary without the vocabulary.
//
// Alphanumeric runs cost ceil(bytes / chars_per_token) tokens, every other
// non-space byte costs one token, whitespace is free. UTF-8 continuation
// bytes are folded into the run of their lead byte.
class ApproximateTokenizer : public Tokenizer {
public:
    explicit ApproximateTokenizer(std::size_t chars_per_token = 4);

    TokenCount count_tokens(const std::string& text,
                            const std::string& model) const override;

    std::string name() const override { return "Approximate"; }

    std::size_t chars_per_token() const noexcept;

private:
    std::size_t chars_per_token_;
};

// Prompt size of a chat transcript: each message's role, name and content
// tokenized together, plus tokens_per_message framing per message, plus
// reply_priming_tokens for the assistant reply header.
TokenCount count_message_tokens(const Tokenizer& tokenizer,
                                const std::vector<ChatMessage>& messages,
                                const std::string& model,
                                TokenCount tokens_per_message = 3,
                                TokenCount reply_priming_tokens = 3);

// Completion size of a response: all choice contents concatenated
TokenCount count_completion_tokens(const Tokenizer& tokenizer,
                                   const std::vector<Choice>& choices,
                                   const std::string& model);

} // namespace quotaguard
