#include "quotaguard/tokenizer.hpp"

#include <cctype>

namespace quotaguard {

namespace {

bool is_word_byte(unsigned char c) {
    // Bytes >= 0x80 belong to multi-byte UTF-8 sequences; treat them as
    // word characters so non-ASCII text is chunked like ASCII words.
    return std::isalnum(c) || c >= 0x80;
}

} // anonymous namespace

ApproximateTokenizer::ApproximateTokenizer(std::size_t chars_per_token)
    : chars_per_token_(chars_per_token == 0 ? 1 : chars_per_token)
{}

TokenCount ApproximateTokenizer::count_tokens(const std::string& text,
                                              const std::string& /*model*/) const
{
    TokenCount tokens = 0;
    std::size_t run = 0;

    auto flush_run = [&]() {
        if (run > 0) {
            tokens += static_cast<TokenCount>((run + chars_per_token_ - 1) / chars_per_token_);
            run = 0;
        }
    };

    for (unsigned char c : text) {
        if (is_word_byte(c)) {
            ++run;
            continue;
        }
        flush_run();
        if (!std::isspace(c)) {
            ++tokens;
        }
    }
    flush_run();
    return tokens;
}

std::size_t ApproximateTokenizer::chars_per_token() const noexcept {
    return chars_per_token_;
}

TokenCount count_message_tokens(const Tokenizer& tokenizer,
                                const std::vector<ChatMessage>& messages,
                                const std::string& model,
                                TokenCount tokens_per_message,
                                TokenCount reply_priming_tokens)
{
    TokenCount total = 0;
    for (auto& msg : messages) {
        total += tokenizer.count_tokens(msg.role + msg.name + msg.content, model);
    }
    return total + tokens_per_message * static_cast<TokenCount>(messages.size())
                 + reply_priming_tokens;
}

TokenCount count_completion_tokens(const Tokenizer& tokenizer,
                                   const std::vector<Choice>& choices,
                                   const std::string& model)
{
    std::string completion_text;
    for (auto& choice : choices) {
        completion_text += choice.message.content;
    }
    return tokenizer.count_tokens(completion_text, model);
}

} // namespace quotaguard
