#include "security/command_tokenizer.hpp"

namespace agentgate::security {

namespace {

enum class LexState {
    BETWEEN,
    WORD,
    SINGLE_QUOTE,
    DOUBLE_QUOTE
};

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool escapable_in_double_quotes(char c) {
    return c == '$' || c == '`' || c == '"' || c == '\\' || c == '\n';
}

} // namespace

TokenizeResult tokenize(const std::string& command) {
    TokenizeResult result;
    LexState state = LexState::BETWEEN;
    std::string current;

    const size_t n = command.size();
    for (size_t i = 0; i < n; ++i) {
        const char c = command[i];

        switch (state) {
            case LexState::BETWEEN:
            case LexState::WORD:
                if (is_blank(c)) {
                    if (state == LexState::WORD) {
                        result.tokens.push_back(std::move(current));
                        current.clear();
                        state = LexState::BETWEEN;
                    }
                } else if (c == '\\') {
                    if (i + 1 >= n) {
                        result.error = "No escaped character";
                        result.tokens.clear();
                        return result;
                    }
                    ++i;
                    if (command[i] == '\n') {
                        // line continuation
                        continue;
                    }
                    current.push_back(command[i]);
                    state = LexState::WORD;
                } else if (c == '\'') {
                    state = LexState::SINGLE_QUOTE;
                } else if (c == '"') {
                    state = LexState::DOUBLE_QUOTE;
                } else {
                    current.push_back(c);
                    state = LexState::WORD;
                }
                break;

            case LexState::SINGLE_QUOTE:
                if (c == '\'') {
                    state = LexState::WORD;
                } else {
                    current.push_back(c);
                }
                break;

            case LexState::DOUBLE_QUOTE:
                if (c == '"') {
                    state = LexState::WORD;
                } else if (c == '\\' && i + 1 < n && escapable_in_double_quotes(command[i + 1])) {
                    ++i;
                    if (command[i] != '\n') {
                        current.push_back(command[i]);
                    }
                } else {
                    current.push_back(c);
                }
                break;
        }
    }

    if (state == LexState::SINGLE_QUOTE || state == LexState::DOUBLE_QUOTE) {
        result.error = "No closing quotation";
        result.tokens.clear();
        return result;
    }

    if (state == LexState::WORD) {
        result.tokens.push_back(std::move(current));
    }

    result.ok = true;
    return result;
}

} // namespace agentgate::security
