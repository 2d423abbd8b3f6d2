#pragma once
#include <string>
#include <vector>

namespace agentgate::security {

struct TokenizeResult {
    bool ok = false;
    std::vector<std::string> tokens;
    std::string error;      // Set when ok == false
};

// Split a shell command into words using POSIX quoting rules:
// - single quotes preserve everything up to the closing quote
// - double quotes honour backslash before $ ` " \ and newline only
// - an unquoted backslash escapes the next character (backslash-newline is dropped)
// No expansion of any kind is performed. Unterminated quotes or a trailing
// backslash yield ok == false; callers decide how to treat that.
TokenizeResult tokenize(const std::string& command);

} // namespace agentgate::security
