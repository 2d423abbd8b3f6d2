#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace agentgate {

// Base class for every fault raised across the gateway
class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& message) : std::runtime_error(message) {}
};

// The agent engine did not finish before its deadline
class TimeoutError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// Agent process could not be started or exited abnormally
class ProcessError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// Engine no longer recognizes the conversation we tried to resume
class StaleSessionError : public ProcessError {
public:
    using ProcessError::ProcessError;
};

// MCP server connection or configuration failure
class McpError : public ProcessError {
public:
    explicit McpError(const std::string& message, std::string server_name = "")
        : ProcessError(message), server_name_(std::move(server_name)) {}

    const std::string& server_name() const { return server_name_; }

private:
    std::string server_name_;
};

// Engine output could not be decoded
class ParsingError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// Session bookkeeping failure (persistence, bad records)
class SessionError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// Invalid configuration value
class ConfigError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// A critical tool call was blocked; the turn is aborted
class ToolValidationError : public GatewayError {
public:
    ToolValidationError(const std::string& message,
                        std::vector<std::string> blocked_tools,
                        std::vector<std::string> allowed_tools)
        : GatewayError(message),
          blocked_tools_(std::move(blocked_tools)),
          allowed_tools_(std::move(allowed_tools)) {}

    const std::vector<std::string>& blocked_tools() const { return blocked_tools_; }
    const std::vector<std::string>& allowed_tools() const { return allowed_tools_; }

private:
    std::vector<std::string> blocked_tools_;
    std::vector<std::string> allowed_tools_;
};

// True for StaleSessionError, or any error whose message carries the
// engine's "conversation not found" wording (case-insensitive).
bool is_stale_session_error(const std::exception& error);

} // namespace agentgate
