#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "security/tool_policy.hpp"
#include "security/validator_state.hpp"

namespace agentgate::security {

enum class BlockReason {
    NONE,
    NOT_ALLOWED,
    EXPLICITLY_DISALLOWED,
    MISSING_PATH,
    INVALID_PATH,
    DANGEROUS_PATTERN,
    BOUNDARY_VIOLATION
};

const char* block_reason_name(BlockReason reason);

struct ValidationResult {
    bool allowed = false;
    BlockReason reason = BlockReason::NONE;
    std::string error;
};

// Outcome of the shell boundary check on its own
struct BoundaryCheckResult {
    bool ok = true;
    bool parsed = true;     // false when the command could not be tokenized
    std::string error;
};

// Path-boundary check for shell commands. Read-only commands are skipped,
// find is checked only with a mutating action, filesystem-modifying
// commands have every non-flag argument resolved against the working
// directory and tested against the roots.
// A command the tokenizer rejects is passed (parsed == false): boundary
// checking is left to the OS sandbox for that command.
BoundaryCheckResult check_bash_directory_boundary(const std::string& command,
                                                  const std::filesystem::path& working_directory,
                                                  const std::vector<std::filesystem::path>& roots);

// Per-call tool validation against a ToolPolicy. Calls are independent;
// the only shared state is the ValidatorState counters and violation log.
class ToolValidator {
public:
    ToolValidator(ToolPolicy policy, ValidatorState& state);

    ValidationResult validate(const std::string& tool_name,
                              const nlohmann::json& input,
                              const std::filesystem::path& working_directory,
                              int64_t user_id);

    const ToolPolicy& policy() const { return policy_; }
    const std::vector<std::filesystem::path>& roots() const { return roots_; }
    ValidatorState& state() { return state_; }

private:
    ToolPolicy policy_;
    std::vector<std::filesystem::path> roots_;
    ValidatorState& state_;

    ValidationResult block(BlockReason reason,
                           const std::string& violation_type,
                           const std::string& error,
                           const std::string& tool_name,
                           const std::filesystem::path& working_directory,
                           int64_t user_id,
                           nlohmann::json detail);
};

} // namespace agentgate::security
