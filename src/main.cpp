#include <spdlog/spdlog.h>
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "gateway/agent_gateway.hpp"
#include "gateway/config.hpp"
#include "gateway/process_executor.hpp"
#include "gateway/prompt_enricher.hpp"
#include "security/tool_validator.hpp"
#include "security/validator_state.hpp"
#include "session/json_file_session_store.hpp"
#include "session/session_manager.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

namespace {

struct CliOptions {
    int64_t user_id = 0;
    std::filesystem::path directory;
    std::optional<std::string> session_id;
    bool force_new = false;
    bool cleanup = false;
    bool stats = false;
    bool json_output = false;
    bool verbose = false;
    std::string prompt;
};

void print_usage() {
    std::cerr << "Usage: agentgate [--user ID] [--dir PATH] [--session ID] [--new] [--cleanup] [--stats] [--json] [-v] PROMPT...\n"
              << "\n"
              << "  --user ID      numeric user id (default: current uid)\n"
              << "  --dir PATH     working directory inside an approved root (default: approved directory)\n"
              << "  --session ID   continue this engine session\n"
              << "  --new          do not auto-resume, start a fresh session\n"
              << "  --cleanup      remove expired sessions and exit\n"
              << "  --stats        print session and tool statistics for the user and exit\n"
              << "  --json         print the full response as JSON\n"
              << "  -v, --verbose  debug logging regardless of AGENTGATE_LOG_LEVEL\n";
}

// Returns false on a usage error
bool parse_args(int argc, char** argv, CliOptions& options) {
    options.user_id = static_cast<int64_t>(getuid());

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--user") {
            if (!next(value)) return false;
            try {
                size_t consumed = 0;
                options.user_id = std::stoll(value, &consumed);
                if (consumed != value.size()) {
                    std::cerr << "Invalid user id: " << value << "\n";
                    return false;
                }
            } catch (const std::logic_error&) {
                std::cerr << "Invalid user id: " << value << "\n";
                return false;
            }
        } else if (arg == "--dir") {
            if (!next(value)) return false;
            options.directory = value;
        } else if (arg == "--session") {
            if (!next(value)) return false;
            options.session_id = value;
        } else if (arg == "--new") {
            options.force_new = true;
        } else if (arg == "--cleanup") {
            options.cleanup = true;
        } else if (arg == "--stats") {
            options.stats = true;
        } else if (arg == "--json") {
            options.json_output = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            if (!options.prompt.empty()) options.prompt += " ";
            options.prompt += arg;
        }
    }

    return options.cleanup || options.stats || !options.prompt.empty();
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    if (!parse_args(argc, argv, options)) {
        print_usage();
        return 2;
    }

    try {
        auto config = agentgate::gateway::load_gateway_config();
        agentgate::core::init_logger(config.log_level);
        if (options.verbose) {
            agentgate::core::set_log_level(spdlog::level::debug);
        }
        spdlog::debug("Configuration: {}", config.to_json().dump());

        std::error_code ec;
        std::filesystem::create_directories(config.approved_directory, ec);
        if (ec) {
            spdlog::warn("Could not create approved directory {}: {}",
                         config.approved_directory.string(), ec.message());
        }

        agentgate::session::JsonFileSessionStore store(config.session_file);
        agentgate::session::SessionManager sessions(store, config.session);

        agentgate::security::ValidatorState validator_state;
        agentgate::security::ToolValidator validator(config.policy, validator_state);

        agentgate::gateway::ProcessAgentExecutor executor(config.executor);
        agentgate::gateway::ContextPromptEnricher enricher(config.enricher);
        agentgate::gateway::AgentGateway gateway(sessions, validator, executor, &enricher);

        if (options.cleanup) {
            size_t removed = gateway.cleanup_expired_sessions();
            std::cout << "Removed " << removed << " expired sessions\n";
            return 0;
        }

        if (options.stats) {
            nlohmann::json out;
            out["user"] = gateway.get_user_summary(options.user_id);
            out["sessions"] = gateway.get_user_sessions(options.user_id);
            out["tools"] = gateway.get_tool_stats();
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        agentgate::gateway::RunRequest request;
        request.prompt = options.prompt;
        request.working_directory = options.directory.empty() ? config.approved_directory : options.directory;
        request.user_id = options.user_id;
        request.session_id = options.session_id;
        request.force_new = options.force_new;

        auto response = gateway.run(request);
        if (options.json_output) {
            std::cout << response.to_json().dump(2) << "\n";
            return 0;
        }
        std::cout << response.content << "\n";
        std::cout << "\nsession: " << (response.session_id.empty() ? "(none)" : response.session_id)
                  << "  cost: $" << response.cost << "\n";
        return 0;

    } catch (const agentgate::ToolValidationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const agentgate::TimeoutError& e) {
        std::cerr << "Timed out: " << e.what() << "\nPlease try again.\n";
        return 1;
    } catch (const agentgate::GatewayError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }
}
