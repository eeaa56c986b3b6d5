#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace steward {

struct StewardConfig {
    std::string api_url = "http://localhost:11434/api";
    std::string api_key = "";
    std::string log_level = "info";
    std::string catalog_path = "";       // JSON catalog; built-in list when empty
    int stall_timeout_seconds = 30;
    int max_attempts = 3;
    int settle_delay_ms = 500;
    std::string openai_url = "https://api.openai.com/v1";
    std::string openai_key = "";         // Hosted models are listed only when set
};

struct CommandConfig {
    std::string command;  // list, pull, delete, run, show, status

    std::string model;

    // List options
    std::string kind = "";   // Empty lists every kind

    bool json_output = false;  // JSON on stdout, logs on stderr

    // Run options
    std::string prompt = "";
};

class CLIParser {
public:
    CLIParser();

    // Parse command line arguments
    // Returns: 0 if should continue, exit code (may be 0) if should exit
    int parse(int argc, char** argv);

    StewardConfig get_config() const { return config_; }
    CommandConfig get_command_config() const { return command_config_; }

    // Check if we should continue (false means exit cleanly, e.g., after --help)
    bool should_continue() const { return should_continue_; }

    // Get exit code (only valid if should_continue() is false)
    int get_exit_code() const { return exit_code_; }
private:
    CLI::App app_;
    StewardConfig config_;
    CommandConfig command_config_;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace steward
