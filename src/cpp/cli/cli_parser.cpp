#include <steward/cli_parser.h>
#include <steward/version.h>
#include <iostream>

#define APP_NAME "steward"
#define APP_DESC APP_NAME " - Local model acquisition and lifecycle manager"

#define PULL_FOOTER "Examples:\n" \
    "  # Pull a recommended model\n" \
    "  steward pull llama3\n\n" \
    "  # Pull from a remote provider with a longer stall window\n" \
    "  steward --api-url http://gpu-box:11434/api --stall-timeout 120 pull mistral"

namespace steward {

static std::string check_positive(const std::string& val) {
    try {
        if (std::stoi(val) > 0) {
            return "";
        }
        return "Value must be a positive integer (got " + val + ")";
    } catch (const std::exception&) {
        return "Value must be a positive integer (got '" + val + "')";
    }
}

static void add_global_options(CLI::App& app, StewardConfig& config) {
    app.add_option("--api-url", config.api_url, "Base URL of the model provider API")
        ->envname("STEWARD_API_URL")
        ->type_name("URL")
        ->default_val(config.api_url);

    app.add_option("--api-key", config.api_key, "Bearer token sent to the provider")
        ->envname("STEWARD_API_KEY")
        ->type_name("KEY");

    app.add_option("--log-level", config.log_level, "Log level")
        ->envname("STEWARD_LOG_LEVEL")
        ->type_name("LEVEL")
        ->check(CLI::IsMember({"critical", "error", "warning", "info", "debug", "trace"}))
        ->default_val(config.log_level);

    app.add_option("--catalog", config.catalog_path, "JSON file with the recommended model catalog")
        ->envname("STEWARD_CATALOG")
        ->type_name("PATH");

    app.add_option("--stall-timeout", config.stall_timeout_seconds,
                   "Seconds without progress before a download counts as stalled")
        ->envname("STEWARD_STALL_TIMEOUT")
        ->type_name("SECONDS")
        ->default_val(config.stall_timeout_seconds)
        ->check(check_positive);

    app.add_option("--max-attempts", config.max_attempts, "Download attempts before giving up")
        ->envname("STEWARD_MAX_ATTEMPTS")
        ->type_name("N")
        ->default_val(config.max_attempts)
        ->check(check_positive);

    app.add_option("--settle-delay-ms", config.settle_delay_ms,
                   "Pause between a failed engine reload and creating a new engine")
        ->envname("STEWARD_SETTLE_DELAY_MS")
        ->type_name("MS")
        ->default_val(config.settle_delay_ms)
        ->check(CLI::NonNegativeNumber);

    app.add_option("--openai-url", config.openai_url, "Base URL of a hosted OpenAI-compatible API")
        ->envname("STEWARD_OPENAI_URL")
        ->type_name("URL")
        ->default_val(config.openai_url);

    app.add_option("--openai-key", config.openai_key, "API key that enables the hosted models")
        ->envname("STEWARD_OPENAI_API_KEY")
        ->type_name("KEY");
}

CLIParser::CLIParser()
    : app_(APP_DESC) {

    app_.set_version_flag("-v,--version", (APP_NAME " version " STEWARD_VERSION_STRING));
    app_.require_subcommand(1);
    app_.set_help_all_flag("--help-all", "Print help for all commands");

    add_global_options(app_, config_);

    // List
    CLI::App* list = app_.add_subcommand("list", "List recommended and installed models");
    list->add_option("--kind", command_config_.kind, "Only list models of this kind")
        ->type_name("KIND")
        ->check(CLI::IsMember({"chat", "embedding"}));
    list->add_flag("--json", command_config_.json_output, "Print the list as JSON");

    // Pull
    CLI::App* pull = app_.add_subcommand("pull", "Download a model");
    pull->add_option("model", command_config_.model, "The model to download")
        ->type_name("MODEL")
        ->required();
    pull->add_flag("--json", command_config_.json_output, "Report the result as JSON");
    pull->footer(PULL_FOOTER);

    // Delete
    CLI::App* del = app_.add_subcommand("delete", "Delete a model");
    del->add_option("model", command_config_.model, "The model to delete")->required();
    del->add_flag("--json", command_config_.json_output, "Report the result as JSON");

    // Run
    CLI::App* run = app_.add_subcommand("run", "Download a model if needed and load it");
    run->add_option("model", command_config_.model, "The model to run")->required();
    run->add_option("--prompt", command_config_.prompt,
                    "Send one prompt (chat models) or input text (embedding models) once loaded")
        ->type_name("TEXT");
    run->add_flag("--json", command_config_.json_output, "Report the result as JSON");

    // Show
    CLI::App* show = app_.add_subcommand("show", "Print what the provider knows about a model");
    show->add_option("model", command_config_.model, "The model to describe")->required();

    // Status
    app_.add_subcommand("status", "Check provider status");
}

int CLIParser::parse(int argc, char** argv) {
    try {
        // Show help if no arguments provided
        if (argc == 1) {
            throw CLI::CallForHelp();
        }
        app_.parse(argc, argv);

        command_config_.command = app_.get_subcommands().at(0)->get_name();
        should_continue_ = true;
        exit_code_ = 0;
        return 0;  // Success, continue
    } catch (const CLI::ParseError& e) {
        // Help/version requested or parse error occurred
        exit_code_ = app_.exit(e);
        should_continue_ = false;
        return exit_code_;
    }
}

} // namespace steward
