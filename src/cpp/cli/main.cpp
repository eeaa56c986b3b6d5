#include <iostream>
#include <iomanip>
#include <csignal>
#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <steward/cli_parser.h>
#include <steward/version.h>
#include <steward/acquisition_controller.h>
#include <steward/engine_manager.h>
#include <steward/error_types.h>
#include <steward/model_registry.h>
#include <steward/model_steward.h>
#include <steward/engines/ollama_engine.h>
#include <steward/engines/openai_engine.h>
#include <steward/engines/provider_engine_factory.h>
#include <steward/providers/http_pull_transport.h>
#include <steward/providers/ollama_client.h>
#include <steward/providers/openai_client.h>
#include <steward/utils/stream_redirect.h>

using namespace steward;

// Exit code for a run interrupted by Ctrl+C
static const int EXIT_CANCELLED = 130;

// Set from the signal handler, turned into a token cancel by the watcher thread
static std::atomic<bool> g_interrupt_requested(false);

// Where --json results go. Stays on stdout while logs are sent to stderr.
static std::ostream* g_result_out = &std::cout;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupt_requested = true;
    }
}

// Cancels the token once Ctrl+C is seen. Token callbacks take locks, so they
// must not run inside the signal handler.
class InterruptWatcher {
public:
    explicit InterruptWatcher(CancellationToken& token)
        : token_(token), thread_([this] { watch(); }) {}

    ~InterruptWatcher() {
        done_ = true;
        thread_.join();
    }

private:
    void watch() {
        while (!done_) {
            if (g_interrupt_requested) {
                std::cout << "\nCancelling..." << std::endl;
                token_.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    CancellationToken& token_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

// Renders acquisition progress on a single console line
class ProgressPrinter {
public:
    void operator()(const AcquisitionProgress& p) {
        bool notice = p.layer_id.empty() && p.total == 0;
        if (notice && p.status != last_status_) {
            if (line_open_) {
                std::cout << std::endl;
                line_open_ = false;
            }
            std::cout << p.status << std::endl;
        } else if (!notice && p.percent != last_percent_) {
            std::cout << "\r  Progress: " << std::setw(3) << p.percent << "% ("
                      << std::fixed << std::setprecision(1)
                      << (p.completed / (1024.0 * 1024.0)) << "/"
                      << (p.total / (1024.0 * 1024.0)) << " MB)   " << std::flush;
            line_open_ = true;
        }
        last_status_ = p.status;
        last_percent_ = p.percent;
    }

    void close() {
        if (line_open_) {
            std::cout << std::endl;
            line_open_ = false;
        }
    }

private:
    std::string last_status_;
    int last_percent_ = -1;
    bool line_open_ = false;
};

// Everything one command needs, wired against the configured providers
struct Services {
    explicit Services(const StewardConfig& config)
        : provider_config(make_provider_config(config)),
          openai_config(make_openai_config(config)),
          client(provider_config, config.log_level),
          openai(config.openai_key.empty() ? nullptr
                 : std::make_unique<providers::OpenAiClient>(openai_config, config.log_level)),
          transport(provider_config, config.log_level),
          registry(provider_list(), config.catalog_path, config.log_level),
          acquisition(transport, client, &registry, make_acquisition_options(config)),
          ollama_factory(provider_config, &registry, config.log_level),
          openai_factory(openai_config, config.log_level),
          factory(registry, ollama_factory),
          engine(factory, std::chrono::milliseconds(config.settle_delay_ms), config.log_level),
          steward(client, registry, acquisition, engine, config.log_level) {
        if (openai) {
            factory.add(openai->name(), openai_factory);
        }
    }

    static utils::ProviderConfig make_provider_config(const StewardConfig& config) {
        utils::ProviderConfig pc;
        pc.api_url = config.api_url;
        pc.api_key = config.api_key;
        return pc;
    }

    static utils::ProviderConfig make_openai_config(const StewardConfig& config) {
        utils::ProviderConfig pc;
        pc.api_url = config.openai_url;
        pc.api_key = config.openai_key;
        return pc;
    }

    static AcquisitionOptions make_acquisition_options(const StewardConfig& config) {
        AcquisitionOptions options;
        options.max_attempts = config.max_attempts;
        options.stall_timeout = std::chrono::seconds(config.stall_timeout_seconds);
        options.log_level = config.log_level;
        return options;
    }

    std::vector<IModelProvider*> provider_list() {
        std::vector<IModelProvider*> list = {&client};
        if (openai) {
            list.push_back(openai.get());
        }
        return list;
    }

    utils::ProviderConfig provider_config;
    utils::ProviderConfig openai_config;
    providers::OllamaClient client;
    std::unique_ptr<providers::OpenAiClient> openai;
    providers::HttpPullTransport transport;
    ModelRegistry registry;
    AcquisitionController acquisition;
    engines::OllamaEngineFactory ollama_factory;
    engines::OpenAiEngineFactory openai_factory;
    engines::ProviderEngineFactory factory;
    EngineLifecycleManager engine;
    ModelSteward steward;
};

// Errors go to stderr, or to stdout as a JSON error body with --json
static void report_error(const std::string& context, const std::exception& e, bool json_output) {
    if (!json_output) {
        std::cerr << context << e.what() << std::endl;
        return;
    }
    auto steward_error = dynamic_cast<const StewardException*>(&e);
    json body = steward_error
        ? ErrorResponse::from_exception(*steward_error)
        : json{{"error", {{"message", e.what()}, {"type", "internal_error"}}}};
    *g_result_out << body.dump() << std::endl;
}

static void report_success(const std::string& model, const json& extra = json::object()) {
    json body = {{"status", "success"}, {"model", model}};
    body.update(extra);
    *g_result_out << body.dump() << std::endl;
}

static int execute_list_command(Services& services, const CommandConfig& command) {
    std::vector<ModelDescriptor> models = command.kind.empty()
        ? services.steward.list_models()
        : services.steward.list_models(model_kind_from_string(command.kind));

    if (command.json_output) {
        json data = json::array();
        for (const auto& model : models) {
            data.push_back(model.to_json());
        }
        *g_result_out << data.dump(2) << std::endl;
        return 0;
    }

    std::cout << std::left << std::setw(32) << "Model Name"
              << std::setw(12) << "Kind"
              << std::setw(10) << "Provider"
              << std::setw(12) << "Installed"
              << "Details" << std::endl;
    std::cout << std::string(90, '-') << std::endl;

    for (const auto& model : models) {
        std::cout << std::left << std::setw(32) << model.id
                  << std::setw(12) << model_kind_to_string(model.kind)
                  << std::setw(10) << model.provider
                  << std::setw(12) << (model.hosted ? "Hosted" : (model.installed ? "Yes" : "No"))
                  << (model.details.empty() ? "-" : model.details) << std::endl;
    }

    std::cout << std::string(90, '-') << std::endl;
    return 0;
}

static int execute_pull_command(Services& services, const CommandConfig& command) {
    std::cout << "Pulling model: " << command.model << std::endl;

    CancellationToken token;
    InterruptWatcher watcher(token);
    ProgressPrinter printer;

    try {
        services.steward.pull(command.model,
            [&printer](const AcquisitionProgress& p) { printer(p); }, token);
        printer.close();
        std::cout << "Model pulled successfully: " << command.model << std::endl;
        if (command.json_output) {
            report_success(command.model);
        }
        return 0;
    } catch (const DownloadCancelledException& e) {
        printer.close();
        report_error("", e, command.json_output);
        return EXIT_CANCELLED;
    } catch (const std::exception& e) {
        printer.close();
        report_error("Error pulling model: ", e, command.json_output);
        return 1;
    }
}

static int execute_delete_command(Services& services, const CommandConfig& command) {
    try {
        services.steward.remove(command.model);
        std::cout << "Model deleted successfully: " << command.model << std::endl;
        if (command.json_output) {
            report_success(command.model);
        }
        return 0;
    } catch (const std::exception& e) {
        report_error("Error deleting model: ", e, command.json_output);
        return 1;
    }
}

static int execute_run_command(Services& services, const CommandConfig& command) {
    std::cout << "Running model: " << command.model << std::endl;

    CancellationToken token;
    InterruptWatcher watcher(token);
    ProgressPrinter printer;

    try {
        services.steward.ensure_ready(command.model,
            [&printer](const AcquisitionProgress& p) { printer(p); }, token,
            [&printer](const std::string& text) {
                printer.close();
                std::cout << text << std::endl;
            });
        printer.close();
        std::cout << "Model loaded successfully!" << std::endl;

        json answer;
        if (!command.prompt.empty()) {
            auto model = services.registry.find_model(command.model);
            if (model && model->kind == ModelKind::Embedding) {
                answer = services.engine.embed({{"input", command.prompt}});
            } else {
                answer = services.engine.chat({{"prompt", command.prompt}});
            }
            if (!command.json_output) {
                std::cout << answer.dump(2) << std::endl;
            }
        }
        if (command.json_output) {
            report_success(command.model, answer.is_null() ? json::object() : json{{"answer", answer}});
        }
        return 0;
    } catch (const DownloadCancelledException& e) {
        printer.close();
        report_error("", e, command.json_output);
        return EXIT_CANCELLED;
    } catch (const std::exception& e) {
        printer.close();
        report_error("Error running model: ", e, command.json_output);
        return 1;
    }
}

static int execute_show_command(Services& services, const CommandConfig& command) {
    json details = services.client.show_model(command.model);
    if (details.is_null()) {
        std::cerr << "Model not found on provider: " << command.model << std::endl;
        return 1;
    }
    std::cout << details.dump(2) << std::endl;
    return 0;
}

static int execute_status_command(Services& services, const StewardConfig& config) {
    if (services.openai) {
        std::cout << "Hosted provider is " << (services.openai->is_available() ? "" : "not ")
                  << "reachable at " << config.openai_url << std::endl;
    }
    if (services.client.is_available()) {
        std::cout << "Provider is reachable at " << config.api_url << std::endl;
        return 0;
    }
    std::cout << "Provider is not reachable at " << config.api_url << std::endl;
    return 1;
}

int main(int argc, char** argv) {
    try {
        CLIParser parser;

        parser.parse(argc, argv);

        // Check if we should continue (false for --help, --version, or errors)
        if (!parser.should_continue()) {
            return parser.get_exit_code();
        }

        auto config = parser.get_config();
        auto command = parser.get_command_config();

        // With --json, stdout carries only the result; everything else goes to stderr
        std::optional<utils::ScopedStreamRedirect> log_redirect;
        if (command.json_output) {
            log_redirect.emplace(std::cout, std::cerr);
            g_result_out = &log_redirect->original();
        }

        if (config.log_level == "debug" || config.log_level == "trace") {
            std::cout << "steward " << STEWARD_VERSION_STRING << std::endl;
            std::cout << "  API URL: " << config.api_url << std::endl;
            std::cout << "  Log level: " << config.log_level << std::endl;
            std::cout << "  Stall timeout: " << config.stall_timeout_seconds << "s" << std::endl;
            std::cout << "  Max attempts: " << config.max_attempts << std::endl;
            if (!config.catalog_path.empty()) {
                std::cout << "  Catalog: " << config.catalog_path << std::endl;
            }
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        Services services(config);

        if (command.command == "list") {
            return execute_list_command(services, command);
        } else if (command.command == "pull") {
            return execute_pull_command(services, command);
        } else if (command.command == "delete") {
            return execute_delete_command(services, command);
        } else if (command.command == "run") {
            return execute_run_command(services, command);
        } else if (command.command == "show") {
            return execute_show_command(services, command);
        } else if (command.command == "status") {
            return execute_status_command(services, config);
        }

        std::cerr << "Unknown command: " << command.command << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
