#include "config.hpp"
#include "console.hpp"
#include "confirmation.hpp"
#include "editor_paths.hpp"
#include "errors.hpp"
#include "lmstudio_client.hpp"
#include "model_config.hpp"
#include "proxy_server.hpp"
#include "settings_updater.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace lmcfg;

// ========== Signal Handling ==========

static ProxyServer* g_proxy = nullptr;  // Running proxy, stopped on Ctrl+C.

// Handles SIGINT and SIGTERM by ending the proxy's accept loop.
void signal_handler(int) {
    if (g_proxy) {
        g_proxy->stop();
    }
}

// ========== Error Reporting ==========

// Prints the hints shown when nothing is listening at the LM Studio URL.
static void print_connect_help(Console& console, const std::string& lmstudio_url) {
    console.print_error("Error: Could not connect to LM Studio at " + lmstudio_url);
    console.print_error("");
    console.print_error("Please ensure:");
    console.print_error("  1. LM Studio is running");
    console.print_error("  2. Local server is started in LM Studio");
    console.print_error("  3. Server is listening on the correct port");
    console.print_error("");
    console.print_error("If LM Studio is running on a different port, use:");
    console.print_error("  --lmstudio-url http://localhost:PORT");
}

// ========== Serve Mode ==========

// Runs the compatibility proxy until interrupted.
static int run_proxy(Console& console, const ProxyOptions& options) {
    ProxyServer proxy(console, options);
    int port = proxy.bind();
    if (port < 0) {
        console.print_error("Error: Could not listen on " + proxy.address() + ":" + std::to_string(options.port));
        return EXIT_FAILURE_CODE;
    }

    console.print_header("Copilot-LMStudio Proxy");
    console.println("  Listening: http://" + proxy.address() + ":" + std::to_string(port));
    console.println("  Upstream:  " + options.upstream_url);
    if (options.cors) {
        console.println("  CORS:      enabled");
    }
    console.print_success("Proxy ready. Press Ctrl+C to stop.");

    g_proxy = &proxy;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    bool served = proxy.listen();
    g_proxy = nullptr;

    if (!served) {
        console.print_error("Error: Proxy stopped unexpectedly");
        return EXIT_FAILURE_CODE;
    }
    console.print_warning("Proxy stopped.");
    return EXIT_OK;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Generate GitHub Copilot custom OpenAI model settings from the models loaded in LM Studio"};
    app.footer("\nExamples:\n"
               "  lmcfg                                         Print the generated block to stdout\n"
               "  lmcfg --settings code                         Update the VS Code user settings\n"
               "  lmcfg --settings-path ~/.config/Code/User/settings.json\n"
               "  lmcfg --base-url http://studio.local:3000/v1 --lmstudio-url http://studio.local:1234\n"
               "  lmcfg serve --port 3000                       Run the proxy the generated settings point at\n");

    std::string base_url = DEFAULT_BASE_URL;
    app.add_option("--base-url", base_url,
                   "Base URL written into each model entry (where Copilot will connect)")
        ->capture_default_str();

    std::string lmstudio_url;
    app.add_option("--lmstudio-url", lmstudio_url,
                   "LM Studio URL to fetch models from (defaults to base-url host with port 1234)");

    std::string editor;
    auto* settings_opt = app.add_option("--settings", editor,
                                        "Use the default settings.json of an editor")
        ->check(CLI::IsMember(std::vector<std::string>{"code", "code-insiders"}, CLI::ignore_case));

    std::string settings_path;
    auto* settings_path_opt = app.add_option("--settings-path", settings_path,
                                             "Path to a settings.json file (prints to stdout if not provided)");
    settings_path_opt->excludes(settings_opt);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log requests and file operations to stderr");

    auto* serve = app.add_subcommand("serve", "Run the compatibility proxy between Copilot and LM Studio");
    ProxyOptions proxy_options;
    serve->add_option("-p,--port", proxy_options.port, "Port to listen on")
        ->capture_default_str()
        ->check(CLI::Range(1, 65535));
    serve->add_option("-l,--lmstudio-url", proxy_options.upstream_url, "LM Studio base URL")
        ->capture_default_str();
    serve->add_flag("-b,--bind-all", proxy_options.bind_all,
                    "Bind to all interfaces (0.0.0.0) instead of localhost only");
    serve->add_flag("-c,--cors", proxy_options.cors, "Enable CORS (Cross-Origin Resource Sharing)");
    serve->add_flag("-v,--verbose", verbose, "Log upstream traffic to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);
    Console console;

    if (*serve) {
        return run_proxy(console, proxy_options);
    }

    // Determine the settings path.
    std::optional<std::string> target_path;
    try {
        if (!editor.empty()) {
            auto kind = parse_editor_kind(editor);
            if (!kind) {
                console.print_error("Error: Unknown editor type: " + editor);
                return EXIT_FAILURE_CODE;
            }
            target_path = vscode_settings_path(*kind).string();
            console.println("Using settings file: " + *target_path);
        } else if (!settings_path.empty()) {
            target_path = expand_user_path(settings_path);
        }
    } catch (const std::exception& e) {
        console.print_error(std::string("Error: ") + e.what());
        return EXIT_FAILURE_CODE;
    }

    // An explicit LM Studio URL wins; otherwise derive it from base-url.
    std::string catalog_root;
    if (!lmstudio_url.empty()) {
        catalog_root = lmstudio_url;
        while (!catalog_root.empty() && catalog_root.back() == '/') {
            catalog_root.pop_back();
        }
    } else {
        catalog_root = derive_lmstudio_url(base_url);
    }
    verbose_log("MAIN", "Catalog: " + models_endpoint(catalog_root) + ", target url: " + base_url);

    try {
        LMStudioClient client(catalog_root);
        std::vector<ModelConfigEntry> entries = synthesize_config(client.list_models(), base_url);

        if (!target_path) {
            std::cout << render_standalone_config(entries) << std::endl;
            return EXIT_OK;
        }

        ConsoleConfirmation gate(console);
        SettingsUpdater updater(console, gate);
        UpdateResult result = updater.update(*target_path, entries);
        return result.outcome == UpdateOutcome::Cancelled ? EXIT_CANCELLED : EXIT_OK;

    } catch (const NetworkError& e) {
        if (e.connect_failed()) {
            print_connect_help(console, catalog_root);
        } else {
            console.print_error(std::string("Error: ") + e.what());
        }
        return EXIT_FAILURE_CODE;
    } catch (const CatalogFormatError& e) {
        console.print_error("Error: Unexpected response from " + models_endpoint(catalog_root) + ": " + e.what());
        return EXIT_FAILURE_CODE;
    } catch (const std::exception& e) {
        console.print_error(std::string("Error: ") + e.what());
        return EXIT_FAILURE_CODE;
    }
}
