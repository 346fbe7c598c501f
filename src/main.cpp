#include <iostream>
#include <memory>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

// Core components
#include "core/pow/pow.hpp"
#include "core/pow/pow_worker.hpp"

// Client protocols
#include "client/api_client.hpp"
#include "client/auth_protocol.hpp"
#include "client/registration.hpp"
#include "client/session_manager.hpp"

// Transport and storage
#include "network/http_client.hpp"
#include "storage/token_store.hpp"

// Utilities
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "powgate/common.hpp"

namespace {

// Set by SIGINT/SIGTERM, polled by long-running commands
std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

void print_usage() {
    std::cerr
        << "powgate " << POWGATE_VERSION_STRING << "\n"
        << "Usage: powgate [--config <file>] [--verbose] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  register <username> <password> [--login]  Solve a challenge and create an account\n"
        << "  login <username> <password>               Log in and store the session token\n"
        << "  logout                                    Forget the stored session token\n"
        << "  whoami                                    Show the user of the stored session\n"
        << "  solve <challenge> <difficulty>            Solve a puzzle locally\n"
        << "  benchmark [milliseconds]                  Measure the local hash rate\n";
}

/**
 * Services wired from the client settings
 */
struct ClientContext {
    powgate::utils::ClientSettings settings;
    std::shared_ptr<powgate::client::ApiClient> api;
    std::shared_ptr<powgate::client::AuthProtocol> auth;
    std::shared_ptr<powgate::storage::TokenStore> store;
    std::unique_ptr<powgate::client::SessionManager> session;

    explicit ClientContext(const powgate::utils::ClientSettings& client_settings)
        : settings(client_settings) {
        auto transport = std::make_shared<powgate::network::HttpClient>(
            settings.server_url, settings.request_timeout_ms);

        powgate::client::ApiEndpoints endpoints;
        endpoints.login_path = settings.login_path;
        endpoints.profile_path = settings.profile_path;

        api = std::make_shared<powgate::client::ApiClient>(transport, endpoints);
        auth = std::make_shared<powgate::client::AuthProtocol>(api);
        store = std::make_shared<powgate::storage::FileTokenStore>(
            std::filesystem::path(settings.data_dir) / "session");
        session = std::make_unique<powgate::client::SessionManager>(auth, store);
    }
};

int print_login_result(const powgate::Result<powgate::client::Profile>& result) {
    if (result.is_err()) {
        std::cerr << "Login failed: "
                  << powgate::user_message(result.error(), "Unknown error") << std::endl;
        return 1;
    }
    std::cout << "Logged in as " << result.value().username << std::endl;
    return 0;
}

int cmd_register(ClientContext& ctx, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        print_usage();
        return 1;
    }
    const std::string& username = args[0];
    const std::string& password = args[1];
    bool login_after = args.size() > 2 && args[2] == "--login";

    powgate::client::RegistrationFlow flow(ctx.api);

    std::atomic<uint64_t> attempts{0};
    flow.set_progress_callback([&attempts](uint64_t count) {
        attempts = count;
    });
    flow.set_state_callback([](powgate::client::RegistrationState state) {
        POWGATE_LOG_INFO("Registration: {}", powgate::client::registration_state_to_string(state));
    });

    if (!flow.submit(username, password)) {
        std::cerr << "Registration already in progress" << std::endl;
        return 1;
    }

    // Keep the interaction thread free: report progress and honour Ctrl+C
    uint64_t reported = 0;
    while (flow.is_busy()) {
        if (g_interrupted) {
            flow.cancel();
        }

        uint64_t current = attempts.load();
        if (current >= reported + 100000) {
            std::cerr << "  ... " << current << " attempts" << std::endl;
            reported = current;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    auto outcome = flow.wait();
    flow.acknowledge();

    if (!outcome.success) {
        std::cerr << outcome.message << std::endl;
        return 1;
    }

    std::cout << outcome.message << std::endl;
    if (outcome.solution) {
        std::cout << "  nonce: " << outcome.solution->nonce << "\n"
                  << "  hash:  " << outcome.solution->digest << "\n"
                  << "  time:  " << outcome.solution->compute_time_ms << " ms" << std::endl;
    }

    if (login_after) {
        return print_login_result(ctx.session->login(username, password));
    }
    return 0;
}

int cmd_login(ClientContext& ctx, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        print_usage();
        return 1;
    }
    return print_login_result(ctx.session->login(args[0], args[1]));
}

int cmd_logout(ClientContext& ctx) {
    ctx.session->logout();
    std::cout << "Logged out" << std::endl;
    return 0;
}

int cmd_whoami(ClientContext& ctx) {
    auto state = ctx.session->restore();
    if (state != powgate::client::SessionState::AUTHENTICATED) {
        std::cout << "anonymous" << std::endl;
        return 0;
    }

    auto profile = ctx.session->profile();
    std::cout << profile->username << std::endl;
    for (auto it = profile->fields.begin(); it != profile->fields.end(); ++it) {
        std::cout << "  " << it.key() << ": " << it.value().dump() << std::endl;
    }
    return 0;
}

int cmd_solve(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        print_usage();
        return 1;
    }

    powgate::core::PowPuzzle puzzle;
    puzzle.challenge = args[0];
    try {
        unsigned long difficulty = std::stoul(args[1]);
        if (difficulty > powgate::core::ProofOfWork::MAX_DIFFICULTY) {
            std::cerr << "Difficulty must be at most "
                      << powgate::core::ProofOfWork::MAX_DIFFICULTY << std::endl;
            return 1;
        }
        puzzle.difficulty = static_cast<uint32_t>(difficulty);
    } catch (const std::exception&) {
        std::cerr << "Invalid difficulty: " << args[1] << std::endl;
        return 1;
    }

    powgate::core::PowWorker worker;
    worker.start(puzzle);

    while (worker.is_running()) {
        if (g_interrupted) {
            worker.cancel();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    auto solution = worker.wait();
    if (!solution) {
        std::cerr << "Cancelled after " << worker.attempts() << " attempts" << std::endl;
        return 1;
    }

    std::cout << "nonce:    " << solution->nonce << "\n"
              << "hash:     " << solution->digest << "\n"
              << "attempts: " << solution->attempts << "\n"
              << "time:     " << solution->compute_time_ms << " ms" << std::endl;
    return 0;
}

int cmd_benchmark(const std::vector<std::string>& args) {
    uint64_t duration_ms = 1000;
    if (!args.empty()) {
        try {
            duration_ms = std::stoull(args[0]);
        } catch (const std::exception&) {
            std::cerr << "Invalid duration: " << args[0] << std::endl;
            return 1;
        }
    }

    uint64_t rate = powgate::core::ProofOfWork::benchmark(duration_ms);
    std::cout << rate << " hashes/sec" << std::endl;

    // Rough time to solve at common difficulties
    for (uint32_t difficulty = 1; difficulty <= 6; ++difficulty) {
        double seconds = powgate::core::ProofOfWork::expected_attempts(difficulty) /
                         static_cast<double>(rate == 0 ? 1 : rate);
        std::cout << "  difficulty " << difficulty << ": ~" << seconds << " s" << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::vector<std::string> args(argv + 1, argv + argc);

        // Determine config file path
        std::string config_path = "powgate.conf";
        bool explicit_config = false;
        bool verbose = false;
        while (!args.empty()) {
            if (args.size() >= 2 && args[0] == "--config") {
                config_path = args[1];
                explicit_config = true;
                args.erase(args.begin(), args.begin() + 2);
            } else if (args[0] == "--verbose" || args[0] == "-v") {
                verbose = true;
                args.erase(args.begin());
            } else {
                break;
            }
        }

        if (args.empty() || args[0] == "--help" || args[0] == "-h") {
            print_usage();
            return args.empty() ? 1 : 0;
        }

        // Load configuration (or use defaults if file doesn't exist)
        powgate::utils::Config config = powgate::utils::Config::defaults();
        if (std::filesystem::exists(config_path)) {
            config = powgate::utils::Config::load_from_file(config_path);
        } else if (explicit_config) {
            std::cerr << "Config file not found: " << config_path << std::endl;
            return 1;
        }

        auto settings = powgate::utils::ClientSettings::from_config(config);
        powgate::utils::Logger::init(settings.log);
        if (verbose) {
            powgate::utils::Logger::set_level("debug");
        }

        const std::string command = args[0];
        std::vector<std::string> command_args(args.begin() + 1, args.end());

        if (command == "solve") {
            return cmd_solve(command_args);
        }
        if (command == "benchmark") {
            return cmd_benchmark(command_args);
        }

        ClientContext ctx(settings);
        POWGATE_LOG_DEBUG("Using server {}", settings.server_url);

        if (command == "register") {
            return cmd_register(ctx, command_args);
        }
        if (command == "login") {
            return cmd_login(ctx, command_args);
        }
        if (command == "logout") {
            return cmd_logout(ctx);
        }
        if (command == "whoami") {
            return cmd_whoami(ctx);
        }

        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage();
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
