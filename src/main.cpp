/// @file src/main.cpp
/// @brief birkhoff CLI entry point.
///
/// Usage:
///   birkhoff --config <file>     Local geodesic between the configured endpoints
///   birkhoff --birkhoff <file>   Global Birkhoff curve shortening
///   birkhoff --help              Print usage

#include "birkhoff/config.hpp"
#include "birkhoff/curve_io.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/log.hpp"
#include "birkhoff/potential.hpp"
#include "birkhoff/simulation.hpp"

#include <fmt/core.h>

#include <csignal>
#include <memory>
#include <string>

namespace {

birkhoff::SimulationClient* g_client = nullptr;

extern "C" void on_interrupt(int) {
    if (g_client) g_client->cancel();
}

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  birkhoff --config <file>     Local geodesic between the configured endpoints\n"
        "  birkhoff --birkhoff <file>   Global Birkhoff curve shortening\n"
        "  birkhoff --help              Show this help\n"
        "\n"
        "Config format: one 'key = value' per line, '#' comments,\n"
        "vectors as comma-separated numbers, e.g.\n"
        "  total_energy = 2.0\n"
        "  endpoint_a   = -1.0, 0.3\n"
        "  endpoint_b   =  1.0, 0.3\n"
        "  potential    = harmonic\n"
    );
}

/// Load the configuration and build its oracle.
/// Returns nullptr after printing the problem.
std::unique_ptr<birkhoff::SimulationClient> make_client(const std::string& path) {
    std::string error;
    auto cfg = birkhoff::ConfigLoader::load_file(path, &error);
    if (!cfg) {
        fmt::print(stderr, "Error: {}: {}\n", path, error);
        return nullptr;
    }
    if (!birkhoff::log::set_level(cfg->log_level)) {
        fmt::print(stderr, "Error: unknown log_level '{}'\n", cfg->log_level);
        return nullptr;
    }

    auto oracle = birkhoff::make_potential(cfg->potential, cfg->potential_params,
                                           cfg->dimension());
    if (!oracle) {
        fmt::print(stderr, "Error: cannot build potential '{}' from {} parameters\n",
                   cfg->potential, cfg->potential_params.size());
        return nullptr;
    }
    return std::make_unique<birkhoff::SimulationClient>(std::move(*cfg), std::move(*oracle));
}

/// Returns 0 if the curve was written (or no output was configured), 1 otherwise.
int write_output(const birkhoff::GeodesicConfig& cfg,
                 const std::vector<birkhoff::Configuration>& nodes) {
    if (cfg.output.empty()) return 0;
    if (!birkhoff::write_curve_csv(cfg.output, nodes)) {
        fmt::print(stderr, "Error: cannot write '{}'\n", cfg.output);
        return 1;
    }
    fmt::print("Curve written to '{}'\n", cfg.output);
    return 0;
}

int status_code(birkhoff::RunStatus status) {
    switch (status) {
        case birkhoff::RunStatus::Converged: return 0;
        case birkhoff::RunStatus::Cancelled: return 130;
        case birkhoff::RunStatus::Failed:    return 2;
    }
    return 2;
}

int run_local(birkhoff::SimulationClient& client) {
    client.start();
    const auto result = client.run();
    client.shutdown();

    fmt::print("Status:      {} ({})\n", birkhoff::to_string(result.status), result.reason);
    fmt::print("Iterations:  {}\n", result.iterations);
    fmt::print("Functional:  {:.12g}\n", result.functional_value);
    fmt::print("Nodes:       {}\n", result.nodes.size());
    if (const auto* stats = client.pool_stats()) {
        fmt::print("Evaluations: {} requests, {} retries, {} discarded\n",
                   stats->requests_sent, stats->retries, stats->discarded_messages);
    }
    if (write_output(client.config(), result.nodes) != 0) return 1;
    return status_code(result.status);
}

int run_global(birkhoff::SimulationClient& client) {
    client.start();
    const auto result = client.run_birkhoff();
    client.shutdown();

    fmt::print("Status:      {} ({})\n", birkhoff::to_string(result.status), result.reason);
    fmt::print("Sweeps:      {}\n", result.sweeps);
    fmt::print("Movement:    {:.3e}\n", result.movement);
    fmt::print("Functional:  {:.12g}\n", result.functional_value);
    if (result.local_failures > 0) {
        fmt::print("Local solves kept unchanged: {}\n", result.local_failures);
    }
    if (write_output(client.config(), result.nodes) != 0) return 1;
    return status_code(result.status);
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--config" && mode != "--birkhoff") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }
    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a config file path\n", mode);
        print_usage();
        return 1;
    }

    try {
        auto client = make_client(argv[2]);
        if (!client) return 1;

        g_client = client.get();
        std::signal(SIGINT, on_interrupt);
        const int code = mode == "--config" ? run_local(*client) : run_global(*client);
        std::signal(SIGINT, SIG_DFL);
        g_client = nullptr;
        return code;
    } catch (const birkhoff::Error& e) {
        std::signal(SIGINT, SIG_DFL);
        g_client = nullptr;
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
