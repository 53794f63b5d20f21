#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"
#include "flowline/config/defaults.hpp"


namespace flowline::examples::cli::throughput {

    // -------------------------------------------------------------
    // Throughput example parameters
    // -------------------------------------------------------------
    struct Params {
        std::string mode               = "offer";
        std::uint64_t count            = 1'000'000;   // messages per producer
        std::uint32_t producers        = 2;
        std::uint32_t message_size     = 64;
        std::size_t buffer_size        = 10 * 1024 * 1024;
        std::size_t threads            = 3;
        std::size_t peek_block_size    = 64 * 1024;
        std::string config_path;
        std::string log_level          = "info";

        // Set when given explicitly on the command line
        bool buffer_size_set = false;
        bool threads_set     = false;

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Mode         : " << mode << "\n"
               << "  Producers    : " << producers << "\n"
               << "  Count        : " << count << " per producer\n"
               << "  Message size : " << message_size << " bytes\n"
               << "  Buffer size  : " << buffer_size << " bytes\n"
               << "  Threads      : " << threads << "\n";
            if (mode == "peek") {
                os << "  Peek block   : " << peek_block_size << " bytes\n";
            }
            if (!config_path.empty()) {
                os << "  Config       : " << config_path << "\n";
            }
            os << "  Log Level    : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};

        app.add_option("-m,--mode", params.mode, "Publication mode: offer | claim | peek")->check(mode_validator)->default_val(params.mode);
        app.add_option("-n,--count", params.count, "Messages per producer")->check(CLI::PositiveNumber)->default_val(params.count);
        app.add_option("-p,--producers", params.producers, "Producer actors")->check(CLI::Range(1u, 64u))->default_val(params.producers);
        app.add_option("--message-size", params.message_size, "Payload size in bytes (>= 8)")->check(CLI::Range(8u, 65536u))->default_val(params.message_size);
        auto* buffer_opt = app.add_option("-b,--buffer-size", params.buffer_size, "Ring buffer capacity in bytes")->check(buffer_size_validator)->default_val(params.buffer_size);
        auto* threads_opt = app.add_option("-t,--threads", params.threads, "Scheduler worker threads")->check(CLI::Range(std::size_t{1}, std::size_t{256}))->default_val(params.threads);
        app.add_option("--peek-block", params.peek_block_size, "Max block length in peek mode")->check(CLI::PositiveNumber)->default_val(params.peek_block_size);
        app.add_option("-c,--config", params.config_path, "JSON runtime configuration")->check(CLI::ExistingFile);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

        app.footer(
            "Producers publish sequenced payloads, one consumer verifies them.\n"
            "Per-stream XXH64 chains of produced and consumed payloads must match."
        );

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }

        params.buffer_size_set = buffer_opt->count() > 0;
        params.threads_set = threads_opt->count() > 0;

        set_log_level(params.log_level);
        return params;
    }

} // namespace flowline::examples::cli::throughput
