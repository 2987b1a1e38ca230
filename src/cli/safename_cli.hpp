#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/models.hpp>
#include <managers/engine_factory.hpp>

struct CliOptions {
    std::string path;
    bool dry_run = false;
    bool recursive = false;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
    std::optional<std::string> rclone;     // overrides config `rclone`
    std::optional<std::string> log_file;   // overrides config `log_file`
};

// Parse argv (without the program name). Errors are usage errors.
Result<CliOptions> parse_args(const std::vector<std::string>& args);

// Config values with CLI flags layered on top.
EngineOptions make_engine_options(const Config& config, const CliOptions& opts);

class SafenameCLI {
public:
    // Runs one batch and returns the process exit code.
    // Throws ConfigurationError when the target fails pre-flight.
    int run(const CliOptions& opts);

private:
    void print_result(const RenameResult& r, bool verbose) const;
    void print_summary(const OperationStats& stats, double elapsed,
                       bool dry_run, bool cancelled) const;
};

void print_usage();
