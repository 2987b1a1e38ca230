#include "safename_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <iostream>
#include <atomic>
#include <chrono>
#include <csignal>

// Engine cancelled by Ctrl-C. Only set while a batch is running.
static std::atomic<RenameEngine*> g_active_engine{nullptr};

extern "C" void handle_sigint(int) {
    RenameEngine* engine = g_active_engine.load();
    if (engine) engine->cancel();
    // A second Ctrl-C terminates immediately
    std::signal(SIGINT, SIG_DFL);
}

// ── Argument parsing ────────────────────────────────────────

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;
    bool only_positional = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];

        if (!only_positional && a == "--") {
            only_positional = true;
        } else if (!only_positional && (a == "-h" || a == "--help")) {
            opts.show_help = true;
        } else if (!only_positional && a == "--version") {
            opts.show_version = true;
        } else if (!only_positional && (a == "-n" || a == "--dry-run")) {
            opts.dry_run = true;
        } else if (!only_positional && (a == "-r" || a == "--recursive")) {
            opts.recursive = true;
        } else if (!only_positional && (a == "-v" || a == "--verbose")) {
            opts.verbose = true;
        } else if (!only_positional && (a == "--rclone" || a == "--log-file")) {
            if (i + 1 >= args.size()) {
                return Result<CliOptions>::Err(fmt::format("{} requires a value", a));
            }
            if (a == "--rclone") opts.rclone = args[++i];
            else opts.log_file = args[++i];
        } else if (!only_positional && a.size() > 1 && a[0] == '-') {
            return Result<CliOptions>::Err("Unknown option: " + a);
        } else {
            if (!opts.path.empty()) {
                return Result<CliOptions>::Err("Only one path may be given (got '" +
                                               opts.path + "' and '" + a + "')");
            }
            opts.path = a;
        }
    }

    if (opts.path.empty() && !opts.show_help && !opts.show_version) {
        return Result<CliOptions>::Err("Missing path");
    }
    return Result<CliOptions>::Ok(opts);
}

EngineOptions make_engine_options(const Config& config, const CliOptions& opts) {
    EngineOptions eo;
    eo.rclone_binary = opts.rclone ? *opts.rclone : config.rclone();
    eo.local_hash = config.local_hash();
    eo.remote_hash = config.remote_hash();
    eo.hash_chunk_size = config.hash_chunk_size();
    eo.exclude = config.exclude();
    return eo;
}

// ── Batch ───────────────────────────────────────────────────

int SafenameCLI::run(const CliOptions& opts) {
    auto config = Config::load_global();
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return EXIT_USAGE;
    }

    set_safename_log_path(opts.log_file ? *opts.log_file : config.value.log_file());
    safename_log(fmt::format("cli: {} path={} dry_run={} recursive={}",
                             SAFENAME_VERSION, opts.path, opts.dry_run, opts.recursive));

    auto created = EngineFactory::create_from_path(opts.path, make_engine_options(config.value, opts));
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return EXIT_USAGE;
    }
    auto engine = std::move(created.value);

    std::cout << theme::banner(SAFENAME_VERSION);
    std::cout << theme::section(opts.dry_run ? "Dry run" : "Renaming");
    std::cout << theme::kv("target", opts.path);
    std::cout << theme::kv("backend", engine->operations().backend_name());
    std::cout << theme::kv("hash", engine->hasher().algorithm_name());
    std::cout << theme::kv("started", format_timestamp(now_iso()));
    std::cout << "\n";

    if (opts.verbose) {
        engine->set_status_callback([](const std::string& dir) {
            std::cout << theme::log(dir);
        });
    }

    auto t0 = std::chrono::steady_clock::now();
    g_active_engine.store(engine.get());
    std::signal(SIGINT, handle_sigint);

    std::vector<RenameResult> results;
    try {
        results = engine->rename_directory(opts.path, opts.recursive, opts.dry_run);
    } catch (...) {
        std::signal(SIGINT, SIG_DFL);
        g_active_engine.store(nullptr);
        throw;
    }

    std::signal(SIGINT, SIG_DFL);
    g_active_engine.store(nullptr);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    for (const auto& r : results) print_result(r, opts.verbose);

    auto stats = RenameEngine::stats(results);
    print_summary(stats, elapsed, opts.dry_run, engine->cancelled());
    return stats.has_errors() ? EXIT_BATCH_ERRORS : EXIT_OK;
}

void SafenameCLI::print_result(const RenameResult& r, bool verbose) const {
    std::string to = r.new_name().value_or("");
    switch (r.outcome()) {
        case RenameOutcome::Renamed:
            if (verbose) std::cout << theme::ok(r.original_name() + " -> " + to);
            break;
        case RenameOutcome::WouldRename:
            if (verbose) std::cout << theme::info(r.original_name() + " -> " + to);
            break;
        case RenameOutcome::AlreadySafe:
            if (verbose) std::cout << theme::log(r.original_name());
            break;
        case RenameOutcome::Excluded:
            if (verbose) std::cout << theme::log(r.original_name() + " (excluded)");
            break;
        case RenameOutcome::CollisionMatch:
            if (verbose) {
                std::cout << theme::step(r.original_name() + " = " + to +
                                         theme::dim("  identical, left in place"));
            }
            break;
        case RenameOutcome::CollisionConflict:
        case RenameOutcome::Failed:
            std::cout << theme::fail(r.original_path() + ": " + r.error().value_or("failed"));
            break;
        case RenameOutcome::RenamedUnaudited:
            std::cout << theme::warn(r.original_name() + " -> " + to + ": " +
                                     r.error().value_or("not recorded"));
            break;
    }
}

void SafenameCLI::print_summary(const OperationStats& stats, double elapsed,
                                bool dry_run, bool cancelled) const {
    std::cout << theme::section("Summary");
    std::cout << theme::kv("files", std::to_string(stats.total()));
    if (dry_run) {
        std::cout << theme::kv("would rename", std::to_string(stats.would_rename()));
    } else {
        std::cout << theme::kv("renamed", std::to_string(stats.renamed()));
    }
    std::cout << theme::kv("already safe", std::to_string(stats.skipped_already_safe()));
    if (stats.skipped_excluded() > 0)
        std::cout << theme::kv("excluded", std::to_string(stats.skipped_excluded()));
    if (stats.collision_match() > 0)
        std::cout << theme::kv("duplicates", std::to_string(stats.collision_match()));
    if (stats.collision_conflict() > 0)
        std::cout << theme::kv("conflicts", theme::red(std::to_string(stats.collision_conflict())));
    if (stats.errored() > 0)
        std::cout << theme::kv("errors", theme::red(std::to_string(stats.errored())));
    if (stats.unaudited() > 0)
        std::cout << theme::kv("unaudited", theme::yellow(std::to_string(stats.unaudited())));
    std::cout << theme::kv("elapsed", format_elapsed(elapsed));
    std::cout << "\n";

    if (cancelled) {
        std::cout << theme::warn("Interrupted; completed renames were recorded");
    }
    if (stats.has_errors()) {
        std::cout << theme::step(fmt::format("Details in {}", safename_log_path()));
    } else if (dry_run) {
        std::cout << theme::step("Nothing was changed. Run without --dry-run to apply.");
    }
    std::cout << "\n";
}

// ── Usage ───────────────────────────────────────────────────

void print_usage() {
    std::cout << theme::banner(SAFENAME_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::ACCENT << "    safename "
              << theme::color::RESET << theme::color::HEADING << "[options] <path>"
              << theme::color::RESET << "\n\n";
    std::cout << theme::color::DIM
              << "    <path> is a local directory, a UNC share, or remote:dir for rclone\n"
              << theme::color::RESET << "\n";
    std::cout << theme::color::ACCENT << "    -n, --dry-run"
              << theme::color::RESET << theme::color::DIM
              << "         Show what would be renamed" << theme::color::RESET << "\n";
    std::cout << theme::color::ACCENT << "    -r, --recursive"
              << theme::color::RESET << theme::color::DIM
              << "       Descend into subdirectories" << theme::color::RESET << "\n";
    std::cout << theme::color::ACCENT << "    -v, --verbose"
              << theme::color::RESET << theme::color::DIM
              << "         One line per file" << theme::color::RESET << "\n";
    std::cout << theme::color::ACCENT << "    --rclone "
              << theme::color::RESET << theme::color::HEADING << "<path>"
              << theme::color::RESET << theme::color::DIM
              << "       rclone binary to use" << theme::color::RESET << "\n";
    std::cout << theme::color::ACCENT << "    --log-file "
              << theme::color::RESET << theme::color::HEADING << "<path>"
              << theme::color::RESET << theme::color::DIM
              << "     Debug log location" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    safename --version    Show version\n"
              << "    safename --help       Show this help\n"
              << "    Config: " << get_global_config_path().string()
              << theme::color::RESET << "\n\n";
}
