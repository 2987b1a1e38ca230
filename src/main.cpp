#include <iostream>
#include <vector>
#include <string>
#include "cli/safename_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <managers/rename_engine.hpp>

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        auto parsed = parse_args(args);
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            std::cout << theme::step("Usage: safename [-n] [-r] [-v] [--rclone <path>] [--log-file <path>] <path>");
            return EXIT_USAGE;
        }

        const auto& opts = parsed.value;
        if (opts.show_version) {
            std::cout << theme::color::HEADING << theme::color::BOLD << "safename"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << SAFENAME_VERSION << theme::color::RESET << "\n";
            return EXIT_OK;
        }
        if (opts.show_help) {
            print_usage();
            return EXIT_OK;
        }

        SafenameCLI cli;
        return cli.run(opts);
    } catch (const ConfigurationError& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_BATCH_ERRORS;
    }
}
