// breakcalc entry point.
#include <filesystem>
#include <iostream>

#include "BreakCalculator.hpp"
#include "BreakError.hpp"
#include "Cli.hpp"
#include "Logger.hpp"
#include "MaterialLoader.hpp"

namespace {
MaterialCatalog buildCatalog(const CliOptions& options) {
    MaterialCatalog catalog;
    MaterialFileLoader loader;
    if (options.materialsPath) {
        loader.applyTo(catalog, *options.materialsPath);
    } else if (std::filesystem::exists(config::kDefaultMaterialsPath)) {
        loader.applyTo(catalog, config::kDefaultMaterialsPath);
    }
    return catalog;
}
}  // namespace

int main(int argc, char** argv) {
    Logger& logger = Logger::getInstance();

    CliOptions options;
    try {
        options = parseCliOptions(argc, argv);
    } catch (const CliError& e) {
        logger.error(e.what());
        printUsage(std::cerr, argv[0]);
        return 2;
    }

    if (options.logFile) {
        logger.init(*options.logFile);
    }
    if (options.verbose) {
        logger.setConsoleLevel(LogLevel::Info);
    }

    try {
        if (options.mode == RunMode::Help) {
            printUsage(std::cout, argv[0]);
            return 0;
        }

        BreakCalculator calculator(buildCatalog(options));
        if (options.mode == RunMode::Interactive) {
            return runInteractive(calculator, options.constants, std::cin, std::cout);
        }
        return runCli(options, calculator, std::cout);
    } catch (const BreakError& e) {
        logger.error(std::string(toString(e.kind())) + ": " + e.what());
        return 1;
    } catch (const CliError& e) {
        logger.error(e.what());
        return 2;
    } catch (const std::exception& e) {
        logger.error(e.what());
        return 1;
    }
}
