// Command-line and interactive front end.
#pragma once

#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

#include "BreakCalculator.hpp"
#include "Config.hpp"
#include "ForceModel.hpp"

// Malformed command line or interactive input.
class CliError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class RunMode {
    Single,
    Matrix,
    AllCsv,
    Interactive,
    Help
};

struct CliOptions {
    RunMode mode{RunMode::Single};
    std::optional<std::string> material;
    int layers{1};
    bool pegged{false};
    std::optional<double> spacingMm;
    bool pencil{false};
    std::string csvPath{config::kDefaultCsvPath};
    std::optional<std::string> plotPath;
    std::optional<std::string> materialsPath;
    PhysicalConstants constants;
    std::optional<std::string> logFile;
    bool verbose{false};
};

void printUsage(std::ostream& out, const char* binary);

// No arguments selects interactive mode. Throws CliError.
CliOptions parseCliOptions(int argc, const char* const* argv);

// Pegged spacing: --spacing, else --pencil, else penny.
StackConfiguration resolveConfiguration(const CliOptions& options);

// Runs a non-interactive mode and returns the process exit status.
int runCli(const CliOptions& options, const BreakCalculator& calculator, std::ostream& out);

// Prompt-driven session; invalid entries are asked again.
int runInteractive(const BreakCalculator& calculator, const PhysicalConstants& constants,
                   std::istream& in, std::ostream& out);
