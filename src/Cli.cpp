// Argument parsing, interactive prompts and mode dispatch.
#include "Cli.hpp"

#include <args.hxx>

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <sstream>
#include <unordered_map>
#include <vector>

#include "CsvExport.hpp"
#include "Logger.hpp"
#include "PlotRenderer.hpp"
#include "Report.hpp"

namespace {
std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::optional<double> parseDouble(const std::string& token) {
    try {
        size_t pos = 0;
        double value = std::stod(token, &pos);
        if (pos != token.size()) return std::nullopt;
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<int> parseInt(const std::string& token) {
    try {
        size_t pos = 0;
        int value = std::stoi(token, &pos);
        if (pos != token.size()) return std::nullopt;
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

const std::unordered_map<std::string, bool> kConfigurationNames{{"pegged", true}, {"unpegged", false}};

// --spacing accepts a preset name or a millimetre value.
struct SpacingReader {
    bool operator()(const std::string& name, const std::string& value, double& destination) {
        if (auto preset = spacingPreset(value)) {
            destination = *preset;
            return true;
        }
        auto parsed = parseDouble(value);
        if (!parsed) {
            throw args::ParseError("Argument '" + name + "' expects millimetres, penny or pencil, got: " + value);
        }
        destination = *parsed;
        return true;
    }
};

// Reads one trimmed line; running out of input ends the session.
std::string promptLine(std::istream& in, std::ostream& out, const std::string& text) {
    out << text << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        throw CliError("Input ended before the session was complete");
    }
    return trim(line);
}

// 1-based menu choice; an empty answer takes defaultChoice when there is one.
int promptChoice(std::istream& in, std::ostream& out, const std::string& text, int count,
                 std::optional<int> defaultChoice = std::nullopt) {
    while (true) {
        std::string answer = promptLine(in, out, text);
        if (answer.empty() && defaultChoice) {
            return *defaultChoice;
        }
        auto choice = parseInt(answer);
        if (choice && *choice >= 1 && *choice <= count) {
            return *choice;
        }
        out << "Invalid choice. Please enter 1-" << count << ".\n";
    }
}

void renderPlotFor(const CliOptions& options, const BreakCalculator& calculator,
                   const StackConfiguration& configuration) {
    StackConfiguration pegged = isPegged(configuration) ? configuration : StackConfiguration{Pegged{}};
    std::vector<PlotSeries> series;
    series.push_back({"unpegged",
                      calculator.evaluateMatrix(*options.material, config::kMatrixFirstLayer,
                                                config::kMatrixLastLayer, Unpegged{}, options.constants),
                      sf::Color(40, 90, 200)});

    std::ostringstream label;
    label << "pegged (" << std::get<Pegged>(pegged).spacingMm << " mm)";
    series.push_back({label.str(),
                      calculator.evaluateMatrix(*options.material, config::kMatrixFirstLayer,
                                                config::kMatrixLastLayer, pegged, options.constants),
                      sf::Color(220, 120, 30)});

    if (!renderForcePlot(*options.plotPath, series, "Breaking force: " + *options.material)) {
        throw std::runtime_error("Plot could not be written to " + *options.plotPath);
    }
}
}  // namespace

void printUsage(std::ostream& out, const char* binary) {
    out << "Usage: " << binary
        << " [--material NAME] [--layers N] [--config {pegged|unpegged}]\n"
        << "             [--spacing MM|penny|pencil] [--pencil] [--matrix] [--all-csv FILE]\n"
        << "             [--plot FILE] [--materials FILE] [--impact-time S] [--contact-area IN2]\n"
        << "             [--exponent K] [--floor-fraction F] [--log-file FILE] [--verbose] [--help]\n"
        << "Run without arguments for interactive mode.\n"
        << "Without --materials, ./" << config::kDefaultMaterialsPath << " is loaded when present;\n"
        << "see data/materials.example.json for the override format.\n";
}

CliOptions parseCliOptions(int argc, const char* const* argv) {
    CliOptions options;
    if (argc <= 1) {
        options.mode = RunMode::Interactive;
        return options;
    }

    args::ArgumentParser parser("Martial arts breaking force calculator",
                                "Run without arguments for interactive mode.");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> material(parser, "name", "Material to evaluate", {"material"});
    args::ValueFlag<int> layers(parser, "n", "Number of stacked layers (default: 1)", {"layers"});
    args::MapFlag<std::string, bool> stacking(parser, "config", "Stack configuration: pegged or unpegged",
                                              {"config"}, kConfigurationNames);
    args::ValueFlag<double, SpacingReader> spacing(parser, "mm", "Pegged spacing in mm, or penny/pencil",
                                                   {"spacing"});
    args::Flag pencil(parser, "pencil", "Use pencil spacing when pegged", {"pencil"});
    args::Flag matrix(parser, "matrix", "Print the 1-10 layer matrix", {"matrix"});
    args::ValueFlag<std::string> allCsv(parser, "file", "Write the CSV matrix for all materials", {"all-csv"});
    args::ValueFlag<std::string> plot(parser, "file", "Render a force vs. layers PNG", {"plot"});
    args::ValueFlag<std::string> materials(parser, "file", "Material override JSON", {"materials"});
    args::ValueFlag<double> impactTime(parser, "s", "Impact duration in seconds", {"impact-time"});
    args::ValueFlag<double> contactArea(parser, "in2", "Striking contact area in square inches",
                                        {"contact-area"});
    args::ValueFlag<double> exponent(parser, "k", "Flexible unpegged scaling exponent", {"exponent"});
    args::ValueFlag<double> floorFraction(parser, "f", "Pegged floor as a fraction of the base force",
                                          {"floor-fraction"});
    args::ValueFlag<std::string> logFile(parser, "file", "Also write the run log here", {"log-file"});
    args::Flag verbose(parser, "verbose", "Echo info log lines to stderr", {"verbose"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        options.mode = RunMode::Help;
        return options;
    } catch (const args::ParseError& e) {
        throw CliError(e.what());
    } catch (const args::ValidationError& e) {
        throw CliError(e.what());
    }

    if (material) options.material = args::get(material);
    if (layers) options.layers = args::get(layers);
    if (stacking) options.pegged = args::get(stacking);
    if (spacing) options.spacingMm = args::get(spacing);
    options.pencil = args::get(pencil);
    if (plot) options.plotPath = args::get(plot);
    if (materials) options.materialsPath = args::get(materials);
    if (impactTime) options.constants.impactTime = args::get(impactTime);
    if (contactArea) options.constants.contactArea = args::get(contactArea);
    if (exponent) options.constants.scalingExponent = args::get(exponent);
    if (floorFraction) options.constants.peggedFloorFraction = args::get(floorFraction);
    if (logFile) options.logFile = args::get(logFile);
    options.verbose = args::get(verbose);

    if (allCsv) {
        options.csvPath = args::get(allCsv);
        options.mode = RunMode::AllCsv;
    } else if (matrix) {
        options.mode = RunMode::Matrix;
    } else {
        options.mode = RunMode::Single;
    }
    return options;
}

StackConfiguration resolveConfiguration(const CliOptions& options) {
    if (!options.pegged) {
        return Unpegged{};
    }
    if (options.spacingMm) {
        return Pegged{*options.spacingMm};
    }
    if (options.pencil) {
        return Pegged{config::spacing_preset::kPencilMm};
    }
    return Pegged{config::spacing_preset::kPennyMm};
}

int runCli(const CliOptions& options, const BreakCalculator& calculator, std::ostream& out) {
    switch (options.mode) {
        case RunMode::Help:
            printUsage(out, "breakcalc");
            return 0;
        case RunMode::Interactive:
            throw CliError("Interactive mode needs an input stream");
        case RunMode::AllCsv:
            writeBreakingMatrixCsv(options.csvPath, calculator, options.constants);
            out << "CSV matrix written to " << options.csvPath << "\n";
            return 0;
        case RunMode::Single:
        case RunMode::Matrix:
            break;
    }

    if (!options.material) {
        throw CliError("--material is required unless --all-csv is given");
    }
    StackConfiguration configuration = resolveConfiguration(options);
    Logger::getInstance().info("Material " + *options.material + ", " + configurationName(configuration));

    if (options.mode == RunMode::Matrix) {
        auto results = calculator.evaluateMatrix(*options.material, config::kMatrixFirstLayer,
                                                 config::kMatrixLastLayer, configuration, options.constants);
        printMatrix(out, results, configuration);
    } else {
        BreakResult result = calculator.evaluate(*options.material, options.layers, configuration,
                                                 options.constants);
        if (result.advisory) {
            Logger::getInstance().warning(result.advisory->message());
        }
        printResult(out, result);
    }

    if (options.plotPath) {
        renderPlotFor(options, calculator, configuration);
        out << "Plot written to " << *options.plotPath << "\n";
    }
    return 0;
}

int runInteractive(const BreakCalculator& calculator, const PhysicalConstants& constants,
                   std::istream& in, std::ostream& out) {
    out << "Martial Arts Breaking Calculator\n";
    out << "This tool calculates force and PSI for breaking materials.\n";
    out << "Select mode:\n";
    out << "1. single calculation (default)\n";
    out << "2. matrix (1-10 layers)\n";
    out << "3. CSV matrix for all materials\n";
    int mode = promptChoice(in, out, "Enter number (1-3) [default 1]: ", 3, 1);

    if (mode == 3) {
        std::string filename = promptLine(in, out, std::string("Enter CSV filename [default: ") +
                                                       config::kDefaultCsvPath + "]: ");
        if (filename.empty()) filename = config::kDefaultCsvPath;
        writeBreakingMatrixCsv(filename, calculator, constants);
        out << "CSV matrix written to " << filename << "\n";
        return 0;
    }

    const std::vector<std::string>& names = calculator.catalog().menuOrder();
    out << "\nSelect material by number:\n";
    for (size_t i = 0; i < names.size(); ++i) {
        out << (i + 1) << ". " << names[i] << "\n";
    }
    int count = static_cast<int>(names.size());
    int materialChoice = promptChoice(in, out, "Enter number (1-" + std::to_string(count) + "): ", count);
    const std::string& material = names[static_cast<size_t>(materialChoice - 1)];

    out << "\nSelect configuration:\n";
    out << "1. pegged\n";
    out << "2. unpegged (default)\n";
    int configChoice = promptChoice(in, out, "Enter number (1-2) [default 2]: ", 2, 2);

    StackConfiguration configuration = Unpegged{};
    if (configChoice == 1) {
        out << "\nSelect spacing:\n";
        out << "1. penny (" << config::spacing_preset::kPennyMm << " mm, default)\n";
        out << "2. pencil (" << config::spacing_preset::kPencilMm << " mm)\n";
        out << "3. custom\n";
        int spacingChoice = promptChoice(in, out, "Enter number (1-3) [default 1]: ", 3, 1);
        double spacing = config::spacing_preset::kPennyMm;
        if (spacingChoice == 2) {
            spacing = config::spacing_preset::kPencilMm;
        } else if (spacingChoice == 3) {
            while (true) {
                auto custom = parseDouble(promptLine(in, out, "Enter custom spacing in mm: "));
                if (custom && *custom >= 0.0) {
                    spacing = *custom;
                    break;
                }
                out << "Invalid number. Please enter a non-negative value.\n";
            }
        }
        configuration = Pegged{spacing};
    }

    if (mode == 2) {
        auto results = calculator.evaluateMatrix(material, config::kMatrixFirstLayer, config::kMatrixLastLayer,
                                                 configuration, constants);
        printMatrix(out, results, configuration);
        return 0;
    }

    int layers = 1;
    while (true) {
        std::string answer = promptLine(in, out, "\nEnter number of layers [default: 1]: ");
        if (answer.empty()) break;
        auto parsed = parseInt(answer);
        if (parsed && *parsed >= 1) {
            layers = *parsed;
            break;
        }
        out << "Layers must be a whole number of at least 1.\n";
    }

    BreakResult result = calculator.evaluate(material, layers, configuration, constants);
    if (result.advisory) {
        Logger::getInstance().warning(result.advisory->message());
    }
    printResult(out, result);
    return 0;
}
