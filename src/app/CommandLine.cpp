#include "app/CommandLine.hpp"

#include <functional>
#include <ostream>
#include <string>

namespace portsy::app {

namespace {

constexpr double kMaxTimeoutSeconds = 3600.0;

enum class ArgKind { None, String, Int, Double };

struct FlagSpec {
    std::vector<std::string> names;
    ArgKind kind;
    std::string valueName;
    std::string help;
    std::function<void(CliOptions&, const std::string&)> apply;
};

int toInt(const std::string& value, const std::string& flag) {
    try {
        size_t used = 0;
        int result = std::stoi(value, &used);
        if (used == value.size()) {
            return result;
        }
    } catch (const std::exception&) {
        // reported below
    }
    throw UsageError("Invalid integer for " + flag + ": '" + value + "'");
}

double toDouble(const std::string& value, const std::string& flag) {
    try {
        size_t used = 0;
        double result = std::stod(value, &used);
        if (used == value.size()) {
            return result;
        }
    } catch (const std::exception&) {
        // reported below
    }
    throw UsageError("Invalid number for " + flag + ": '" + value + "'");
}

const std::vector<FlagSpec>& flagSpecs() {
    static const std::vector<FlagSpec> specs = {
        {{"--preset"}, ArgKind::String, "NAME", "Scan a named preset (see --list-presets)",
         [](CliOptions& o, const std::string& v) { o.preset = v; }},
        {{"-s", "--start-port"}, ArgKind::Int, "PORT", "Start port (default: 3000)",
         [](CliOptions& o, const std::string& v) { o.startPort = toInt(v, "--start-port"); }},
        {{"-e", "--end-port"}, ArgKind::Int, "PORT", "End port (default: 9000)",
         [](CliOptions& o, const std::string& v) { o.endPort = toInt(v, "--end-port"); }},
        {{"-t", "--timeout"}, ArgKind::Double, "SECONDS", "Connect timeout (default: 0.5)",
         [](CliOptions& o, const std::string& v) {
             double seconds = toDouble(v, "--timeout");
             if (!(seconds > 0.0) || seconds > kMaxTimeoutSeconds) {
                 throw UsageError("--timeout must be between 0 and " +
                                  std::to_string(static_cast<int>(kMaxTimeoutSeconds)) +
                                  " seconds");
             }
             o.timeoutSeconds = seconds;
         }},
        {{"--workers"}, ArgKind::Int, "N", "Concurrent liveness probes (default: 100)",
         [](CliOptions& o, const std::string& v) {
             int workers = toInt(v, "--workers");
             if (workers < 1) {
                 throw UsageError("--workers must be at least 1");
             }
             o.workers = workers;
         }},
        {{"--comprehensive-routes"}, ArgKind::None, "", "Check all framework-specific routes",
         [](CliOptions& o, const std::string&) { o.comprehensiveRoutes = true; }},
        {{"--no-routes"}, ArgKind::None, "", "Skip route discovery",
         [](CliOptions& o, const std::string&) { o.noRoutes = true; }},
        {{"--no-duplicates"}, ArgKind::None, "", "Skip duplicate detection",
         [](CliOptions& o, const std::string&) { o.noDuplicates = true; }},
        {{"--include-unattributed"}, ArgKind::None, "", "Keep open ports with unknown owner",
         [](CliOptions& o, const std::string&) { o.includeUnattributed = true; }},
        {{"-j", "--json"}, ArgKind::String, "FILE", "Export results to a JSON file",
         [](CliOptions& o, const std::string& v) { o.jsonPath = v; }},
        {{"--list-presets"}, ArgKind::None, "", "List available scan presets and exit",
         [](CliOptions& o, const std::string&) { o.listPresets = true; }},
        {{"--config"}, ArgKind::String, "DIR", "Configuration directory",
         [](CliOptions& o, const std::string& v) { o.configDir = v; }},
        {{"-v", "--verbose"}, ArgKind::None, "", "Debug output on the console",
         [](CliOptions& o, const std::string&) { o.verbose = true; }},
        {{"-h", "--help"}, ArgKind::None, "", "Show this help",
         [](CliOptions& o, const std::string&) { o.help = true; }},
    };
    return specs;
}

const FlagSpec* findFlag(const std::string& name) {
    for (const auto& spec : flagSpecs()) {
        for (const auto& candidate : spec.names) {
            if (candidate == name) {
                return &spec;
            }
        }
    }
    return nullptr;
}

} // namespace

CliOptions parseCommandLine(const std::vector<std::string>& args) {
    CliOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string name = args[i];
        std::optional<std::string> inlineValue;

        // --flag=value
        if (name.rfind("--", 0) == 0) {
            if (auto eq = name.find('='); eq != std::string::npos) {
                inlineValue = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
        }

        const FlagSpec* spec = findFlag(name);
        if (!spec) {
            throw UsageError("Unknown option: " + args[i]);
        }

        if (spec->kind == ArgKind::None) {
            if (inlineValue) {
                throw UsageError("Option " + name + " takes no value");
            }
            spec->apply(options, "");
            continue;
        }

        if (inlineValue) {
            spec->apply(options, *inlineValue);
        } else if (i + 1 < args.size()) {
            spec->apply(options, args[++i]);
        } else {
            throw UsageError("Option " + name + " requires a value");
        }
    }

    return options;
}

CliOptions parseCommandLine(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseCommandLine(args);
}

void printUsage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [options]\n\n";
    out << "Finds local services listening on TCP ports, discovers their HTTP routes\n";
    out << "and reports likely duplicates.\n\n";
    out << "Options:\n";

    for (const auto& spec : flagSpecs()) {
        std::string line;
        for (const auto& name : spec.names) {
            if (!line.empty()) {
                line += ", ";
            }
            line += name;
        }
        if (!spec.valueName.empty()) {
            line += " " + spec.valueName;
        }

        out << "  " << line;
        for (size_t i = line.size(); i < 30; ++i) {
            out << ' ';
        }
        out << ' ' << spec.help << "\n";
    }
}

} // namespace portsy::app
