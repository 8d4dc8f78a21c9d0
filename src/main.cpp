#include "effmap/effmap.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

void printUsage() {
    std::cout << "Usage: motor_effmap --config PATH [--set KEY=VALUE]... [--output-dir DIR]"
                 " [--summary PATH] [--parallel-sheets] [--quiet] SHEET.csv [SHEET.csv...]\n";
}

void ensureDirectory(const std::filesystem::path& path) {
    if (!path.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
    }
}

struct SheetRunResult {
    std::optional<effmap::SheetReport> report;
    std::optional<effmap::SheetFailure> failure;
    bool outputError{false};
    std::string stdoutLog;
    std::string stderrLog;
};

/// Load, process and export one sheet. Console output is buffered in the result.
SheetRunResult processSheet(const std::string& sheetPath, const effmap::ConfigMap& config,
                            const std::filesystem::path& outputDir) {
    using namespace effmap;

    SheetRunResult result;
    std::ostringstream out;
    std::ostringstream err;
    const std::string sheetLabel = std::filesystem::path(sheetPath).stem().string();

    try {
        const DataTable table = loadCsvTable(sheetPath);
        EffMapSession session(config);
        session.load(table);
        out << sheetLabel << ": " << session.mapped().size() << " rows mapped, "
            << session.dataset().size() << " after normalisation, envelope "
            << fitKindName(session.envelope().kind()) << '\n';

        SheetReport report = session.run();
        for (const auto& warning : report.warnings) {
            err << sheetLabel << ": warning: " << warning << '\n';
        }

        const std::string base = report.baseName.empty() ? sheetLabel : report.baseName;
        try {
            const std::filesystem::path envelopePath = outputDir / (base + "_envelope.csv");
            write_csv_envelope(envelopePath.string(), session.envelope());

            for (const auto& channel : report.channels) {
                if (!channel.error.empty()) {
                    err << sheetLabel << ": " << channelLabel(channel.channel)
                        << ": configuration error: " << channel.error << '\n';
                    continue;
                }
                if (channel.grid) {
                    const std::filesystem::path mapPath =
                        outputDir / (base + "_" + channelLabel(channel.channel) + "_map.csv");
                    write_csv_grid(mapPath.string(), *channel.grid, channel.channel);
                    out << sheetLabel << ": wrote " << channelLabel(channel.channel) << " map ("
                        << channel.grid->nx << "x" << channel.grid->ny << ") to " << mapPath
                        << '\n';
                }
                if (channel.ratioRequested) {
                    out << sheetLabel << ": " << channelLabel(channel.channel) << " area ratios:";
                    for (const auto& entry : channel.ratios) {
                        out << ' ' << entry.level << "%=" << entry.ratio;
                    }
                    out << '\n';
                }
            }

            const std::filesystem::path ratioPath = outputDir / (base + "_area_ratio.csv");
            if (write_csv_area_ratios(ratioPath.string(), report)) {
                out << sheetLabel << ": wrote area ratio table to " << ratioPath << '\n';
            }
        } catch (const std::exception& ex) {
            err << sheetLabel << ": failed to write outputs: " << ex.what() << '\n';
            result.outputError = true;
        }
        result.report = std::move(report);
    } catch (const StructuralError& ex) {
        err << sheetLabel << ": skipped: " << ex.what() << '\n';
        result.failure = SheetFailure{sheetLabel, "structural", ex.what()};
    } catch (const ConfigError& ex) {
        err << sheetLabel << ": configuration error: " << ex.what() << '\n';
        result.failure = SheetFailure{sheetLabel, "config", ex.what()};
    } catch (const std::runtime_error& ex) {
        err << sheetLabel << ": failed: " << ex.what() << '\n';
        result.failure = SheetFailure{sheetLabel, "io", ex.what()};
    }

    result.stdoutLog = out.str();
    result.stderrLog = err.str();
    return result;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace effmap;

    std::optional<std::string> configPath;
    std::optional<std::string> summaryPath;
    std::string outputDir = ".";
    bool parallelSheetsFlag = false;
    bool quiet = false;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> sheets;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a path argument\n";
                printUsage();
                return 1;
            }
            configPath = std::string(argv[++i]);
        } else if (arg == "--set") {
            if (i + 1 >= argc) {
                std::cerr << "--set requires a KEY=VALUE argument\n";
                printUsage();
                return 1;
            }
            const std::string assignment = argv[++i];
            const auto eq = assignment.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "--set requires a KEY=VALUE argument, got '" << assignment << "'\n";
                return 1;
            }
            overrides.emplace_back(assignment.substr(0, eq), assignment.substr(eq + 1));
        } else if (arg == "--output-dir") {
            if (i + 1 >= argc) {
                std::cerr << "--output-dir requires a directory argument\n";
                printUsage();
                return 1;
            }
            outputDir = argv[++i];
        } else if (arg == "--summary") {
            if (i + 1 >= argc) {
                std::cerr << "--summary requires a path argument\n";
                printUsage();
                return 1;
            }
            summaryPath = std::string(argv[++i]);
        } else if (arg == "--parallel-sheets") {
            parallelSheetsFlag = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unrecognised argument: " << arg << "\n";
            printUsage();
            return 1;
        } else {
            sheets.push_back(arg);
        }
    }

    if (!configPath || sheets.empty()) {
        printUsage();
        return (configPath || !sheets.empty()) ? 1 : 0;
    }

    ConfigMap config;
    try {
        config = loadConfigFile(*configPath);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load configuration: " << ex.what() << "\n";
        return 1;
    }
    for (const auto& [key, value] : overrides) {
        config[key] = value;
    }

    const std::filesystem::path outDir(outputDir);
    ensureDirectory(outDir);

    std::size_t threadCount = 1;
    if (parallelSheetsFlag && sheets.size() > 1) {
        const unsigned int hw = std::thread::hardware_concurrency();
        if (hw > 1) {
            threadCount = std::min<std::size_t>(sheets.size(), static_cast<std::size_t>(hw - 1));
        }
        if (threadCount == 0) {
            threadCount = 1;
        }
    }

    if (threadCount > 1 && !quiet) {
        std::cout << "Processing " << sheets.size() << " sheets with " << threadCount
                  << " worker threads\n";
    }

    std::vector<SheetRunResult> results(sheets.size());
    if (threadCount > 1) {
        std::atomic<std::size_t> nextIndex{0};
        std::vector<std::thread> workers;
        workers.reserve(threadCount);
        for (std::size_t t = 0; t < threadCount; ++t) {
            workers.emplace_back([&]() {
                while (true) {
                    const std::size_t idx = nextIndex.fetch_add(1);
                    if (idx >= sheets.size()) {
                        break;
                    }
                    results[idx] = processSheet(sheets[idx], config, outDir);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        for (std::size_t idx = 0; idx < sheets.size(); ++idx) {
            results[idx] = processSheet(sheets[idx], config, outDir);
        }
    }

    std::vector<SheetReport> reports;
    std::vector<SheetFailure> failures;
    bool outputFailure = false;
    for (auto& result : results) {
        if (!quiet && !result.stdoutLog.empty()) {
            std::cout << result.stdoutLog;
        }
        if (!result.stderrLog.empty()) {
            std::cerr << result.stderrLog;
        }
        if (result.report) {
            reports.push_back(std::move(*result.report));
        }
        if (result.failure) {
            failures.push_back(std::move(*result.failure));
        }
        if (result.outputError) {
            outputFailure = true;
        }
    }

    if (summaryPath) {
        try {
            write_json_summary(*summaryPath, reports, failures);
            if (!quiet) {
                std::cout << "Wrote run summary to " << *summaryPath << '\n';
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write summary: " << ex.what() << '\n';
            outputFailure = true;
        }
    }

    if (!quiet) {
        std::cout << "Processed " << reports.size() << " of " << sheets.size() << " sheet(s)\n";
    }
    return (failures.empty() && !outputFailure) ? 0 : 2;
}
