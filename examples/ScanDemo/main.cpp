/**
 * @file main.cpp
 * @brief Scan files with the built-in catalog and print deduplicated findings
 *
 * Usage:
 *   argus_scan_demo [--config FILE] [--learning FILE] [--save-learning FILE] PATH...
 *
 * Each file is scanned, merged at file level, then the whole run is merged
 * at scan level. Findings and deduplication statistics are printed as JSON.
 *
 * Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Config.hpp>
#include <Argus/Core/Settings.hpp>
#include <Argus/Core/Logger.hpp>
#include <Argus/Core/PatternRegistry.hpp>
#include <Argus/Core/PatternCatalog.hpp>
#include <Argus/Core/PatternEngine.hpp>
#include <Argus/Core/DeduplicationEngine.hpp>
#include <Argus/Core/LearningStore.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace Argus;
using namespace Argus::Core;
using json = nlohmann::json;

namespace {

struct Arguments {
    std::string configPath;
    std::string learningPath;
    std::string saveLearningPath;
    std::vector<std::string> files;
};

void printUsage(const char* program) {
    std::cerr << "argus " << VERSION_STRING << "\n"
              << "usage: " << program
              << " [--config FILE] [--learning FILE] [--save-learning FILE] PATH...\n";
}

bool parseArguments(int argc, char** argv, Arguments& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next(args.configPath)) return false;
        } else if (arg == "--learning") {
            if (!next(args.learningPath)) return false;
        } else if (arg == "--save-learning") {
            if (!next(args.saveLearningPath)) return false;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else {
            args.files.push_back(arg);
        }
    }
    return !args.files.empty();
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

Result<Config::EngineSettings> loadSettings(const std::string& path) {
    if (path.empty()) {
        return Config::EngineSettings{};
    }
    Config::ConfigLoader loader;
    auto config = loader.load(path);
    if (config.isFailure()) {
        return config.error();
    }
    return Config::EngineSettings::fromConfigMap(config.value());
}

} // anonymous namespace

int main(int argc, char** argv) {
    Arguments args;
    if (!parseArguments(argc, argv, args)) {
        printUsage(argv[0]);
        return 2;
    }

    auto settings = loadSettings(args.configPath);
    if (settings.isFailure()) {
        std::cerr << "argus: cannot load '" << args.configPath << "': "
                  << getErrorMessage(settings.error()) << "\n";
        return 1;
    }
    const Config::EngineSettings& cfg = settings.value();

    auto& logger = Logger::Instance();
    const LogOutput outputs = cfg.logFile.empty() ? LogOutput::Console
                                                  : (LogOutput::Console | LogOutput::File);
    if (!logger.Initialize(cfg.logLevel, outputs, cfg.logFile)) {
        std::cerr << "argus: logging unavailable, continuing without it\n";
    }

    PatternRegistry registry;
    if (auto registered = registerBuiltInPatterns(registry); registered.isFailure()) {
        ARGUS_LOG_CRITICAL_F("Built-in catalog failed to register: %s",
                             std::string(getErrorMessage(registered.error())).c_str());
        logger.Shutdown();
        return 1;
    }

    LearningStore learning;
    if (!args.learningPath.empty()) {
        std::string text;
        if (!readFile(args.learningPath, text)) {
            ARGUS_LOG_ERROR_F("Cannot read learning data '%s'", args.learningPath.c_str());
        } else if (auto imported = learning.importLearningData(std::string_view(text)); imported.isFailure()) {
            ARGUS_LOG_ERROR_F("Ignoring learning data '%s': %s", args.learningPath.c_str(),
                              std::string(getErrorMessage(imported.error())).c_str());
        }
    }

    PatternEngine engine(registry, &learning);
    DeduplicationEngine dedup(cfg.dedup);

    FindingBatch scanBatch;
    size_t scannedFiles = 0;
    for (const auto& path : args.files) {
        std::string content;
        if (!readFile(path, content)) {
            ARGUS_LOG_ERROR_F("Cannot read '%s', skipping", path.c_str());
            continue;
        }
        ++scannedFiles;

        Core::ScanOptions options = cfg.scan;
        options.filePath = path;

        FindingBatch fileBatch;
        for (const auto& finding : engine.scanContent(content, options)) {
            fileBatch.emplace_back(FindingRecord::fromFinding(finding, path));
        }
        for (auto& record : dedup.deduplicateFileFindings(fileBatch, path)) {
            scanBatch.emplace_back(std::move(record));
        }
    }

    auto result = dedup.deduplicateScanFindings(scanBatch);

    json findings = json::array();
    for (const auto& record : result.findings) {
        findings.push_back(record.toJson());
    }

    json report = {
        {"filesScanned", scannedFiles},
        {"findings", std::move(findings)},
        {"summary", {
            {"totalFindings", result.summary.totalFindings},
            {"uniqueFindings", result.summary.uniqueFindings},
            {"duplicatesRemoved", result.summary.duplicatesRemoved},
            {"deduplicationRate", result.summary.deduplicationRate},
            {"deduplicationTimeMs", result.summary.deduplicationTime.count()}
        }},
        {"deduplicationStats", dedup.getStats().toJson()}
    };
    std::cout << report.dump(2) << std::endl;

    if (!args.saveLearningPath.empty()) {
        std::ofstream out(args.saveLearningPath);
        if (!out) {
            ARGUS_LOG_ERROR_F("Cannot write learning data to '%s'", args.saveLearningPath.c_str());
        } else {
            out << learning.exportLearningData().dump(2) << "\n";
        }
    }

    logger.Shutdown();
    return 0;
}
