/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file anonBench.cpp
 * @brief CLI tool to benchmark anonymization strategies across dataset sizes
 *
 * For every selected method and size, generates a reproducible dataset, times
 * the anonymization and prints one line per measurement, grouped by method.
 *
 * Default: all methods (deterministic, shuffle, bitwise),
 *          sizes 100 1000 5000 10000 50000 100000, test_data profile.
 */

#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <anonbench/anonbench.h>
#include "cli_common.h"

// ── Configuration ───────────────────────────────────────────────────

struct Config {
    std::vector<std::string>    methods;        // empty = all
    std::vector<int64_t>        sizes;          // empty = DEFAULT_SIZES
    std::string                 profile         = anonbench::DEFAULT_PROFILE;
    size_t                      trials          = 1;

    // Strategy options
    std::optional<uint64_t>     seed            = anonbench::DEFAULT_SHUFFLE_SEED;
    std::string                 shuffle_mode    = "permute";
    std::string                 key             = anonbench::DEFAULT_DETERMINISTIC_KEY;
    std::string                 primary_key     = anonbench::DEFAULT_PRIMARY_KEY;
    std::string                 secondary_key   = anonbench::DEFAULT_SECONDARY_KEY;

    // Output
    std::string                 json_file;

    // Flags
    bool                        restore         = false;
    bool                        verify          = false;
    bool                        list_profiles   = false;
    bool                        verbose         = false;
    bool                        help            = false;
};

// ── Usage ───────────────────────────────────────────────────────────

static void printUsage(const char* prog) {
    std::cout
        << "Usage: " << prog << " [OPTIONS]\n\n"

        << "Benchmark anonymization methods on synthetic datasets.\n\n"

        << "Selection:\n"
        << "  -m, --method NAME        Method to run: deterministic, shuffle, bitwise\n"
        << "                           (repeatable or comma-separated; default: all)\n"
        << "  -s, --sizes N [N ...]    Dataset sizes in rows\n"
        << "                           (default: 100 1000 5000 10000 50000 100000)\n"
        << "  -t, --trials N           Timed repetitions per measurement (default: 1)\n"
        << "  -p, --profile NAME       Dataset profile (default: test_data)\n"
        << "  --list                   List available profiles and exit\n\n"

        << "Strategies:\n"
        << "  --seed N|random          Shuffle seed (default: fixed; 'random' = fresh per run)\n"
        << "  --shuffle-mode MODE      permute (default) or rotate\n"
        << "  --key KEY                Deterministic secret key\n"
        << "  --primary-key KEY        Bitwise primary key (SHA-256 sequence)\n"
        << "  --secondary-key KEY      Bitwise secondary key (SHA-512 sequence)\n\n"

        << "Measurement:\n"
        << "  --restore                Also time restore of reversible methods\n"
        << "  --verify                 Check each method's guarantees on its output\n"
        << "  --json PATH              Write results as JSON to PATH\n\n"

        << "General:\n"
        << "  -v, --verbose            Verbose progress output\n"
        << "  -h, --help               Show this help message\n\n"

        << "Examples:\n"
        << "  " << prog << "\n"
        << "  " << prog << " -m shuffle -s 1000 10000\n"
        << "  " << prog << " -m deterministic,bitwise -s 5000 --restore --verify\n"
        << "  " << prog << " -p people -t 3 --json results.json\n";
}

// ── Argument parsing ────────────────────────────────────────────────

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cfg.help = true;
            return cfg;
        } else if (arg == "--list") {
            cfg.list_profiles = true;
            return cfg;
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--restore") {
            cfg.restore = true;
        } else if (arg == "--verify") {
            cfg.verify = true;
        } else if ((arg == "-m" || arg == "--method") && i + 1 < argc) {
            for (const auto& name : anonbench_cli::splitList(argv[++i])) {
                anonbench::parseMethod(name);   // reject before anything runs
                cfg.methods.push_back(name);
            }
        } else if ((arg == "-s" || arg == "--sizes") && i + 1 < argc) {
            const size_t before = cfg.sizes.size();
            while (i + 1 < argc && argv[i + 1][0] != '-') {
                for (const auto& item : anonbench_cli::splitList(argv[++i])) {
                    cfg.sizes.push_back(anonbench_cli::parsePositiveSize(item));
                }
            }
            if (cfg.sizes.size() == before) {
                throw std::runtime_error(arg + " requires at least one size.");
            }
        } else if ((arg == "-t" || arg == "--trials") && i + 1 < argc) {
            cfg.trials = anonbench_cli::parseCount(arg, argv[++i]);
        } else if ((arg == "-p" || arg == "--profile") && i + 1 < argc) {
            cfg.profile = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            cfg.seed = anonbench_cli::parseSeed(argv[++i]);
        } else if (arg == "--shuffle-mode" && i + 1 < argc) {
            cfg.shuffle_mode = argv[++i];
            anonbench_cli::parseShuffleMode(cfg.shuffle_mode);
        } else if (arg == "--key" && i + 1 < argc) {
            cfg.key = argv[++i];
        } else if (arg == "--primary-key" && i + 1 < argc) {
            cfg.primary_key = argv[++i];
        } else if (arg == "--secondary-key" && i + 1 < argc) {
            cfg.secondary_key = argv[++i];
        } else if (arg == "--json" && i + 1 < argc) {
            cfg.json_file = argv[++i];
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("Unknown option or missing value: " + arg);
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }

    if (cfg.methods.empty()) {
        for (auto m : anonbench::ALL_METHODS) {
            cfg.methods.push_back(anonbench::methodName(m));
        }
    }
    if (cfg.sizes.empty()) {
        cfg.sizes.assign(anonbench::DEFAULT_SIZES.begin(), anonbench::DEFAULT_SIZES.end());
    }
    return cfg;
}

// ── Output ──────────────────────────────────────────────────────────

static void printTableHeader(const std::string& method) {
    std::cout << "\nMethod: " << method << "\n"
              << std::right
              << std::setw(10) << "Size"
              << std::setw(16) << "Anonymize"
              << std::setw(16) << "Restore"
              << std::setw(14) << "krows/s" << "\n"
              << std::string(56, '-') << "\n";
}

static void printRecord(const anonbench::MeasurementRecord& r) {
    std::cout << std::right
              << std::setw(10) << r.size()
              << std::setw(16) << anonbench_cli::formatMs(r.elapsed())
              << std::setw(16) << (r.restoreElapsed() ? anonbench_cli::formatMs(*r.restoreElapsed()) : std::string("-"))
              << std::setw(14) << std::fixed << std::setprecision(1) << (r.rowsPerSecond() / 1000.0)
              << "\n";
}

static void writeJson(const std::string& path, const std::vector<anonbench::MeasurementRecord>& records) {
    std::ofstream jf(path);
    if (!jf) {
        throw std::runtime_error("Cannot open JSON output file: " + path);
    }
    jf << "[\n";
    for (size_t i = 0; i < records.size(); ++i) {
        jf << "  " << records[i].toJson();
        if (i + 1 < records.size()) jf << ",";
        jf << "\n";
    }
    jf << "]\n";
    if (!jf) {
        throw std::runtime_error("Failed to write JSON output file: " + path);
    }
}

// ── Main ────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.help) {
            printUsage(argv[0]);
            return 0;
        }

        // ── List profiles ───────────────────────────────────────────
        if (cfg.list_profiles) {
            const auto& profiles = anonbench::listProfiles();
            std::cout << "Available dataset profiles (" << profiles.size() << "):\n\n";
            std::cout << std::left
                      << std::setw(16) << "Name"
                      << std::setw(8)  << "Cols"
                      << "Description\n";
            std::cout << std::string(14, '-') << "  "
                      << std::string(6, '-')  << "  "
                      << std::string(40, '-') << "\n";
            for (const auto& p : profiles) {
                std::cout << std::left
                          << std::setw(16) << p.name
                          << std::setw(8)  << p.layout.columnCount()
                          << p.description << "\n";
            }
            return 0;
        }

        // ── Strategies ──────────────────────────────────────────────
        anonbench::StrategyOptions options;
        options.deterministic.key     = cfg.key;
        options.shuffle.seed          = cfg.seed;
        options.shuffle.mode          = anonbench_cli::parseShuffleMode(cfg.shuffle_mode);
        options.bitwise.primary_key   = cfg.primary_key;
        options.bitwise.secondary_key = cfg.secondary_key;
        const anonbench::StrategyRegistry registry(options);

        anonbench::RunnerOptions runOptions;
        runOptions.profile          = cfg.profile;
        runOptions.trials           = cfg.trials;
        runOptions.measure_restore  = cfg.restore;
        runOptions.verify           = cfg.verify;
        runOptions.log              = cfg.verbose ? &std::cerr : nullptr;

        anonbench::BenchmarkRunner runner(registry, runOptions);

        if (cfg.verbose) {
            std::cerr << "AnonBench " << anonbench::getVersion() << "\n";
            std::cerr << "Profile:   " << runner.options().profile << "\n";
            std::cerr << "Trials:    " << cfg.trials << "\n";
            std::cerr << "Shuffle:   " << cfg.shuffle_mode << ", seed "
                      << (cfg.seed ? std::to_string(*cfg.seed) : std::string("random")) << "\n";
            anonbench_cli::printLayoutSummary("Layout", anonbench::getProfile(cfg.profile).layout);
        }

        // ── Run ─────────────────────────────────────────────────────
        std::string currentMethod;
        auto onRecord = [&currentMethod](const anonbench::MeasurementRecord& r) {
            if (r.methodName() != currentMethod) {
                currentMethod = r.methodName();
                printTableHeader(currentMethod);
            }
            printRecord(r);
        };
        const auto records = runner.run(cfg.methods, cfg.sizes, onRecord);

        if (!cfg.json_file.empty()) {
            writeJson(cfg.json_file, records);
            std::cerr << "JSON results written to: " << cfg.json_file << "\n";
        }
        if (cfg.verify) {
            std::cerr << "Verification: ALL PASSED (" << records.size() << " measurements)\n";
        }
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
