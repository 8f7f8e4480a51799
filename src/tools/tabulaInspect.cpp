/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file tabulaInspect.cpp
 * @brief CLI tool to display the structure of serialized Tables and Wrappers
 *
 * Accepts canonical text: a row array is read as a Table, an object as a
 * Wrapper. Prints the column structure of every Table and optionally the
 * first rows and column checks.
 */

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <tabula/tabula.h>
#include "cli_common.h"

struct Config {
    std::string input_file;
    size_t rows = 0;
    bool checks = false;
    bool verbose = false;
    bool help = false;
};

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] INPUT_FILE\n\n";
    std::cout << "Display the structure of a serialized Table or Wrapper.\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  INPUT_FILE     Canonical text file\n\n";
    std::cout << "Options:\n";
    std::cout << "  -n, --rows N            Print the first N rows of every Table\n";
    std::cout << "  -c, --checks            Report null and duplicate checks per column\n";
    std::cout << "  -v, --verbose           Enable verbose output (file size)\n";
    std::cout << "  -h, --help              Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " users.json\n";
    std::cout << "  " << program_name << " -c -n 5 request.json\n";
}

Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.help = true;
            return config;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-c" || arg == "--checks") {
            config.checks = true;
        } else if (arg == "-n" || arg == "--rows") {
            if (i + 1 >= argc) {
                throw std::runtime_error("Option " + arg + " requires a value");
            }
            config.rows = std::stoul(argv[++i]);
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("Unknown option: " + arg);
        } else {
            if (config.input_file.empty()) {
                config.input_file = arg;
            } else {
                throw std::runtime_error("Too many arguments. Only one input file expected.");
            }
        }
    }

    if (config.input_file.empty() && !config.help) {
        throw std::runtime_error("Input file is required");
    }

    return config;
}

void printRows(const tabula::Table& table, size_t count) {
    const size_t n = std::min(count, table.getRowCount());
    if (n == 0) return;
    for (const auto& row : table.getRows(0, n - 1)) {
        std::cout << "  " << row << "\n";
    }
    if (n < table.getRowCount()) {
        std::cout << "  ... (" << (table.getRowCount() - n) << " more rows)\n";
    }
}

void inspectTable(const std::string& label, const tabula::Table& table, const Config& config) {
    tabula_cli::printTableSummary(label, table, config.checks, std::cout);
    printRows(table, config.rows);
}

int main(int argc, char* argv[]) {
    try {
        Config config = parseArgs(argc, argv);

        if (config.help) {
            printUsage(argv[0]);
            return 0;
        }

        if (!std::filesystem::exists(config.input_file)) {
            std::cerr << "Error: File does not exist: " << config.input_file << std::endl;
            return 1;
        }

        const std::string text = tabula_cli::readFile(config.input_file);

        std::cout << "Tabula Structure: " << config.input_file << std::endl;
        if (config.verbose) {
            std::cout << "File size: " << tabula_cli::formatBytes(text.size()) << std::endl;
        }

        tabula::Value document = tabula::parseCanonical(text);
        if (document.isArray()) {
            std::cout << std::endl;
            inspectTable("Table", tabula::Table::fromValue(document), config);
            return 0;
        }

        tabula::Wrapper wrapper = tabula::Wrapper::fromSerialized(text);
        std::cout << "Entries: " << wrapper.size() << std::endl << std::endl;
        for (const auto& key : wrapper.keys()) {
            auto entry = wrapper.get(key);
            if (auto* table = std::get_if<tabula::Table>(&entry)) {
                inspectTable("[" + key + "] Table", *table, config);
            } else if (auto* value = std::get_if<std::string>(&entry)) {
                std::cout << "[" << key << "] " << tabula::quoteString(*value) << "\n";
            } else {
                std::cout << "[" << key << "] null\n";
            }
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
