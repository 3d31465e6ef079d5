/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

/**
 * @file DatasetParser.cpp
 * @brief Implementation of the dataset state machine and value parser.
 *
 * Implementation notes:
 *  - Line numbers in diagnostics are 1-based and count blank lines.
 *  - Storing a vector removes any vector of the same name from the other
 *    map, so a name lives in exactly one of them.
 */

#include "DatasetParser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace
{

std::string trim(const std::string& s)
{
    std::size_t start = 0;
    std::size_t end = s.size();
    while (start < end && std::isspace((unsigned char)s[start])) ++start;
    while (end > start && std::isspace((unsigned char)s[end - 1])) --end;
    return s.substr(start, end - start);
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Tokens between the leading '<' and trailing '>' of a tag line.
std::vector<std::string> tagTokens(const std::string& line)
{
    std::istringstream iss(line.substr(1, line.size() - 2));
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

bool parseReal(const std::string& s, double& out)
{
    if (s.empty()) return false;
    if (std::any_of(s.begin(), s.end(),
                    [](unsigned char c) { return std::isspace(c); }))
        return false;
    // strtod rather than stod: subnormal and overflowing values set ERANGE
    // but are still numbers.
    const char* begin = s.c_str();
    char* end = nullptr;
    out = std::strtod(begin, &end);
    return end == begin + s.size();
}

}  // namespace

std::complex<double> DatasetParser::parseValue(const std::string& text,
                                               bool& valid)
{
    valid = false;
    std::string s = trim(text);
    if (s.empty()) return {0.0, 0.0};

    std::size_t j = s.find('j');
    if (j == std::string::npos) {
        double re = 0.0;
        if (!parseReal(s, re)) return {0.0, 0.0};
        valid = true;
        return {re, 0.0};
    }

    // REAL followed by +jIMAG or -jIMAG
    if (j < 2 || (s[j - 1] != '+' && s[j - 1] != '-')) return {0.0, 0.0};

    double re = 0.0;
    double im = 0.0;
    if (!parseReal(s.substr(0, j - 1), re)) return {0.0, 0.0};
    std::string imag = s.substr(j + 1);
    if (imag.empty() || imag[0] == '+' || imag[0] == '-') return {0.0, 0.0};
    if (!parseReal(std::string(1, s[j - 1]) + imag, im)) return {0.0, 0.0};

    valid = true;
    return {re, im};
}

bool DatasetParser::isErrorLine(const std::string& lowered)
{
    return startsWith(lowered, "error") || startsWith(lowered, "fatal") ||
           lowered.find("error:") != std::string::npos;
}

bool DatasetParser::isWarningLine(const std::string& lowered)
{
    return startsWith(lowered, "warning") ||
           lowered.find("warning:") != std::string::npos;
}

void DatasetParser::closeBlock(Dataset& dataset, OpenBlock& block)
{
    if (!block.active) return;

    DataVector dv;
    dv.name = block.name;
    dv.isIndependent = block.independent;
    dv.dependencies = block.dependencies;
    dv.values.resize((Eigen::Index)block.values.size());
    for (std::size_t i = 0; i < block.values.size(); ++i) {
        dv.values((Eigen::Index)i) = block.values[i];
    }

    if (block.independent) {
        if ((int)block.values.size() != block.expectedCount) {
            dataset.warnings.push_back(
                "Vector '" + block.name + "' has " +
                std::to_string(block.values.size()) + " values, expected " +
                std::to_string(block.expectedCount));
        }
        dataset.dependentVectors.erase(block.name);
        dataset.independentVectors[block.name] = std::move(dv);
    } else {
        dataset.independentVectors.erase(block.name);
        dataset.dependentVectors[block.name] = std::move(dv);
    }

    block = OpenBlock();
}

bool DatasetParser::openIndependent(const std::string& line, int lineNumber,
                                    OpenBlock& block, Dataset& dataset)
{
    // <indep NAME COUNT>
    std::vector<std::string> tokens;
    if (line.back() == '>') tokens = tagTokens(line);

    bool ok = tokens.size() == 3 && tokens[0] == "indep" &&
              !tokens[2].empty() &&
              std::all_of(tokens[2].begin(), tokens[2].end(),
                          [](unsigned char c) { return std::isdigit(c); });
    int count = 0;
    if (ok) {
        try {
            count = std::stoi(tokens[2]);
        } catch (const std::exception&) {
            ok = false;
        }
    }
    if (!ok) {
        dataset.warnings.push_back("Malformed independent vector header at line " +
                                   std::to_string(lineNumber) + ": '" + line +
                                   "'");
        return false;
    }

    block = OpenBlock();
    block.active = true;
    block.independent = true;
    block.name = tokens[1];
    block.expectedCount = count;
    block.headerLine = lineNumber;
    return true;
}

bool DatasetParser::openDependent(const std::string& line, int lineNumber,
                                  OpenBlock& block, Dataset& dataset)
{
    // <dep NAME DEP*>
    std::vector<std::string> tokens;
    if (line.back() == '>') tokens = tagTokens(line);

    if (tokens.size() < 2 || tokens[0] != "dep") {
        dataset.warnings.push_back("Malformed dependent vector header at line " +
                                   std::to_string(lineNumber) + ": '" + line +
                                   "'");
        return false;
    }

    block = OpenBlock();
    block.active = true;
    block.independent = false;
    block.name = tokens[1];
    block.dependencies.assign(tokens.begin() + 2, tokens.end());
    block.headerLine = lineNumber;
    return true;
}

Dataset DatasetParser::parse(const std::string& text) const
{
    Dataset dataset;
    dataset.rawOutput = text;

    if (trim(text).empty()) {
        dataset.status = SimulationStatus::ParseError;
        dataset.errors.push_back("Empty output received");
        return dataset;
    }

    dataset.status = SimulationStatus::Success;

    OpenBlock block;
    bool haveVersion = false;

    std::istringstream in(text);
    std::string rawLine;
    int lineNumber = 0;

    auto reportUnterminated = [&](const std::string& where) {
        dataset.warnings.push_back("Vector '" + block.name + "' opened at line " +
                                   std::to_string(block.headerLine) +
                                   " is not terminated " + where);
    };

    while (std::getline(in, rawLine)) {
        ++lineNumber;
        std::string line = trim(rawLine);
        if (line.empty()) continue;

        // Closing tags
        if (line == "</indep>" || line == "</dep>") {
            bool indepTag = line == "</indep>";
            if (!block.active) {
                dataset.warnings.push_back("Unexpected '" + line +
                                           "' at line " +
                                           std::to_string(lineNumber));
            } else {
                if (block.independent != indepTag) {
                    dataset.warnings.push_back(
                        "Closing tag '" + line + "' at line " +
                        std::to_string(lineNumber) +
                        " does not match vector '" + block.name + "'");
                }
                closeBlock(dataset, block);
            }
            continue;
        }

        // Opening tags
        if (startsWith(line, "<indep") || startsWith(line, "<dep")) {
            if (block.active) {
                reportUnterminated("before line " + std::to_string(lineNumber));
                closeBlock(dataset, block);
            }
            if (startsWith(line, "<indep"))
                openIndependent(line, lineNumber, block, dataset);
            else
                openDependent(line, lineNumber, block, dataset);
            continue;
        }

        if (block.active) {
            bool valid = false;
            std::complex<double> value = parseValue(line, valid);
            if (valid)
                block.values.push_back(value);
            else
                dataset.warnings.push_back("Failed to parse value at line " +
                                           std::to_string(lineNumber) + ": '" +
                                           line + "'");
            continue;
        }

        // Dataset header
        std::size_t tag = line.find("<Qucs Dataset");
        if (tag == std::string::npos && startsWith(line, "<Dataset")) tag = 0;
        if (tag != std::string::npos) {
            std::size_t start = line.find("Dataset", tag) + 7;
            std::size_t end = line.find('>', start);
            std::string version =
                end == std::string::npos ? ""
                                         : trim(line.substr(start, end - start));
            if (version.empty()) {
                dataset.warnings.push_back("Malformed dataset header at line " +
                                           std::to_string(lineNumber) + ": '" +
                                           line + "'");
            } else if (haveVersion) {
                dataset.warnings.push_back(
                    "Duplicate dataset header at line " +
                    std::to_string(lineNumber) + " ignored");
            } else {
                dataset.version = version;
                haveVersion = true;
            }
            continue;
        }

        std::string lowered = toLower(line);
        if (isErrorLine(lowered)) {
            dataset.errors.push_back(line);
            dataset.status = SimulationStatus::Error;
            continue;
        }
        if (isWarningLine(lowered)) {
            dataset.warnings.push_back(line);
            continue;
        }
        // Anything else is solver chatter.
    }

    if (block.active) {
        reportUnterminated("at end of output");
        closeBlock(dataset, block);
    }

    if (!haveVersion && dataset.independentVectors.empty() &&
        dataset.dependentVectors.empty()) {
        if (dataset.errors.empty())
            dataset.errors.push_back("No valid dataset found in output");
        dataset.status = SimulationStatus::ParseError;
    }

    return dataset;
}
