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
 * @file Driver.cpp
 * @brief Implementation of the command-line driver entry points.
 */

#include "Driver.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "Dataset.hpp"
#include "DatasetParser.hpp"
#include "TypedResult.hpp"

int runBinder(std::istream& input, const BinderOptions& options,
              std::ostream& out)
{
    std::string text((std::istreambuf_iterator<char>(input)),
                     std::istreambuf_iterator<char>());

    DatasetParser parser;
    Dataset dataset = parser.parse(text);

    for (const auto& e : dataset.getErrors())
        std::cerr << "Error: " << e << std::endl;
    if (!options.quiet) {
        for (const auto& w : dataset.getWarnings())
            std::cerr << "Warning: " << w << std::endl;
    }

    if (options.listVectors) {
        for (const auto& name : dataset.listVectors()) out << name << std::endl;
    } else {
        dataset.printSummary(out);
        if (!dataset.listVectors().empty()) {
            out << std::endl;
            extractTypedResult(dataset, options).print(out);
        }
    }

    if (dataset.hasErrors()) return 2;
    if (options.strictDataset && !dataset.getWarnings().empty()) return 2;
    return 0;
}

int runBinder(const std::string& filename, const BinderOptions& options,
              std::ostream& out)
{
    if (filename == "-") return runBinder(std::cin, options, out);

    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Failed to open dataset file: " << filename
                  << std::endl;
        return 1;
    }
    return runBinder(file, options, out);
}
