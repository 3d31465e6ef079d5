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
 * @file main.cpp
 *
 * @brief Contains the implementation of the main function
 */

#include "main.hpp"

#include <getopt.h>

#include <iostream>
#include <string>

#include "AnalysisKind.hpp"
#include "BinderOptions.hpp"
#include "Driver.hpp"

static void printHelp(const char *prog)
{
    std::cout << "Usage: " << prog << " [options] [dataset-file | -]\n";
    std::cout << "Options:\n";
    std::cout << "  --analysis <kind>   dc, ac, tran, sp or hb (default dc)\n";
    std::cout << "  --z0 <ohms>         S-parameter reference impedance "
                 "(default 50)\n";
    std::cout << "  --strict            Exit with status 2 on dataset "
                 "warnings\n";
    std::cout << "  --quiet             Suppress warning lines on stderr\n";
    std::cout << "  --list              List vector names only\n";
    std::cout << "  --help              Show this help message\n";
}

int main(int argc, char *argv[])
{
    BinderOptions options;

    static struct option long_options[] = {
        {"analysis", required_argument, 0, 0},
        {"z0", required_argument, 0, 0},
        {"strict", no_argument, 0, 0},
        {"quiet", no_argument, 0, 0},
        {"list", no_argument, 0, 0},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int option_index = 0;
    int c;
    try {
        while ((c = getopt_long(argc, argv, "h", long_options,
                                &option_index)) != -1) {
            if (c == 'h') {
                printHelp(argv[0]);
                return 0;
            } else if (c == 0) {
                std::string name = long_options[option_index].name;
                if (name == "analysis")
                    options.analysis = parseAnalysisKind(optarg);
                else if (name == "z0")
                    options.referenceImpedance = std::stod(optarg);
                else if (name == "strict")
                    options.strictDataset = true;
                else if (name == "quiet")
                    options.quiet = true;
                else if (name == "list")
                    options.listVectors = true;
            } else {
                printHelp(argv[0]);
                return 1;
            }
        }

        // Validate options (throws on bad input)
        options.validate();
    } catch (const std::exception &ex) {
        std::cerr << "Invalid option: " << ex.what() << std::endl;
        return 1;
    }

    // Remaining non-option args: [dataset-file]
    std::string filename = "dataset.dat";
    if (optind < argc) {
        filename = argv[optind];
    }

    return runBinder(filename, options);
}
