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
#include <gtest/gtest.h>

#include <BinderOptions.hpp>
#include <Driver.hpp>
#include <sstream>
#include <string>

/*
 * Driver tests
 *
 * Covers the exit codes and output of the command-line driver on in-memory
 * streams and on an unreadable file.
 */

namespace
{

const char* kDC =
    "<Qucs Dataset 0.0.24>\n"
    "<dep _net1.V>\n+1.0e+01\n</dep>\n"
    "<dep V1.I>\n-5.0e-03\n</dep>\n";

}  // namespace

TEST(Driver, SuccessPrintsSummaryAndResult)
{
    std::istringstream in(kDC);
    std::ostringstream out;
    BinderOptions options;
    int rc = runBinder(in, options, out);
    EXPECT_EQ(rc, 0);
    EXPECT_NE(out.str().find("Status: Success"), std::string::npos);
    EXPECT_NE(out.str().find("V(_net1): 10"), std::string::npos);
    EXPECT_NE(out.str().find("I(V1): -0.005"), std::string::npos);
}

TEST(Driver, ListVectors)
{
    std::istringstream in(kDC);
    std::ostringstream out;
    BinderOptions options;
    options.listVectors = true;
    EXPECT_EQ(runBinder(in, options, out), 0);
    EXPECT_EQ(out.str(), "V1.I\n_net1.V\n");
}

TEST(Driver, EmptyInputIsDatasetError)
{
    std::istringstream in("");
    std::ostringstream out;
    testing::internal::CaptureStderr();
    int rc = runBinder(in, BinderOptions(), out);
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 2);
    EXPECT_NE(err.find("Error: Empty output received"), std::string::npos);
}

TEST(Driver, WarningsFailOnlyWhenStrict)
{
    const char* text =
        "<Qucs Dataset 0.0.24>\n"
        "<indep time 3>\n+0.0e+00\n</indep>\n";

    {
        std::istringstream in(text);
        std::ostringstream out;
        testing::internal::CaptureStderr();
        int rc = runBinder(in, BinderOptions(), out);
        std::string err = testing::internal::GetCapturedStderr();
        EXPECT_EQ(rc, 0);
        EXPECT_NE(err.find("Warning: Vector 'time' has 1 values, expected 3"),
                  std::string::npos);
    }
    {
        std::istringstream in(text);
        std::ostringstream out;
        BinderOptions options;
        options.strictDataset = true;
        options.quiet = true;
        testing::internal::CaptureStderr();
        int rc = runBinder(in, options, out);
        std::string err = testing::internal::GetCapturedStderr();
        EXPECT_EQ(rc, 2);
        EXPECT_TRUE(err.empty());
    }
}

TEST(Driver, MissingFile)
{
    std::ostringstream out;
    testing::internal::CaptureStderr();
    int rc = runBinder(std::string("/nonexistent/dir/dataset.dat"),
                       BinderOptions(), out);
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("Failed to open dataset file"), std::string::npos);
}

// No main(): test binary links with gtest_main which supplies main().
