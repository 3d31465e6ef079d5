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

#include <Dataset.hpp>
#include <DatasetParser.hpp>
#include <LookupError.hpp>
#include <complex>
#include <sstream>
#include <string>
#include <vector>

/*
 * Dataset parser tests
 *
 * Covers:
 *  - a well-formed AC-style dataset with real and complex vectors
 *  - empty and non-dataset input
 *  - error and warning lines interleaved with data
 *  - count mismatches, bad value lines, malformed headers and
 *    unterminated blocks
 *  - vector accessors and the summary printout
 */

namespace
{

const char* kWellFormed =
    "<Qucs Dataset 0.0.24>\n"
    "<indep freq 3>\n"
    "  +1.00000000000000e+09\n"
    "  +2.00000000000000e+09\n"
    "  +3.00000000000000e+09\n"
    "</indep>\n"
    "<dep V1 freq>\n"
    "  +1.0e+00+j0.0e+00\n"
    "  +5.0e-01-j5.0e-01\n"
    "  +0.0e+00+j1.0e+00\n"
    "</dep>\n";

}  // namespace

TEST(DatasetParser, WellFormedRoundTrip)
{
    DatasetParser parser;
    Dataset ds = parser.parse(kWellFormed);

    EXPECT_EQ(ds.getStatus(), SimulationStatus::Success);
    EXPECT_EQ(ds.getVersion(), "0.0.24");
    EXPECT_TRUE(ds.getErrors().empty());
    EXPECT_TRUE(ds.getWarnings().empty());
    EXPECT_FALSE(ds.hasErrors());

    Eigen::VectorXd freq = ds.realVector("freq");
    ASSERT_EQ(freq.size(), 3);
    EXPECT_DOUBLE_EQ(freq(0), 1e9);
    EXPECT_DOUBLE_EQ(freq(1), 2e9);
    EXPECT_DOUBLE_EQ(freq(2), 3e9);

    Eigen::VectorXcd v1 = ds.complexVector("V1");
    ASSERT_EQ(v1.size(), 3);
    EXPECT_EQ(v1(1), std::complex<double>(0.5, -0.5));
    EXPECT_EQ(v1(2), std::complex<double>(0.0, 1.0));

    Eigen::VectorXd im = ds.imagVector("V1");
    EXPECT_DOUBLE_EQ(im(1), -0.5);

    const DataVector& dv = ds.vector("V1");
    EXPECT_FALSE(dv.isIndependent);
    ASSERT_EQ(dv.dependencies.size(), 1u);
    EXPECT_EQ(dv.dependencies[0], "freq");
    EXPECT_TRUE(ds.vector("freq").isIndependent);
    EXPECT_EQ(ds.getRawOutput(), kWellFormed);
}

TEST(DatasetParser, ListVectorsIndependentFirst)
{
    DatasetParser parser;
    Dataset ds = parser.parse(
        "<Qucs Dataset 1.0>\n"
        "<dep b.V>\n+1.0e+00\n</dep>\n"
        "<dep a.V>\n+2.0e+00\n</dep>\n"
        "<indep time 1>\n+0.0e+00\n</indep>\n");
    std::vector<std::string> expected = {"time", "a.V", "b.V"};
    EXPECT_EQ(ds.listVectors(), expected);
}

TEST(DatasetParser, EmptyInput)
{
    DatasetParser parser;
    for (const char* text : {"", "   \n\t\n  "}) {
        Dataset ds = parser.parse(text);
        EXPECT_EQ(ds.getStatus(), SimulationStatus::ParseError);
        ASSERT_EQ(ds.getErrors().size(), 1u);
        EXPECT_EQ(ds.getErrors()[0], "Empty output received");
        EXPECT_TRUE(ds.listVectors().empty());
        EXPECT_TRUE(ds.hasErrors());
    }
}

TEST(DatasetParser, DefaultDatasetIsNotRun)
{
    Dataset ds;
    EXPECT_EQ(ds.getStatus(), SimulationStatus::NotRun);
    EXPECT_TRUE(ds.hasErrors());
}

TEST(DatasetParser, NoDatasetInOutput)
{
    DatasetParser parser;
    Dataset ds = parser.parse("solver starting\nsolver finished\n");
    EXPECT_EQ(ds.getStatus(), SimulationStatus::ParseError);
    ASSERT_EQ(ds.getErrors().size(), 1u);
    EXPECT_EQ(ds.getErrors()[0], "No valid dataset found in output");
}

TEST(DatasetParser, ErrorLinesKeepTheirText)
{
    DatasetParser parser;
    Dataset ds = parser.parse("Fatal: netlist check failed\n");
    EXPECT_EQ(ds.getStatus(), SimulationStatus::ParseError);
    ASSERT_EQ(ds.getErrors().size(), 1u);
    EXPECT_EQ(ds.getErrors()[0], "Fatal: netlist check failed");
}

TEST(DatasetParser, PartialRunKeepsData)
{
    DatasetParser parser;
    Dataset ds = parser.parse(
        "<Qucs Dataset 0.0.24>\n"
        "<indep frequency 2>\n+1.0e+09\n+2.0e+09\n</indep>\n"
        "checker error: no ground node\n"
        "WARNING: singular matrix at point 2\n"
        "<dep S[1,1] frequency>\n+1.0e-01+j0.0e+00\n+2.0e-01-j1.0e-01\n</dep>\n"
        "ERROR in line 12\n");

    EXPECT_EQ(ds.getStatus(), SimulationStatus::Error);
    ASSERT_EQ(ds.getErrors().size(), 2u);
    EXPECT_EQ(ds.getErrors()[0], "checker error: no ground node");
    EXPECT_EQ(ds.getErrors()[1], "ERROR in line 12");
    ASSERT_EQ(ds.getWarnings().size(), 1u);
    EXPECT_EQ(ds.getWarnings()[0], "WARNING: singular matrix at point 2");
    EXPECT_TRUE(ds.hasVector("S[1,1]"));
    EXPECT_EQ(ds.complexVector("S[1,1]").size(), 2);
    EXPECT_TRUE(ds.hasErrors());
}

TEST(DatasetParser, CountMismatchWarnsButKeepsValues)
{
    DatasetParser parser;
    Dataset ds = parser.parse(
        "<Qucs Dataset 0.0.24>\n"
        "<indep time 4>\n+0.0e+00\n+1.0e-03\n</indep>\n");

    EXPECT_EQ(ds.getStatus(), SimulationStatus::Success);
    ASSERT_EQ(ds.getWarnings().size(), 1u);
    EXPECT_EQ(ds.getWarnings()[0], "Vector 'time' has 2 values, expected 4");
    Eigen::VectorXd t = ds.realVector("time");
    ASSERT_EQ(t.size(), 2);
    EXPECT_DOUBLE_EQ(t(1), 1e-3);
}

TEST(DatasetParser, BadValueLineWarnsWithLineNumber)
{
    DatasetParser parser;
    Dataset ds = parser.parse(
        "<Qucs Dataset 0.0.24>\n"
        "<dep _net1.V>\n"
        "+1.0e+00\n"
        "\n"
        "garbage\n"
        "+3.0e+00\n"
        "</dep>\n");

    EXPECT_EQ(ds.getStatus(), SimulationStatus::Success);
    ASSERT_EQ(ds.getWarnings().size(), 1u);
    EXPECT_EQ(ds.getWarnings()[0], "Failed to parse value at line 5: 'garbage'");
    Eigen::VectorXd v = ds.realVector("_net1.V");
    ASSERT_EQ(v.size(), 2);
    EXPECT_DOUBLE_EQ(v(0), 1.0);
    EXPECT_DOUBLE_EQ(v(1), 3.0);
}

TEST(DatasetParser, MalformedHeadersWarn)
{
    DatasetParser parser;
    Dataset ds = parser.parse(
        "<Qucs Dataset 0.0.24>\n"
        "<indep freq>\n"
        "<indep time x>\n"
        "<dep>\n"
        "<dep V1\n");

    EXPECT_EQ(ds.getStatus(), SimulationStatus::Success);
    ASSERT_EQ(ds.getWarnings().size(), 4u);
    EXPECT_NE(ds.getWarnings()[0].find("Malformed independent vector header at line 2"),
              std::string::npos);
    EXPECT_NE(ds.getWarnings()[1].find("line 3"), std::string::npos);
    EXPECT_NE(ds.getWarnings()[2].find("Malformed dependent vector header at line 4"),
              std::string::npos);
    EXPECT_NE(ds.getWarnings()[3].find("line 5"), std::string::npos);
    EXPECT_TRUE(ds.listVectors().empty());
}

TEST(DatasetParser, UnterminatedBlockIsKept)
{
    DatasetParser parser;
    Dataset ds = parser.parse(
        "<Qucs Dataset 0.0.24>\n"
        "<dep a.V>\n+1.0e+00\n"
        "<dep b.V>\n+2.0e+00\n+3.0e+00\n");

    ASSERT_EQ(ds.getWarnings().size(), 2u);
    EXPECT_NE(ds.getWarnings()[0].find("Vector 'a.V' opened at line 2"),
              std::string::npos);
    EXPECT_NE(ds.getWarnings()[1].find("at end of output"), std::string::npos);
    EXPECT_EQ(ds.complexVector("a.V").size(), 1);
    EXPECT_EQ(ds.complexVector("b.V").size(), 2);
}

TEST(DatasetParser, StrayClosingTagWarns)
{
    DatasetParser parser;
    Dataset ds = parser.parse("<Qucs Dataset 0.0.24>\n</dep>\n");
    ASSERT_EQ(ds.getWarnings().size(), 1u);
    EXPECT_EQ(ds.getWarnings()[0], "Unexpected '</dep>' at line 2");
}

TEST(DatasetParser, NameLivesInOneMapOnly)
{
    DatasetParser parser;
    Dataset ds = parser.parse(
        "<Qucs Dataset 0.0.24>\n"
        "<indep x 1>\n+1.0e+00\n</indep>\n"
        "<dep x>\n+2.0e+00\n</dep>\n");

    EXPECT_EQ(ds.getIndependentVectors().count("x"), 0u);
    ASSERT_EQ(ds.getDependentVectors().count("x"), 1u);
    EXPECT_DOUBLE_EQ(ds.realVector("x")(0), 2.0);
    EXPECT_EQ(ds.listVectors().size(), 1u);
}

TEST(DatasetParser, ErrorLikeTextInsideBlockIsAValue)
{
    DatasetParser parser;
    Dataset ds = parser.parse(
        "<Qucs Dataset 0.0.24>\n"
        "<dep a.V>\nerror: bad\n+1.0e+00\n</dep>\n");
    EXPECT_EQ(ds.getStatus(), SimulationStatus::Success);
    EXPECT_TRUE(ds.getErrors().empty());
    ASSERT_EQ(ds.getWarnings().size(), 1u);
    EXPECT_EQ(ds.complexVector("a.V").size(), 1);
}

TEST(DatasetParser, HeaderOnlyIsSuccess)
{
    DatasetParser parser;
    Dataset ds = parser.parse("<Qucs Dataset 0.0.24>\n");
    EXPECT_EQ(ds.getStatus(), SimulationStatus::Success);
    EXPECT_TRUE(ds.listVectors().empty());
}

TEST(DatasetParser, MissingVectorThrowsWithAvailableNames)
{
    DatasetParser parser;
    Dataset ds = parser.parse(kWellFormed);
    try {
        ds.realVector("V2");
        FAIL() << "expected VectorNotFoundError";
    } catch (const VectorNotFoundError& ex) {
        EXPECT_EQ(ex.requested(), "V2");
        std::vector<std::string> expected = {"freq", "V1"};
        EXPECT_EQ(ex.available(), expected);
        EXPECT_NE(std::string(ex.what()).find("[freq, V1]"), std::string::npos);
    }
    EXPECT_THROW(ds.imagVector("nope"), LookupError);
    EXPECT_FALSE(ds.hasVector("nope"));
}

TEST(DatasetParser, SummaryListsVectorsAndDiagnostics)
{
    DatasetParser parser;
    Dataset ds = parser.parse(
        "<Qucs Dataset 0.0.24>\n"
        "<indep time 3>\n+0.0e+00\n</indep>\n"
        "<dep _net1.Vt time>\n+1.0e+00\n</dep>\n");

    std::ostringstream oss;
    ds.printSummary(oss);
    std::string out = oss.str();
    EXPECT_NE(out.find("Status: Success"), std::string::npos);
    EXPECT_NE(out.find("Version: 0.0.24"), std::string::npos);
    EXPECT_NE(out.find("Warning: Vector 'time' has 1 values, expected 3"),
              std::string::npos);
    EXPECT_NE(out.find("time: 1 points"), std::string::npos);
    EXPECT_NE(out.find("_net1.Vt: 1 points [deps: time]"), std::string::npos);
}

// No main(): test binary links with gtest_main which supplies main().
