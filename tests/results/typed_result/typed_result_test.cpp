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

#include <AnalysisKind.hpp>
#include <DatasetParser.hpp>
#include <LookupError.hpp>
#include <TypedResult.hpp>
#include <complex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/*
 * Typed result tests
 *
 * Covers:
 *  - suffix conventions for DC, AC, transient and harmonic balance
 *  - sweep axis selection and the index fallback
 *  - S-parameter port count, zero-filled missing pairs and range checks
 *  - analysis name parsing
 */

namespace
{

Dataset parse(const std::string& text)
{
    DatasetParser parser;
    return parser.parse(text);
}

// Two disconnected two-port networks: ports 1-2 and ports 3-4.
const char* kFourPortSweep =
    "<Qucs Dataset 0.0.24>\n"
    "<indep frequency 3>\n+1.0e+09\n+2.0e+09\n+3.0e+09\n</indep>\n"
    "<dep S[1,1] frequency>\n+1.0e-01+j0.0e+00\n+1.0e-01+j0.0e+00\n+1.0e-01+j0.0e+00\n</dep>\n"
    "<dep S[2,1] frequency>\n+9.0e-01-j1.0e-01\n+8.0e-01-j2.0e-01\n+7.0e-01-j3.0e-01\n</dep>\n"
    "<dep S[1,2] frequency>\n+9.0e-01-j1.0e-01\n+8.0e-01-j2.0e-01\n+7.0e-01-j3.0e-01\n</dep>\n"
    "<dep S[2,2] frequency>\n+1.0e-01+j0.0e+00\n+1.0e-01+j0.0e+00\n+1.0e-01+j0.0e+00\n</dep>\n"
    "<dep S[3,3] frequency>\n+2.0e-01+j0.0e+00\n+2.0e-01+j0.0e+00\n+2.0e-01+j0.0e+00\n</dep>\n"
    "<dep S[4,3] frequency>\n+5.0e-01+j5.0e-01\n+5.0e-01+j5.0e-01\n+5.0e-01+j5.0e-01\n</dep>\n"
    "<dep S[3,4] frequency>\n+5.0e-01+j5.0e-01\n+5.0e-01+j5.0e-01\n+5.0e-01+j5.0e-01\n</dep>\n"
    "<dep S[4,4] frequency>\n+2.0e-01+j0.0e+00\n+2.0e-01+j0.0e+00\n+2.0e-01+j0.0e+00\n</dep>\n";

}  // namespace

TEST(TypedResult, DCSuffixes)
{
    Dataset ds = parse(
        "<Qucs Dataset 0.0.24>\n"
        "<dep _net1.V>\n+1.0e+01\n</dep>\n"
        "<dep _net2.V>\n+5.0e+00\n</dep>\n"
        "<dep V1.I>\n-5.0e-03\n</dep>\n"
        "<dep _net1.v>\n+1.0e+00\n</dep>\n");

    TypedResult r = extractTypedResult(ds, AnalysisKind::DC);
    EXPECT_EQ(r.getKind(), AnalysisKind::DC);
    EXPECT_EQ(r.points(), 1);
    EXPECT_TRUE(r.getSweepName().empty());
    EXPECT_DOUBLE_EQ(r.getSweep()(0), 0.0);

    EXPECT_EQ(r.getVoltages().size(), 2u);
    EXPECT_DOUBLE_EQ(r.voltage("_net1").real()(0), 10.0);
    EXPECT_DOUBLE_EQ(r.voltage("_net2").real()(0), 5.0);
    EXPECT_DOUBLE_EQ(r.current("V1").real()(0), -5e-3);
    EXPECT_EQ(r.voltageNames(), (std::vector<std::string>{"_net1", "_net2"}));
    EXPECT_EQ(r.currentNames(), (std::vector<std::string>{"V1"}));
}

TEST(TypedResult, ACSuffixesAndSweep)
{
    Dataset ds = parse(
        "<Qucs Dataset 0.0.24>\n"
        "<indep acfrequency 2>\n+1.0e+03\n+1.0e+04\n</indep>\n"
        "<dep _net1.v acfrequency>\n+1.0e+00+j0.0e+00\n+7.0e-01-j7.0e-01\n</dep>\n"
        "<dep V1.i acfrequency>\n+0.0e+00-j1.0e-03\n+0.0e+00-j2.0e-03\n</dep>\n"
        "<dep _net1.V>\n+3.0e+00\n</dep>\n");

    TypedResult r = extractTypedResult(ds, AnalysisKind::AC);
    EXPECT_EQ(r.getSweepName(), "acfrequency");
    ASSERT_EQ(r.points(), 2);
    EXPECT_DOUBLE_EQ(r.getSweep()(1), 1e4);
    EXPECT_EQ(r.voltage("_net1")(1), std::complex<double>(0.7, -0.7));
    EXPECT_EQ(r.current("V1")(0), std::complex<double>(0.0, -1e-3));
    // DC-style names are not part of an AC result
    EXPECT_EQ(r.getVoltages().size(), 1u);
}

TEST(TypedResult, TransientAndHarmonicBalanceSuffixes)
{
    Dataset ds = parse(
        "<Qucs Dataset 0.0.24>\n"
        "<indep time 2>\n+0.0e+00\n+1.0e-06\n</indep>\n"
        "<dep _net1.Vt time>\n+0.0e+00\n+1.0e+00\n</dep>\n"
        "<dep V1.It time>\n+0.0e+00\n+1.0e-03\n</dep>\n"
        "<indep hbfrequency 2>\n+0.0e+00\n+1.0e+09\n</indep>\n"
        "<dep _net1.Vb hbfrequency>\n+1.0e+00\n+2.0e-01+j1.0e-01\n</dep>\n"
        "<dep V1.Ib hbfrequency>\n+1.0e-03\n+0.0e+00\n</dep>\n");

    TypedResult tran = extractTypedResult(ds, AnalysisKind::Transient);
    EXPECT_EQ(tran.getSweepName(), "time");
    EXPECT_DOUBLE_EQ(tran.getSweep()(1), 1e-6);
    EXPECT_DOUBLE_EQ(tran.voltage("_net1").real()(1), 1.0);
    EXPECT_DOUBLE_EQ(tran.current("V1").real()(1), 1e-3);

    TypedResult hb = extractTypedResult(ds, AnalysisKind::HarmonicBalance);
    EXPECT_EQ(hb.getSweepName(), "hbfrequency");
    EXPECT_EQ(hb.voltage("_net1")(1), std::complex<double>(0.2, 0.1));
    EXPECT_DOUBLE_EQ(hb.current("V1").real()(0), 1e-3);
}

TEST(TypedResult, MissingSweepFallsBackToIndex)
{
    Dataset ds = parse(
        "<Qucs Dataset 0.0.24>\n"
        "<dep _net1.Vt>\n+0.0e+00\n+1.0e+00\n+2.0e+00\n</dep>\n");

    TypedResult r = extractTypedResult(ds, AnalysisKind::Transient);
    EXPECT_TRUE(r.getSweepName().empty());
    ASSERT_EQ(r.points(), 3);
    EXPECT_DOUBLE_EQ(r.getSweep()(2), 2.0);
}

TEST(TypedResult, LookupFailureListsAvailableNames)
{
    Dataset ds = parse(
        "<Qucs Dataset 0.0.24>\n"
        "<dep _net1.V>\n+1.0e+00\n</dep>\n");
    TypedResult r = extractTypedResult(ds, AnalysisKind::DC);
    try {
        r.voltage("_net9");
        FAIL() << "expected VectorNotFoundError";
    } catch (const VectorNotFoundError& ex) {
        EXPECT_EQ(ex.requested(), "_net9");
        EXPECT_EQ(ex.available(), (std::vector<std::string>{"_net1"}));
    }
    EXPECT_THROW(r.current("V1"), VectorNotFoundError);
}

TEST(TypedResult, SParameterPortsAndReferenceImpedance)
{
    BinderOptions options;
    options.referenceImpedance = 75.0;
    TypedResult r =
        extractTypedResult(parse(kFourPortSweep), AnalysisKind::SParameter, options);

    EXPECT_EQ(r.getSweepName(), "frequency");
    EXPECT_EQ(r.points(), 3);
    EXPECT_EQ(r.numPorts(), 4);
    EXPECT_DOUBLE_EQ(r.referenceImpedance(), 75.0);
    EXPECT_TRUE(r.hasSParameter(2, 1));
    EXPECT_EQ(r.sParameter(2, 1)(2), std::complex<double>(0.7, -0.3));
    EXPECT_TRUE(r.getVoltages().empty());
}

TEST(TypedResult, MissingCrossPortPairIsZero)
{
    TypedResult r =
        extractTypedResult(parse(kFourPortSweep), AnalysisKind::SParameter);

    for (int i : {1, 2}) {
        for (int j : {3, 4}) {
            EXPECT_FALSE(r.hasSParameter(i, j));
            Eigen::VectorXcd sij = r.sParameter(i, j);
            Eigen::VectorXcd sji = r.sParameter(j, i);
            ASSERT_EQ(sij.size(), r.points());
            ASSERT_EQ(sji.size(), r.points());
            EXPECT_EQ(sij.cwiseAbs().maxCoeff(), 0.0);
            EXPECT_EQ(sji.cwiseAbs().maxCoeff(), 0.0);
        }
    }
}

TEST(TypedResult, SParameterOutsidePortRangeThrows)
{
    TypedResult r =
        extractTypedResult(parse(kFourPortSweep), AnalysisKind::SParameter);
    EXPECT_THROW(r.sParameter(0, 1), std::out_of_range);
    EXPECT_THROW(r.sParameter(1, 5), std::out_of_range);

    TypedResult dc = extractTypedResult(parse(kFourPortSweep), AnalysisKind::DC);
    EXPECT_EQ(dc.numPorts(), 0);
    EXPECT_THROW(dc.sParameter(1, 1), std::out_of_range);
}

TEST(TypedResult, SMatrixAtPoint)
{
    TypedResult r =
        extractTypedResult(parse(kFourPortSweep), AnalysisKind::SParameter);
    Eigen::MatrixXcd s = r.sMatrixAt(1);
    ASSERT_EQ(s.rows(), 4);
    ASSERT_EQ(s.cols(), 4);
    EXPECT_EQ(s(1, 0), std::complex<double>(0.8, -0.2));
    EXPECT_EQ(s(3, 2), std::complex<double>(0.5, 0.5));
    EXPECT_EQ(s(0, 3), std::complex<double>(0.0, 0.0));
    EXPECT_THROW(r.sMatrixAt(3), std::out_of_range);
}

TEST(TypedResult, IgnoresNonPortNames)
{
    Dataset ds = parse(
        "<Qucs Dataset 0.0.24>\n"
        "<indep frequency 1>\n+1.0e+09\n</indep>\n"
        "<dep S[1,1] frequency>\n+1.0e-01\n</dep>\n"
        "<dep S[0,1] frequency>\n+1.0e-01\n</dep>\n"
        "<dep S[a,1] frequency>\n+1.0e-01\n</dep>\n"
        "<dep Sx[2,2] frequency>\n+1.0e-01\n</dep>\n");
    TypedResult r = extractTypedResult(ds, AnalysisKind::SParameter);
    EXPECT_EQ(r.numPorts(), 1);
}

TEST(TypedResult, OptionsSelectTheKind)
{
    BinderOptions options;
    options.analysis = AnalysisKind::SParameter;
    TypedResult r = extractTypedResult(parse(kFourPortSweep), options);
    EXPECT_EQ(r.getKind(), AnalysisKind::SParameter);
    EXPECT_EQ(r.numPorts(), 4);
}

TEST(TypedResult, PrintShowsVectors)
{
    TypedResult r =
        extractTypedResult(parse(kFourPortSweep), AnalysisKind::SParameter);
    std::ostringstream oss;
    r.print(oss);
    std::string out = oss.str();
    EXPECT_NE(out.find("SParameter result: 3 point(s) over 'frequency'"),
              std::string::npos);
    EXPECT_NE(out.find("S[1,3] (no coupling): 0 0 0"), std::string::npos);
    EXPECT_NE(out.find("S[2,1]: 0.9-j0.1 0.8-j0.2 0.7-j0.3"), std::string::npos);
}

TEST(AnalysisKindParse, KnownAndUnknownNames)
{
    EXPECT_EQ(parseAnalysisKind("dc"), AnalysisKind::DC);
    EXPECT_EQ(parseAnalysisKind("ac"), AnalysisKind::AC);
    EXPECT_EQ(parseAnalysisKind("tran"), AnalysisKind::Transient);
    EXPECT_EQ(parseAnalysisKind("sp"), AnalysisKind::SParameter);
    EXPECT_EQ(parseAnalysisKind("hb"), AnalysisKind::HarmonicBalance);
    EXPECT_THROW(parseAnalysisKind("noise"), std::invalid_argument);
    EXPECT_THROW(parseAnalysisKind("DC"), std::invalid_argument);

    std::ostringstream oss;
    oss << AnalysisKind::Transient;
    EXPECT_EQ(oss.str(), "Transient");
}

// No main(): test binary links with gtest_main which supplies main().
