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

#include <DatasetParser.hpp>
#include <cmath>
#include <complex>

TEST(ParseValue, EmptyInput)
{
    bool ok = true;
    std::complex<double> v = DatasetParser::parseValue("", ok);
    EXPECT_FALSE(ok);
    EXPECT_TRUE(std::isfinite(v.real()));
    EXPECT_DOUBLE_EQ(v.imag(), 0.0);
}

TEST(ParseValue, RealExponential)
{
    bool ok = false;

    std::complex<double> v1 = DatasetParser::parseValue("+1.00000000000000e+09", ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(v1.real(), 1e9);
    EXPECT_DOUBLE_EQ(v1.imag(), 0.0);

    std::complex<double> v2 = DatasetParser::parseValue("-2.5e-03", ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(v2.real(), -2.5e-3);

    std::complex<double> v3 = DatasetParser::parseValue("  +0.0e+00  ", ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(v3.real(), 0.0);
}

TEST(ParseValue, SubnormalAndOverflowingExponents)
{
    bool ok = false;

    std::complex<double> tiny = DatasetParser::parseValue("+1.0e-310", ok);
    EXPECT_TRUE(ok);
    EXPECT_GT(tiny.real(), 0.0);
    EXPECT_LT(tiny.real(), 1e-300);

    std::complex<double> huge = DatasetParser::parseValue("1e400", ok);
    EXPECT_TRUE(ok);
    EXPECT_TRUE(std::isinf(huge.real()));

    std::complex<double> c = DatasetParser::parseValue("+1.0e-310-j1e400", ok);
    EXPECT_TRUE(ok);
    EXPECT_GT(c.real(), 0.0);
    EXPECT_TRUE(std::isinf(c.imag()));
    EXPECT_LT(c.imag(), 0.0);
}

TEST(ParseValue, ComplexPositiveImaginary)
{
    bool ok = false;
    std::complex<double> v =
        DatasetParser::parseValue("+1.234e+00+j5.678e-01", ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(v.real(), 1.234);
    EXPECT_DOUBLE_EQ(v.imag(), 0.5678);
}

TEST(ParseValue, ComplexNegativeImaginary)
{
    bool ok = false;
    std::complex<double> v = DatasetParser::parseValue("+5.0e-01-j5.0e-01", ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(v.real(), 0.5);
    EXPECT_DOUBLE_EQ(v.imag(), -0.5);
}

TEST(ParseValue, ComplexWithNegativeExponents)
{
    bool ok = false;
    std::complex<double> v =
        DatasetParser::parseValue("-3.0e-12-j4.0e-12", ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(v.real(), -3.0e-12);
    EXPECT_DOUBLE_EQ(v.imag(), -4.0e-12);
}

TEST(ParseValue, RejectsGarbage)
{
    bool ok = true;
    DatasetParser::parseValue("abc", ok);
    EXPECT_FALSE(ok);

    ok = true;
    DatasetParser::parseValue("1.0e+00xyz", ok);
    EXPECT_FALSE(ok);

    ok = true;
    DatasetParser::parseValue("1.2.3", ok);
    EXPECT_FALSE(ok);
}

TEST(ParseValue, RejectsMalformedComplex)
{
    bool ok = true;
    // marker without a real part
    DatasetParser::parseValue("+j1.0e+00", ok);
    EXPECT_FALSE(ok);

    ok = true;
    // marker without a sign
    DatasetParser::parseValue("1.0e+00j2.0e+00", ok);
    EXPECT_FALSE(ok);

    ok = true;
    // missing imaginary digits
    DatasetParser::parseValue("1.0e+00+j", ok);
    EXPECT_FALSE(ok);

    ok = true;
    // embedded whitespace
    DatasetParser::parseValue("1.0e+00 +j2.0e+00", ok);
    EXPECT_FALSE(ok);

    ok = true;
    // doubled sign on the imaginary part
    DatasetParser::parseValue("1.0e+00+j-2.0e+00", ok);
    EXPECT_FALSE(ok);
}

// No main(): test binary links with gtest_main which supplies main().
