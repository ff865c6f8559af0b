// Copyright (c) 2022, Pacific Biosciences of California, Inc.
//
// All rights reserved.
//
// THIS SOFTWARE CONSTITUTES AND EMBODIES PACIFIC BIOSCIENCES' CONFIDENTIAL
// AND PROPRIETARY INFORMATION.
//
// Disclosure, redistribution and use of this software is subject to the
// terms and conditions of the applicable written agreement(s) between you
// and Pacific Biosciences, where "you" refers to you or your company or
// organization, as applicable.  Any other disclosure, redistribution or
// use is prohibited.
//
// THIS SOFTWARE IS PROVIDED BY PACIFIC BIOSCIENCES AND ITS CONTRIBUTORS "AS
// IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
// THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
// PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL PACIFIC BIOSCIENCES OR ITS
// CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
// EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
// OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
// WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
// OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
// ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include <pacbio/PBException.h>

#include <ramp-stats/ReadPattern.h>

using namespace RampStats;

TEST(ReadPattern, SingleReadResultants)
{
    const auto meta = ReadPatternMetadata::FromReadPattern({{1}, {2}, {4}, {7}}, 1.0);

    ASSERT_EQ(meta.NumResultants(), 4);
    EXPECT_FLOAT_EQ(meta.tBar[0], 1.0f);
    EXPECT_FLOAT_EQ(meta.tBar[1], 2.0f);
    EXPECT_FLOAT_EQ(meta.tBar[2], 4.0f);
    EXPECT_FLOAT_EQ(meta.tBar[3], 7.0f);

    // A lone read contributes its own time to tau
    for (size_t i = 0; i < meta.NumResultants(); ++i)
    {
        EXPECT_FLOAT_EQ(meta.tau[i], meta.tBar[i]) << "i: " << i;
        EXPECT_EQ(meta.nReads[i], 1u) << "i: " << i;
    }
}

TEST(ReadPattern, GroupedReads)
{
    const double readTime = 2.0;
    const auto meta = ReadPatternMetadata::FromReadPattern({{1}, {2, 3}, {4, 5, 6}}, readTime);

    ASSERT_EQ(meta.NumResultants(), 3);
    EXPECT_EQ(meta.nReads[0], 1u);
    EXPECT_EQ(meta.nReads[1], 2u);
    EXPECT_EQ(meta.nReads[2], 3u);

    EXPECT_FLOAT_EQ(meta.tBar[0], readTime * 1.0);
    EXPECT_FLOAT_EQ(meta.tBar[1], readTime * 2.5);
    EXPECT_FLOAT_EQ(meta.tBar[2], readTime * 5.0);

    // tau = dt * sum_k (2(n-k)-1) r_k / n^2
    EXPECT_FLOAT_EQ(meta.tau[0], readTime * 1.0);
    EXPECT_FLOAT_EQ(meta.tau[1], readTime * (3*2 + 1*3) / 4.0);
    EXPECT_FLOAT_EQ(meta.tau[2], readTime * (5*4 + 3*5 + 1*6) / 9.0);

    EXPECT_NO_THROW(meta.Check());
}

TEST(ReadPattern, TauNeverExceedsTBarForGroups)
{
    // Averaging correlated reads gives less variance than the mean time alone
    const auto meta = ReadPatternMetadata::FromReadPattern({{1, 2, 3, 4}, {5, 6, 7, 8}, {9, 10}}, 3.04);
    for (size_t i = 0; i < meta.NumResultants(); ++i)
    {
        EXPECT_LT(meta.tau[i], meta.tBar[i]) << "i: " << i;
        EXPECT_GT(meta.tau[i], 0.0f) << "i: " << i;
    }
}

TEST(ReadPattern, BadPatterns)
{
    EXPECT_THROW(ReadPatternMetadata::FromReadPattern({}, 1.0), PBException);
    EXPECT_THROW(ReadPatternMetadata::FromReadPattern({{1, 2}}, 1.0), PBException);
    EXPECT_THROW(ReadPatternMetadata::FromReadPattern({{1}, {}}, 1.0), PBException);
    EXPECT_THROW(ReadPatternMetadata::FromReadPattern({{0}, {1}}, 1.0), PBException);
    EXPECT_THROW(ReadPatternMetadata::FromReadPattern({{1, 2}, {2, 3}}, 1.0), PBException);
    EXPECT_THROW(ReadPatternMetadata::FromReadPattern({{3}, {1}}, 1.0), PBException);

    EXPECT_THROW(ReadPatternMetadata::FromReadPattern({{1}, {2}}, 0.0), PBException);
    EXPECT_THROW(ReadPatternMetadata::FromReadPattern({{1}, {2}}, -1.0), PBException);
    EXPECT_THROW(ReadPatternMetadata::FromReadPattern({{1}, {2}}, std::numeric_limits<double>::quiet_NaN()),
                 PBException);
}

TEST(ReadPattern, Check)
{
    ReadPatternMetadata meta;
    meta.tBar = {0.0f, 1.0f, 3.0f};
    meta.tau = {0.0f, 0.5f, 1.0f};
    meta.nReads = {4, 4, 2};
    EXPECT_NO_THROW(meta.Check());

    // Equal times are a numeric degeneracy, not a precondition violation
    meta.tBar = {0.0f, 0.0f, 3.0f};
    EXPECT_NO_THROW(meta.Check());

    auto shortTau = meta;
    shortTau.tau.pop_back();
    EXPECT_THROW(shortTau.Check(), PBException);

    auto shortReads = meta;
    shortReads.nReads.pop_back();
    EXPECT_THROW(shortReads.Check(), PBException);

    // As are zero read counts
    auto noReads = meta;
    noReads.nReads[1] = 0;
    EXPECT_NO_THROW(noReads.Check());

    ReadPatternMetadata single;
    single.tBar = {1.0f};
    single.tau = {1.0f};
    single.nReads = {1};
    EXPECT_THROW(single.Check(), PBException);
}
