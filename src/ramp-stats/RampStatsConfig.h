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
//
// File Description:
///  \brief Defines the configuration parameters for the ramp-stats application


#ifndef RAMP_STATS_CONFIG_H
#define RAMP_STATS_CONFIG_H

#include <cstdint>
#include <vector>

#include <pacbio/configuration/PBConfig.h>
#include <pacbio/configuration/types/Variant.h>

#include <ramp-stats/ReadPattern.h>

namespace RampStats::Jump {

struct ReadPatternConfig : PacBio::Configuration::PBConfig<ReadPatternConfig>
{
    PB_CONFIG(ReadPatternConfig);

    // Time between consecutive reads, in seconds
    PB_CONFIG_PARAM(double, readTime, 3.04);

    // 1-based read indices averaged into each resultant, in acquisition order
    PB_CONFIG_PARAM(std::vector<std::vector<int>>, resultants,
                    (std::vector<std::vector<int>>{{1}, {2, 3}, {4, 5, 6}, {7, 8, 9},
                                                   {10, 11}, {12}, {13, 14}, {15}}));

    ReadPatternMetadata Metadata() const
    { return ReadPatternMetadata::FromReadPattern(resultants, readTime); }
};

// Fabricates ramps for every pixel of a nRows x nCols image
struct SimInputConfig : PacBio::Configuration::PBConfig<SimInputConfig>
{
    PB_CONFIG(SimInputConfig);

    PB_CONFIG_PARAM(uint32_t, nRows, 64);
    PB_CONFIG_PARAM(uint32_t, nCols, 64);

    // Pixel fluxes (electrons/second) are spread over [minFlux, maxFlux]
    PB_CONFIG_PARAM(float, minFlux, 0.0f);
    PB_CONFIG_PARAM(float, maxFlux, 100.0f);

    // Per read noise, in electrons
    PB_CONFIG_PARAM(float, readNoise, 5.0f);

    // Every jumpStride'th pixel gets a step of jumpAmplitude electrons added
    // to all reads past the middle of the ramp.  0 disables the steps.
    PB_CONFIG_PARAM(uint32_t, jumpStride, 0);
    PB_CONFIG_PARAM(float, jumpAmplitude, 500.0f);

    PB_CONFIG_PARAM(uint32_t, seed, 42);
};

// Ramps supplied directly in the configuration, one image row of pixels
struct InlineInputConfig : PacBio::Configuration::PBConfig<InlineInputConfig>
{
    PB_CONFIG(InlineInputConfig);

    // One vector of resultants per pixel
    PB_CONFIG_PARAM(std::vector<std::vector<double>>, resultants, 0);

    // One read noise per pixel
    PB_CONFIG_PARAM(std::vector<double>, readNoise, 0);
};

struct RampStatsConfig : PacBio::Configuration::PBConfig<RampStatsConfig>
{
    PB_CONFIG(RampStatsConfig);

    PB_CONFIG_OBJECT(ReadPatternConfig, readPattern);

    PB_CONFIG_VARIANT(source, SimInputConfig, InlineInputConfig);
};

} // namespace RampStats::Jump


namespace PacBio::Configuration {

template <>
void ValidateConfig<RampStats::Jump::ReadPatternConfig>(
        const RampStats::Jump::ReadPatternConfig& config,
        ValidationResults* results);

template <>
void ValidateConfig<RampStats::Jump::SimInputConfig>(
        const RampStats::Jump::SimInputConfig& config,
        ValidationResults* results);

template <>
void ValidateConfig<RampStats::Jump::InlineInputConfig>(
        const RampStats::Jump::InlineInputConfig& config,
        ValidationResults* results);

// Cross checks between the read pattern and the source
template <>
void ValidateConfig<RampStats::Jump::RampStatsConfig>(
        const RampStats::Jump::RampStatsConfig& config,
        ValidationResults* results);

} // namespace PacBio::Configuration

#endif // RAMP_STATS_CONFIG_H
