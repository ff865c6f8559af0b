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
///  \brief Sources of up-the-ramp resultant images

#ifndef RAMP_STATS_RAMP_SOURCE_H
#define RAMP_STATS_RAMP_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>

#include <boost/multi_array.hpp>

#include <ramp-stats/RampStatsConfig.h>

namespace RampStats::Jump {

/// Resultants of every pixel of a detector image.
struct RampImage
{
    /// arr[row][col][resultant], c storage order, so each pixel's ramp is
    /// contiguous.
    boost::multi_array<float, 3> resultants;

    /// arr[row][col], read noise in the same units as the resultants
    boost::multi_array<float, 2> readNoise;

    size_t NumRows() const { return resultants.shape()[0]; }
    size_t NumCols() const { return resultants.shape()[1]; }
    size_t NumResultants() const { return resultants.shape()[2]; }
};

/// Fabricates ramps with a deterministic flux per pixel, Poisson shot noise
/// accumulated read by read, and Gaussian read noise on every read.
class RampSimulator
{
public:
    RampSimulator(ReadPatternConfig patternCfg, SimInputConfig simCfg);

    RampImage Generate();

public:
    /// Electrons per second collected by \a pixelId (row major index).
    float Id2Flux(size_t pixelId) const
    {
        const auto frac = static_cast<float>(pixelId % fluxSteps) / (fluxSteps - 1);
        return simCfg_.minFlux + frac * (simCfg_.maxFlux - simCfg_.minFlux);
    }

    /// True if \a pixelId has a step injected half way up its ramp.
    bool HasJump(size_t pixelId) const
    {
        return simCfg_.jumpStride > 0 && pixelId % simCfg_.jumpStride == 0;
    }

    std::pair<size_t, size_t> Id2Coords(size_t pixelId) const
    {
        auto lda = simCfg_.nCols;
        return { pixelId / lda, pixelId % lda };
    }

private:
    static constexpr uint32_t fluxSteps = 64;

    ReadPatternConfig patternCfg_;
    SimInputConfig simCfg_;

    std::default_random_engine gnr_;
};

/// Lays the pixels of an inline configuration out as a single image row.
/// \throws PBException if the pixels do not all have the same resultant
///         count, or the read noise count differs from the pixel count.
RampImage MakeInlineImage(const InlineInputConfig& cfg);

/// Builds the image described by the configured source.
RampImage CreateRampImage(const RampStatsConfig& cfg);

} // namespace RampStats::Jump

#endif // RAMP_STATS_RAMP_SOURCE_H
