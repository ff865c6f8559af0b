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
///  \brief Validation of the ramp-stats configuration

#include "RampStatsConfig.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <ramp-stats/RampStatsConstants.h>

namespace PacBio::Configuration {

using namespace RampStats::Jump;

template <>
void ValidateConfig<ReadPatternConfig>(const ReadPatternConfig& config, ValidationResults* results)
{
    const double readTime = config.readTime;
    if (!std::isfinite(readTime) || readTime <= 0)
    {
        std::ostringstream msg;
        msg << "Bad value.  readTime = " << readTime
            << ".  Should be positive and finite.";
        results->AddError(msg.str());
    }

    const auto& pattern = config.resultants;
    if (pattern.size() < minResultants)
    {
        std::ostringstream msg;
        msg << "Bad value.  resultants has " << pattern.size()
            << " entries.  At least " << minResultants << " resultants are required.";
        results->AddError(msg.str());
    }

    int lastRead = 0;
    for (size_t i = 0; i < pattern.size(); ++i)
    {
        if (pattern[i].empty())
        {
            std::ostringstream msg;
            msg << "Bad value.  resultants[" << i << "] is empty.";
            results->AddError(msg.str());
        }
        for (const auto read : pattern[i])
        {
            if (read <= lastRead)
            {
                std::ostringstream msg;
                msg << "Bad value.  resultants[" << i << "] contains read " << read
                    << ".  Reads are 1-based and must be strictly increasing.";
                results->AddError(msg.str());
            }
            lastRead = std::max(lastRead, read);
        }
    }
}

template <>
void ValidateConfig<SimInputConfig>(const SimInputConfig& config, ValidationResults* results)
{
    if (config.nRows == 0 || config.nCols == 0)
    {
        std::ostringstream msg;
        msg << "Bad value.  Image is " << config.nRows << "x" << config.nCols
            << ".  Both dimensions must be non-zero.";
        results->AddError(msg.str());
    }

    const float minFlux = config.minFlux;
    const float maxFlux = config.maxFlux;
    if (!std::isfinite(minFlux) || !std::isfinite(maxFlux) || minFlux > maxFlux)
    {
        std::ostringstream msg;
        msg << "Bad value.  Flux range [" << minFlux << ", " << maxFlux
            << "].  Should be finite and ordered.";
        results->AddError(msg.str());
    }

    const float readNoise = config.readNoise;
    if (std::isnan(readNoise) || readNoise < 0)
    {
        std::ostringstream msg;
        msg << "Bad value.  readNoise = " << readNoise
            << ".  Should be greater or equal to zero.";
        results->AddError(msg.str());
    }

    const float jumpAmplitude = config.jumpAmplitude;
    if (!std::isfinite(jumpAmplitude))
    {
        std::ostringstream msg;
        msg << "Bad value.  jumpAmplitude = " << jumpAmplitude
            << ".  Should be finite.";
        results->AddError(msg.str());
    }
}

template <>
void ValidateConfig<InlineInputConfig>(const InlineInputConfig& config, ValidationResults* results)
{
    const auto& resultants = config.resultants;
    const auto& readNoise = config.readNoise;
    if (resultants.empty())
    {
        results->AddError("Bad value.  resultants is empty.  At least one pixel is required.");
    }
    if (readNoise.size() != resultants.size())
    {
        std::ostringstream msg;
        msg << "Bad value.  readNoise has " << readNoise.size() << " entries but there are "
            << resultants.size() << " pixels.";
        results->AddError(msg.str());
    }
    for (size_t i = 0; i < readNoise.size(); ++i)
    {
        if (std::isnan(readNoise[i]) || readNoise[i] < 0)
        {
            std::ostringstream msg;
            msg << "Bad value.  readNoise[" << i << "] = " << readNoise[i]
                << ".  Should be greater or equal to zero.";
            results->AddError(msg.str());
        }
    }
}

template <>
void ValidateConfig<RampStatsConfig>(const RampStatsConfig& config, ValidationResults* results)
{
    const size_t numResultants = config.readPattern.resultants.size();
    config.source.Visit(
        [](const SimInputConfig&) {},
        [&](const InlineInputConfig& cfg)
        {
            for (size_t i = 0; i < cfg.resultants.size(); ++i)
            {
                if (cfg.resultants[i].size() != numResultants)
                {
                    std::ostringstream msg;
                    msg << "Bad value.  Pixel " << i << " has " << cfg.resultants[i].size()
                        << " resultants but the read pattern has " << numResultants << ".";
                    results->AddError(msg.str());
                }
            }
        });
}

} // namespace PacBio::Configuration
