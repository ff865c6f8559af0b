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
///  \brief Simulated and inline ramp image sources

#include "RampSource.h"

#include <algorithm>
#include <string>
#include <vector>

#include <pacbio/logging/Logger.h>
#include <pacbio/PBException.h>

namespace RampStats::Jump {

RampSimulator::RampSimulator(ReadPatternConfig patternCfg, SimInputConfig simCfg)
    : patternCfg_(std::move(patternCfg))
    , simCfg_(std::move(simCfg))
    , gnr_(simCfg_.seed)
{
    if (simCfg_.nRows == 0 || simCfg_.nCols == 0)
        throw PBException("Incorrect image dimension. Both rows and columns must be non-zero.");
    if (simCfg_.readNoise < 0)
        throw PBException("Simulated read noise cannot be negative");

    // Throws unless every read index is 1-based and strictly increasing, so
    // the last read of the last resultant bounds all of them.
    patternCfg_.Metadata();
}

RampImage RampSimulator::Generate()
{
    const auto& pattern = patternCfg_.resultants;
    const double readTime = patternCfg_.readTime;
    const size_t numRows = simCfg_.nRows;
    const size_t numCols = simCfg_.nCols;
    const size_t numResultants = pattern.size();

    const int lastRead = pattern.back().back();
    const int jumpRead = lastRead / 2;

    PBLOG_INFO << "Simulating " << numRows << "x" << numCols << " pixels, "
               << numResultants << " resultants over " << lastRead << " reads";

    RampImage image {
        boost::multi_array<float, 3>(boost::extents[numRows][numCols][numResultants], boost::c_storage_order()),
        boost::multi_array<float, 2>(boost::extents[numRows][numCols], boost::c_storage_order())
    };

    const float readNoise = simCfg_.readNoise;
    std::normal_distribution<float> noise(0.0f, readNoise > 0 ? readNoise : 1.0f);

    // reads[k] is the accumulated signal of read k+1
    std::vector<double> reads(lastRead);
    for (size_t pixelId = 0; pixelId < numRows * numCols; ++pixelId)
    {
        const auto [row, col] = Id2Coords(pixelId);
        const double electronsPerRead = Id2Flux(pixelId) * readTime;
        const bool jump = HasJump(pixelId);

        double accumulated = 0;
        for (int k = 0; k < lastRead; ++k)
        {
            if (electronsPerRead > 0)
            {
                std::poisson_distribution<int64_t> shot(electronsPerRead);
                accumulated += shot(gnr_);
            }
            reads[k] = accumulated;
            if (jump && k + 1 > jumpRead) reads[k] += simCfg_.jumpAmplitude;
            if (readNoise > 0) reads[k] += noise(gnr_);
        }

        for (size_t i = 0; i < numResultants; ++i)
        {
            double sum = 0;
            for (const auto read : pattern[i]) sum += reads[read - 1];
            image.resultants[row][col][i] = static_cast<float>(sum / pattern[i].size());
        }
        image.readNoise[row][col] = readNoise;
    }

    return image;
}

RampImage MakeInlineImage(const InlineInputConfig& cfg)
{
    const auto& pixels = cfg.resultants;
    const auto& readNoise = cfg.readNoise;
    if (pixels.empty())
        throw PBException("Inline source has no pixels");
    if (readNoise.size() != pixels.size())
        throw PBException("Inline source has " + std::to_string(pixels.size()) + " pixels but "
                          + std::to_string(readNoise.size()) + " read noise values");

    const size_t numPixels = pixels.size();
    const size_t numResultants = pixels[0].size();
    RampImage image {
        boost::multi_array<float, 3>(boost::extents[1][numPixels][numResultants], boost::c_storage_order()),
        boost::multi_array<float, 2>(boost::extents[1][numPixels], boost::c_storage_order())
    };

    for (size_t p = 0; p < numPixels; ++p)
    {
        if (pixels[p].size() != numResultants)
            throw PBException("Inline pixel " + std::to_string(p) + " has " + std::to_string(pixels[p].size())
                              + " resultants, expected " + std::to_string(numResultants));
        std::copy(pixels[p].begin(), pixels[p].end(), image.resultants[0][p].begin());
        image.readNoise[0][p] = static_cast<float>(readNoise[p]);
    }

    PBLOG_INFO << "Loaded " << numPixels << " inline pixels with " << numResultants << " resultants";
    return image;
}

RampImage CreateRampImage(const RampStatsConfig& cfg)
{
    return cfg.source.Visit(
        [&](const SimInputConfig& simCfg) -> RampImage
        {
            RampSimulator sim(cfg.readPattern, simCfg);
            return sim.Generate();
        },
        [&](const InlineInputConfig& inlineCfg) -> RampImage
        {
            return MakeInlineImage(inlineCfg);
        }
    );
}

} // namespace RampStats::Jump
