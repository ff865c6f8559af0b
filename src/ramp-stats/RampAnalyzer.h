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
///  \brief Computes jump detection statistics for every pixel of an image

#ifndef RAMP_STATS_RAMP_ANALYZER_H
#define RAMP_STATS_RAMP_ANALYZER_H

#include <functional>
#include <string>

#include <boost/multi_array.hpp>

#include <ramp-stats/JumpStatistics.h>
#include <ramp-stats/RampSource.h>
#include <ramp-stats/RampStatsConfig.h>
#include <ramp-stats/ReadPattern.h>

namespace RampStats::Jump {

struct RampStatsResult
{
    /// NumFixedOffsets x NumColumns, shared by every pixel of the image
    StatsTable fixed;

    /// arr[row][col][PixelOffsets][column]
    boost::multi_array<float, 4> pixel;
};

/// High level functionality, building the configured image source, computing
/// the statistics and writing them to \a outputFile.
///
/// \param config         The read pattern and source configuration
/// \param outputFile     Destination of the JSON statistics file
/// \param exitRequested  Polled between stages; a true return abandons the
///                       analysis
/// \return               true if the file was written, false if the analysis
///                       was abandoned early
bool AnalyzeSourceInput(const RampStatsConfig& config,
                        const std::string& outputFile,
                        const std::function<bool()>& exitRequested);

/// Lower level function computing the fixed table once and then every pixel's
/// table from its own ramp.  The image and the metadata are validated once
/// before the per pixel loop.
///
/// \param metadata  Timing summary of the read pattern the image was taken with
/// \param image     Resultants and read noise of every pixel
/// \return          The shared fixed table and the per pixel tables
/// \throws PBException if the image resultant count differs from the
///         metadata, the read noise map shape differs from the image, or any
///         read noise is negative or NaN.
RampStatsResult AnalyzeRamps(const ReadPatternMetadata& metadata, const RampImage& image);

/// Number of non-finite entries in the pixel tables, excluding the double
/// step entries of the last column, which are always NaN.  Non-zero only for
/// degenerate read patterns or non-finite resultants.
size_t CountDegenerateEntries(const RampStatsResult& result);

} // namespace RampStats::Jump

#endif // RAMP_STATS_RAMP_ANALYZER_H
