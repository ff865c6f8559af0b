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

#include "RampAnalyzer.h"

#include <algorithm>
#include <cmath>

#include <pacbio/logging/Logger.h>
#include <pacbio/PBException.h>

#include <ramp-stats/RampStatsFile.h>

namespace RampStats::Jump {

bool AnalyzeSourceInput(const RampStatsConfig& config,
                        const std::string& outputFile,
                        const std::function<bool()>& exitRequested)
{
    const auto metadata = config.readPattern.Metadata();
    PBLOG_INFO << "Read pattern has " << metadata.NumResultants() << " resultants, readTime "
               << config.readPattern.readTime << "s";

    const auto image = CreateRampImage(config);
    if (exitRequested()) return false;

    const auto result = AnalyzeRamps(metadata, image);
    if (exitRequested()) return false;

    const auto degenerate = CountDegenerateEntries(result);
    if (degenerate > 0)
    {
        PBLOG_WARN << degenerate << " pixel statistics are not finite. The read pattern may have "
                   << "resultants with equal mean times, or the input ramps contain non-finite values";
    }

    WriteRampStatsFile(outputFile, metadata, result);
    PBLOG_INFO << "Ramp statistics file " << outputFile << " written and closed.";

    return true;
}

RampStatsResult AnalyzeRamps(const ReadPatternMetadata& metadata, const RampImage& image)
{
    metadata.Check();

    const size_t numResultants = metadata.NumResultants();
    const size_t numRows = image.NumRows();
    const size_t numCols = image.NumCols();

    if (image.NumResultants() != numResultants)
    {
        throw PBException("Image has " + std::to_string(image.NumResultants()) + " resultants per pixel"
                          + " but the read pattern has " + std::to_string(numResultants));
    }
    if (image.readNoise.shape()[0] != numRows || image.readNoise.shape()[1] != numCols)
    {
        throw PBException("Read noise map is " + std::to_string(image.readNoise.shape()[0]) + "x"
                          + std::to_string(image.readNoise.shape()[1]) + " but the image is "
                          + std::to_string(numRows) + "x" + std::to_string(numCols));
    }
    if (!(image.resultants.storage_order() == boost::c_storage_order())
        || !(image.readNoise.storage_order() == boost::c_storage_order()))
    {
        throw PBException("Ramp images must use c storage order");
    }

    const float* noiseBegin = image.readNoise.data();
    const float* noiseEnd = noiseBegin + image.readNoise.num_elements();
    const auto badNoise = std::find_if(noiseBegin, noiseEnd, [](float x) { return std::isnan(x) || x < 0; });
    if (badNoise != noiseEnd)
    {
        const auto pixelId = static_cast<size_t>(badNoise - noiseBegin);
        throw PBException("Read noise of pixel (" + std::to_string(pixelId / numCols) + ","
                          + std::to_string(pixelId % numCols) + ") is " + std::to_string(*badNoise)
                          + ", must be non-negative");
    }

    const size_t numTableCols = NumColumns(numResultants);
    RampStatsResult ret {
        MakeFixedTable(numResultants),
        boost::multi_array<float, 4>(boost::extents[numRows][numCols][NumPixelOffsets][numTableCols],
                                     boost::c_storage_order())
    };
    FillFixedValues(ret.fixed, metadata);

    // The fixed table is read only from here on.
    const float* fixed = ret.fixed.data();
    const float* ramps = image.resultants.data();
    const float* readNoise = image.readNoise.data();
    float* pixel = ret.pixel.data();
    const size_t pixelStride = NumPixelOffsets * numTableCols;

    const size_t rowsPerReport = std::max<size_t>(1, numRows / 10);
    for (size_t row = 0; row < numRows; ++row)
    {
        for (size_t col = 0; col < numCols; ++col)
        {
            const size_t p = row * numCols + col;
            Kernels::FillPixelValues(ramps + p * numResultants, fixed, readNoise[p],
                                     numResultants, pixel + p * pixelStride);
        }
        if ((row + 1) % rowsPerReport == 0)
            PBLOG_DEBUG << "AnalyzeRamps completed " << row + 1 << " of " << numRows << " rows";
    }

    PBLOG_INFO << "Computed jump statistics for " << numRows * numCols << " pixels";
    return ret;
}

size_t CountDegenerateEntries(const RampStatsResult& result)
{
    const auto* shape = result.pixel.shape();
    const size_t numPixels = shape[0] * shape[1];
    const size_t numTableCols = shape[3];
    const float* pixel = result.pixel.data();

    size_t count = 0;
    for (size_t p = 0; p < numPixels; ++p)
    {
        for (size_t offset = 0; offset < NumPixelOffsets; ++offset)
        {
            const bool isDouble = offset == DoubleLocalSlope || offset == DoubleVarReadNoise;
            const size_t definedCols = isDouble ? numTableCols - 1 : numTableCols;
            const float* row = pixel + (p * NumPixelOffsets + offset) * numTableCols;
            count += std::count_if(row, row + definedCols, [](float x) { return !std::isfinite(x); });
        }
    }
    return count;
}

} // namespace RampStats::Jump
