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
///  \brief JSON serialization of the jump detection statistics

#include "RampStatsFile.h"

#include <cmath>
#include <fstream>
#include <memory>

#include <pacbio/logging/Logger.h>
#include <pacbio/PBException.h>

#include <ramp-stats/RampAnalyzer.h>
#include <ramp-stats/RampStatsConstants.h>

namespace RampStats::Jump {

namespace {

Json::Value ToJson(float x)
{
    return std::isfinite(x) ? Json::Value(x) : Json::Value(Json::nullValue);
}

template <typename T>
Json::Value ToJson(const T* begin, size_t count)
{
    Json::Value arr(Json::arrayValue);
    for (size_t i = 0; i < count; ++i) arr.append(ToJson(begin[i]));
    return arr;
}

Json::Value ToJson(const uint32_t* begin, size_t count)
{
    Json::Value arr(Json::arrayValue);
    for (size_t i = 0; i < count; ++i) arr.append(Json::UInt(begin[i]));
    return arr;
}

Json::StreamWriterBuilder GetStreamWriterBuilder()
{
    Json::StreamWriterBuilder builder;
    builder.settings_["commentStyle"] = "None";
    builder.settings_["indentation"] = "  ";
    return builder;
}

} // anonymous namespace

Json::Value RampStatsToJson(const ReadPatternMetadata& metadata, const RampStatsResult& result)
{
    metadata.Check();
    const size_t numResultants = metadata.NumResultants();
    const size_t numTableCols = result.fixed.shape()[1];
    if (numTableCols != NumColumns(numResultants) || result.pixel.shape()[3] != numTableCols)
    {
        throw PBException("Statistics tables have " + std::to_string(numTableCols)
                          + " columns, inconsistent with " + std::to_string(numResultants) + " resultants");
    }

    Json::Value root;
    root["numResultants"] = Json::UInt64(numResultants);

    auto& meta = root["metadata"];
    meta["t_bar"] = ToJson(metadata.tBar.data(), numResultants);
    meta["tau"] = ToJson(metadata.tau.data(), numResultants);
    meta["n_reads"] = ToJson(metadata.nReads.data(), numResultants);

    auto& fixed = root["fixed"];
    for (uint32_t offset = 0; offset < NumFixedOffsets; ++offset)
    {
        const auto name = FixedOffsetName(static_cast<FixedOffsets>(offset));
        fixed[name] = ToJson(result.fixed.data() + offset * numTableCols, numTableCols);
    }

    const size_t numRows = result.pixel.shape()[0];
    const size_t numCols = result.pixel.shape()[1];
    auto& pixels = root["pixels"];
    pixels["numRows"] = Json::UInt64(numRows);
    pixels["numCols"] = Json::UInt64(numCols);
    for (uint32_t offset = 0; offset < NumPixelOffsets; ++offset)
    {
        Json::Value perPixel(Json::arrayValue);
        for (size_t p = 0; p < numRows * numCols; ++p)
        {
            const float* row = result.pixel.data() + (p * NumPixelOffsets + offset) * numTableCols;
            perPixel.append(ToJson(row, numTableCols));
        }
        pixels[PixelOffsetName(static_cast<PixelOffsets>(offset))] = std::move(perPixel);
    }

    return root;
}

void WriteRampStatsFile(const std::string& fileName,
                        const ReadPatternMetadata& metadata,
                        const RampStatsResult& result)
{
    const auto json = RampStatsToJson(metadata, result);

    std::ofstream out(fileName);
    if (!out)
    {
        throw PBException("Unable to open " + fileName + " for writing");
    }

    std::unique_ptr<Json::StreamWriter> writer(GetStreamWriterBuilder().newStreamWriter());
    writer->write(json, &out);
    out << std::endl;
    if (!out)
    {
        throw PBException("Failed writing ramp statistics to " + fileName);
    }
    PBLOG_DEBUG << "Wrote " << result.pixel.shape()[0] * result.pixel.shape()[1] << " pixels to " << fileName;
}

} // namespace RampStats::Jump
