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
///  \brief Fixed and pixel statistics tables for jump detection

#include "JumpStatistics.h"

#include <cmath>
#include <limits>
#include <string>

#include <Eigen/Core>

#include <pacbio/PBException.h>

namespace RampStats::Jump {

namespace {

typedef Eigen::Map<const Eigen::ArrayXf> ConstMapArrayXf;
typedef Eigen::Map<Eigen::ArrayXf> MapArrayXf;
typedef Eigen::Map<const Eigen::Array<uint32_t, Eigen::Dynamic, 1>> ConstMapArrayXu;

constexpr float nan = std::numeric_limits<float>::quiet_NaN();

StatsTable MakeTable(size_t numRows, size_t numResultants)
{
    if (numResultants < minResultants)
    {
        throw PBException("Statistics tables need at least " + std::to_string(minResultants)
                          + " resultants, requested " + std::to_string(numResultants));
    }
    return StatsTable(boost::extents[numRows][NumColumns(numResultants)], boost::c_storage_order());
}

void CheckTable(const StatsTableRef& table, size_t numRows, size_t numResultants, const char* tableName)
{
    if (numResultants < minResultants)
    {
        throw PBException(std::string(tableName) + " table needs at least " + std::to_string(minResultants)
                          + " resultants, got " + std::to_string(numResultants));
    }
    const auto numCols = NumColumns(numResultants);
    if (table.shape()[0] != numRows || table.shape()[1] != numCols)
    {
        throw PBException(std::string(tableName) + " table is " + std::to_string(table.shape()[0])
                          + "x" + std::to_string(table.shape()[1]) + ", expected "
                          + std::to_string(numRows) + "x" + std::to_string(numCols));
    }
    if (!(table.storage_order() == boost::c_storage_order()))
    {
        throw PBException(std::string(tableName) + " table must use c storage order");
    }
}

} // anonymous namespace

StatsTable MakeFixedTable(size_t numResultants)
{
    return MakeTable(NumFixedOffsets, numResultants);
}

StatsTable MakePixelTable(size_t numResultants)
{
    return MakeTable(NumPixelOffsets, numResultants);
}

void CheckFixedTable(const StatsTableRef& fixed, size_t numResultants)
{
    CheckTable(fixed, NumFixedOffsets, numResultants, "Fixed");
}

void CheckPixelTable(const StatsTableRef& pixel, size_t numResultants)
{
    CheckTable(pixel, NumPixelOffsets, numResultants, "Pixel");
}

StatsTableRef& FillFixedValues(StatsTableRef& fixed, const ReadPatternMetadata& metadata)
{
    metadata.Check();
    const auto numResultants = metadata.NumResultants();
    CheckFixedTable(fixed, numResultants);

    Kernels::FillFixedValues(metadata.tBar.data(), metadata.tau.data(), metadata.nReads.data(),
                             numResultants, fixed.data());
    return fixed;
}

StatsTableRef& FillPixelValues(StatsTableRef& pixel,
                               const std::vector<float>& resultants,
                               const StatsTableRef& fixed,
                               float readNoise)
{
    const auto numResultants = resultants.size();
    CheckFixedTable(fixed, numResultants);
    CheckPixelTable(pixel, numResultants);
    if (std::isnan(readNoise) || readNoise < 0)
    {
        throw PBException("Read noise must be non-negative, got " + std::to_string(readNoise));
    }

    Kernels::FillPixelValues(resultants.data(), fixed.data(), readNoise, numResultants, pixel.data());
    return pixel;
}

namespace Kernels {

void FillFixedValues(const float* tBarPtr, const float* tauPtr, const uint32_t* nReadsPtr,
                     size_t numResultants, float* fixed)
{
    const Eigen::Index n = numResultants;
    const Eigen::Index numCols = n - 1;   // single step pairs (i, i+1)
    const Eigen::Index numDouble = n - 2; // double step pairs (i, i+2)

    ConstMapArrayXf tBar(tBarPtr, n);
    ConstMapArrayXf tau(tauPtr, n);
    ConstMapArrayXu nReads(nReadsPtr, n);

    auto row = [&](FixedOffsets offset) { return MapArrayXf(fixed + offset * numCols, numCols); };

    // The min() covers patterns whose resultant times are only non-decreasing.
    row(SingleTBarDiff) = tBar.tail(numCols) - tBar.head(numCols);
    row(SingleTBarDiffSqr) = row(SingleTBarDiff).square();
    row(SingleReadRecip) = nReads.tail(numCols).cast<float>().inverse()
                         + nReads.head(numCols).cast<float>().inverse();
    row(SingleVarSlopeVal) = tau.tail(numCols) + tau.head(numCols)
                           - 2.0f * tBar.tail(numCols).min(tBar.head(numCols));

    row(DoubleTBarDiff).head(numDouble) = tBar.tail(numDouble) - tBar.head(numDouble);
    row(DoubleTBarDiffSqr).head(numDouble) = row(DoubleTBarDiff).head(numDouble).square();
    row(DoubleReadRecip).head(numDouble) = nReads.tail(numDouble).cast<float>().inverse()
                                         + nReads.head(numDouble).cast<float>().inverse();
    row(DoubleVarSlopeVal).head(numDouble) = tau.tail(numDouble) + tau.head(numDouble)
                                           - 2.0f * tBar.tail(numDouble).min(tBar.head(numDouble));

    // No resultant two steps past the last column.
    for (auto offset : { DoubleTBarDiff, DoubleTBarDiffSqr, DoubleReadRecip, DoubleVarSlopeVal })
    {
        row(offset)[numCols - 1] = nan;
    }
}

void FillPixelValues(const float* resultantsPtr, const float* fixed, float readNoise,
                     size_t numResultants, float* pixel)
{
    const Eigen::Index n = numResultants;
    const Eigen::Index numCols = n - 1;
    const Eigen::Index numDouble = n - 2;

    ConstMapArrayXf resultants(resultantsPtr, n);

    auto fixedRow = [&](FixedOffsets offset) { return ConstMapArrayXf(fixed + offset * numCols, numCols); };
    auto row = [&](PixelOffsets offset) { return MapArrayXf(pixel + offset * numCols, numCols); };

    const float readNoise2 = readNoise * readNoise;

    row(SingleLocalSlope) = (resultants.tail(numCols) - resultants.head(numCols)) / fixedRow(SingleTBarDiff);
    row(SingleVarReadNoise) = readNoise2 * fixedRow(SingleReadRecip);

    row(DoubleLocalSlope).head(numDouble) = (resultants.tail(numDouble) - resultants.head(numDouble))
                                          / fixedRow(DoubleTBarDiff).head(numDouble);
    row(DoubleVarReadNoise).head(numDouble) = readNoise2 * fixedRow(DoubleReadRecip).head(numDouble);

    row(DoubleLocalSlope)[numCols - 1] = nan;
    row(DoubleVarReadNoise)[numCols - 1] = nan;
}

} // namespace Kernels

} // namespace RampStats::Jump
