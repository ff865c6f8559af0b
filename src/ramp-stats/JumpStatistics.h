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
///  \brief Fixed (per read pattern) and pixel (per ramp) statistics used by
///         the jump detection stage of the ramp fit.

#ifndef RAMP_STATS_JUMP_STATISTICS_H
#define RAMP_STATS_JUMP_STATISTICS_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include <boost/multi_array.hpp>

#include <ramp-stats/RampStatsConstants.h>
#include <ramp-stats/ReadPattern.h>

namespace RampStats::Jump {

/// Tables are stored arr[row][column] with c storage order, so each named
/// row is a contiguous run of NumColumns(numResultants) floats.
using StatsTable = boost::multi_array<float, 2>;
using StatsTableRef = boost::multi_array_ref<float, 2>;

/// Allocates a NumFixedOffsets x NumColumns(numResultants) table.
/// \throws PBException if numResultants < minResultants
StatsTable MakeFixedTable(size_t numResultants);

/// Allocates a NumPixelOffsets x NumColumns(numResultants) table.
/// \throws PBException if numResultants < minResultants
StatsTable MakePixelTable(size_t numResultants);

/// Fills the read pattern statistics for every adjacent (single step) and
/// skip-one (double step) resultant pair.  The double step entries of the
/// last column are NaN, since no resultant exists two steps past it.
///
/// The table is computed once per read pattern and may then be shared,
/// read-only, by any number of concurrent FillPixelValues calls.
///
/// \param fixed     Output table, NumFixedOffsets x NumColumns(n)
/// \param metadata  The read pattern timing summary
/// \return          \a fixed, to allow chaining
/// \throws PBException if the metadata fails ReadPatternMetadata::Check or
///         the table shape does not match it.
StatsTableRef& FillFixedValues(StatsTableRef& fixed, const ReadPatternMetadata& metadata);

/// Fills the local slope and read noise variance of one pixel's ramp for
/// every single and double step resultant pair.  The double step entries of
/// the last column are NaN.  Degenerate time separations in the fixed table
/// propagate as inf/NaN.
///
/// \param pixel       Output table, NumPixelOffsets x NumColumns(n)
/// \param resultants  The pixel's n resultant values
/// \param fixed       A table previously filled by FillFixedValues
/// \param readNoise   The pixel's read noise, non-negative
/// \return            \a pixel, to allow chaining
/// \throws PBException on any shape mismatch or a negative/NaN read noise.
StatsTableRef& FillPixelValues(StatsTableRef& pixel,
                               const std::vector<float>& resultants,
                               const StatsTableRef& fixed,
                               float readNoise);

/// Boundary checks shared by the checked entry points and by batch callers
/// that validate once and then call the kernels below directly.
/// \throws PBException describing the mismatch
void CheckFixedTable(const StatsTableRef& fixed, size_t numResultants);
void CheckPixelTable(const StatsTableRef& pixel, size_t numResultants);

/// Unchecked kernels.  All pointers address contiguous storage: inputs of
/// numResultants elements, tables of NumOffsets * NumColumns(numResultants)
/// floats laid out row by row.  The caller guarantees numResultants >= 2.
namespace Kernels {

void FillFixedValues(const float* tBar, const float* tau, const uint32_t* nReads,
                     size_t numResultants, float* fixed);

void FillPixelValues(const float* resultants, const float* fixed, float readNoise,
                     size_t numResultants, float* pixel);

} // namespace Kernels

} // namespace RampStats::Jump

#endif // RAMP_STATS_JUMP_STATISTICS_H
