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
///  \brief Row layout of the fixed and pixel statistics tables used by the
///         jump detection stage.
///
/// Both tables are row-major, contiguous 2-D float buffers with one column per
/// adjacent resultant pair (numResultants - 1 columns).  The rows are addressed
/// by the enumerations below; the numeric values and the names returned by
/// FixedOffsetName/PixelOffsetName form the interchange schema consumed
/// downstream, so neither the order nor the names may change.

#ifndef RAMP_STATS_CONSTANTS_H
#define RAMP_STATS_CONSTANTS_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace RampStats::Jump {

/// Rows of the per read pattern ("fixed") statistics table.
enum FixedOffsets : uint32_t
{
    SingleTBarDiff = 0,
    DoubleTBarDiff,
    SingleTBarDiffSqr,
    DoubleTBarDiffSqr,
    SingleReadRecip,
    DoubleReadRecip,
    SingleVarSlopeVal,
    DoubleVarSlopeVal,

    NumFixedOffsets
};

/// Rows of the per pixel statistics table.
enum PixelOffsets : uint32_t
{
    SingleLocalSlope = 0,
    DoubleLocalSlope,
    SingleVarReadNoise,
    DoubleVarReadNoise,

    NumPixelOffsets
};

inline constexpr std::array<const char*, NumFixedOffsets> fixedOffsetNames
{
    "single_t_bar_diff",
    "double_t_bar_diff",
    "single_t_bar_diff_sqr",
    "double_t_bar_diff_sqr",
    "single_read_recip",
    "double_read_recip",
    "single_var_slope_val",
    "double_var_slope_val"
};

inline constexpr std::array<const char*, NumPixelOffsets> pixelOffsetNames
{
    "single_local_slope",
    "double_local_slope",
    "single_var_read_noise",
    "double_var_read_noise"
};

inline constexpr const char* FixedOffsetName(FixedOffsets offset)
{ return fixedOffsetNames[offset]; }

inline constexpr const char* PixelOffsetName(PixelOffsets offset)
{ return pixelOffsetNames[offset]; }

/// Smallest number of resultants for which the tables have any columns.
inline constexpr size_t minResultants = 2;

/// Number of table columns for a read pattern of \a numResultants resultants.
inline constexpr size_t NumColumns(size_t numResultants)
{ return numResultants - 1; }

} // namespace RampStats::Jump

#endif // RAMP_STATS_CONSTANTS_H
