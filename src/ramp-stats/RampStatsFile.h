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

#ifndef RAMP_STATS_RAMP_STATS_FILE_H
#define RAMP_STATS_RAMP_STATS_FILE_H

#include <cstddef>
#include <string>

#include <json/json.h>

#include <ramp-stats/ReadPattern.h>

namespace RampStats::Jump {

struct RampStatsResult;

/// Builds the document
/// {
///   "numResultants": n,
///   "metadata": { "t_bar": [...], "tau": [...], "n_reads": [...] },
///   "fixed":    { "single_t_bar_diff": [...], ... },
///   "pixels":   { "numRows": r, "numCols": c,
///                 "single_local_slope": [[...], ...], ... }
/// }
/// Fixed and pixel rows are keyed by their schema names.  Each pixel row
/// holds one array per pixel, in row major pixel order.  Non-finite values,
/// including the undefined last double step column, are written as null.
/// \throws PBException if the metadata fails ReadPatternMetadata::Check or
///         the table column counts do not match it.
Json::Value RampStatsToJson(const ReadPatternMetadata& metadata, const RampStatsResult& result);

/// Writes RampStatsToJson to \a fileName.
/// \throws PBException if the file cannot be written
void WriteRampStatsFile(const std::string& fileName,
                        const ReadPatternMetadata& metadata,
                        const RampStatsResult& result);

} // namespace RampStats::Jump

#endif // RAMP_STATS_RAMP_STATS_FILE_H
