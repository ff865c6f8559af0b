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
///  \brief Per-resultant timing metadata for an up-the-ramp read pattern.

#ifndef RAMP_STATS_READ_PATTERN_H
#define RAMP_STATS_READ_PATTERN_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace RampStats {

/// A read pattern lists, for every resultant, the 1-based indices of the
/// individual reads that were averaged into it.  e.g. [[1], [2, 3], [4, 5, 6]]
using ReadPattern = std::vector<std::vector<int>>;

/// The timing summary shared by every pixel exposed with one read pattern.
/// All three vectors have one entry per resultant.
struct ReadPatternMetadata
{
    /// Mean time of the reads composing each resultant.
    /// Non-decreasing, though not necessarily strictly increasing.
    std::vector<float> tBar;

    /// Variance contributing time term of each resultant.
    std::vector<float> tau;

    /// Number of reads averaged into each resultant.
    std::vector<uint32_t> nReads;

    size_t NumResultants() const
    { return tBar.size(); }

    /// Verifies the three sequences have equal length and there are at least
    /// two resultants.  Values are not checked; zero read counts or unordered
    /// times surface as non-finite statistics.
    /// \throws PBException describing the first problem found.
    void Check() const;

    /// Derives the metadata from a read pattern.
    /// \param pattern   The reads composing each resultant, in acquisition order
    /// \param readTime  Time between consecutive reads, in seconds
    /// \throws PBException if the pattern has fewer than two resultants, an
    ///         empty resultant, a read index below 1 or out of order, or if
    ///         readTime is not a positive finite number.
    static ReadPatternMetadata FromReadPattern(const ReadPattern& pattern, double readTime);
};

} // namespace RampStats

#endif // RAMP_STATS_READ_PATTERN_H
