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
///  \brief Derivation and validation of read pattern metadata

#include "ReadPattern.h"

#include <cmath>
#include <string>

#include <pacbio/PBException.h>

#include <ramp-stats/RampStatsConstants.h>

namespace RampStats {

void ReadPatternMetadata::Check() const
{
    const auto numResultants = tBar.size();
    if (tau.size() != numResultants || nReads.size() != numResultants)
    {
        throw PBException("Read pattern metadata length mismatch. tBar:" + std::to_string(tBar.size())
                          + " tau:" + std::to_string(tau.size())
                          + " nReads:" + std::to_string(nReads.size()));
    }
    if (numResultants < Jump::minResultants)
    {
        throw PBException("Read pattern must have at least " + std::to_string(Jump::minResultants)
                          + " resultants, found " + std::to_string(numResultants));
    }
}

ReadPatternMetadata ReadPatternMetadata::FromReadPattern(const ReadPattern& pattern, double readTime)
{
    if (!std::isfinite(readTime) || readTime <= 0)
    {
        throw PBException("readTime must be positive and finite, got " + std::to_string(readTime));
    }
    if (pattern.size() < Jump::minResultants)
    {
        throw PBException("Read pattern must have at least " + std::to_string(Jump::minResultants)
                          + " resultants, found " + std::to_string(pattern.size()));
    }

    ReadPatternMetadata ret;
    ret.tBar.reserve(pattern.size());
    ret.tau.reserve(pattern.size());
    ret.nReads.reserve(pattern.size());

    int lastRead = 0;
    for (size_t i = 0; i < pattern.size(); ++i)
    {
        const auto& resultant = pattern[i];
        if (resultant.empty())
            throw PBException("Resultant " + std::to_string(i) + " of the read pattern is empty");

        // Reads are weighted by how many later reads in the same resultant
        // share their noise: tau = dt * sum_k (2(n-k)-1) r_k / n^2
        const double n = static_cast<double>(resultant.size());
        double readSum = 0;
        double weightedSum = 0;
        for (size_t k = 0; k < resultant.size(); ++k)
        {
            const int read = resultant[k];
            if (read < 1)
                throw PBException("Read indices are 1-based, found " + std::to_string(read)
                                  + " in resultant " + std::to_string(i));
            if (read <= lastRead)
                throw PBException("Read indices must be strictly increasing, found " + std::to_string(read)
                                  + " after " + std::to_string(lastRead) + " in resultant " + std::to_string(i));
            lastRead = read;

            readSum += read;
            weightedSum += (2.0 * (n - k) - 1.0) * read;
        }

        ret.nReads.push_back(static_cast<uint32_t>(resultant.size()));
        ret.tBar.push_back(static_cast<float>(readTime * readSum / n));
        ret.tau.push_back(static_cast<float>(readTime * weightedSum / (n * n)));
    }

    return ret;
}

} // namespace RampStats
