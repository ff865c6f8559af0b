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
///  \brief Defines the ramp-stats process, which launches the analysis thread and services the main thread


#ifndef RAMP_STATS_PROCESS_H
#define RAMP_STATS_PROCESS_H

#include <optional>
#include <string>
#include <vector>

#include <pacbio/process/OptionParser.h>
#include <pacbio/process/ProcessBase.h>

#include <ramp-stats/RampStatsConfig.h>
#include <ramp-stats/ExitCodes.h>

namespace RampStats::Jump {

class RampStatsProcess : public PacBio::Process::ThreadedProcessBase
{
public:
    struct Settings
    {
        bool validateOnly = false;
        RampStatsConfig rampStatsConfig;
        double timeoutSeconds = 0.0;
        std::string outputFile;
    };

public:
    RampStatsProcess() = default;
    ~RampStatsProcess() override;

    /// Direct connection from actual main entry point to a member function of this class.
    /// The caller should just map a valid argc and argv from the main entry point to this method.
    /// \param argc - number of command line arguments include the path to the binary
    /// \param argv - command line arguments. Must be nullptr terminated.
    /// \returns the exit code that the process should end with.
    int Main(int argc, const char* argv[]);

    /// ProcessBase override, called with exceptions caught by the framework.
    void SendException(const std::string& message) override;

    /// See SendException(const std::string&)
    void SendException(const std::exception& ex) override;

    /// Creates the command line parser that will parse argv
    static PacBio::Process::OptionParser CreateOptionParser();

    /// Converts the options into a RampStatsProcess::Settings struct.  Any
    /// validation errors will be logged.
    ///
    /// \param options a Values class holding the CLI options
    /// \return std::optional<Settings> that is empty if there were any
    ///         parsing/validation errors, and otherwise holds the values
    ///         extracted from the options input
    static std::optional<Settings> HandleLocalOptions(PacBio::Process::Values& options);

protected:
    /// Runs the analysis and returns a Linux process exit code.  See ExitCodes.h.
    /// \returns process exit code
    int Run();

    /// Launches the analysis thread and waits for it to complete or time out.
    /// \returns process exit code
    int RunAllThreads();

private:
    std::vector<std::string> commandLine_;
    Settings settings_;
};

} // namespace RampStats::Jump

#endif // RAMP_STATS_PROCESS_H
