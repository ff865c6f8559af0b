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
///  \brief Defines the ramp-stats process

#include "RampStatsProcess.h"

#include <chrono>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>

#include <json/json.h>

// library includes
#include <pacbio/configuration/MergeConfigs.h>
#include <pacbio/dev/AutoTimer.h>
#include <pacbio/logging/Logger.h>
#include <pacbio/POSIX.h>
#include <pacbio/process/OptionParser.h>
#include <pacbio/process/ProcessBase.h>

// local includes
#include "ExitCodes.h"
#include "RampAnalyzer.h"
#include "RampStatsConfig.h"

// generated in the build directory from version.h.in
#include <version.h>

using namespace PacBio;
using namespace PacBio::Configuration;
using namespace PacBio::Process;
using namespace PacBio::Logging;


namespace RampStats::Jump {

RampStatsProcess::~RampStatsProcess()
{
    Abort();
    Join();
}

OptionParser RampStatsProcess::CreateOptionParser()
{
    OptionParser parser = ProcessBase::OptionParserFactory();
    std::stringstream ss;
    ss << "Up-the-ramp jump detection statistics\n\n"
       << CMAKE_BUILD_TYPE_STRING << " build";
    parser.description(ss.str());
    parser.version(VERSION_STRING);

    parser.add_option("--config").action_append().help("Loads JSON configuration. Can be file name or inline JSON object, e.g. \"{ ... }\"");
    parser.add_option("--showconfig").action_store_true().help("Shows the entire configuration namespace with current values and exits");
    parser.add_option("--validateconfig").action_store_true().help("Validates the supplied configuration settings and exits");

    parser.add_option("--timeoutSeconds").type_double().set_default(60*5).help("ramp-stats will self abort if this timeout expires");
    parser.add_option("--outputFile").type_string().help("Destination JSON file, containing the fixed and per pixel statistics");
    return parser;
}

std::optional<RampStatsProcess::Settings> RampStatsProcess::HandleLocalOptions(PacBio::Process::Values& options)
{
    Settings ret;
    try
    {
        std::vector<std::string> cliValidationErrors;

        ret.validateOnly = options.get("validateconfig");

        ret.timeoutSeconds = options.get("timeoutSeconds");
        if (ret.timeoutSeconds <= 0) cliValidationErrors.push_back("--timeoutSeconds must be strictly positive");

        ret.outputFile = options["outputFile"];
        if (ret.outputFile.empty() && !ret.validateOnly)
            cliValidationErrors.push_back("Must supply value for --outputFile option");

        Json::Value json = MergeConfigs(options.all("config"));
        ret.rampStatsConfig = RampStatsConfig(json);

        if (options.get("showconfig"))
        {
            std::cout << ret.rampStatsConfig.Serialize() << std::endl;
            exit(0);
        }

        auto jsonValidation = ret.rampStatsConfig.Validate();
        if (jsonValidation.ErrorCount() > 0)
        {
            jsonValidation.PrintErrors();
        }

        for (const auto& err : cliValidationErrors)
        {
            PBLOG_ERROR << err;
        }

        if (cliValidationErrors.size() + jsonValidation.ErrorCount() > 0)
        {
            return {};
        }

        PBLOG_INFO << ret.rampStatsConfig.Serialize();
        return ret;
    } catch(std::exception& e)
    {
        PBLOG_ERROR << "Caught exception while parsing options: " << e.what();
    }
    return {};
}

int RampStatsProcess::RunAllThreads()
{
    CreateThread("Analysis", [this]()
    {
        try
        {
            bool success = AnalyzeSourceInput(settings_.rampStatsConfig, settings_.outputFile,
                                              [this]() { return ExitRequested(); });

            if (success) PBLOG_INFO << "Main analysis has completed";
            else PBLOG_INFO << "Main analysis not successful";
            RequestExit();
        } catch (const std::exception& ex)
        {
            PBLOG_ERROR << "Caught exception thrown by analysis thread: " << ex.what();
            PBLOG_ERROR << "Analysis thread will now terminate early";
            SetExitCode(ExitCode::StdException);
            RequestExit();
        }
        PBLOG_INFO << "Analysis Thread Complete";
    });

    PBLOG_INFO << "RampStatsProcess waiting to complete analysis";
    Dev::QuietAutoTimer timer;
    while(!ExitRequested())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
        if (timer.GetElapsedMilliseconds() > settings_.timeoutSeconds*1000)
        {
            PBLOG_ERROR << "Timeout limit exceeded, attempting to self-terminate process...";
            SetExitCode(ExitCode::Timeout);
            RequestExit();
        }
    }

    PBLOG_INFO << "Joining...";
    Join();
    PBLOG_INFO << "All threads joined";

    return ExitCode();
}

int RampStatsProcess::Run()
{
    PBLOG_INFO << "ramp-stats: Version " << VERSION_STRING << " CMAKE_BUILD_TYPE:" << CMAKE_BUILD_TYPE_STRING;

    std::stringstream ss;
    for (const auto& arg : commandLine_)
    {
        ss << arg << " ";
    }
    PBLOG_INFO << "command line: " << ss.str();
    PBLOG_INFO << "Process Id:" << POSIX::GetPid();

    try
    {
        auto exitCode1 = RunAllThreads();
        SetExitCode(exitCode1);
        PBLOG_INFO << "main: RunAllThreads() normal exit, code:" << exitCode1;
    }
    catch (const std::exception& ex)
    {
        PBLOG_ERROR << "main: fatal exception: " << ex.what();
        SetExitCode(ExitCode::StdException);
    }

    auto exitCode = ExitCode();
    PBLOG_DEBUG << "main: exit code:" << exitCode;
    return exitCode;
}

int RampStatsProcess::Main(int argc, const char *argv[])
{
    int exitCode = ExitCode::DefaultUnknownFailure;
    try
    {
        // save the command line for later
        for (const char **arg = argv; *arg; arg++)
            commandLine_.push_back(*arg);

        auto parser = CreateOptionParser();
        Values &options = parser.parse_args(argc, argv);
        HandleGlobalOptions(options);
        auto settings = HandleLocalOptions(options);
        if (!settings.has_value())
        {
            exitCode = ExitCode::CommandParsingException;
        }
        else if (settings->validateOnly)
        {
            PBLOG_INFO << "Configuration is valid";
            exitCode = ExitCode::NormalExit;
        }
        else
        {
            settings_ = settings.value();
            exitCode = Run();
        }
    }
    // These top level exception handlers should never be called, but are here to prevent an exception leak
    // from calling `terminate()`. They also do not write to the logger.
    catch (const std::system_error &ex)
    {
        if (ex.code().value() != 0)
        {
            std::cerr << "exit_exception at main(): " << ex.what() << ", exit code" << ex.code().value() << std::endl;
            exitCode = ex.code().value();
        }
        else
        {
            exitCode = ExitCode::StdException;
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "std::exception caught at main(): " << ex.what() << std::endl;
        exitCode = ExitCode::StdException;
    }
    return exitCode;
}

void RampStatsProcess::SendException(const std::string& message)
{
    PBLOG_ERROR << "RampStatsProcess Exception message caught:" << message;
}

void RampStatsProcess::SendException(const std::exception& ex)
{
    PBLOG_DEBUG << "RampStatsProcess std::exception caught:" << ex.what();
}

} // namespace RampStats::Jump
