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

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <pacbio/dev/gtest-extras.h>
#include <pacbio/dev/TemporaryDirectory.h>
#include <pacbio/ipc/JSON.h>
#include <pacbio/logging/Logger.h>

#include <ramp-stats/RampStatsProcess.h>
#include <ramp-stats/ExitCodes.h>

using namespace RampStats::Jump;
using namespace testing;

namespace {

const std::string inlineConfig = R"JSON({
    "readPattern": { "readTime": 1.0, "resultants": [[1], [2], [4], [7]] },
    "source": { "InlineInputConfig": { "resultants": [[100, 140, 220, 400]], "readNoise": [5] } }
})JSON";

} // anonymous namespace

TEST(RampStatsProcess,Help)
{
    RampStatsProcess process;
    int argc = 2;
    const char* argv[] = {"./binary", "--help", nullptr};
    EXPECT_EXIT(process.Main(argc, argv), ExitedWithCode(0), "");
}

TEST(RampStatsProcess,Version)
{
    RampStatsProcess process;
    int argc = 2;
    const char* argv[] = {"./binary", "--version", nullptr};
    EXPECT_EXIT(process.Main(argc, argv), ExitedWithCode(0), "");
}

TEST(RampStatsProcess,BadArg)
{
    RampStatsProcess process;
    int argc = 2;
    const char* argv[] = {"./binary", "--badArg", nullptr};
    EXPECT_EXIT(process.Main(argc, argv),
        ExitedWithCode(2),
        R"(error: no such option: --badArg)");
}

TEST(RampStatsProcess,OptionParser)
{
    auto parser = RampStatsProcess::CreateOptionParser();
    EXPECT_THAT(parser.description(), HasSubstr("Up-the-ramp jump detection statistics"));
}

TEST(RampStatsProcess,LocalOptions)
{
    PacBio::Logging::LogSeverityContext ls(PacBio::Logging::LogLevel::FATAL);
    auto parser = RampStatsProcess::CreateOptionParser();

    auto parseCli = [&parser](std::vector<const char*> args)
    {
        args.insert(args.begin(), "./binary");
        args.insert(args.end(), nullptr);
        auto options = parser.parse_args(args.size()-1, args.data());

        return RampStatsProcess::HandleLocalOptions(options);
    };

    auto settings = parseCli({});
    // We've failed to set a mandatory argument
    EXPECT_FALSE(settings.has_value());

    settings = parseCli({"--outputFile=location"});
    EXPECT_TRUE(settings.has_value());
    if (settings.has_value())
    {
        EXPECT_FALSE(settings->validateOnly);
        EXPECT_EQ(settings->outputFile, "location");
        EXPECT_DOUBLE_EQ(settings->timeoutSeconds, 300.0);
    }

    // Validation alone needs no output file
    settings = parseCli({"--validateconfig"});
    EXPECT_TRUE(settings.has_value());
    if (settings.has_value())
    {
        EXPECT_TRUE(settings->validateOnly);
    }

    settings = parseCli({"--outputFile=location", "--timeoutSeconds=0"});
    EXPECT_FALSE(settings.has_value());

    // An invalid configuration value
    settings = parseCli({"--outputFile=location", R"(--config={"readPattern":{"readTime":-1.0}})"});
    EXPECT_FALSE(settings.has_value());

    // Unparseable configuration
    settings = parseCli({"--outputFile=location", "--config={\"readPatern\":{}}"});
    EXPECT_FALSE(settings.has_value());

    // A more comprehensive setting
    const std::string config = "--config=" + inlineConfig;
    settings = parseCli({"--outputFile=location", config.c_str(), "--timeoutSeconds=80.2"});
    EXPECT_TRUE(settings.has_value());
    if (settings.has_value())
    {
        EXPECT_EQ(settings->outputFile, "location");
        EXPECT_DOUBLE_EQ(settings->timeoutSeconds, 80.2);
        EXPECT_DOUBLE_EQ(settings->rampStatsConfig.readPattern.readTime, 1.0);
        EXPECT_EQ(settings->rampStatsConfig.readPattern.resultants.size(), 4u);
    }
}

TEST(RampStatsProcess,ValidateOnly)
{
    PacBio::Logging::LogSeverityContext ls(PacBio::Logging::LogLevel::FATAL);

    RampStatsProcess process;
    const std::string config = "--config=" + inlineConfig;
    const char* argv[] = {"./binary", "--validateconfig", config.c_str(), nullptr};
    EXPECT_EQ(process.Main(3, argv), ExitCode::NormalExit);
}

TEST(RampStatsProcess,MissingOutput)
{
    PacBio::Logging::LogSeverityContext ls(PacBio::Logging::LogLevel::FATAL);

    RampStatsProcess process;
    const char* argv[] = {"./binary", nullptr};
    EXPECT_EQ(process.Main(1, argv), ExitCode::CommandParsingException);
}

TEST(RampStatsProcess,EndToEnd)
{
    PacBio::Logging::LogSeverityContext ls(PacBio::Logging::LogLevel::FATAL);
    PacBio::Dev::TemporaryDirectory tmpDir;
    const std::string outputFile = "--outputFile=" + tmpDir.DirName() + "/stats.json";
    const std::string config = "--config=" + inlineConfig;

    RampStatsProcess process;
    const char* argv[] = {"./binary", config.c_str(), outputFile.c_str(), nullptr};
    ASSERT_EQ(process.Main(3, argv), ExitCode::NormalExit);

    std::ifstream in(tmpDir.DirName() + "/stats.json");
    ASSERT_TRUE(in.good());
    std::stringstream ss;
    ss << in.rdbuf();
    const auto root = PacBio::IPC::ParseJSON(ss.str());

    const auto& pixels = root["pixels"];
    EXPECT_EQ(pixels["numRows"].asUInt(), 1u);
    EXPECT_EQ(pixels["numCols"].asUInt(), 1u);

    const auto& single = pixels["single_local_slope"][0];
    ASSERT_EQ(single.size(), 3u);
    EXPECT_FLOAT_EQ(single[0].asFloat(), 40.0f);
    EXPECT_FLOAT_EQ(single[1].asFloat(), 40.0f);
    EXPECT_FLOAT_EQ(single[2].asFloat(), 60.0f);

    const auto& dbl = pixels["double_local_slope"][0];
    EXPECT_FLOAT_EQ(dbl[0].asFloat(), 40.0f);
    EXPECT_FLOAT_EQ(dbl[1].asFloat(), 52.0f);
    EXPECT_TRUE(dbl[2].isNull());

    // Single reads on both sides: 5^2 * (1 + 1)
    EXPECT_FLOAT_EQ(pixels["single_var_read_noise"][0][0].asFloat(), 50.0f);
}

TEST(RampStatsProcess,AnalysisFailure)
{
    PacBio::Logging::LogSeverityContext ls(PacBio::Logging::LogLevel::FATAL);
    PacBio::Dev::TemporaryDirectory tmpDir;
    const std::string outputFile = "--outputFile=" + tmpDir.DirName() + "/no/such/dir/stats.json";
    const std::string config = "--config=" + inlineConfig;

    RampStatsProcess process;
    const char* argv[] = {"./binary", config.c_str(), outputFile.c_str(), nullptr};
    EXPECT_EQ(process.Main(3, argv), ExitCode::StdException);
}
