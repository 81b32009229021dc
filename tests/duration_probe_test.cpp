#include <gtest/gtest.h>

#include "contact_sheet/duration_probe.hpp"

#include "fake_process_runner.hpp"

using namespace contact_sheet;
using namespace contact_sheet::test_support;

TEST(ParseDurationTest, PlainNumber) {
  auto r = parse_duration("12.5");
  ASSERT_TRUE(r.ok());
  EXPECT_DOUBLE_EQ(r.duration, 12.5);
  EXPECT_TRUE(r.warnings.empty());
}

TEST(ParseDurationTest, SurroundingWhitespaceIgnored) {
  auto r = parse_duration("  600.040000\n");
  ASSERT_TRUE(r.ok());
  EXPECT_DOUBLE_EQ(r.duration, 600.04);
}

TEST(ParseDurationTest, EmptyIsZeroWithWarning) {
  for (const char *text : {"", "\n", "   "}) {
    auto r = parse_duration(text);
    ASSERT_TRUE(r.ok());
    EXPECT_DOUBLE_EQ(r.duration, 0.0);
    EXPECT_EQ(r.warnings.size(), 1u);
  }
}

TEST(ParseDurationTest, NegativeIsClampedWithWarning) {
  auto r = parse_duration("-3.0");
  ASSERT_TRUE(r.ok());
  EXPECT_DOUBLE_EQ(r.duration, 0.0);
  ASSERT_EQ(r.warnings.size(), 1u);
  EXPECT_NE(r.warnings[0].find("negative"), std::string::npos);
}

TEST(ParseDurationTest, NonNumericIsParseFailure) {
  for (const char *text : {"abc", "N/A", "12.5s", "nan", "inf", "1e999"}) {
    auto r = parse_duration(text);
    EXPECT_EQ(r.code, ErrorCode::ProbeParseFailure) << text;
  }
}

TEST(ParseDurationTest, ParseFailureQuotesTheOutput) {
  auto r = parse_duration("abc");
  EXPECT_NE(r.diagnostic.find("'abc'"), std::string::npos);
}

TEST(ProbeDurationTest, RunsProbeWithVideoAsSingleArgument) {
  FakeProcessRunner runner;
  runner.handler = [](const std::vector<std::string> &) {
    return exited(0, "125.0\n");
  };

  auto r = probe_duration(runner, "/opt/ff/ffprobe", "my clip; rm -rf.mp4");
  ASSERT_TRUE(r.ok());
  EXPECT_DOUBLE_EQ(r.duration, 125.0);

  ASSERT_EQ(runner.calls.size(), 1u);
  const auto &argv = runner.calls[0];
  std::vector<std::string> expected = {
      "/opt/ff/ffprobe", "-v",  "error", "-show_entries", "format=duration",
      "-of", "default=noprint_wrappers=1:nokey=1", "my clip; rm -rf.mp4"};
  EXPECT_EQ(argv, expected);
}

TEST(ProbeDurationTest, NonZeroExitCarriesDiagnostics) {
  FakeProcessRunner runner;
  runner.handler = [](const std::vector<std::string> &) {
    return exited(1, "", "missing.mp4: No such file or directory\n");
  };

  auto r = probe_duration(runner, "/opt/ff/ffprobe", "missing.mp4");
  EXPECT_EQ(r.code, ErrorCode::ProbeExecutionFailure);
  EXPECT_NE(r.diagnostic.find("No such file or directory"), std::string::npos);
  EXPECT_NE(r.diagnostic.find("ffprobe"), std::string::npos);
  EXPECT_EQ(runner.calls.size(), 1u);
}

TEST(ProbeDurationTest, GarbageOutputIsParseFailure) {
  FakeProcessRunner runner;
  runner.handler = [](const std::vector<std::string> &) {
    return exited(0, "abc\n");
  };
  auto r = probe_duration(runner, "/opt/ff/ffprobe", "x.mp4");
  EXPECT_EQ(r.code, ErrorCode::ProbeParseFailure);
}

TEST(ProbeDurationTest, EmptyOutputIsZeroNotError) {
  FakeProcessRunner runner;
  runner.handler = [](const std::vector<std::string> &) { return exited(0); };
  auto r = probe_duration(runner, "/opt/ff/ffprobe", "x.mp4");
  ASSERT_TRUE(r.ok());
  EXPECT_DOUBLE_EQ(r.duration, 0.0);
  EXPECT_EQ(r.warnings.size(), 1u);
}

TEST(ProbeDurationTest, UnstartableProbeIsToolNotFound) {
  FakeProcessRunner runner;
  runner.handler = [](const std::vector<std::string> &) {
    return not_started();
  };
  auto r = probe_duration(runner, "/opt/ff/ffprobe", "x.mp4");
  EXPECT_EQ(r.code, ErrorCode::ToolNotFound);
}

TEST(ProbeDurationTest, DoesNotRetry) {
  FakeProcessRunner runner;
  runner.handler = [](const std::vector<std::string> &) {
    return exited(1, "", "boom");
  };
  probe_duration(runner, "/opt/ff/ffprobe", "x.mp4");
  EXPECT_EQ(runner.calls.size(), 1u);
}
