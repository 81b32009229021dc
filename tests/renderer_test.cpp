#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "contact_sheet/renderer.hpp"

#include "fake_process_runner.hpp"

using namespace contact_sheet;
using namespace contact_sheet::test_support;

namespace fs = std::filesystem;

namespace {

class RendererTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("contact_sheet_renderer_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(dir_, ec);
  }

  RenderRequest request_for(const fs::path &out) {
    SheetConfig cfg;
    SheetPlan plan{20, 4};
    return build_render_request(plan, cfg, "input.mp4", out.string());
  }

  static void write_file(const fs::path &p, const std::string &content) {
    std::ofstream f(p, std::ios::binary);
    f << content;
  }

  fs::path dir_;
};

} // namespace

TEST_F(RendererTest, SuccessReportsArtifact) {
  fs::path out = dir_ / "sheet.jpg";
  FakeProcessRunner runner;
  runner.handler = [&](const std::vector<std::string> &) {
    write_file(out, "JPEGDATA");
    return exited(0);
  };

  auto r = render_sheet(runner, "/opt/ff/ffmpeg", request_for(out));
  ASSERT_TRUE(r.ok()) << r.diagnostic;
  EXPECT_EQ(r.output_path, out.string());
  EXPECT_TRUE(fs::exists(out));
  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].front(), "/opt/ff/ffmpeg");
}

TEST_F(RendererTest, FailureRemovesPartialOutput) {
  fs::path out = dir_ / "sheet.jpg";
  FakeProcessRunner runner;
  runner.handler = [&](const std::vector<std::string> &) {
    write_file(out, "PARTIAL");
    return exited(1, "", "Error while filtering: Invalid argument\n");
  };

  auto r = render_sheet(runner, "/opt/ff/ffmpeg", request_for(out));
  EXPECT_EQ(r.code, ErrorCode::RenderExecutionFailure);
  EXPECT_NE(r.diagnostic.find("Error while filtering: Invalid argument"),
            std::string::npos);
  EXPECT_NE(r.diagnostic.find("-frames:v 1"), std::string::npos);
  EXPECT_FALSE(fs::exists(out));
  EXPECT_TRUE(r.warnings.empty());
}

TEST_F(RendererTest, FailureWithoutOutputIsStillExecutionFailure) {
  fs::path out = dir_ / "never_written.jpg";
  FakeProcessRunner runner;
  runner.handler = [](const std::vector<std::string> &) {
    return exited(183, "", "broken");
  };

  auto r = render_sheet(runner, "/opt/ff/ffmpeg", request_for(out));
  EXPECT_EQ(r.code, ErrorCode::RenderExecutionFailure);
  EXPECT_FALSE(fs::exists(out));
  EXPECT_TRUE(r.warnings.empty());
}

TEST_F(RendererTest, UnstartableRendererIsExecutionFailure) {
  fs::path out = dir_ / "sheet.jpg";
  FakeProcessRunner runner;
  runner.handler = [](const std::vector<std::string> &) {
    return not_started("cannot execute");
  };
  auto r = render_sheet(runner, "/opt/ff/ffmpeg", request_for(out));
  EXPECT_EQ(r.code, ErrorCode::RenderExecutionFailure);
  EXPECT_NE(r.diagnostic.find("cannot execute"), std::string::npos);
}

TEST_F(RendererTest, CleanupFailureIsOnlyAWarning) {
  fs::path out = dir_ / "sheet.jpg";
  FakeProcessRunner runner;
  runner.handler = [&](const std::vector<std::string> &) {
    fs::create_directories(out);
    write_file(out / "keep.txt", "user data");
    return exited(1, "", "disk full");
  };

  auto r = render_sheet(runner, "/opt/ff/ffmpeg", request_for(out));
  EXPECT_EQ(r.code, ErrorCode::RenderExecutionFailure);
  ASSERT_EQ(r.warnings.size(), 1u);
  EXPECT_NE(r.warnings[0].find(out.string()), std::string::npos);
  EXPECT_NE(r.diagnostic.find("disk full"), std::string::npos);
  EXPECT_TRUE(fs::exists(out / "keep.txt"));
}

TEST_F(RendererTest, ExistingDirectoryAtOutputIsNeverRemoved) {
  fs::path out = dir_ / "albums";
  fs::create_directories(out);
  FakeProcessRunner runner;
  runner.handler = [](const std::vector<std::string> &) {
    return exited(1, "", "Is a directory");
  };

  auto r = render_sheet(runner, "/opt/ff/ffmpeg", request_for(out));
  EXPECT_EQ(r.code, ErrorCode::RenderExecutionFailure);
  EXPECT_TRUE(fs::is_directory(out));
  EXPECT_EQ(r.warnings.size(), 1u);
}

TEST_F(RendererTest, DanglingSymlinkAtOutputIsRemoved) {
  fs::path out = dir_ / "sheet.jpg";
  FakeProcessRunner runner;
  runner.handler = [&](const std::vector<std::string> &) {
    fs::create_symlink(dir_ / "missing_target.jpg", out);
    return exited(1, "", "broken");
  };

  auto r = render_sheet(runner, "/opt/ff/ffmpeg", request_for(out));
  EXPECT_EQ(r.code, ErrorCode::RenderExecutionFailure);
  EXPECT_FALSE(fs::exists(fs::symlink_status(out)));
  EXPECT_TRUE(r.warnings.empty());
}

TEST_F(RendererTest, RemovePartialOutputIgnoresMissingFile) {
  EXPECT_FALSE(remove_partial_output((dir_ / "nothing.jpg").string()).has_value());
}
