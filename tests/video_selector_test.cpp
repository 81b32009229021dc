#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

#include "contact_sheet/video_selector.hpp"

using namespace contact_sheet;

namespace fs = std::filesystem;

namespace {

class VideoSelectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("contact_sheet_selector_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void touch(const std::string &name) { std::ofstream(dir_ / name) << "x"; }

  fs::path dir_;
};

/// Resolver that records what it was offered
class RecordingResolver : public VideoResolver {
public:
  std::optional<std::string>
  resolve(const std::vector<std::string> &candidates) override {
    offered = candidates;
    if (pick < 0)
      return std::nullopt;
    return candidates.at(static_cast<size_t>(pick));
  }
  std::vector<std::string> offered;
  int pick = 0;
};

} // namespace

TEST(NormalizeExtensionsTest, AddsDotAndLowercases) {
  auto exts = normalize_extensions({"MP4", ".MkV", "webm", "mp4"});
  std::vector<std::string> expected = {".mp4", ".mkv", ".webm"};
  EXPECT_EQ(exts, expected);
}

TEST(NormalizeExtensionsTest, EmptyFallsBackToDefaults) {
  EXPECT_EQ(normalize_extensions({}), default_video_extensions());
  EXPECT_EQ(default_video_extensions().size(), 6u);
}

TEST_F(VideoSelectorTest, ListsMatchingFilesSortedByName) {
  touch("b.MKV");
  touch("a.mp4");
  touch("notes.txt");
  touch("c.avi");
  fs::create_directories(dir_ / "folder.mp4");

  std::vector<std::string> files;
  std::string error;
  ASSERT_TRUE(list_video_files(dir_.string(), default_video_extensions(),
                               files, error))
      << error;
  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(fs::path(files[0]).filename().string(), "a.mp4");
  EXPECT_EQ(fs::path(files[1]).filename().string(), "b.MKV");
  EXPECT_EQ(fs::path(files[2]).filename().string(), "c.avi");
}

TEST_F(VideoSelectorTest, MissingDirectoryIsAnError) {
  std::vector<std::string> files;
  std::string error;
  EXPECT_FALSE(list_video_files((dir_ / "nope").string(),
                                default_video_extensions(), files, error));
  EXPECT_NE(error.find("not found"), std::string::npos);
}

TEST_F(VideoSelectorTest, EmptyDirectoryYieldsNoVideoWithoutError) {
  touch("readme.md");
  RecordingResolver resolver;
  auto sel = select_video(dir_.string(), default_video_extensions(), resolver);
  EXPECT_TRUE(sel.ok());
  EXPECT_FALSE(sel.video.has_value());
  EXPECT_TRUE(resolver.offered.empty());
}

TEST_F(VideoSelectorTest, ResolverReceivesAllCandidates) {
  touch("one.mp4");
  touch("two.mov");
  RecordingResolver resolver;
  resolver.pick = 1;
  auto sel = select_video(dir_.string(), default_video_extensions(), resolver);
  ASSERT_TRUE(sel.ok());
  ASSERT_TRUE(sel.video.has_value());
  EXPECT_EQ(fs::path(*sel.video).filename().string(), "two.mov");
  EXPECT_EQ(resolver.offered.size(), 2u);
}

TEST_F(VideoSelectorTest, DeclinedSelectionIsNoSelection) {
  touch("one.mp4");
  touch("two.mov");
  RecordingResolver resolver;
  resolver.pick = -1;
  auto sel = select_video(dir_.string(), default_video_extensions(), resolver);
  EXPECT_EQ(sel.code, ErrorCode::NoSelection);
}

TEST_F(VideoSelectorTest, UnreadableDirectoryIsVideoNotFound) {
  RecordingResolver resolver;
  auto sel = select_video((dir_ / "missing").string(),
                          default_video_extensions(), resolver);
  EXPECT_EQ(sel.code, ErrorCode::VideoNotFound);
}

TEST(NonInteractiveResolverTest, AcceptsOnlyASingleCandidate) {
  NonInteractiveResolver r;
  EXPECT_EQ(r.resolve({"only.mp4"}), std::optional<std::string>("only.mp4"));
  EXPECT_FALSE(r.resolve({"a.mp4", "b.mp4"}).has_value());
}

TEST(PromptResolverTest, RepromptsUntilValidChoice) {
  std::istringstream in("abc\n7\n0\n 2 \n");
  std::ostringstream out;
  PromptResolver r(in, out);

  auto chosen = r.resolve({"/v/a.mp4", "/v/b.mp4", "/v/c.mp4"});
  ASSERT_TRUE(chosen.has_value());
  EXPECT_EQ(*chosen, "/v/b.mp4");

  std::string text = out.str();
  EXPECT_NE(text.find("  1: a.mp4"), std::string::npos);
  EXPECT_NE(text.find("  3: c.mp4"), std::string::npos);
  EXPECT_NE(text.find("Invalid input"), std::string::npos);
  EXPECT_NE(text.find("Invalid choice"), std::string::npos);
  EXPECT_NE(text.find("(1-3)"), std::string::npos);
}

TEST(PromptResolverTest, EndOfInputCancels) {
  std::istringstream in("");
  std::ostringstream out;
  PromptResolver r(in, out);
  EXPECT_FALSE(r.resolve({"a.mp4", "b.mp4"}).has_value());
  EXPECT_NE(out.str().find("cancelled"), std::string::npos);
}

TEST(PromptResolverTest, SingleCandidateNeedsNoInput) {
  std::istringstream in("");
  std::ostringstream out;
  PromptResolver r(in, out);
  EXPECT_EQ(r.resolve({"a.mp4"}), std::optional<std::string>("a.mp4"));
  EXPECT_TRUE(out.str().empty());
}
