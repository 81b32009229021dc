/**
 * @file main.cpp
 * @brief Entry point for Contact Sheet application
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing (getopt_long)
 *
 *          - Tool discovery before any video work
 *
 *          - Video selection: explicit file, or directory scan with an
 *            interactive / non-interactive resolver
 *
 *          - Output path defaulting and directory creation
 *
 * @note Defaults for interval, columns, height and tool locations come from
 *       CONTACT_SHEET_* environment variables (see config.hpp); options on
 *       the command line take precedence.
 */

#include <getopt.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "contact_sheet/config.hpp"
#include "contact_sheet/logging.hpp"
#include "contact_sheet/process.hpp"
#include "contact_sheet/sheet_generator.hpp"
#include "contact_sheet/sheet_planner.hpp"
#include "contact_sheet/system.hpp"
#include "contact_sheet/video_selector.hpp"

using namespace contact_sheet;

namespace {

constexpr int EXIT_USAGE = 2;

struct Options {
  std::string video_file;
  std::string dir = ".";
  std::string output;
  std::vector<std::string> extensions;
  bool non_interactive = false;
  SheetConfig sheet;
};

void print_usage(const char *prog) {
  fmt::print(
      "Usage: {} [options] [video_file]\n"
      "\n"
      "Generate a contact sheet (thumbnail grid) from a video file.\n"
      "If video_file is omitted, the scan directory is searched.\n"
      "\n"
      "Options:\n"
      "  -d, --dir DIR          Directory to scan (default: .)\n"
      "  -i, --interval SEC     Seconds between thumbnails (default: {})\n"
      "  -c, --columns N        Columns in the grid (default: {})\n"
      "  -H, --height PX        Thumbnail height in pixels (default: {})\n"
      "  -o, --output FILE      Output image "
      "(default: <video dir>/<name>_contact.jpg)\n"
      "  -e, --ext EXT          Video extension to scan for; repeatable\n"
      "                         (default: .mp4 .mkv .avi .mov .wmv .flv)\n"
      "  -n, --non-interactive  Never prompt when several videos are found\n"
      "  -h, --help             Show this help\n",
      prog, Config::interval_sec(), Config::columns(), Config::thumb_height());
}

bool parse_double(const char *text, double &value) {
  errno = 0;
  char *end = nullptr;
  value = std::strtod(text, &end);
  return end != text && *end == '\0' && errno != ERANGE;
}

bool parse_int(const char *text, int &value) {
  errno = 0;
  char *end = nullptr;
  long parsed = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || errno == ERANGE || parsed > 1000000 ||
      parsed < -1000000)
    return false;
  value = static_cast<int>(parsed);
  return true;
}

/// @return -1 to continue, otherwise the exit status
int parse_options(int argc, char *argv[], Options &opts) {
  static const struct option long_opts[] = {
      {"dir", required_argument, nullptr, 'd'},
      {"interval", required_argument, nullptr, 'i'},
      {"columns", required_argument, nullptr, 'c'},
      {"height", required_argument, nullptr, 'H'},
      {"output", required_argument, nullptr, 'o'},
      {"ext", required_argument, nullptr, 'e'},
      {"non-interactive", no_argument, nullptr, 'n'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  opts.sheet.interval = Config::interval_sec();
  opts.sheet.columns = Config::columns();
  opts.sheet.thumb_height = Config::thumb_height();

  int c;
  while ((c = getopt_long(argc, argv, "d:i:c:H:o:e:nh", long_opts,
                          nullptr)) != -1) {
    switch (c) {
    case 'd':
      opts.dir = optarg;
      break;
    case 'i':
      if (!parse_double(optarg, opts.sheet.interval)) {
        LOG_ERROR("Invalid interval '{}'", optarg);
        return EXIT_USAGE;
      }
      break;
    case 'c':
      if (!parse_int(optarg, opts.sheet.columns)) {
        LOG_ERROR("Invalid column count '{}'", optarg);
        return EXIT_USAGE;
      }
      break;
    case 'H':
      if (!parse_int(optarg, opts.sheet.thumb_height)) {
        LOG_ERROR("Invalid thumbnail height '{}'", optarg);
        return EXIT_USAGE;
      }
      break;
    case 'o':
      opts.output = optarg;
      break;
    case 'e':
      opts.extensions.push_back(optarg);
      break;
    case 'n':
      opts.non_interactive = true;
      break;
    case 'h':
      print_usage(argv[0]);
      return EXIT_SUCCESS;
    default:
      print_usage(argv[0]);
      return EXIT_USAGE;
    }
  }

  if (optind < argc) {
    opts.video_file = argv[optind++];
  }
  if (optind < argc) {
    LOG_ERROR("Unexpected argument '{}'", argv[optind]);
    return EXIT_USAGE;
  }

  /// Reject bad geometry before any tool is looked up
  PlanResult checked = validate_config(opts.sheet);
  if (!checked.ok()) {
    LOG_ERROR("{}", checked.diagnostic);
    return EXIT_USAGE;
  }
  return -1;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  Options opts;
  int status = parse_options(argc, argv, opts);
  if (status >= 0)
    return status;

  namespace fs = std::filesystem;

  // **---- TOOL DISCOVERY ----**

  SystemProcessRunner runner;
  SheetGenerator generator(runner, Config::ffprobe_bin(), Config::ffmpeg_bin(),
                           Config::jpeg_quality());
  if (!generator.check_tools().ok()) {
    return EXIT_FAILURE;
  }

  // **---- VIDEO SELECTION ----**

  std::string video;
  if (!opts.video_file.empty()) {
    std::error_code ec;
    if (!fs::is_regular_file(opts.video_file, ec)) {
      LOG_ERROR("Specified video file not found: '{}'", opts.video_file);
      return EXIT_FAILURE;
    }
    video = opts.video_file;
  } else {
    auto extensions = normalize_extensions(opts.extensions);
    NonInteractiveResolver batch_resolver;
    PromptResolver prompt_resolver(std::cin, std::cout);
    VideoResolver &resolver =
        opts.non_interactive ? static_cast<VideoResolver &>(batch_resolver)
                             : static_cast<VideoResolver &>(prompt_resolver);

    Selection selection = select_video(opts.dir, extensions, resolver);
    if (!selection.ok())
      return EXIT_FAILURE;
    if (!selection.video)
      return EXIT_SUCCESS;
    video = *selection.video;
  }

  // **---- OUTPUT PATH ----**

  std::string output =
      opts.output.empty() ? default_output_path(video) : opts.output;
  std::string dir_error;
  if (!ensure_parent_directory(output, dir_error)) {
    LOG_ERROR("{}", dir_error);
    return EXIT_FAILURE;
  }

  // **---- GENERATE ----**

  SheetResult result = generator.run(video, opts.sheet, output);

  if (Config::timing_enabled()) {
    TimingCollector::print_summary();
  }

  if (result.ok()) {
    LOG_SUCCESS("\nDone.");
    return EXIT_SUCCESS;
  }

  LOG_ERROR("Contact sheet generation failed at {} stage ({}): {}",
            stage_name(result.stage), error_code_name(result.code),
            result.diagnostic);
  return EXIT_FAILURE;
}
