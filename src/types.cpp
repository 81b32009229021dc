/**
 * @file types.cpp
 * @brief Names for error codes and stages
 */

#include "contact_sheet/types.hpp"

namespace contact_sheet {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::ToolNotFound:
    return "ToolNotFound";
  case ErrorCode::ProbeParseFailure:
    return "ProbeError::ParseFailure";
  case ErrorCode::ProbeExecutionFailure:
    return "ProbeError::ExecutionFailure";
  case ErrorCode::InvalidConfig:
    return "PlanError::InvalidConfig";
  case ErrorCode::EmptyVideo:
    return "PlanError::EmptyVideo";
  case ErrorCode::NoThumbnails:
    return "PlanError::NoThumbnails";
  case ErrorCode::RenderExecutionFailure:
    return "RenderError::ExecutionFailure";
  case ErrorCode::VideoNotFound:
    return "VideoNotFound";
  case ErrorCode::NoSelection:
    return "NoSelection";
  case ErrorCode::OutputDirectory:
    return "OutputDirectory";
  }
  return "Unknown";
}

const char *stage_name(Stage stage) {
  switch (stage) {
  case Stage::Tools:
    return "tools";
  case Stage::Select:
    return "select";
  case Stage::Probe:
    return "probe";
  case Stage::Plan:
    return "plan";
  case Stage::Render:
    return "render";
  case Stage::Done:
    return "done";
  }
  return "unknown";
}

} // namespace contact_sheet
