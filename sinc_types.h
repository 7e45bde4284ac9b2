#pragma once
#include <cstdint>

// Per-image processing state. Terminal: SKIPPED, FALLBACK_APPLIED, RESAMPLED, FAILED.
enum class TaskStatus {
  UNSEEN = 0,
  WAITING_FOR_LOAD = 1,
  EVALUATED = 2,
  SKIPPED = 3,
  FALLBACK_APPLIED = 4,
  RESAMPLED = 5,
  FAILED = 6,
};

enum class ErrorKind {
  NONE = 0,
  NOT_READY,
  INELIGIBLE,
  ORIGIN_RESTRICTED,
  GPU_UNAVAILABLE,
  SHADER_FAILURE,
  DRAW_FAILURE,
  FALLBACK_INELIGIBLE,
};

// Why a task ended where it did (finer grained than ErrorKind for the skip cases).
enum class TaskReason {
  NONE = 0,
  VECTOR_SOURCE,
  PLACEHOLDER,
  NO_SCALING,
  BELOW_ZOOM_THRESHOLD,
  ORIGIN_RESTRICTED,
  GPU_UNAVAILABLE,
  SHADER_FAILURE,
  DRAW_FAILURE,
  FALLBACK_INELIGIBLE,
};

enum class SafetyDecision {
  SAFE = 0,
  UNSAFE_REFETCHABLE = 1,
  UNSAFE_PERMANENT = 2,
};

struct scale_info {
  bool valid = false;             // false: natural size unknown (not decoded yet)
  double scale_x = 0.0;
  double scale_y = 0.0;
  bool needs_resampling = false;
  double content_w = 0.0;
  double content_h = 0.0;
  uint32_t target_w = 0;
  uint32_t target_h = 0;
};

// Relative tolerance shared by eligibility, integer and uniformity tests.
static constexpr double kScaleTolerance = 1e-3;

static inline bool task_status_terminal(TaskStatus s) {
  return s == TaskStatus::SKIPPED || s == TaskStatus::FALLBACK_APPLIED ||
         s == TaskStatus::RESAMPLED || s == TaskStatus::FAILED;
}

static inline const char* task_status_to_string(TaskStatus s) {
  switch (s) {
    case TaskStatus::UNSEEN:           return "unseen";
    case TaskStatus::WAITING_FOR_LOAD: return "waitingForLoad";
    case TaskStatus::EVALUATED:        return "evaluated";
    case TaskStatus::SKIPPED:          return "skipped";
    case TaskStatus::FALLBACK_APPLIED: return "fallbackApplied";
    case TaskStatus::RESAMPLED:        return "resampled";
    case TaskStatus::FAILED:           return "failed";
    default:                           return "unknown";
  }
}

static inline const char* task_reason_to_string(TaskReason r) {
  switch (r) {
    case TaskReason::NONE:                 return "none";
    case TaskReason::VECTOR_SOURCE:        return "vectorSource";
    case TaskReason::PLACEHOLDER:          return "placeholder";
    case TaskReason::NO_SCALING:           return "noScaling";
    case TaskReason::BELOW_ZOOM_THRESHOLD: return "belowZoomThreshold";
    case TaskReason::ORIGIN_RESTRICTED:    return "originRestricted";
    case TaskReason::GPU_UNAVAILABLE:      return "gpuUnavailable";
    case TaskReason::SHADER_FAILURE:       return "shaderFailure";
    case TaskReason::DRAW_FAILURE:         return "drawFailure";
    case TaskReason::FALLBACK_INELIGIBLE:  return "fallbackIneligible";
    default:                               return "unknown";
  }
}

static inline const char* error_kind_to_string(ErrorKind e) {
  switch (e) {
    case ErrorKind::NONE:                return "none";
    case ErrorKind::NOT_READY:           return "notReady";
    case ErrorKind::INELIGIBLE:          return "ineligible";
    case ErrorKind::ORIGIN_RESTRICTED:   return "originRestricted";
    case ErrorKind::GPU_UNAVAILABLE:     return "gpuUnavailable";
    case ErrorKind::SHADER_FAILURE:      return "shaderFailure";
    case ErrorKind::DRAW_FAILURE:        return "drawFailure";
    case ErrorKind::FALLBACK_INELIGIBLE: return "fallbackIneligible";
    default:                             return "unknown";
  }
}

static inline TaskReason task_reason_from_error(ErrorKind e) {
  switch (e) {
    case ErrorKind::ORIGIN_RESTRICTED:   return TaskReason::ORIGIN_RESTRICTED;
    case ErrorKind::GPU_UNAVAILABLE:     return TaskReason::GPU_UNAVAILABLE;
    case ErrorKind::SHADER_FAILURE:      return TaskReason::SHADER_FAILURE;
    case ErrorKind::DRAW_FAILURE:        return TaskReason::DRAW_FAILURE;
    case ErrorKind::FALLBACK_INELIGIBLE: return TaskReason::FALLBACK_INELIGIBLE;
    default:                             return TaskReason::NONE;
  }
}
