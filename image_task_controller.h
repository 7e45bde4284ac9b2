#pragma once
#include <cstdint>
#include <map>
#include <string>

#include "fallback_renderer.h"
#include "http_fetch.h"
#include "image_host.h"
#include "kernel_program.h"
#include "resampler.h"
#include "safety_resolver.h"
#include "sinc_config.h"
#include "sinc_types.h"

struct image_task {
  image_element *element = nullptr;
  TaskStatus status = TaskStatus::UNSEEN;
  TaskReason reason = TaskReason::NONE;
  ErrorKind gpu_error = ErrorKind::NONE;  // why the GPU path did not produce a surface
  double scale_x = 0.0;                   // valid once status >= EVALUATED
  double scale_y = 0.0;
  render_surface *surface = nullptr;      // at most one per element
  display_state prior_display{};
  bool refetch_pending = false;
  bool refetch_failed = false;
  std::string refetch_url;                // source being re-hosted while refetch_pending
  std::string backend;
  uint64_t generation = 0;                // bumped on every reset; stale callbacks compare it
};

// Per-document session: sequences geometry -> safety -> kernel | fallback for every
// image, owns the task table, the rendering-hint side table and the refetch caches.
//
// Single-threaded. document_host::set_source must not dispatch the resulting load
// synchronously; the host reports it later through on_load().
class ImageTaskController {
public:
  // resampler / fetcher may be null (no GPU / no network).
  ImageTaskController(document_host &doc, const sinc_options &opt, Resampler *resampler, FetchClient *fetcher);

  ImageTaskController(const ImageTaskController&) = delete;
  ImageTaskController& operator=(const ImageTaskController&) = delete;

  // One pass over the document in traversal order.
  void process_all();

  // Starts work for one image; a no-op for images already in progress or done.
  void process(image_element &img);

  // Load notification: resumes a waiting image, or restarts a finished one whose
  // source changed. A load for a different source supersedes an in-flight refetch.
  // Earlier output is torn down even when the image is now gated out.
  void on_load(image_element &img);

  // Element left the document: drop everything keyed by it, including refetch waiters.
  void on_detached(image_element &img);

  const image_task* task_for(const image_element &img) const;
  bool has_pending_work() const;
  size_t terminal_events() const { return terminal_events_; }

  const sinc_options& options() const { return opt_; }
  void set_options(const sinc_options &opt);

  SafetyResolver& safety() { return safety_; }
  const RenderHintCache& hints() const { return hints_; }

  // [{id, src, status, reason, scaleX, scaleY, backend}, ...] in document order.
  std::string status_json();

private:
  bool gated_out(const image_element &img) const;
  image_task& task_entry(image_element &img);
  void reset_task(image_task &t);
  void evaluate(image_element &img, image_task &t);
  void run_resample(image_element &img, image_task &t, const scale_info &si);
  void start_refetch(image_element &img, image_task &t);
  void finish(image_element &img, image_task &t, TaskStatus s, TaskReason r);
  void teardown(image_element &img, image_task &t);

  document_host &doc_;
  sinc_options opt_;
  Resampler *resampler_;
  SafetyResolver safety_;
  RenderHintCache hints_;
  std::map<const image_element*, image_task> tasks_;
  uint64_t next_generation_ = 1;
  size_t terminal_events_ = 0;
};
