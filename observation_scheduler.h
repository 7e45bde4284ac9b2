#pragma once
#include <stdint.h>
#include "image_task_controller.h"

// Coalesces document change notifications into throttled processing passes.
// The host feeds it mutations, loads and detaches, and calls poll() from its loop.
class ObservationScheduler {
public:
  explicit ObservationScheduler(ImageTaskController &ctl) : ctl_(ctl) {}

  // Arms a pass at now + throttleMs unless one is already armed.
  void notify_mutation(uint64_t now_ms);

  // Load of a tracked or untracked image: re-evaluates it and arms a pass.
  void notify_load(image_element &img, uint64_t now_ms);

  void notify_detached(image_element &img);

  // Runs one process_all() when the armed time has been reached. True if it ran.
  bool poll(uint64_t now_ms);

  bool armed() const { return armed_; }
  uint64_t next_due_ms() const { return due_ms_; }
  int passes() const { return passes_; }

private:
  void arm(uint64_t now_ms);

  ImageTaskController &ctl_;
  bool armed_ = false;
  uint64_t due_ms_ = 0;
  int passes_ = 0;
};
