#include "observation_scheduler.h"

#include <cstdio>

void ObservationScheduler::arm(uint64_t now_ms) {
  if (armed_) return;
  armed_ = true;
  due_ms_ = now_ms + (uint64_t)ctl_.options().throttle_ms;
}

void ObservationScheduler::notify_mutation(uint64_t now_ms) {
  if (!ctl_.options().enabled) return;
  if (!ctl_.options().observe && passes_ > 0) return;
  arm(now_ms);
}

void ObservationScheduler::notify_load(image_element &img, uint64_t now_ms) {
  ctl_.on_load(img);
  if (!ctl_.options().observe && passes_ > 0) return;
  arm(now_ms);
}

void ObservationScheduler::notify_detached(image_element &img) {
  ctl_.on_detached(img);
}

bool ObservationScheduler::poll(uint64_t now_ms) {
  if (!armed_ || now_ms < due_ms_) return false;
  armed_ = false;
  passes_++;
  ctl_.process_all();
  fprintf(stderr, "[scheduler] pass %d at %llu ms\n", passes_, (unsigned long long)now_ms);
  return true;
}
