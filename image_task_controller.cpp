#include "image_task_controller.h"
#include "geometry_analyzer.h"
#include "sinc_diag.h"

#include <algorithm>
#include <cstdio>
#include <nlohmann/json.hpp>

using nlohmann::json;

static std::string short_src(const std::string &s) {
  if (s.size() <= 96) return s;
  return s.substr(0, 93) + "...";
}

ImageTaskController::ImageTaskController(document_host &doc, const sinc_options &opt,
                                         Resampler *resampler, FetchClient *fetcher)
  : doc_(doc), opt_(opt), resampler_(resampler), safety_(doc, fetcher) {
  options_normalize(opt_);
}

void ImageTaskController::set_options(const sinc_options &opt) {
  opt_ = opt;
  options_normalize(opt_);
}

bool ImageTaskController::gated_out(const image_element &img) const {
  if (!opt_.enabled) return true;
  if (!opt_.global && !img.opt_in) return true;
  for (const auto &c : img.ancestor_classes) {
    if (std::find(opt_.exclude_classes.begin(), opt_.exclude_classes.end(), c) != opt_.exclude_classes.end()) return true;
  }
  return false;
}

image_task& ImageTaskController::task_entry(image_element &img) {
  auto it = tasks_.find(&img);
  if (it != tasks_.end()) return it->second;
  image_task &t = tasks_[&img];
  t.element = &img;
  t.generation = next_generation_++;
  return t;
}

const image_task* ImageTaskController::task_for(const image_element &img) const {
  auto it = tasks_.find(&img);
  return it == tasks_.end() ? nullptr : &it->second;
}

bool ImageTaskController::has_pending_work() const {
  for (const auto &kv : tasks_) {
    if (kv.second.status == TaskStatus::WAITING_FOR_LOAD) return true;
  }
  return false;
}

void ImageTaskController::process_all() {
  for (image_element *img : doc_.images()) {
    if (img) process(*img);
  }
}

void ImageTaskController::process(image_element &img) {
  if (gated_out(img)) return;
  image_task &t = task_entry(img);

  if (t.status == TaskStatus::UNSEEN) {
    evaluate(img, t);
    return;
  }
  // Decoded without a load notification reaching us (e.g. cached image).
  if (t.status == TaskStatus::WAITING_FOR_LOAD && !t.refetch_pending &&
      img.complete && img.natural_w && img.natural_h) {
    evaluate(img, t);
  }
}

void ImageTaskController::on_load(image_element &img) {
  auto it = tasks_.find(&img);
  if (it != tasks_.end()) {
    image_task &t = it->second;
    if (t.refetch_pending) {
      if (img.effective_src() == t.refetch_url) return;
      fprintf(stderr, "[task] %s superseded a pending refetch\n", short_src(img.effective_src()).c_str());
      safety_.cancel(&img);
      reset_task(t);
    } else if (t.status != TaskStatus::UNSEEN && t.status != TaskStatus::WAITING_FOR_LOAD) {
      fprintf(stderr, "[task] %s reloaded; re-evaluating\n", short_src(img.effective_src()).c_str());
      teardown(img, t);
      reset_task(t);
    }
  }

  if (gated_out(img)) return;
  if (it == tasks_.end()) {
    process(img);
    return;
  }
  evaluate(img, it->second);
}

void ImageTaskController::on_detached(image_element &img) {
  safety_.cancel(&img);
  hints_.forget(img);
  tasks_.erase(&img);
}

void ImageTaskController::reset_task(image_task &t) {
  image_element *el = t.element;
  t = image_task{};
  t.element = el;
  t.generation = next_generation_++;
}

void ImageTaskController::teardown(image_element &img, image_task &t) {
  if (t.surface) {
    kernel_teardown(doc_, img, t.surface, t.prior_display);
    t.surface = nullptr;
  }
  fallback_restore(img, hints_);
}

void ImageTaskController::evaluate(image_element &img, image_task &t) {
  if (image_is_vector(img)) {
    finish(img, t, TaskStatus::SKIPPED, TaskReason::VECTOR_SOURCE);
    return;
  }
  if (!img.complete || img.natural_w == 0 || img.natural_h == 0) {
    if (t.status != TaskStatus::WAITING_FOR_LOAD) {
      fprintf(stderr, "[task] waiting for load: %s\n", short_src(img.effective_src()).c_str());
    }
    t.status = TaskStatus::WAITING_FOR_LOAD;
    return;
  }

  const uint32_t min_sz = (uint32_t)opt_.min_natural_size;
  if (img.natural_w <= min_sz || img.natural_h <= min_sz) {
    finish(img, t, TaskStatus::SKIPPED, TaskReason::PLACEHOLDER);
    return;
  }

  scale_info si = geometry_analyze(img);
  if (!si.valid) {
    t.status = TaskStatus::WAITING_FOR_LOAD;
    return;
  }
  t.scale_x = si.scale_x;
  t.scale_y = si.scale_y;
  t.status = TaskStatus::EVALUATED;

  if (!si.needs_resampling) {
    finish(img, t, TaskStatus::SKIPPED, TaskReason::NO_SCALING);
    return;
  }
  if (opt_.zoom_threshold > 0.0 && std::max(si.scale_x, si.scale_y) < opt_.zoom_threshold) {
    finish(img, t, TaskStatus::SKIPPED, TaskReason::BELOW_ZOOM_THRESHOLD);
    return;
  }

  switch (safety_.resolve(img, t.refetch_failed)) {
    case SafetyDecision::SAFE:
      run_resample(img, t, si);
      break;
    case SafetyDecision::UNSAFE_REFETCHABLE:
      start_refetch(img, t);
      break;
    case SafetyDecision::UNSAFE_PERMANENT:
      finish(img, t, TaskStatus::FAILED, TaskReason::ORIGIN_RESTRICTED);
      break;
  }
}

void ImageTaskController::run_resample(image_element &img, image_task &t, const scale_info &si) {
  if (t.surface) {
    kernel_teardown(doc_, img, t.surface, t.prior_display);
    t.surface = nullptr;
  }

  ErrorKind gpu_err = ErrorKind::GPU_UNAVAILABLE;
  if (resampler_ && opt_.gpu) {
    resample_result rr = kernel_resample(doc_, img, si.target_w, si.target_h, si.scale_x, si.scale_y, *resampler_);
    if (rr.ok()) {
      fallback_restore(img, hints_);
      t.surface = rr.surface;
      t.prior_display = rr.prior_display;
      t.backend = rr.backend;
      t.gpu_error = ErrorKind::NONE;
      finish(img, t, TaskStatus::RESAMPLED, TaskReason::NONE);
      return;
    }
    gpu_err = rr.error;
  }
  t.gpu_error = gpu_err;

  if (fallback_apply_integer_hint(img, si.scale_x, si.scale_y, hints_)) {
    t.backend = "css-pixelated";
    finish(img, t, TaskStatus::FALLBACK_APPLIED, task_reason_from_error(gpu_err));
    return;
  }
  t.backend = "none";
  finish(img, t, TaskStatus::FAILED, TaskReason::FALLBACK_INELIGIBLE);
}

void ImageTaskController::start_refetch(image_element &img, image_task &t) {
  t.status = TaskStatus::WAITING_FOR_LOAD;
  t.refetch_pending = true;
  t.refetch_url = img.effective_src();

  const image_element *key = &img;
  const uint64_t gen = t.generation;
  const std::string url = t.refetch_url;
  safety_.refetch(url, [this, key, gen, url](bool ok, const std::string &uri) {
    auto it = tasks_.find(key);
    if (it == tasks_.end() || it->second.generation != gen || !it->second.refetch_pending) return;
    image_task &tt = it->second;
    image_element &el = *tt.element;
    tt.refetch_pending = false;
    tt.refetch_url.clear();

    if (el.effective_src() != url) {
      fprintf(stderr, "[task] dropping refetch of %s; source changed\n", short_src(url).c_str());
      tt.status = TaskStatus::UNSEEN;
      return;
    }
    if (ok) {
      // The swapped source loads later and re-enters evaluate() through on_load().
      fprintf(stderr, "[task] re-hosted %s as data URI\n", short_src(url).c_str());
      doc_.set_source(el, uri);
      return;
    }
    tt.refetch_failed = true;
    finish(el, tt, TaskStatus::FAILED, TaskReason::ORIGIN_RESTRICTED);
  }, &img);
}

void ImageTaskController::finish(image_element &img, image_task &t, TaskStatus s, TaskReason r) {
  t.status = s;
  t.reason = r;
  terminal_events_++;

  json ev;
  ev["event"] = "terminal";
  ev["id"] = img.id;
  ev["src"] = short_src(img.effective_src());
  ev["status"] = task_status_to_string(s);
  ev["reason"] = task_reason_to_string(r);
  ev["scaleX"] = t.scale_x;
  ev["scaleY"] = t.scale_y;
  ev["scaleType"] = geometry_scale_type(t.scale_x, t.scale_y);
  ev["backend"] = t.backend.empty() ? "none" : t.backend;
  if (t.gpu_error != ErrorKind::NONE) ev["gpuError"] = error_kind_to_string(t.gpu_error);
  diag_emit(ev);
}

std::string ImageTaskController::status_json() {
  json arr = json::array();
  for (image_element *img : doc_.images()) {
    if (!img) continue;
    json o;
    o["id"] = img->id;
    o["src"] = short_src(img->effective_src());
    const image_task *t = task_for(*img);
    if (!t) {
      o["status"] = "untracked";
    } else {
      o["status"] = task_status_to_string(t->status);
      o["reason"] = task_reason_to_string(t->reason);
      o["scaleX"] = t->scale_x;
      o["scaleY"] = t->scale_y;
      o["backend"] = t->backend.empty() ? "none" : t->backend;
      if (t->surface) {
        o["surface"] = std::to_string(t->surface->w) + "x" + std::to_string(t->surface->h);
      }
    }
    arr.push_back(o);
  }
  return arr.dump(2);
}
