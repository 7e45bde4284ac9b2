#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "image_task_controller.h"
#include "sinc_diag.h"
#include "test_support.h"

namespace {

class ImageTaskControllerTest : public ::testing::Test {
protected:
  void SetUp() override {
    diag_set_sink([this](const nlohmann::json &ev) { events.push_back(ev); });
  }
  void TearDown() override { diag_set_sink(nullptr); }

  std::unique_ptr<ImageTaskController> make(Resampler *r) {
    return std::make_unique<ImageTaskController>(doc, opt, r, &net);
  }

  FakeDocument doc;
  FakeFetchClient net;
  FakeResampler gpu;
  sinc_options opt;
  std::vector<nlohmann::json> events;
};

const char *kCross = "https://cdn.other.example/photo.jpg";

TEST_F(ImageTaskControllerTest, ScenarioA_UnscaledImageIsSkippedUntouched) {
  image_element &img = doc.add("a", "img/a.jpg", 100, 100, 100, 100);
  auto ctl = make(&gpu);
  ctl->process_all();

  const image_task *t = ctl->task_for(img);
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->status, TaskStatus::SKIPPED);
  EXPECT_EQ(t->reason, TaskReason::NO_SCALING);
  EXPECT_EQ(doc.mutations(), 0);
  EXPECT_TRUE(img.inline_style.empty());
  EXPECT_EQ(gpu.calls, 0);
}

TEST_F(ImageTaskControllerTest, ScenarioB_SameOriginUpscaleIsResampled) {
  image_element &img = doc.add("b", "img/b.jpg", 100, 100, 300, 300);
  auto ctl = make(&gpu);
  ctl->process_all();

  const image_task *t = ctl->task_for(img);
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->status, TaskStatus::RESAMPLED);
  ASSERT_EQ(doc.surface_count(), 1u);
  render_surface *s = doc.surface_for(img);
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->w, 300u);
  EXPECT_EQ(s->h, 300u);
  EXPECT_EQ(s->rgba.size(), 300u * 300u * 4u);
  EXPECT_EQ(style_value(img.inline_style, "display"), "none");
  EXPECT_EQ(gpu.last_dst_w, 300);
  EXPECT_FALSE(gpu.last_downsample);
  EXPECT_TRUE(net.requests.empty());
}

TEST_F(ImageTaskControllerTest, ScenarioC_FailedRefetchLeavesImageVisible) {
  image_element &img = doc.add("c", kCross, 100, 100, 300, 300);
  auto ctl = make(&gpu);
  ctl->process_all();

  const image_task *t = ctl->task_for(img);
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->status, TaskStatus::FAILED);
  EXPECT_EQ(t->reason, TaskReason::ORIGIN_RESTRICTED);
  EXPECT_TRUE(t->refetch_failed);
  EXPECT_EQ(net.requests.size(), 1u);
  EXPECT_EQ(doc.surface_count(), 0u);
  EXPECT_TRUE(img.inline_style.empty());
  EXPECT_EQ(img.src, kCross);
  EXPECT_EQ(gpu.calls, 0);
}

TEST_F(ImageTaskControllerTest, ScenarioD_GpuUnavailableFallsBackToIntegerHint) {
  image_element &img = doc.add("d", "img/d.jpg", 50, 50, 200, 200);
  gpu.fail = ErrorKind::GPU_UNAVAILABLE;
  auto ctl = make(&gpu);
  ctl->process_all();

  const image_task *t = ctl->task_for(img);
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->status, TaskStatus::FALLBACK_APPLIED);
  EXPECT_EQ(t->reason, TaskReason::GPU_UNAVAILABLE);
  EXPECT_EQ(style_value(img.inline_style, "image-rendering"), "pixelated");
  EXPECT_EQ(img.inline_style.count("display"), 0u);
  EXPECT_EQ(doc.surface_count(), 0u);
  EXPECT_TRUE(ctl->hints().has(img));
}

TEST_F(ImageTaskControllerTest, VectorSourceSkippedBeforeReadiness) {
  image_element &img = doc.add("v", "icons/logo.SVG?v=2", 0, 0, 64, 64);
  auto ctl = make(&gpu);
  ctl->process_all();

  const image_task *t = ctl->task_for(img);
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->status, TaskStatus::SKIPPED);
  EXPECT_EQ(t->reason, TaskReason::VECTOR_SOURCE);
  EXPECT_EQ(doc.mutations(), 0);
}

TEST_F(ImageTaskControllerTest, PlaceholderSkipped) {
  image_element &img = doc.add("p", "img/pixel.jpg", 8, 8, 64, 64);
  auto ctl = make(&gpu);
  ctl->process_all();
  EXPECT_EQ(ctl->task_for(img)->reason, TaskReason::PLACEHOLDER);
  EXPECT_EQ(gpu.calls, 0);
}

TEST_F(ImageTaskControllerTest, WaitsForLoadThenResumes) {
  image_element &img = doc.add("w", "img/late.jpg", 0, 0, 200, 200);
  auto ctl = make(&gpu);
  ctl->process_all();
  ASSERT_EQ(ctl->task_for(img)->status, TaskStatus::WAITING_FOR_LOAD);
  EXPECT_TRUE(ctl->has_pending_work());

  ctl->process_all();
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::WAITING_FOR_LOAD);
  EXPECT_EQ(ctl->terminal_events(), 0u);

  FakeDocument::decode(img, 100, 100);
  ctl->on_load(img);
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::RESAMPLED);
  EXPECT_FALSE(ctl->has_pending_work());
}

TEST_F(ImageTaskControllerTest, RepeatedPassesAreIdempotent) {
  image_element &img = doc.add("i", "img/i.jpg", 100, 100, 250, 250);
  auto ctl = make(&gpu);
  ctl->process_all();
  ctl->process_all();
  ctl->process(img);

  EXPECT_EQ(gpu.calls, 1);
  EXPECT_EQ(doc.inserts, 1);
  EXPECT_EQ(doc.surface_count(), 1u);
  EXPECT_EQ(ctl->terminal_events(), 1u);
  EXPECT_EQ(events.size(), 1u);
}

TEST_F(ImageTaskControllerTest, UniformIntegerScaleWithoutGpuGetsHint) {
  image_element &img = doc.add("u", "img/u.jpg", 100, 100, 200, 200);
  auto ctl = make(nullptr);
  ctl->process_all();
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::FALLBACK_APPLIED);
}

TEST_F(ImageTaskControllerTest, NonUniformScaleWithShaderFailureFailsVisibly) {
  image_element &img = doc.add("n", "img/n.jpg", 100, 100, 200, 300);
  img.inline_style["display"] = "inline-block";
  img.inline_style["image-rendering"] = "auto";
  const auto before = img.inline_style;
  gpu.fail = ErrorKind::SHADER_FAILURE;
  auto ctl = make(&gpu);
  ctl->process_all();

  const image_task *t = ctl->task_for(img);
  EXPECT_EQ(t->status, TaskStatus::FAILED);
  EXPECT_EQ(t->reason, TaskReason::FALLBACK_INELIGIBLE);
  EXPECT_EQ(t->gpu_error, ErrorKind::SHADER_FAILURE);
  EXPECT_EQ(img.inline_style, before);
  EXPECT_EQ(doc.surface_count(), 0u);
  EXPECT_EQ(doc.inserts, 1);
  EXPECT_EQ(doc.removes, 1);
}

TEST_F(ImageTaskControllerTest, FractionalScaleWithShaderFailureRestoresAbsentDisplay) {
  image_element &img = doc.add("f", "img/f.jpg", 100, 100, 150, 150);
  gpu.fail = ErrorKind::SHADER_FAILURE;
  auto ctl = make(&gpu);
  ctl->process_all();

  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::FAILED);
  EXPECT_EQ(img.inline_style.count("display"), 0u);
  EXPECT_EQ(img.inline_style.count("image-rendering"), 0u);
  EXPECT_EQ(doc.surface_count(), 0u);
}

TEST_F(ImageTaskControllerTest, SrcsetMismatchIsNotHinted) {
  image_element &img = doc.add("s", "img/s.jpg", 100, 100, 200, 200);
  img.srcset = "img/s.jpg 1x, img/s@2x.jpg 2x";
  img.current_src = "img/s@2x.jpg";
  auto ctl = make(nullptr);
  ctl->process_all();
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::FAILED);
  EXPECT_EQ(img.inline_style.count("image-rendering"), 0u);
}

TEST_F(ImageTaskControllerTest, DownscaleUsesLinearLight) {
  image_element &img = doc.add("ds", "img/big.jpg", 400, 400, 100, 100);
  auto ctl = make(&gpu);
  ctl->process_all();
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::RESAMPLED);
  EXPECT_TRUE(gpu.last_downsample);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back()["scaleType"], "downscaling");
}

TEST_F(ImageTaskControllerTest, ZoomThresholdSkipsSmallMagnification) {
  image_element &small = doc.add("z1", "img/z1.jpg", 100, 100, 200, 200);
  image_element &large = doc.add("z2", "img/z2.jpg", 100, 100, 400, 400);
  opt.zoom_threshold = 3.0;
  auto ctl = make(&gpu);
  ctl->process_all();
  EXPECT_EQ(ctl->task_for(small)->reason, TaskReason::BELOW_ZOOM_THRESHOLD);
  EXPECT_EQ(ctl->task_for(large)->status, TaskStatus::RESAMPLED);
}

TEST_F(ImageTaskControllerTest, GatesLeaveImagesUntracked) {
  image_element &plain = doc.add("g1", "img/g1.jpg", 100, 100, 200, 200);
  image_element &flagged = doc.add("g2", "img/g2.jpg", 100, 100, 200, 200);
  flagged.opt_in = true;
  image_element &modal = doc.add("g3", "img/g3.jpg", 100, 100, 200, 200);
  modal.opt_in = true;
  modal.ancestor_classes = {"page", "modal"};

  opt.global = false;
  auto ctl = make(&gpu);
  ctl->process_all();
  EXPECT_EQ(ctl->task_for(plain), nullptr);
  EXPECT_NE(ctl->task_for(flagged), nullptr);
  EXPECT_EQ(ctl->task_for(modal), nullptr);

  sinc_options off = opt;
  off.enabled = false;
  ctl->set_options(off);
  image_element &later = doc.add("g4", "img/g4.jpg", 100, 100, 200, 200);
  later.opt_in = true;
  ctl->process_all();
  EXPECT_EQ(ctl->task_for(later), nullptr);
}

TEST_F(ImageTaskControllerTest, GpuOptionOffSkipsResampler) {
  image_element &img = doc.add("o", "img/o.jpg", 100, 100, 300, 300);
  opt.gpu = false;
  auto ctl = make(&gpu);
  ctl->process_all();
  EXPECT_EQ(gpu.calls, 0);
  EXPECT_EQ(doc.inserts, 0);
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::FALLBACK_APPLIED);
  EXPECT_EQ(ctl->task_for(img)->reason, TaskReason::GPU_UNAVAILABLE);
}

TEST_F(ImageTaskControllerTest, SameOriginAndDataSourcesNeverRefetch) {
  doc.add("r1", "img/r1.jpg", 100, 100, 200, 200);
  doc.add("r2", "https://page.example/r2.jpg", 100, 100, 200, 200);
  doc.add("r3", "data:image/jpeg;base64,/9j/4AAQ", 100, 100, 200, 200);
  image_element &anon = doc.add("r4", kCross, 100, 100, 200, 200);
  anon.cross_origin = "anonymous";
  auto ctl = make(&gpu);
  ctl->process_all();
  EXPECT_TRUE(net.requests.empty());
  EXPECT_EQ(gpu.calls, 4);
}

TEST_F(ImageTaskControllerTest, SuccessfulRefetchSwapsSourceAndResamplesOnLoad) {
  net.respond(kCross, ok_response(make_jpeg(16, 16)));
  image_element &img = doc.add("x", kCross, 100, 100, 200, 200);
  auto ctl = make(&gpu);
  ctl->process_all();

  ASSERT_EQ(doc.source_swaps.size(), 1u);
  EXPECT_EQ(img.src.compare(0, 23, "data:image/jpeg;base64,"), 0);
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::WAITING_FOR_LOAD);
  EXPECT_FALSE(ctl->task_for(img)->refetch_pending);
  EXPECT_EQ(gpu.calls, 0);

  FakeDocument::decode(img, 100, 100);
  ctl->on_load(img);
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::RESAMPLED);
  EXPECT_EQ(net.requests.size(), 1u);
}

TEST_F(ImageTaskControllerTest, OneRefetchPerDistinctUrl) {
  net.deferred = true;
  net.respond(kCross, ok_response(make_jpeg(16, 16)));
  image_element &a = doc.add("m1", kCross, 100, 100, 200, 200);
  image_element &b = doc.add("m2", kCross, 100, 100, 200, 200);
  auto ctl = make(&gpu);
  ctl->process_all();

  EXPECT_EQ(net.requests.size(), 1u);
  EXPECT_TRUE(ctl->task_for(a)->refetch_pending);
  EXPECT_TRUE(ctl->task_for(b)->refetch_pending);

  net.complete_all();
  EXPECT_EQ(doc.source_swaps.size(), 2u);
  EXPECT_EQ(a.src, b.src);

  image_element &c = doc.add("m3", kCross, 100, 100, 200, 200);
  ctl->process(c);
  EXPECT_EQ(net.requests.size(), 1u);
  EXPECT_EQ(doc.source_swaps.size(), 3u);
  EXPECT_EQ(ctl->safety().fetch_attempts(), 1u);
}

TEST_F(ImageTaskControllerTest, FailedUrlIsNotRetriedForOtherElements) {
  image_element &a = doc.add("e1", kCross, 100, 100, 200, 200);
  auto ctl = make(&gpu);
  ctl->process_all();
  ASSERT_EQ(ctl->task_for(a)->status, TaskStatus::FAILED);

  image_element &b = doc.add("e2", kCross, 100, 100, 200, 200);
  ctl->process(b);
  EXPECT_EQ(ctl->task_for(b)->status, TaskStatus::FAILED);
  EXPECT_EQ(ctl->task_for(b)->reason, TaskReason::ORIGIN_RESTRICTED);
  EXPECT_EQ(net.requests.size(), 1u);
}

TEST_F(ImageTaskControllerTest, ReloadReplacesSurface) {
  image_element &img = doc.add("rl", "img/one.jpg", 100, 100, 200, 200);
  auto ctl = make(&gpu);
  ctl->process_all();
  ASSERT_EQ(doc.surface_count(), 1u);

  img.src = "img/two.jpg";
  FakeDocument::decode(img, 50, 50);
  ctl->on_load(img);

  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::RESAMPLED);
  EXPECT_EQ(doc.surface_count(), 1u);
  EXPECT_EQ(gpu.calls, 2);
  EXPECT_EQ(gpu.last_src_w, 50);
  EXPECT_EQ(style_value(img.inline_style, "display"), "none");
}

TEST_F(ImageTaskControllerTest, ReloadRestoresHintBeforeResampling) {
  image_element &img = doc.add("h", "img/h.jpg", 100, 100, 200, 200);
  img.inline_style["image-rendering"] = "auto";
  gpu.fail = ErrorKind::DRAW_FAILURE;
  auto ctl = make(&gpu);
  ctl->process_all();
  ASSERT_EQ(ctl->task_for(img)->status, TaskStatus::FALLBACK_APPLIED);
  ASSERT_EQ(style_value(img.inline_style, "image-rendering"), "pixelated");

  gpu.fail = ErrorKind::NONE;
  ctl->on_load(img);
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::RESAMPLED);
  EXPECT_EQ(style_value(img.inline_style, "image-rendering"), "auto");
  EXPECT_FALSE(ctl->hints().has(img));
}

TEST_F(ImageTaskControllerTest, DetachDropsTaskAndHint) {
  image_element &img = doc.add("dt", "img/dt.jpg", 100, 100, 300, 300);
  auto ctl = make(nullptr);
  ctl->process_all();
  ASSERT_TRUE(ctl->hints().has(img));

  ctl->on_detached(img);
  EXPECT_EQ(ctl->task_for(img), nullptr);
  EXPECT_EQ(ctl->hints().size(), 0u);
}

TEST_F(ImageTaskControllerTest, TerminalEventCarriesScaleAndBackend) {
  doc.add("ev", "img/ev.jpg", 100, 100, 300, 300);
  auto ctl = make(&gpu);
  ctl->process_all();

  ASSERT_EQ(events.size(), 1u);
  const nlohmann::json &ev = events[0];
  EXPECT_EQ(ev["event"], "terminal");
  EXPECT_EQ(ev["status"], "resampled");
  EXPECT_EQ(ev["reason"], "none");
  EXPECT_EQ(ev["scaleType"], "upscaling");
  EXPECT_EQ(ev["backend"], "fake");
  EXPECT_DOUBLE_EQ(ev["scaleX"].get<double>(), 3.0);
}

TEST_F(ImageTaskControllerTest, StatusJsonListsImagesInOrder) {
  doc.add("first", "img/1.jpg", 100, 100, 100, 100);
  doc.add("second", "img/2.jpg", 100, 100, 200, 200);
  auto ctl = make(&gpu);
  ctl->process_all();

  nlohmann::json j = nlohmann::json::parse(ctl->status_json());
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[0]["id"], "first");
  EXPECT_EQ(j[0]["status"], "skipped");
  EXPECT_EQ(j[1]["status"], "resampled");
  EXPECT_EQ(j[1]["surface"], "200x200");
}

TEST_F(ImageTaskControllerTest, NewSourceSupersedesPendingRefetch) {
  const std::string old_url = "https://cdn.other.example/old.jpg";
  net.deferred = true;
  net.respond(old_url, ok_response(make_jpeg(16, 16)));
  image_element &img = doc.add("sp", old_url, 100, 100, 200, 200);
  auto ctl = make(&gpu);
  ctl->process_all();
  ASSERT_TRUE(ctl->task_for(img)->refetch_pending);

  // load of the source being refetched changes nothing
  ctl->on_load(img);
  EXPECT_TRUE(ctl->task_for(img)->refetch_pending);
  EXPECT_EQ(gpu.calls, 0);

  img.src = "img/new.jpg";
  FakeDocument::decode(img, 100, 100);
  ctl->on_load(img);
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::RESAMPLED);
  EXPECT_FALSE(ctl->task_for(img)->refetch_pending);
  EXPECT_EQ(gpu.calls, 1);

  net.complete_all();
  EXPECT_EQ(img.src, "img/new.jpg");
  EXPECT_TRUE(doc.source_swaps.empty());
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::RESAMPLED);
  EXPECT_EQ(doc.surface_count(), 1u);
  EXPECT_TRUE(ctl->safety().cached_representation(old_url, nullptr));
}

TEST_F(ImageTaskControllerTest, RefetchResultIgnoredWhenSourceChangedBeforeLoad) {
  net.deferred = true;
  net.respond(kCross, ok_response(make_jpeg(16, 16)));
  image_element &img = doc.add("sc", kCross, 100, 100, 200, 200);
  auto ctl = make(&gpu);
  ctl->process_all();

  img.src = "img/replacement.jpg";
  net.complete_all();
  EXPECT_TRUE(doc.source_swaps.empty());
  EXPECT_EQ(img.src, "img/replacement.jpg");
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::UNSEEN);

  ctl->process(img);
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::RESAMPLED);
}

TEST_F(ImageTaskControllerTest, ReloadWhileDisabledTearsDownEarlierOutput) {
  image_element &img = doc.add("gd", "img/gd.jpg", 100, 100, 300, 300);
  auto ctl = make(&gpu);
  ctl->process_all();
  ASSERT_EQ(doc.surface_count(), 1u);

  sinc_options off = opt;
  off.enabled = false;
  ctl->set_options(off);
  img.src = "img/gd2.jpg";
  FakeDocument::decode(img, 100, 100);
  ctl->on_load(img);

  EXPECT_EQ(doc.surface_count(), 0u);
  EXPECT_EQ(img.inline_style.count("display"), 0u);
  EXPECT_EQ(gpu.calls, 1);
  EXPECT_EQ(ctl->task_for(img)->status, TaskStatus::UNSEEN);
}

TEST_F(ImageTaskControllerTest, ReloadInsideExcludedContainerRestoresHint) {
  image_element &img = doc.add("gx", "img/gx.jpg", 100, 100, 200, 200);
  auto ctl = make(nullptr);
  ctl->process_all();
  ASSERT_EQ(style_value(img.inline_style, "image-rendering"), "pixelated");

  img.ancestor_classes = {"overlay"};
  ctl->on_load(img);
  EXPECT_EQ(img.inline_style.count("image-rendering"), 0u);
  EXPECT_FALSE(ctl->hints().has(img));
}

TEST_F(ImageTaskControllerTest, DetachDropsRefetchWaiters) {
  net.deferred = true;
  net.respond(kCross, ok_response(make_jpeg(16, 16)));
  image_element &img = doc.add("dw", kCross, 100, 100, 200, 200);
  auto ctl = make(&gpu);
  ctl->process_all();
  ASSERT_EQ(ctl->safety().waiter_count(kCross), 1u);

  ctl->on_detached(img);
  EXPECT_EQ(ctl->safety().waiter_count(kCross), 0u);
  EXPECT_TRUE(ctl->safety().in_flight(kCross));

  net.complete_all();
  EXPECT_TRUE(doc.source_swaps.empty());
  EXPECT_TRUE(ctl->safety().cached_representation(kCross, nullptr));
}

}  // namespace
