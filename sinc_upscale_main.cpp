#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <time.h>
#include <unistd.h>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "gpu_lanczos.h"
#include "http_fetch.h"
#include "image_task_controller.h"
#include "jpeg_codec.h"
#include "observation_scheduler.h"
#include "page_host.h"
#include "sinc_config.h"

// -------------------- Helpers --------------------
static std::string slurp_file(const std::string &path) {
  std::ifstream f(path);
  if (!f.is_open()) return {};
  std::stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}
static bool write_file_atomic(const std::string &path, const std::vector<uint8_t> &data) {
  std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) return false;
    f.write((const char*)data.data(), (std::streamsize)data.size());
    f.flush();
    if (!f.good()) return false;
  }
  if (rename(tmp.c_str(), path.c_str()) != 0) return false;
  return true;
}
static uint64_t monotonic_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (uint64_t)ts.tv_sec * 1000ull + (uint64_t)ts.tv_nsec / 1000000ull;
}
static bool ensure_dir(const std::string &dir) {
  if (mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST) return true;
  perror(dir.c_str());
  return false;
}

// -------------------- Output --------------------
static int write_surfaces(PageHost &page, const std::string &out_dir) {
  if (!ensure_dir(out_dir)) return -1;
  int written = 0;
  for (const auto &s : page.surfaces()) {
    if (!s->replaces || s->rgba.size() < (size_t)s->w * s->h * 4) continue;
    std::vector<uint8_t> jpg;
    if (!encode_rgba_to_jpeg(s->rgba.data(), (int)s->w, (int)s->h, 92, jpg)) {
      fprintf(stderr, "[main] encode failed for %s\n", s->replaces->id.c_str());
      continue;
    }
    std::string path = out_dir + "/" + s->replaces->id + ".jpg";
    if (!write_file_atomic(path, jpg)) {
      fprintf(stderr, "[main] cannot write %s\n", path.c_str());
      continue;
    }
    fprintf(stderr, "[main] wrote %s (%ux%u)\n", path.c_str(), s->w, s->h);
    written++;
  }
  return written;
}

// ---------------- Main ----------------
static void usage(const char *argv0) {
  fprintf(stderr,
    "Usage: %s --page MANIFEST.json [--config PATH] [--out DIR] [--no-gpu]\n"
    "          [--throttle-ms N] [--zoom-threshold X] [--timeout-ms N] [--print-config]\n",
    argv0
  );
}

int main(int argc, char **argv) {
  std::string page_path;
  std::string cfg_path;
  std::string out_dir = "out";
  int timeout_ms = 30000;
  bool print_config = false;

  // config first so the remaining flags override it
  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0 && i+1<argc) cfg_path=argv[++i];
  }

  sinc_options opt;
  if (!cfg_path.empty()) {
    std::string text = slurp_file(cfg_path);
    if (text.empty() || !options_from_json_text(text, opt)) {
      fprintf(stderr, "[config] cannot load %s, using defaults\n", cfg_path.c_str());
      opt = sinc_options();
    } else {
      fprintf(stderr, "[config] loaded %s\n", cfg_path.c_str());
    }
  }

  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0) { i++; continue; }
    if (strcmp(argv[i],"--page")==0 && i+1<argc) page_path=argv[++i];
    else if (strcmp(argv[i],"--out")==0 && i+1<argc) out_dir=argv[++i];
    else if (strcmp(argv[i],"--no-gpu")==0) opt.gpu=false;
    else if (strcmp(argv[i],"--throttle-ms")==0 && i+1<argc) opt.throttle_ms=atoi(argv[++i]);
    else if (strcmp(argv[i],"--zoom-threshold")==0 && i+1<argc) opt.zoom_threshold=atof(argv[++i]);
    else if (strcmp(argv[i],"--timeout-ms")==0 && i+1<argc) timeout_ms=atoi(argv[++i]);
    else if (strcmp(argv[i],"--print-config")==0) print_config=true;
    else if (strcmp(argv[i],"-h")==0 || strcmp(argv[i],"--help")==0) {
      usage(argv[0]); return 0;
    } else {
      fprintf(stderr, "Unknown argument: %s\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }
  options_normalize(opt);

  if (print_config) {
    printf("%s\n", options_to_json(opt).c_str());
    if (page_path.empty()) return 0;
  }
  if (page_path.empty()) { usage(argv[0]); return 1; }

  HttpFetchClient net;
  PageHost page(&net);
  if (!page.load_manifest_file(page_path)) return 1;

  GpuLanczos gpu;
  ImageTaskController ctl(page, opt, opt.gpu ? &gpu : nullptr, &net);
  ObservationScheduler sched(ctl);

  const uint64_t t0 = monotonic_ms();
  sched.notify_mutation(t0);
  for (;;) {
    page.pump_loads([&](image_element &img) { sched.notify_load(img, monotonic_ms()); });
    const uint64_t now = monotonic_ms();
    sched.poll(now);
    if (!sched.armed() && !page.loads_pending()) break;
    if (now - t0 > (uint64_t)timeout_ms) {
      fprintf(stderr, "[main] timeout after %d ms with work pending\n", timeout_ms);
      break;
    }
    usleep(2000);
  }

  if (ctl.has_pending_work()) fprintf(stderr, "[main] some images never finished loading\n");
  int written = write_surfaces(page, out_dir);
  fprintf(stderr, "[main] done: %zu terminal events, %d surfaces written, backend %s\n",
          ctl.terminal_events(), written < 0 ? 0 : written, gpu.backend_name());

  printf("%s\n", ctl.status_json().c_str());
  return 0;
}
