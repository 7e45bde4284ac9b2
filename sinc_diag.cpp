#include "sinc_diag.h"
#include <cstdio>

static diag_sink_fn g_sink;

void diag_set_sink(diag_sink_fn fn) {
  g_sink = std::move(fn);
}

void diag_emit(const nlohmann::json &event) {
  if (g_sink) {
    g_sink(event);
    return;
  }
  fprintf(stderr, "[diag] %s\n", event.dump().c_str());
}
