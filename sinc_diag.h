#pragma once
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

// Structured diagnostics: one event per terminal task transition.
// The default sink prints "[diag] <json>" to stderr.
using diag_sink_fn = std::function<void(const nlohmann::json &event)>;

void diag_set_sink(diag_sink_fn fn);   // empty fn => default sink
void diag_emit(const nlohmann::json &event);
