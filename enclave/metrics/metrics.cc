// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "metrics/metrics.h"
#include "context/context.h"
#include "util/log.h"

namespace ocw::metrics {

namespace {

static std::atomic<uint64_t> recorded_errors[error::Error_ARRAYSIZE] = {0};
static const uint64_t kUnsetGauge = UINT64_MAX;

// Errors are exported as a single "errors" counter, tagged by error name,
// and only once they've been seen.
void AddErrorsToMetrics(MetricsPB* pb) {
  for (int i = 0; i < error::Error_ARRAYSIZE; i++) {
    if (!error::Error_IsValid(i)) continue;
    uint64_t v = recorded_errors[i].load();
    if (v == 0) continue;
    U64PB* c = pb->add_counters();
    c->set_name("errors");
    c->set_v(v);
    (*c->mutable_tags())["error"] = error::Error_Name(static_cast<error::Error>(i));
  }
}

}  // namespace

MetricsPB* AllAsPB(context::Context* ctx) {
  auto out = ctx->Protobuf<MetricsPB>();
  AddErrorsToMetrics(out);
  for (auto& c : internal::counters) c.AddToMetrics(out);
  for (auto& g : internal::gauges) g.AddToMetrics(out);
  return out;
}

void ClearAllForTest() {
  for (auto& e : recorded_errors) e.store(0);
  for (auto& c : internal::counters) c.Clear();
  for (auto& g : internal::gauges) g.Clear();
}

Counter::Counter(const std::string& name, std::map<std::string, std::string>&& tags)
    : v_(0), name_(name), tags_(std::move(tags)) {}

void Counter::IncrementBy(uint64_t v) {
  v_.fetch_add(v);
}

void Counter::AddToMetrics(MetricsPB* pb) {
  auto c = pb->add_counters();
  c->set_name(name_);
  c->set_v(v_.load());
  c->mutable_tags()->insert(tags_.begin(), tags_.end());
}

void Counter::Clear() {
  v_.store(0);
}

Gauge::Gauge(const std::string& name) : v_(kUnsetGauge), name_(name) {}

void Gauge::Set(uint64_t v) {
  v_.store(v);
}

void Gauge::AddToMetrics(MetricsPB* pb) {
  uint64_t v = v_.load();
  if (v == kUnsetGauge) return;
  auto g = pb->add_gauges();
  g->set_name(name_);
  g->set_v(v);
}

void Gauge::Clear() {
  v_.store(kUnsetGauge);
}

namespace internal {

error::Error RecordError(error::Error e, const char* file, int line) {
  LOG(VERBOSE) << "error " << error::Error_Name(e) << " at " << file << ":" << line;
  recorded_errors[e].fetch_add(1);
  return e;
}

uint64_t ErrorCount(error::Error e) {
  return recorded_errors[e].load();
}

Counter counters[COUNTERS_ARRAY_SIZE] = {
#define CREATE_COUNTER(ns, varname, name, tags) Counter(#ns "." #name, std::map<std::string, std::string>tags),
#include "metrics/counters.h"
#undef CREATE_COUNTER
};

Gauge gauges[GAUGES_ARRAY_SIZE] = {
#define CREATE_GAUGE(ns, name) Gauge(#ns "." #name),
#include "metrics/gauges.h"
#undef CREATE_GAUGE
};

}  // namespace internal

}  // namespace ocw::metrics
