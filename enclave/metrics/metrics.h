// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_METRICS_METRICS_H__
#define __OCW_METRICS_METRICS_H__

#include <string>
#include <atomic>
#include <map>

#include "proto/metrics.pb.h"
#include "proto/error.pb.h"

namespace ocw::context { class Context; }

namespace ocw::metrics {

// Export all global metrics as a single protobuf.
MetricsPB* AllAsPB(context::Context* ctx);

// Return all global metrics to an initial state.  For testing only.
void ClearAllForTest();

// A counter provides a simple, atomic counter object that monotonically increases.
// We do not protect against overflows, but given that this is a 64-bit value, they
// would be pretty impressive.
class Counter {
 public:
  Counter(const std::string& name, std::map<std::string, std::string>&& tags);
  void IncrementBy(uint64_t v);
  inline void Increment() { IncrementBy(1); }
  uint64_t Value() const { return v_.load(); }
 private:
  friend MetricsPB* AllAsPB(context::Context* ctx);
  friend void ClearAllForTest();
  void AddToMetrics(MetricsPB* pb);
  void Clear();
  std::atomic<uint64_t> v_;
  const std::string name_;
  const std::map<std::string, std::string> tags_;
};

// A gauge provides a simple, atomic gauge object that can be set to arbitrary
// values.  We save UINT64_MAX as a special invalid value.
class Gauge {
 public:
  Gauge(const std::string& name);
  void Set(uint64_t v);
  uint64_t Value() const { return v_.load(); }
  void Clear();
 private:
  friend MetricsPB* AllAsPB(context::Context* ctx);
  void AddToMetrics(MetricsPB* pb);
  std::atomic<uint64_t> v_;
  const std::string name_;
};

// counters.h and gauges.h are X-macro lists.  We define CREATE_COUNTER and
// CREATE_GAUGE, include the list, then undefine them, both here (for the
// enums used to index metrics) and in metrics.cc (for the metric objects).
enum Counters {
#define CREATE_COUNTER(ns, varname, name, tags) CTR__##ns##__##varname,
#include "metrics/counters.h"
#undef CREATE_COUNTER
  COUNTERS_ARRAY_SIZE,
};
enum Gauges {
#define CREATE_GAUGE(ns, name) GAG__##ns##__##name,
#include "metrics/gauges.h"
#undef CREATE_GAUGE
  GAUGES_ARRAY_SIZE,
};

namespace internal {
error::Error RecordError(error::Error e, const char* file, int line);
uint64_t ErrorCount(error::Error e);
extern Counter counters[COUNTERS_ARRAY_SIZE];
extern Gauge gauges[GAUGES_ARRAY_SIZE];
}  // namespace internal

}  // namespace ocw::metrics

// COUNTER(ns, name) returns a pointer to a metrics::Counter based on the
// counter namespace/name as created in counters.h.
#define COUNTER(ns, name) (&::ocw::metrics::internal::counters[::ocw::metrics::CTR__##ns##__##name])

// GAUGE(ns, name) returns a pointer to a metrics::Gauge based on the
// gauge namespace/name as created in gauges.h.
#define GAUGE(ns, name) (&::ocw::metrics::internal::gauges[::ocw::metrics::GAG__##ns##__##name])

// COUNTED_ERROR counts an error within metrics, returning that same error.
// It's generally used like:
//    return COUNTED_ERROR(Foo_Bar);
#define COUNTED_ERROR(x) ::ocw::metrics::internal::RecordError(::ocw::error::x, __FILE__, __LINE__)

#endif  // __OCW_METRICS_METRICS_H__
