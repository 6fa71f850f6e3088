// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_SERVICE_SERVICE_H__
#define __OCW_SERVICE_SERVICE_H__

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "context/context.h"
#include "guard/guard.h"
#include "proto/enclaveconfig.pb.h"
#include "proto/error.pb.h"
#include "proto/msgs.pb.h"
#include "queue/queue.h"
#include "system/system.h"
#include "util/macros.h"
#include "worker/worker.h"

namespace ocw::service {

enclaveconfig::WorkerConfig DefaultWorkerConfig();
error::Error ValidateConfig(const enclaveconfig::WorkerConfig& config);

// Service is the request surface of the worker.  Every request that touches
// runtime state goes through the runtime guard, with a per-request policy
// on whether it may run in safe mode or while state is being replaced.
class Service {
 public:
  DELETE_COPY_AND_ASSIGN(Service);

  // Merges `provided` over DefaultWorkerConfig, validates it, and restores
  // the newest checkpoint if checkpoints are enabled.
  static std::pair<std::unique_ptr<Service>, error::Error> Create(
      context::Context* ctx,
      const enclaveconfig::WorkerConfig& provided,
      system::Factory system_factory);

  // Handles `req`, filling `resp`.  Failures are reported in resp->status(),
  // with no inner response.
  void Handle(context::Context* ctx, const WorkerRequest& req, WorkerResponse* resp);
  // Handles a serialized WorkerRequest, returning a serialized WorkerResponse.
  std::string HandleSerialized(context::Context* ctx, const std::string& req);

  const enclaveconfig::WorkerConfig& config() const { return config_; }

 private:
  Service(const enclaveconfig::WorkerConfig& config, std::unique_ptr<worker::Worker> worker);
  error::Error RestoreCheckpoint(context::Context* ctx);
  error::Error HandleRequest(context::Context* ctx, const WorkerRequest& req, WorkerResponse* resp);

  const enclaveconfig::WorkerConfig config_;
  guard::SafeBox<worker::Worker> box_;
};

// RequestPool handles requests on a fixed set of threads, in the order
// they're submitted.  Handling itself is serialized by the runtime guard,
// but requests that don't need it (and readers waiting on it) don't queue
// behind one thread.
class RequestPool {
 public:
  typedef std::function<void(const WorkerResponse&)> Callback;

  DELETE_COPY_AND_ASSIGN(RequestPool);
  RequestPool(Service* service, size_t threads, size_t max_queued);
  // Handles everything already submitted, then joins the threads.
  ~RequestPool();

  // Queues `req`, calling `cb` with its response from a pool thread.
  // Blocks while the queue is full.  Returns false once shut down.
  bool Submit(WorkerRequest req, Callback cb);

 private:
  struct Work {
    WorkerRequest request;
    Callback callback;
  };
  void Run();

  Service* service_;
  queue::Queue<Work> queue_;
  std::vector<std::thread> threads_;
};

}  // namespace ocw::service

#endif  // __OCW_SERVICE_SERVICE_H__
