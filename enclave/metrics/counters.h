// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

// This file contains all counter metrics used within the worker core.
//
// They're created with the macro CREATE_COUNTER, which takes arguments:
//   * ns - namespace of the counter (generally, module name)
//   * varname - name of the variable used to reference this counter, must be
//     unique within the namespace (ns)
//   * name - name of the exported variable (actually, "ns.name")
//   * tags - set of tags associated with this variable, either empty `({})`, or
//     an initializer list `({{"foo", "bar"}, {"baz", "blah"}})` for tags
//     foo=bar, baz=blah.  Must be wrapped in parens.
//
// Once these counters are created here, they're used with the incantation:
//   COUNTER(ns, varname)->CounterFunction();
// IE:
//   COUNTER(mq, messages_enqueued)->IncrementBy(3);
//
// All counters created here are exported, even if they are zero.  This
// differs from error counts, which are exported only if non-zero.

CREATE_COUNTER(service, requests_handled, requests, ({{"outcome", "ok"}}))
CREATE_COUNTER(service, requests_failed, requests, ({{"outcome", "error"}}))
CREATE_COUNTER(service, requests_queued, requests_queued, ({}))

CREATE_COUNTER(guard, acquired, acquired, ({}))
CREATE_COUNTER(guard, refused_safe_mode, refused, ({{"reason", "safe_mode"}}))
CREATE_COUNTER(guard, refused_state_pending, refused, ({{"reason", "state_pending"}}))
CREATE_COUNTER(guard, slow_release, slow_release, ({}))
CREATE_COUNTER(guard, state_replacements, state_replacements, ({}))

CREATE_COUNTER(sync, headers_synced, headers_synced, ({}))
CREATE_COUNTER(sync, headers_skipped, headers_skipped, ({}))
CREATE_COUNTER(sync, authority_set_changes, authority_set_changes, ({}))
CREATE_COUNTER(sync, blocks_fed, blocks_fed, ({}))
CREATE_COUNTER(sync, blocks_rolled_back, blocks_rolled_back, ({}))
CREATE_COUNTER(sync, assumed_at_block, assumed_at_block, ({}))

CREATE_COUNTER(chainstorage, changes_applied, changes_applied, ({}))
CREATE_COUNTER(chainstorage, proof_nodes_loaded, proof_nodes_loaded, ({}))

CREATE_COUNTER(mq, messages_enqueued, messages_enqueued, ({}))
CREATE_COUNTER(mq, messages_purged, messages_purged, ({}))
CREATE_COUNTER(mq, messages_dispatched, messages_dispatched, ({}))
CREATE_COUNTER(mq, messages_unhandled, messages_unhandled, ({}))
CREATE_COUNTER(mq, messages_replayed, messages_replayed, ({}))

CREATE_COUNTER(attestation, create_success, create, ({{"outcome", "success"}}))
CREATE_COUNTER(attestation, create_retry, create, ({{"outcome", "retry"}}))
CREATE_COUNTER(attestation, create_failure, create, ({{"outcome", "failure"}}))
CREATE_COUNTER(attestation, validate_success, validate, ({{"outcome", "success"}}))
CREATE_COUNTER(attestation, validate_failure, validate, ({{"outcome", "failure"}}))

CREATE_COUNTER(handover, challenges_created, challenges_created, ({}))
CREATE_COUNTER(handover, challenges_consumed, challenges_consumed, ({}))
CREATE_COUNTER(handover, keys_sent, keys_sent, ({}))
CREATE_COUNTER(handover, keys_received, keys_received, ({}))

CREATE_COUNTER(checkpoint, taken, taken, ({}))
CREATE_COUNTER(checkpoint, loaded, loaded, ({}))
CREATE_COUNTER(checkpoint, pruned, pruned, ({}))
CREATE_COUNTER(checkpoint, unreadable, unreadable, ({}))

CREATE_COUNTER(worker, runtime_initialized, runtime_initialized, ({}))
CREATE_COUNTER(worker, blocks_dispatched, blocks_dispatched, ({}))
CREATE_COUNTER(worker, blocks_ignored, blocks_ignored, ({}))
CREATE_COUNTER(worker, runtime_info_refreshed, runtime_info_refreshed, ({}))
CREATE_COUNTER(worker, checkpoint_failures, checkpoint_failures, ({}))

CREATE_COUNTER(system, registry_events, registry_events, ({}))
CREATE_COUNTER(system, heartbeats_answered, heartbeats_answered, ({}))

CREATE_COUNTER(context, cpu_uncategorized, cpu, ({{"in", "uncategorized"}, {"action", "uncategorized"}}))
CREATE_COUNTER(context, cpu_env_evidence, cpu, ({{"in", "env"}, {"action", "evidence"}}))
CREATE_COUNTER(context, cpu_env_attest, cpu, ({{"in", "env"}, {"action", "attest"}}))
CREATE_COUNTER(context, cpu_env_seal, cpu, ({{"in", "env"}, {"action", "seal"}}))
CREATE_COUNTER(context, cpu_sync_header, cpu, ({{"in", "sync"}, {"action", "sync_header"}}))
CREATE_COUNTER(context, cpu_sync_feed_block, cpu, ({{"in", "sync"}, {"action", "feed_block"}}))
CREATE_COUNTER(context, cpu_storage_root, cpu, ({{"in", "chainstorage"}, {"action", "root"}}))
CREATE_COUNTER(context, cpu_mq_sign, cpu, ({{"in", "mq"}, {"action", "sign"}}))
CREATE_COUNTER(context, cpu_attestation_create, cpu, ({{"in", "attestation"}, {"action", "create"}}))
CREATE_COUNTER(context, cpu_attestation_validate, cpu, ({{"in", "attestation"}, {"action", "validate"}}))
CREATE_COUNTER(context, cpu_handover_start, cpu, ({{"in", "handover"}, {"action", "start"}}))
CREATE_COUNTER(context, cpu_handover_receive, cpu, ({{"in", "handover"}, {"action", "receive"}}))
CREATE_COUNTER(context, cpu_checkpoint_write, cpu, ({{"in", "checkpoint"}, {"action", "write"}}))
CREATE_COUNTER(context, cpu_checkpoint_load, cpu, ({{"in", "checkpoint"}, {"action", "load"}}))
CREATE_COUNTER(context, cpu_worker_dispatch, cpu, ({{"in", "worker"}, {"action", "dispatch"}}))
CREATE_COUNTER(context, cpu_worker_init, cpu, ({{"in", "worker"}, {"action", "init"}}))
CREATE_COUNTER(context, cpu_service_handle, cpu, ({{"in", "service"}, {"action", "handle"}}))
CREATE_COUNTER(context, lock_guard, cpu, ({{"in", "guard"}, {"action", "lock"}, {"lock", "guard"}}))
CREATE_COUNTER(context, lock_send_queue, cpu, ({{"in", "mq"}, {"action", "lock"}, {"lock", "send_queue"}}))
CREATE_COUNTER(context, lock_testenv, cpu, ({{"in", "env"}, {"action", "lock"}, {"lock", "testenv"}}))
CREATE_COUNTER(context, lock_test, cpu, ({{"in", "test"}}))
