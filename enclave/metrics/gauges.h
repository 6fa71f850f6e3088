// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

// This file contains all gauge metrics used within the worker core.
//
// They're created with the macro CREATE_GAUGE, which takes arguments:
//   * ns - namespace of the gauge (generally, module name)
//   * varname - name of the variable used to reference this gauge, must be
//     unique within the namespace (ns).  Also the exported name.
//
// Once these gauges are created here, they're used with the incantation:
//   GAUGE(ns, varname)->GaugeFunction();
// IE:
//   GAUGE(sync, next_block_number)->Set(12);
//
// Gauges are only exported after their first Set call.  If Clear is called,
// they will no longer be exported.

CREATE_GAUGE(sync, next_header_number)
CREATE_GAUGE(sync, next_block_number)
CREATE_GAUGE(sync, authority_set_id)

CREATE_GAUGE(chainstorage, entries)

CREATE_GAUGE(mq, pending_messages)

CREATE_GAUGE(worker, safe_mode_level)
CREATE_GAUGE(worker, initialized)

CREATE_GAUGE(checkpoint, last_block)

