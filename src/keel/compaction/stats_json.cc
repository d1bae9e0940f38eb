/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */

#include "compaction/service.h"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <string_view>

namespace compaction {

namespace {

using writer_t = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void rjson_serialize(writer_t& w, std::string_view s) {
    w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
}

// model::offset{} marks an offset that was never assigned
void rjson_serialize(writer_t& w, model::offset o) {
    if (o == model::offset{}) {
        w.Null();
    } else {
        w.Int64(o());
    }
}

void rjson_serialize(writer_t& w, const storage::offset_stats& s) {
    w.StartObject();
    w.Key("start_offset");
    rjson_serialize(w, s.start_offset);
    w.Key("dirty_offset");
    rjson_serialize(w, s.dirty_offset);
    w.Key("next_offset");
    rjson_serialize(w, s.next_offset);
    w.EndObject();
}

void rjson_serialize(writer_t& w, const storage::log_stats& s) {
    w.StartObject();
    w.Key("segment_count");
    w.Uint64(s.segment_count);
    w.Key("entry_count");
    w.Uint64(s.entry_count);
    w.Key("size_bytes");
    w.Uint64(s.size_bytes);
    w.Key("offsets");
    rjson_serialize(w, s.offsets);
    w.EndObject();
}

void rjson_serialize(writer_t& w, const run_stats& s) {
    w.StartObject();
    w.Key("boundary");
    rjson_serialize(w, s.boundary);
    w.Key("entries_read");
    w.Uint64(s.entries_read);
    w.Key("keys_indexed");
    w.Uint64(s.keys_indexed);
    w.Key("tombstones");
    w.Uint64(s.tombstones);
    w.Key("entries_written");
    w.Uint64(s.entries_written);
    w.Key("bytes_written");
    w.Uint64(s.bytes_written);
    w.Key("duration_ms");
    w.Int64(s.duration.count());
    w.EndObject();
}

void rjson_serialize(writer_t& w, const compactor_stats& s) {
    w.StartObject();
    w.Key("state");
    rjson_serialize(w, to_string_view(s.state));
    w.Key("runs_started");
    w.Uint64(s.runs_started);
    w.Key("runs_succeeded");
    w.Uint64(s.runs_succeeded);
    w.Key("runs_failed");
    w.Uint64(s.runs_failed);
    w.Key("last_run");
    if (s.last_run) {
        rjson_serialize(w, *s.last_run);
    } else {
        w.Null();
    }
    w.Key("last_error");
    if (s.last_error) {
        rjson_serialize(w, std::string_view(*s.last_error));
    } else {
        w.Null();
    }
    w.EndObject();
}

void rjson_serialize(writer_t& w, const compacted_log_stats& s) {
    w.StartObject();
    w.Key("boundary");
    rjson_serialize(w, s.boundary);
    w.Key("entry_count");
    w.Uint64(s.entry_count);
    w.Key("size_bytes");
    w.Uint64(s.size_bytes);
    w.Key("file");
    if (s.file) {
        rjson_serialize(w, s.file->native());
    } else {
        w.Null();
    }
    w.Key("active_readers");
    w.Uint64(s.active_readers);
    w.EndObject();
}

} // namespace

ss::sstring to_json(const topic_stats& s) {
    rapidjson::StringBuffer buf;
    writer_t w(buf);
    w.StartObject();
    w.Key("topic");
    rjson_serialize(w, std::string_view(s.topic()));
    w.Key("log");
    rjson_serialize(w, s.log);
    w.Key("compactor");
    rjson_serialize(w, s.compactor);
    w.Key("pointer_version");
    w.Uint64(s.pointer_version);
    w.Key("compacted_log");
    if (s.compacted) {
        rjson_serialize(w, *s.compacted);
    } else {
        w.Null();
    }
    w.EndObject();
    return {buf.GetString(), buf.GetSize()};
}

} // namespace compaction
