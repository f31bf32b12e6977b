#include "seqrun/serialization.h"

#include <unordered_set>

namespace seqrun {

// --- JSON helpers ---

static json_object* opt_int64(const std::optional<int64_t>& v) {
    return v ? json_object_new_int64(*v) : nullptr;
}

static json_object* opt_int(const std::optional<int>& v) {
    return v ? json_object_new_int(*v) : nullptr;
}

static bool get_string(json_object* o, const char* k, std::string* out, std::string* err) {
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) {
        *err = std::string("field '") + k + "' missing or not a string";
        return false;
    }
    *out = std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    return true;
}

// Absent and null both mean "unset"; anything else must be an integer.
static bool get_opt_int64(json_object* o, const char* k, std::optional<int64_t>* out, std::string* err) {
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) {
        out->reset();
        return true;
    }
    if (!json_object_is_type(v, json_type_int)) {
        *err = std::string("field '") + k + "' is not an integer";
        return false;
    }
    *out = json_object_get_int64(v);
    return true;
}

static bool get_opt_int(json_object* o, const char* k, std::optional<int>* out, std::string* err) {
    std::optional<int64_t> wide;
    if (!get_opt_int64(o, k, &wide, err)) return false;
    if (wide) *out = (int)*wide;
    else out->reset();
    return true;
}

// --- Job serialization ---

json_object* job_to_json(const Job& j) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "id", json_object_new_string_len(j.id.c_str(), (int)j.id.size()));
    json_object_object_add(o, "name", json_object_new_string_len(j.name.c_str(), (int)j.name.size()));
    json_object_object_add(o, "command", json_object_new_string_len(j.command.c_str(), (int)j.command.size()));
    json_object_object_add(o, "status", json_object_new_string(status_to_str(j.status)));
    json_object_object_add(o, "created_at", opt_int64(j.created_at));
    json_object_object_add(o, "started_at", opt_int64(j.started_at));
    json_object_object_add(o, "completed_at", opt_int64(j.completed_at));
    json_object_object_add(o, "exit_code", opt_int(j.exit_code));
    json_object_object_add(o, "pid", opt_int(j.pid));
    json_object_object_add(o, "stop_requested", json_object_new_boolean(j.stop_requested ? 1 : 0));
    return o;
}

bool job_from_json(json_object* o, Job* out, std::string* err) {
    if (!o || !json_object_is_type(o, json_type_object) || !out || !err) {
        if (err) *err = "job entry is not an object";
        return false;
    }
    Job j;
    std::string status;
    if (!get_string(o, "id", &j.id, err)) return false;
    if (j.id.empty()) {
        *err = "field 'id' is empty";
        return false;
    }
    if (!get_string(o, "name", &j.name, err)) return false;
    if (!get_string(o, "command", &j.command, err)) return false;
    if (!get_string(o, "status", &status, err)) return false;
    auto st = status_from_str(status);
    if (!st) {
        *err = "unknown status '" + status + "'";
        return false;
    }
    j.status = *st;

    if (!get_opt_int64(o, "created_at", &j.created_at, err)) return false;
    if (!j.created_at) {
        *err = "field 'created_at' missing";
        return false;
    }
    if (!get_opt_int64(o, "started_at", &j.started_at, err)) return false;
    if (!get_opt_int64(o, "completed_at", &j.completed_at, err)) return false;
    if (!get_opt_int(o, "exit_code", &j.exit_code, err)) return false;
    if (!get_opt_int(o, "pid", &j.pid, err)) return false;

    json_object* v = nullptr;
    if (json_object_object_get_ex(o, "stop_requested", &v) && v) {
        if (!json_object_is_type(v, json_type_boolean)) {
            *err = "field 'stop_requested' is not a boolean";
            return false;
        }
        j.stop_requested = (json_object_get_boolean(v) != 0);
    }

    *out = std::move(j);
    return true;
}

// --- Queue file ---

std::string queue_state_to_json(const QueueState& qs) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "version", json_object_new_int(kQueueFormatVersion));
    json_object_object_add(root, "next_id", json_object_new_int64(qs.next_id));
    json_object* arr = json_object_new_array();
    for (const auto& j : qs.jobs) {
        json_object_array_add(arr, job_to_json(j));
    }
    json_object_object_add(root, "jobs", arr);

    std::string out = json_object_to_json_string_ext(
        root, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(root);
    out.push_back('\n');
    return out;
}

QueueState queue_state_from_json(const std::string& text, const std::string& origin) {
    enum json_tokener_error jerr = json_tokener_success;
    json_object* root = json_tokener_parse_verbose(text.c_str(), &jerr);
    if (!root) {
        throw StoreCorruption(origin + ": invalid JSON (" + json_tokener_error_desc(jerr) + ")");
    }

    auto fail = [&](const std::string& msg) {
        json_object_put(root);
        throw StoreCorruption(origin + ": " + msg);
    };

    if (!json_object_is_type(root, json_type_object)) fail("top level is not an object");

    json_object* v = nullptr;
    if (!json_object_object_get_ex(root, "version", &v) || !v || !json_object_is_type(v, json_type_int)) {
        fail("missing version");
    }
    int64_t version = json_object_get_int64(v);
    if (version != kQueueFormatVersion) {
        fail("unsupported version " + std::to_string(version));
    }

    QueueState qs;
    if (!json_object_object_get_ex(root, "next_id", &v) || !v || !json_object_is_type(v, json_type_int)) {
        fail("missing next_id");
    }
    qs.next_id = json_object_get_int64(v);
    if (qs.next_id < 1) fail("next_id must be positive");

    json_object* arr = nullptr;
    if (!json_object_object_get_ex(root, "jobs", &arr) || !arr || !json_object_is_type(arr, json_type_array)) {
        fail("missing jobs array");
    }

    std::unordered_set<std::string> seen;
    const size_t n = json_object_array_length(arr);
    qs.jobs.reserve(n);
    for (size_t i = 0; i < n; i++) {
        Job j;
        std::string err;
        if (!job_from_json(json_object_array_get_idx(arr, i), &j, &err)) {
            fail("job #" + std::to_string(i) + ": " + err);
        }
        if (!seen.insert(j.id).second) {
            fail("duplicate job id " + j.id);
        }
        qs.jobs.push_back(std::move(j));
    }

    json_object_put(root);
    return qs;
}

} // namespace seqrun
