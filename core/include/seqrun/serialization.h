#pragma once

#include "types.h"

#include <json-c/json.h>

#include <stdexcept>
#include <string>

namespace seqrun {

// Thrown when the persisted queue cannot be read back. Never swallowed:
// the process that hits it reports it and stops.
class StoreCorruption : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Current on-disk format version of the queue file.
constexpr int kQueueFormatVersion = 1;

// --- Job serialization ---

json_object* job_to_json(const Job& j);
// Strict: returns false and sets *err when a field is missing or mistyped.
bool job_from_json(json_object* o, Job* out, std::string* err);

// --- Queue file ---

std::string queue_state_to_json(const QueueState& qs);
// Throws StoreCorruption on any structural problem.
QueueState queue_state_from_json(const std::string& text, const std::string& origin);

} // namespace seqrun
