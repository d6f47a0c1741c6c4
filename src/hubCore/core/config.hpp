#pragma once

#include <cstddef>

#include "types.hpp"

// Longest accepted event name. Longer names are rejected, never truncated.
#ifndef HUBCORE_MAX_EVENT_NAME_LENGTH
#define HUBCORE_MAX_EVENT_NAME_LENGTH 64
#endif

// Capacity of the human-readable form produced by hub_event::to_string().
#ifndef HUBCORE_MAX_EVENT_STRING_LENGTH
#define HUBCORE_MAX_EVENT_STRING_LENGTH 256
#endif

// Minimum error_severity (numeric) that the error handler writes to the log sink.
// 0 = info, 1 = warning, 2 = error, 3 = critical, 4 = fatal
#ifndef HUBCORE_ERROR_LOG_SEVERITY
#define HUBCORE_ERROR_LOG_SEVERITY 2
#endif

namespace hubCore::config {

        // Event envelope configuration
        constexpr size_t max_event_name_length = HUBCORE_MAX_EVENT_NAME_LENGTH;
        constexpr size_t max_event_string_length = HUBCORE_MAX_EVENT_STRING_LENGTH;

        // Canonical 8-4-4-4-12 textual id
        constexpr size_t event_id_string_length = 36;
        constexpr size_t event_id_size = 16;

        // Error reporting
        constexpr u8 error_log_severity = HUBCORE_ERROR_LOG_SEVERITY;

        static_assert(max_event_name_length > 0, "event names need at least one character");
        static_assert(max_event_string_length >= 64, "string form too small to hold an id");

} // namespace hubCore::config
