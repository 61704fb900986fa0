#pragma once

#include "session_store.hpp"

enum class AggregateStatus { Working, Idle, NeedsInput, NotRunning };

// needs_input > working > idle; an empty set is not_running.
AggregateStatus aggregate(const SessionMap& sessions);

const char* to_string(AggregateStatus status);

// Short label for the indicator, e.g. "Input needed".
const char* status_text(AggregateStatus status);
