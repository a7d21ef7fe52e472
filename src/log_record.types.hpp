#pragma once

#include <functional>
#include <string>

// One entry of a run's log. `attempt` is the optimization attempt that
// produced the entry, or -1 for pipeline-level events.
struct ExecutionLog {
    int attempt = -1;
    std::string category;
    std::string message;
};

using LogSink = std::function<void(const std::string& category, const std::string& message)>;
