#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace text_processing {

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result;                                 // The stage output; default-constructed on failure
    bool succeeded = true;
    std::optional<std::string> error;         // Error message if stage failed
    std::chrono::microseconds duration{0};
    std::string stage_name;                   // Name of the stage (for logging)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace text_processing
