#pragma once

#include "Diagnostics.hpp"
#include "RedactionTypes.hpp"

#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include <plog/Log.h>

namespace redaction {

// Runs one pipeline stage and folds any exception into a failed StageResult<T>.
// Stage exceptions describe broken invariants only; they never quote the text being processed.
template<typename T, typename Fn>
StageResult<T> run_stage(const char* stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [start]() {
        return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    };

    try
    {
        T value = std::forward<Fn>(fn)();
        const auto took = elapsed();
        if (Diagnostics::IsVerbose())
            PLOG_INFO_(Diagnostics::kLogInstance) << "[" << stage_name << "] done in " << took.count() << "us";
        return StageResult<T>::success(std::move(value), took, stage_name);
    }
    catch (const std::exception& ex)
    {
        const auto took = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance) << "[" << stage_name << "] failed after " << took.count()
                                               << "us: " << ex.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Redaction, "Redaction stage failed",
                                            std::string(stage_name) + ": " + ex.what());
        return StageResult<T>::failure(ex.what(), took, stage_name);
    }
}

} // namespace redaction
