#include "RedactionPipeline.hpp"
#include "Diagnostics.hpp"
#include "EntryPreparer.hpp"
#include "RedactionSession.hpp"
#include "Redactor.hpp"
#include "StageRunner.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>

namespace redaction
{

namespace
{

bool isBlank(const std::string& text) { return trim(text).empty(); }

void logStageResult(const StageResult<std::string>& stage, const char* name)
{
    if (!Diagnostics::IsVerbose())
        return;

    if (stage.succeeded)
    {
        // Only post-redaction text is ever previewed
        PLOG_INFO_(Diagnostics::kLogInstance) << "[RedactionPipeline] stage=" << name
                                              << " status=ok duration=" << stage.duration.count()
                                              << "us output=" << Diagnostics::Preview(stage.result);
    }
    else
    {
        PLOG_ERROR_(Diagnostics::kLogInstance) << "[RedactionPipeline] stage=" << name
                                               << " status=error duration=" << stage.duration.count()
                                               << "us reason=" << (stage.error ? *stage.error : "unknown");
    }
}

} // namespace

struct RedactionPipeline::Impl
{
    std::vector<PIIEntry> entries;
    std::vector<CanonicalPIIEntry> prepared;
    std::unique_ptr<RedactionSession> session;
    std::optional<std::uint32_t> seed;

    std::unique_ptr<RedactionSession> makeSession() const
    {
        if (seed)
            return std::make_unique<RedactionSession>(*seed);
        return std::make_unique<RedactionSession>(createSession());
    }
};

RedactionPipeline::RedactionPipeline()
    : impl_(std::make_unique<Impl>())
{
}

RedactionPipeline::RedactionPipeline(std::vector<PIIEntry> entries)
    : RedactionPipeline()
{
    setEntries(std::move(entries));
}

RedactionPipeline::~RedactionPipeline() = default;

void RedactionPipeline::setEntries(std::vector<PIIEntry> entries)
{
    impl_->entries = std::move(entries);
    impl_->prepared = preparePIIEntries(impl_->entries);
    impl_->session.reset();

    PLOG_INFO_(Diagnostics::kLogInstance) << "[RedactionPipeline] " << impl_->entries.size() << " entries -> "
                                          << impl_->prepared.size() << " match candidates";
}

const std::vector<PIIEntry>& RedactionPipeline::entries() const noexcept { return impl_->entries; }

const std::vector<CanonicalPIIEntry>& RedactionPipeline::preparedEntries() const noexcept { return impl_->prepared; }

void RedactionPipeline::setSessionSeed(std::optional<std::uint32_t> seed) { impl_->seed = seed; }

RedactionOutcome RedactionPipeline::redactInput(const std::string& input)
{
    // Any input change invalidates nonces handed out for the previous input
    impl_->session.reset();

    if (impl_->prepared.empty())
    {
        if (input.empty())
            return RedactionOutcome::success({});

        PLOG_WARNING_(Diagnostics::kLogInstance) << "[RedactionPipeline] redact refused: no PII entries configured";
        return RedactionOutcome::failure(RedactionError::Unconfigured, kNoEntriesWarning);
    }

    if (isBlank(input))
        return RedactionOutcome::success({});

    auto session = impl_->makeSession();
    auto stage = run_stage<std::string>("redact", [&]() { return redact(input, impl_->prepared, *session); });
    logStageResult(stage, "redact");

    if (!stage.succeeded)
        return RedactionOutcome::failure(RedactionError::StageFailed, kRedactionFailedWarning);

    PLOG_DEBUG_(Diagnostics::kLogInstance) << "[RedactionPipeline] session holds " << session->size() << " nonces";
    impl_->session = std::move(session);
    return RedactionOutcome::success(std::move(stage.result));
}

RedactionOutcome RedactionPipeline::restoreResponse(const std::string& response) const
{
    if (!impl_->session)
    {
        if (isBlank(response))
            return RedactionOutcome::success({});

        PLOG_WARNING_(Diagnostics::kLogInstance) << "[RedactionPipeline] restore refused: no active session";
        return RedactionOutcome::failure(RedactionError::NoActiveSession, kNoSessionWarning);
    }

    if (isBlank(response))
        return RedactionOutcome::success({});

    const RedactionSession& session = *impl_->session;
    auto stage = run_stage<std::string>("restore", [&]() { return restore(response, session); });
    if (!stage.succeeded)
    {
        logStageResult(stage, "restore");
        return RedactionOutcome::failure(RedactionError::StageFailed, kRestoreFailedWarning);
    }

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[RedactionPipeline] stage=restore status=ok duration="
                                              << stage.duration.count() << "us";
    }
    return RedactionOutcome::success(std::move(stage.result));
}

bool RedactionPipeline::hasActiveSession() const noexcept { return impl_->session != nullptr; }

const RedactionSession* RedactionPipeline::session() const noexcept { return impl_->session.get(); }

void RedactionPipeline::resetSession() { impl_->session.reset(); }

} // namespace redaction
