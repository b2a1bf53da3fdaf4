#include <UploadJob.hpp>

#include <algorithm>
#include <stdexcept>

std::string job_state_name(JobState state) {
    switch (state) {
    case JobState::Classifying: return "classifying";
    case JobState::Resolving: return "resolving";
    case JobState::Preflight: return "preflight";
    case JobState::Building: return "building";
    case JobState::Submitting: return "submitting";
    case JobState::Done: return "done";
    case JobState::Failed: return "failed";
    }
    return "unknown";
}

std::string outcome_kind_name(OutcomeKind kind) {
    switch (kind) {
    case OutcomeKind::Pending: return "Pending";
    case OutcomeKind::Succeeded: return "Succeeded";
    case OutcomeKind::Failed: return "Failed";
    case OutcomeKind::Skipped: return "Skipped";
    }
    return "Unknown";
}

std::string overall_outcome_name(OverallOutcome outcome) {
    switch (outcome) {
    case OverallOutcome::Succeeded: return "Succeeded";
    case OverallOutcome::Failed: return "Failed";
    case OverallOutcome::PartialFailure: return "PartialFailure";
    case OverallOutcome::Skipped: return "Skipped";
    }
    return "Unknown";
}

OverallOutcome overall_outcome(const std::vector<OutcomeKind>& outcomes) {
    size_t succeeded = 0, failed = 0, skipped = 0;
    for (auto kind : outcomes) {
        if (kind == OutcomeKind::Succeeded) ++succeeded;
        else if (kind == OutcomeKind::Skipped) ++skipped;
        else ++failed;
    }

    if (skipped == outcomes.size()) return OverallOutcome::Skipped;
    if (succeeded == outcomes.size()) return OverallOutcome::Succeeded;
    if (failed == outcomes.size()) return OverallOutcome::Failed;
    return OverallOutcome::PartialFailure;
}

UploadJob::UploadJob(std::string release_name, const std::vector<std::string>& targets)
    : release_name_(std::move(release_name)) {
    for (const auto& t : targets) outcomes_.emplace_back(t, TargetOutcome{});
}

void UploadJob::advance(JobState next) {
    bool legal = false;
    switch (state_) {
    case JobState::Classifying: legal = next == JobState::Resolving || next == JobState::Preflight; break;
    case JobState::Resolving: legal = next == JobState::Preflight; break;
    case JobState::Preflight: legal = next == JobState::Building || next == JobState::Done; break;
    case JobState::Building: legal = next == JobState::Submitting; break;
    case JobState::Submitting: legal = next == JobState::Done; break;
    case JobState::Done:
    case JobState::Failed: break;
    }
    if (next == JobState::Failed && state_ != JobState::Done && state_ != JobState::Failed) legal = true;

    if (!legal) throw std::logic_error("upload job cannot go from " + job_state_name(state_) + " to " + job_state_name(next));

    if (next == JobState::Done && !terminal()) throw std::logic_error("upload job done with targets still pending");

    state_ = next;
    history_.push_back(next);
}

void UploadJob::fail(const std::string& error) {
    fatal_error = error;
    for (auto& [name, outcome] : outcomes_) {
        if (!outcome.terminal()) outcome = TargetOutcome::failed(error);
    }
    advance(JobState::Failed);
}

TargetOutcome& UploadJob::outcome(const std::string& target) {
    auto it = std::find_if(outcomes_.begin(), outcomes_.end(), [&](const auto& o) { return o.first == target; });
    if (it == outcomes_.end()) throw std::out_of_range("no target named '" + target + "' in this job");
    return it->second;
}

const TargetOutcome& UploadJob::outcome(const std::string& target) const {
    auto it = std::find_if(outcomes_.begin(), outcomes_.end(), [&](const auto& o) { return o.first == target; });
    if (it == outcomes_.end()) throw std::out_of_range("no target named '" + target + "' in this job");
    return it->second;
}

std::vector<std::string> UploadJob::pending_targets() const {
    std::vector<std::string> pending;
    for (const auto& [name, outcome] : outcomes_) {
        if (!outcome.terminal()) pending.push_back(name);
    }
    return pending;
}

bool UploadJob::terminal() const {
    return std::all_of(outcomes_.begin(), outcomes_.end(), [](const auto& o) { return o.second.terminal(); });
}

OverallOutcome UploadJob::overall() const {
    std::vector<OutcomeKind> kinds;
    for (const auto& [name, outcome] : outcomes_) kinds.push_back(outcome.kind);
    return overall_outcome(kinds);
}
