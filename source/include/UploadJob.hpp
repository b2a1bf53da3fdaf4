#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <Identity.hpp>
#include <Release.hpp>

enum class JobState { Classifying, Resolving, Preflight, Building, Submitting, Done, Failed };

std::string job_state_name(JobState state);

enum class OutcomeKind { Pending, Succeeded, Failed, Skipped };

std::string outcome_kind_name(OutcomeKind kind);

struct TargetOutcome {
    OutcomeKind kind = OutcomeKind::Pending;
    std::string reason;
    std::optional<unsigned> status;     // HTTP status behind a failure, when there was one

    bool terminal() const { return kind != OutcomeKind::Pending; }

    static TargetOutcome succeeded(std::string detail = {}) { return { OutcomeKind::Succeeded, std::move(detail), std::nullopt }; }
    static TargetOutcome failed(std::string reason, std::optional<unsigned> status = std::nullopt) {
        return { OutcomeKind::Failed, std::move(reason), status };
    }
    static TargetOutcome skipped(std::string reason) { return { OutcomeKind::Skipped, std::move(reason), std::nullopt }; }
};

enum class OverallOutcome { Succeeded, Failed, PartialFailure, Skipped };

std::string overall_outcome_name(OverallOutcome outcome);

// nothing or only Skipped -> Skipped, only Succeeded -> Succeeded, only Failed -> Failed,
// any mix -> PartialFailure. A Pending slot counts as Failed.
OverallOutcome overall_outcome(const std::vector<OutcomeKind>& outcomes);

// One release's trip through the pipeline. Owned by the orchestrator call that runs it.
class UploadJob {
public:
    UploadJob(std::string release_name, const std::vector<std::string>& targets);

    JobState state() const { return state_; }
    const std::vector<JobState>& history() const { return history_; }

    // throws std::logic_error on a transition the pipeline never makes
    void advance(JobState next);

    // fatal error: the job goes to Failed and every Pending target with it
    void fail(const std::string& error);

    TargetOutcome& outcome(const std::string& target);
    const TargetOutcome& outcome(const std::string& target) const;
    const std::vector<std::pair<std::string, TargetOutcome>>& outcomes() const { return outcomes_; }

    std::vector<std::string> pending_targets() const;

    // every target has a terminal outcome
    bool terminal() const;

    OverallOutcome overall() const;

    const std::string& release_name() const { return release_name_; }

    std::optional<ContentType> type;
    ParsedName parsed;
    IdentitySet identities;
    std::optional<std::string> fatal_error;

private:
    std::string release_name_;
    JobState state_ = JobState::Classifying;
    std::vector<JobState> history_{ JobState::Classifying };
    std::vector<std::pair<std::string, TargetOutcome>> outcomes_;
};
