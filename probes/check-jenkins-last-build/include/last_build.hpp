#pragma once
#include "../../../shared/cpp/probe_sdk/include/jenkins_jobs.hpp"
#include "../../../shared/cpp/probe_sdk/include/plugin_output.hpp"
#include <cstdint>
#include <string>
#include <vector>

class Trace;

constexpr std::int64_t MS_PER_DAY = 86400000;

enum class BuildOutcome {
    Running, // result empty or null
    Success,
    Failure,
    Unstable,
    Unrecognized, // ABORTED, NOT_BUILT, ...
};

BuildOutcome classify_result(const std::string& result);

struct LastBuildReport {
    long passed{0};
    long failed{0};
    long unstable{0};
    long running{0};
    long unrecognized{0};
    // excluded jobs
    long never_built{0};
    long stale{0};
    long disabled{0};
    std::vector<std::string> lines; // "[RESULT] name" per counted job, input order
};

// Folds the job list into a report; only jobs built within `days` of
// `now_ms` that are not disabled are counted.
LastBuildReport summarize_last_builds(const std::vector<JobLastBuild>& jobs,
                                      std::int64_t now_ms, int days, const Trace& trace);

Verdict last_build_verdict(const LastBuildReport& report, int days);

std::int64_t current_time_ms();

Verdict check_last_builds(const std::string& body, const std::string& url,
                          std::int64_t now_ms, int days, const Trace& trace);
