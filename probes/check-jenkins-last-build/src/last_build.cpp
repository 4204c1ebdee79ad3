#include "../include/last_build.hpp"
#include "../../../shared/cpp/probe_sdk/include/trace.hpp"
#include <chrono>

BuildOutcome classify_result(const std::string& result) {
    if (result.empty()) return BuildOutcome::Running;
    if (result == "SUCCESS") return BuildOutcome::Success;
    if (result == "FAILURE") return BuildOutcome::Failure;
    if (result == "UNSTABLE") return BuildOutcome::Unstable;
    return BuildOutcome::Unrecognized;
}

LastBuildReport summarize_last_builds(const std::vector<JobLastBuild>& jobs,
                                      std::int64_t now_ms, int days, const Trace& trace) {
    LastBuildReport r;
    const std::int64_t window_ms = (std::int64_t)days * MS_PER_DAY;
    // oldest timestamp still inside the window
    const std::int64_t oldest_ms = now_ms - window_ms;
    trace.line("Found " + std::to_string(jobs.size()) + " jobs");

    for (auto& job : jobs) {
        if (!job.last_build) {
            trace.line("job: " + job.name + " never built, skipped");
            ++r.never_built;
            continue;
        }
        const LastBuild& b = *job.last_build;
        trace.line("job: " + job.name + " disabled=" + (job.disabled ? "1" : "0") +
                   " status=" + b.result + " timestamp=" + std::to_string(b.timestamp));
        if (b.timestamp < oldest_ms) {
            ++r.stale;
            continue;
        }
        if (job.disabled) {
            ++r.disabled;
            continue;
        }
        switch (classify_result(b.result)) {
            case BuildOutcome::Running: ++r.running; break;
            case BuildOutcome::Success: ++r.passed; break;
            case BuildOutcome::Failure: ++r.failed; break;
            case BuildOutcome::Unstable: ++r.unstable; break;
            case BuildOutcome::Unrecognized:
                trace.line("job: " + job.name + " unrecognized result " + b.result + ", not counted");
                ++r.unrecognized;
                break;
        }
        r.lines.push_back("[" + (b.result.empty() ? std::string("RUNNING") : b.result) + "] " + job.name);
    }
    return r;
}

Verdict last_build_verdict(const LastBuildReport& report, int days) {
    Verdict v;
    if (report.failed > 0) {
        v.severity = Severity::Critical;
        v.message = std::to_string(report.failed) + " jobs have a error status";
    } else if (report.unstable > 0) {
        v.severity = Severity::Warning;
        v.message = std::to_string(report.unstable) + " jobs have a unstable status";
    } else {
        v.severity = Severity::Ok;
        v.message = "All builds for the last " + std::to_string(days) + " days are ok";
    }
    v.metrics = {
        {"passed", report.passed},
        {"unstable", report.unstable},
        {"failed", report.failed},
        {"running", report.running},
    };
    v.details = report.lines;
    return v;
}

std::int64_t current_time_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

Verdict check_last_builds(const std::string& body, const std::string& url,
                          std::int64_t now_ms, int days, const Trace& trace) {
    std::vector<JobLastBuild> jobs;
    try {
        jobs = parse_job_last_builds(body);
    } catch (const DecodeError& e) {
        trace.line(std::string("decode failed: ") + e.what());
        return unknown_verdict("Invalid response from " + url + " (" + e.what() + ")");
    }
    return last_build_verdict(summarize_last_builds(jobs, now_ms, days, trace), days);
}
