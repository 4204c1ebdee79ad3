#include "../include/job_status.hpp"
#include "../../../shared/cpp/probe_sdk/include/trace.hpp"

JobColor classify_color(const std::string& color) {
    if (color == "blue") return JobColor::Passed;
    if (color == "red") return JobColor::Failed;
    if (color == "yellow") return JobColor::Unstable;
    if (color == "disabled") return JobColor::Disabled;
    return JobColor::Unrecognized;
}

const char* job_color_name(JobColor c) {
    switch (c) {
        case JobColor::Passed: return "passed";
        case JobColor::Failed: return "failed";
        case JobColor::Unstable: return "unstable";
        case JobColor::Disabled: return "disabled";
        case JobColor::Unrecognized: return "unrecognized";
    }
    return "unrecognized";
}

JobStatusCounts count_job_status(const std::vector<JobSummary>& jobs, const Trace& trace) {
    JobStatusCounts c;
    c.jobs = (long)jobs.size();
    trace.line("Found " + std::to_string(c.jobs) + " jobs");
    for (auto& job : jobs) {
        JobColor bucket = classify_color(job.color);
        trace.line("job: " + job.name + " color=" + job.color + " -> " + job_color_name(bucket));
        switch (bucket) {
            case JobColor::Passed: ++c.passed; break;
            case JobColor::Failed: ++c.failed; break;
            case JobColor::Unstable: ++c.unstable; break;
            case JobColor::Disabled: ++c.disabled; break;
            case JobColor::Unrecognized: ++c.unrecognized; break;
        }
    }
    if (c.unrecognized > 0) {
        trace.line(std::to_string(c.unrecognized) + " jobs with unrecognized color, reported as running");
    }
    return c;
}

Verdict job_status_verdict(const JobStatusCounts& counts) {
    Verdict v;
    if (counts.failed > 0) {
        v.severity = Severity::Critical;
        v.message = std::to_string(counts.failed) + " jobs have a error status";
    } else if (counts.unstable > 0) {
        v.severity = Severity::Warning;
        v.message = std::to_string(counts.unstable) + " jobs have a unstable status";
    } else {
        v.severity = Severity::Ok;
        v.message = "All jobs are ok";
    }
    v.metrics = {
        {"jobs", counts.jobs},
        {"passed", counts.passed},
        {"unstable", counts.unstable},
        {"failed", counts.failed},
        {"disabled", counts.disabled},
        {"running", counts.running()},
    };
    return v;
}

Verdict check_job_status(const std::string& body, const std::string& url, const Trace& trace) {
    std::vector<JobSummary> jobs;
    try {
        jobs = parse_job_summaries(body);
    } catch (const DecodeError& e) {
        trace.line(std::string("decode failed: ") + e.what());
        return unknown_verdict("Invalid response from " + url + " (" + e.what() + ")");
    }
    return job_status_verdict(count_job_status(jobs, trace));
}
