#pragma once
#include "../../../shared/cpp/probe_sdk/include/jenkins_jobs.hpp"
#include "../../../shared/cpp/probe_sdk/include/plugin_output.hpp"
#include <string>
#include <vector>

class Trace;

enum class JobColor {
    Passed,   // blue
    Failed,   // red
    Unstable, // yellow
    Disabled,
    Unrecognized, // *_anime, notbuilt, aborted, grey, no color
};

JobColor classify_color(const std::string& color);
const char* job_color_name(JobColor c);

struct JobStatusCounts {
    long jobs{0};
    long passed{0};
    long failed{0};
    long unstable{0};
    long disabled{0};
    long unrecognized{0};

    long active() const { return jobs - disabled; }
    long running() const { return active() - passed - failed - unstable; }
};

JobStatusCounts count_job_status(const std::vector<JobSummary>& jobs, const Trace& trace);

Verdict job_status_verdict(const JobStatusCounts& counts);

// Decodes a tree=jobs[color,name] body and classifies it. A body that does
// not decode yields an UNKNOWN verdict naming the url.
Verdict check_job_status(const std::string& body, const std::string& url, const Trace& trace);
