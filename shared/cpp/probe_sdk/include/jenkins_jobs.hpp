#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when the API body is not the JSON document the probe asked for.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// tree=jobs[color,name]
struct JobSummary {
    std::string name;
    std::string color; // empty when the job has no color (folders, views)
};

struct LastBuild {
    std::string result; // empty while the build is still running
    std::int64_t timestamp{0}; // ms since epoch
};

// tree=jobs[disabled,name,lastBuild[result,timestamp]]
struct JobLastBuild {
    std::string name;
    bool disabled{false};
    std::optional<LastBuild> last_build; // nullopt: job was never built
};

extern const char* const JOB_SUMMARY_TREE;
extern const char* const JOB_LAST_BUILD_TREE;

std::vector<JobSummary> parse_job_summaries(const std::string& body);
std::vector<JobLastBuild> parse_job_last_builds(const std::string& body);
