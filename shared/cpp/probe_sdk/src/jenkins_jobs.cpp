#include "../include/jenkins_jobs.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using json = nlohmann::json;

const char* const JOB_SUMMARY_TREE = "jobs[color,name]";
const char* const JOB_LAST_BUILD_TREE = "jobs[disabled,name,lastBuild[result,timestamp]]";

namespace {

const json& jobs_array(const json& doc) {
    if (!doc.is_object()) throw DecodeError("response is not a JSON object");
    auto it = doc.find("jobs");
    if (it == doc.end()) throw DecodeError("missing 'jobs' field");
    if (!it->is_array()) throw DecodeError("'jobs' is not an array");
    return *it;
}

json parse_body(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw DecodeError(std::string("malformed JSON: ") + e.what());
    }
}

// Absent and null fields read as the fallback; a present field of the wrong type is an error.
std::string string_or(const json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_string()) throw DecodeError(std::string("'") + key + "' is not a string");
    return it->get<std::string>();
}

std::string job_name(const json& job, size_t index) {
    if (!job.is_object()) throw DecodeError("job #" + std::to_string(index) + " is not an object");
    auto it = job.find("name");
    if (it == job.end() || !it->is_string()) {
        throw DecodeError("job #" + std::to_string(index) + " has no name");
    }
    return it->get<std::string>();
}

} // namespace

std::vector<JobSummary> parse_job_summaries(const std::string& body) {
    auto doc = parse_body(body);
    const json& jobs = jobs_array(doc);
    std::vector<JobSummary> out;
    out.reserve(jobs.size());
    for (size_t i = 0; i < jobs.size(); ++i) {
        JobSummary s;
        s.name = job_name(jobs[i], i);
        s.color = string_or(jobs[i], "color", std::string());
        out.push_back(std::move(s));
    }
    return out;
}

std::vector<JobLastBuild> parse_job_last_builds(const std::string& body) {
    auto doc = parse_body(body);
    const json& jobs = jobs_array(doc);
    std::vector<JobLastBuild> out;
    out.reserve(jobs.size());
    for (size_t i = 0; i < jobs.size(); ++i) {
        const json& j = jobs[i];
        JobLastBuild job;
        job.name = job_name(j, i);

        auto dis = j.find("disabled");
        if (dis != j.end() && !dis->is_null()) {
            if (!dis->is_boolean()) throw DecodeError("job '" + job.name + "': 'disabled' is not a boolean");
            job.disabled = dis->get<bool>();
        }

        auto lb = j.find("lastBuild");
        if (lb != j.end() && !lb->is_null()) {
            if (!lb->is_object()) throw DecodeError("job '" + job.name + "': 'lastBuild' is not an object");
            auto ts = lb->find("timestamp");
            if (ts == lb->end() || !ts->is_number_integer()) {
                throw DecodeError("job '" + job.name + "': lastBuild has no integer timestamp");
            }
            if (ts->is_number_unsigned() &&
                ts->get<std::uint64_t>() > (std::uint64_t)std::numeric_limits<std::int64_t>::max()) {
                throw DecodeError("job '" + job.name + "': lastBuild timestamp out of range");
            }
            LastBuild build;
            build.timestamp = ts->get<std::int64_t>();
            build.result = string_or(*lb, "result", std::string());
            job.last_build = std::move(build);
        }
        out.push_back(std::move(job));
    }
    return out;
}
