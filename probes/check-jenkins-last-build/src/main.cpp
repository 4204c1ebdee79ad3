#include "../include/last_build.hpp"
#include "../../../shared/cpp/probe_sdk/include/probe_runner.hpp"
#include <iostream>

int main(int argc, char** argv) {
    PluginInfo info;
    info.name = "check_jenkins_last_build";
    info.version = "1.7.2";
    info.summary = "A Nagios plugin that checks the lastBuild of the jobs of a Jenkins instance (through HTTP request)";
    info.description =
        "    check_jenkins_last_build is a Nagios plugin that looks at the last\n"
        "    build of every enabled job built within the last --days days and\n"
        "    counts them as passed (SUCCESS), unstable (UNSTABLE), failed\n"
        "    (FAILURE) or running (no result yet). Jobs never built are ignored.\n"
        "    It exits CRITICAL when any build failed, WARNING when any build is\n"
        "    unstable and OK otherwise, then lists every counted job as\n"
        "    [RESULT] name. Perfdata:\n"
        "    passed=<n> unstable=<n> failed=<n> running=<n>\n";
    info.accepts_days = true;

    return run_probe(argc, argv, info, JOB_LAST_BUILD_TREE,
        [](const std::string& body, const std::string& url, const PluginOptions& opts, const Trace& trace) {
            return check_last_builds(body, url, current_time_ms(), opts.days, trace);
        }, std::cout);
}
