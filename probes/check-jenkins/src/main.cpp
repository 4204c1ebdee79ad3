#include "../include/job_status.hpp"
#include "../../../shared/cpp/probe_sdk/include/probe_runner.hpp"
#include <iostream>

int main(int argc, char** argv) {
    PluginInfo info;
    info.name = "check_jenkins";
    info.version = "1.7.1";
    info.summary = "A Nagios plugin that counts the jobs of a Jenkins instance (through HTTP request)";
    info.description =
        "    check_jenkins is a Nagios plugin that counts the jobs of a Jenkins\n"
        "    instance by color: passed (blue), unstable (yellow), failed (red),\n"
        "    disabled and running (every other enabled job).\n"
        "    It exits CRITICAL when any job failed, WARNING when any job is\n"
        "    unstable and OK otherwise. Perfdata:\n"
        "    jobs=<n> passed=<n> unstable=<n> failed=<n> disabled=<n> running=<n>\n";

    return run_probe(argc, argv, info, JOB_SUMMARY_TREE,
        [](const std::string& body, const std::string& url, const PluginOptions&, const Trace& trace) {
            return check_job_status(body, url, trace);
        }, std::cout);
}
