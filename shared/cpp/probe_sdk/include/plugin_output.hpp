#pragma once
#include <string>
#include <vector>

// Nagios plugin return values; the numeric value is the process exit code.
enum class Severity {
    Ok = 0,
    Warning = 1,
    Critical = 2,
    Unknown = 3,
};

struct Metric {
    std::string label;
    long value{0};
};

struct Verdict {
    Severity severity{Severity::Unknown};
    std::string message;
    std::vector<Metric> metrics;     // rendered as "|label=value ..." unless suppressed
    std::vector<std::string> details; // printed after the verdict and metrics lines
};

const char* severity_label(Severity s);
int exit_code(Severity s);

Verdict unknown_verdict(const std::string& message);

std::string format_metrics(const std::vector<Metric>& metrics);
std::string render_verdict(const Verdict& v, bool with_metrics);
