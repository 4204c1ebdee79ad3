#include "../include/plugin_output.hpp"
#include <sstream>

const char* severity_label(Severity s) {
    switch (s) {
        case Severity::Ok: return "OK";
        case Severity::Warning: return "WARNING";
        case Severity::Critical: return "CRITICAL";
        case Severity::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

int exit_code(Severity s) {
    return static_cast<int>(s);
}

Verdict unknown_verdict(const std::string& message) {
    Verdict v;
    v.severity = Severity::Unknown;
    v.message = message;
    return v;
}

std::string format_metrics(const std::vector<Metric>& metrics) {
    std::ostringstream os;
    bool first = true;
    for (auto& m : metrics) {
        if (!first) os << ' ';
        os << m.label << '=' << m.value;
        first = false;
    }
    return os.str();
}

std::string render_verdict(const Verdict& v, bool with_metrics) {
    std::string out = std::string(severity_label(v.severity)) + ": " + v.message + "\n";
    if (with_metrics && !v.metrics.empty()) {
        out += "|" + format_metrics(v.metrics) + "\n";
    }
    for (auto& d : v.details) {
        out += d;
        out += '\n';
    }
    return out;
}
