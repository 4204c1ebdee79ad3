#pragma once
#include <string>
#include <optional>

// Threshold options are parsed and kept for tracing, the probes do not enforce them.
struct Thresholds {
    std::optional<long> warning;      // total jobs count
    std::optional<long> critical;
    std::optional<double> failed_warn; // failed/enabled ratio, percent
    std::optional<double> failed_crit;

    bool any() const { return warning || critical || failed_warn || failed_crit; }
};

struct PluginOptions {
    std::string url; // trailing slash already stripped
    bool debug{false};
    long timeout_s{10};
    std::optional<std::string> proxy;
    bool no_proxy{false};
    bool no_perfdata{false};
    bool insecure{false};
    std::string username;
    std::string password;
    Thresholds thresholds;
    int days{1}; // only accepted when PluginInfo::accepts_days
};

struct PluginInfo {
    std::string name;    // e.g. "check_jenkins"
    std::string version;
    std::string summary; // one line for NAME
    std::string description;
    bool accepts_days{false};
};

enum class CliAction {
    Run,
    Help,
    Version,
    Manual,
    UsageError,
};

struct CliResult {
    CliAction action{CliAction::UsageError};
    PluginOptions options;
    std::string error; // set for UsageError
};

CliResult parse_plugin_args(int argc, const char* const* argv, const PluginInfo& info);

std::string strip_trailing_slash(std::string url);

std::string usage_text(const PluginInfo& info);
std::string version_text(const PluginInfo& info);
std::string manual_text(const PluginInfo& info);
