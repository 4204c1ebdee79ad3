#include "../include/plugin_cli.hpp"
#include <sstream>
#include <vector>

namespace {

bool parse_long(const std::string& s, long& out) {
    try {
        size_t pos = 0;
        long v = std::stol(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_double(const std::string& s, double& out) {
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string invalid_value(const std::string& name, const std::string& value, const char* expected) {
    return "Value \"" + value + "\" invalid for option " + name + " (" + expected + " expected)";
}

// Maps short aliases onto their long names.
std::string long_name(const std::string& arg) {
    if (arg == "-h") return "help";
    if (arg == "-v") return "version";
    if (arg == "-d") return "debug";
    if (arg == "-t") return "timeout";
    if (arg == "-u") return "username";
    if (arg == "-p") return "password";
    if (arg == "-w") return "warning";
    if (arg == "-c") return "critical";
    return {};
}

CliResult usage_error(std::string msg) {
    CliResult r;
    r.action = CliAction::UsageError;
    r.error = std::move(msg);
    return r;
}

} // namespace

std::string strip_trailing_slash(std::string url) {
    if (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

CliResult parse_plugin_args(int argc, const char* const* argv, const PluginInfo& info) {
    CliResult res;
    PluginOptions& o = res.options;
    std::vector<std::string> positional;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (options_done || a.size() < 2 || a[0] != '-') {
            positional.push_back(a);
            continue;
        }
        if (a == "--") { options_done = true; continue; }

        std::string name;
        std::optional<std::string> inline_value;
        if (a.compare(0, 2, "--") == 0) {
            name = a.substr(2);
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name.erase(eq);
            }
        } else {
            name = long_name(a);
            if (name.empty()) return usage_error("Unknown option: " + a.substr(1));
        }

        auto take_value = [&](std::string& out) -> bool {
            if (inline_value) { out = *inline_value; return true; }
            if (i + 1 < argc) { out = argv[++i]; return true; }
            return false;
        };
        auto flag = [&](bool& target) -> bool {
            if (inline_value) return false;
            target = true;
            return true;
        };

        std::string v;
        if (name == "help" || name == "version" || name == "man") {
            if (inline_value) return usage_error("Option " + name + " does not take an argument");
            res.action = name == "help" ? CliAction::Help
                       : name == "version" ? CliAction::Version
                       : CliAction::Manual;
            return res;
        } else if (name == "debug" || name == "noproxy" || name == "noperfdata" || name == "insecure") {
            bool& target = name == "debug" ? o.debug
                         : name == "noproxy" ? o.no_proxy
                         : name == "noperfdata" ? o.no_perfdata
                         : o.insecure;
            if (!flag(target)) return usage_error("Option " + name + " does not take an argument");
        } else if (name == "timeout") {
            if (!take_value(v)) return usage_error("Option timeout requires an argument");
            long t = 0;
            if (!parse_long(v, t) || t <= 0) return usage_error(invalid_value(name, v, "positive number"));
            o.timeout_s = t;
        } else if (name == "proxy") {
            if (!take_value(v)) return usage_error("Option proxy requires an argument");
            o.proxy = v;
        } else if (name == "username" || name == "password") {
            if (!take_value(v)) return usage_error("Option " + name + " requires an argument");
            (name == "username" ? o.username : o.password) = v;
        } else if (name == "warning" || name == "critical") {
            if (!take_value(v)) return usage_error("Option " + name + " requires an argument");
            long n = 0;
            if (!parse_long(v, n) || n < 0) return usage_error(invalid_value(name, v, "count"));
            (name == "warning" ? o.thresholds.warning : o.thresholds.critical) = n;
        } else if (name == "failedwarn" || name == "failedcrit") {
            if (!take_value(v)) return usage_error("Option " + name + " requires an argument");
            double pct = 0;
            if (!parse_double(v, pct) || pct < 0 || pct > 100) return usage_error(invalid_value(name, v, "percentage"));
            (name == "failedwarn" ? o.thresholds.failed_warn : o.thresholds.failed_crit) = pct;
        } else if (name == "days" && info.accepts_days) {
            if (!take_value(v)) return usage_error("Option days requires an argument");
            long d = 0;
            if (!parse_long(v, d) || d < 0 || d > 100000) return usage_error(invalid_value(name, v, "number of days"));
            o.days = static_cast<int>(d);
        } else {
            return usage_error("Unknown option: " + name);
        }
    }

    if (positional.empty()) return usage_error("Missing Jenkins url parameter");
    if (positional.size() > 1) return usage_error("Unexpected argument: " + positional[1]);
    o.url = strip_trailing_slash(positional.front());
    res.action = CliAction::Run;
    return res;
}

std::string usage_text(const PluginInfo& info) {
    std::ostringstream os;
    os << "Usage:\n"
       << "    " << info.name << " --version\n"
       << "    " << info.name << " --help\n"
       << "    " << info.name << " --man\n"
       << "    " << info.name << " [options] <jenkins-url>\n"
       << "\n"
       << "    Options:\n"
       << "      -d --debug               turns on debug traces\n"
       << "      -t --timeout=<timeout>   the timeout in seconds to wait for the\n"
       << "                               request (default 10)\n"
       << "      --proxy=<url>            the http proxy url (default from\n"
       << "                               HTTP_PROXY env)\n"
       << "      --noproxy                do not use HTTP_PROXY env\n"
       << "      --noperfdata             do not output perfdata\n"
       << "      -w --warning=<count>     total jobs count WARNING threshold\n"
       << "                               (accepted, not enforced)\n"
       << "      -c --critical=<count>    total jobs count CRITICAL threshold\n"
       << "                               (accepted, not enforced)\n"
       << "      --failedwarn=<%>         failed/enabled jobs ratio WARNING\n"
       << "                               threshold (accepted, not enforced)\n"
       << "      --failedcrit=<%>         failed/enabled jobs ratio CRITICAL\n"
       << "                               threshold (accepted, not enforced)\n"
       << "      -u --username=<username> the username for authentication\n"
       << "      -p --password=<password> the password for authentication\n"
       << "      --insecure               allow HTTPS insecure connection (self\n"
       << "                               signed, expired, ...)\n";
    if (info.accepts_days) {
        os << "      --days=<days>            max days since lastBuild (default 1)\n";
    }
    return os.str();
}

std::string version_text(const PluginInfo& info) {
    return info.name + " version " + info.version + "\n";
}

std::string manual_text(const PluginInfo& info) {
    std::ostringstream os;
    os << "NAME\n"
       << "    " << info.name << " - " << info.summary << "\n\n"
       << "SYNOPSIS\n"
       << usage_text(info) << "\n"
       << "EXIT STATUS\n"
       << "    0 OK, 1 WARNING, 2 CRITICAL, 3 UNKNOWN (also for --help,\n"
       << "    --version, --man and usage errors).\n\n"
       << "DESCRIPTION\n"
       << info.description << "\n";
    return os.str();
}
