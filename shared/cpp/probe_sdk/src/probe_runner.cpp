#include "../include/probe_runner.hpp"
#include "../include/jenkins_client.hpp"
#include "../include/trace.hpp"
#include <ostream>

int print_cli_action(const CliResult& cli, const PluginInfo& info, std::ostream& out) {
    switch (cli.action) {
        case CliAction::Help: out << usage_text(info); break;
        case CliAction::Version: out << version_text(info); break;
        case CliAction::Manual: out << manual_text(info); break;
        case CliAction::UsageError:
            out << "UNKNOWN: " << cli.error << "\n\n" << usage_text(info);
            break;
        case CliAction::Run: return exit_code(Severity::Ok);
    }
    return exit_code(Severity::Unknown);
}

int run_probe(int argc, const char* const* argv, const PluginInfo& info,
              const std::string& tree, const ProbeCheck& check, std::ostream& out) {
    auto cli = parse_plugin_args(argc, argv, info);
    if (cli.action != CliAction::Run) return print_cli_action(cli, info, out);

    const PluginOptions& opts = cli.options;
    Trace trace(info.name, opts.debug);
    if (opts.thresholds.any()) {
        trace.line("Threshold options are accepted but not enforced");
    }

    ClientConfig cfg;
    cfg.base_url = opts.url;
    cfg.user_agent = info.name + "/" + info.version;
    cfg.timeout_s = opts.timeout_s;
    cfg.proxy = opts.proxy;
    cfg.no_proxy = opts.no_proxy;
    cfg.insecure = opts.insecure;
    cfg.username = opts.username;
    cfg.password = opts.password;

    Verdict v;
    try {
        JenkinsClient client(cfg, trace);
        auto body = client.fetch(tree);
        v = check(body, client.api_url(tree), opts, trace);
    } catch (const FetchError& e) {
        trace.line("fetch failed: " + e.reason());
        v = unknown_verdict(e.what());
    } catch (const std::exception& e) {
        v = unknown_verdict(e.what());
    }

    out << render_verdict(v, !opts.no_perfdata);
    return exit_code(v.severity);
}
