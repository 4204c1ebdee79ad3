#include "../shared/cpp/probe_sdk/include/plugin_cli.hpp"
#include "../shared/cpp/probe_sdk/include/probe_runner.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

namespace {

PluginInfo info_for(bool days) {
    PluginInfo info;
    info.name = days ? "check_jenkins_last_build" : "check_jenkins";
    info.version = days ? "1.7.2" : "1.7.1";
    info.summary = "test";
    info.description = "    test probe\n";
    info.accepts_days = days;
    return info;
}

CliResult parse(std::vector<const char*> args, bool days = false) {
    args.insert(args.begin(), "probe");
    return parse_plugin_args((int)args.size(), args.data(), info_for(days));
}

} // namespace

TEST(PluginCli, Defaults)
{
    auto r = parse({"https://ci.example.com/"});
    ASSERT_EQ(r.action, CliAction::Run);
    EXPECT_EQ(r.options.url, "https://ci.example.com");
    EXPECT_EQ(r.options.timeout_s, 10);
    EXPECT_FALSE(r.options.debug);
    EXPECT_FALSE(r.options.proxy);
    EXPECT_FALSE(r.options.no_proxy);
    EXPECT_FALSE(r.options.no_perfdata);
    EXPECT_FALSE(r.options.insecure);
    EXPECT_FALSE(r.options.thresholds.any());
    EXPECT_EQ(r.options.days, 1);
}

TEST(PluginCli, OnlyOneSlashStripped)
{
    EXPECT_EQ(strip_trailing_slash("http://ci//"), "http://ci/");
    EXPECT_EQ(strip_trailing_slash("http://ci"), "http://ci");
    EXPECT_EQ(strip_trailing_slash(""), "");
}

TEST(PluginCli, AllOptions)
{
    auto r = parse({"-d", "-t", "5", "--proxy=http://proxy:3128", "--noperfdata", "--insecure",
                    "-u", "nagios", "--password", "secret", "-w", "100", "--critical=200",
                    "--failedwarn", "10", "--failedcrit=25.5", "http://ci"});
    ASSERT_EQ(r.action, CliAction::Run) << r.error;
    const auto& o = r.options;
    EXPECT_TRUE(o.debug);
    EXPECT_EQ(o.timeout_s, 5);
    EXPECT_EQ(o.proxy.value_or(""), "http://proxy:3128");
    EXPECT_TRUE(o.no_perfdata);
    EXPECT_TRUE(o.insecure);
    EXPECT_EQ(o.username, "nagios");
    EXPECT_EQ(o.password, "secret");
    EXPECT_EQ(o.thresholds.warning.value_or(-1), 100);
    EXPECT_EQ(o.thresholds.critical.value_or(-1), 200);
    EXPECT_DOUBLE_EQ(o.thresholds.failed_warn.value_or(-1), 10.0);
    EXPECT_DOUBLE_EQ(o.thresholds.failed_crit.value_or(-1), 25.5);
    EXPECT_TRUE(o.thresholds.any());
    EXPECT_EQ(o.url, "http://ci");
}

TEST(PluginCli, Days)
{
    auto r = parse({"--days", "7", "http://ci"}, true);
    ASSERT_EQ(r.action, CliAction::Run) << r.error;
    EXPECT_EQ(r.options.days, 7);

    r = parse({"--days=0", "http://ci"}, true);
    ASSERT_EQ(r.action, CliAction::Run) << r.error;
    EXPECT_EQ(r.options.days, 0);

    EXPECT_EQ(parse({"--days=-1", "http://ci"}, true).action, CliAction::UsageError);
    EXPECT_EQ(parse({"--days", "http://ci"}, true).action, CliAction::UsageError);
    // the aggregate probe has no freshness window
    r = parse({"--days=2", "http://ci"}, false);
    EXPECT_EQ(r.action, CliAction::UsageError);
    EXPECT_EQ(r.error, "Unknown option: days");
}

TEST(PluginCli, MissingUrl)
{
    auto r = parse({"-d"});
    EXPECT_EQ(r.action, CliAction::UsageError);
    EXPECT_EQ(r.error, "Missing Jenkins url parameter");
}

TEST(PluginCli, ExtraPositional)
{
    auto r = parse({"http://a", "http://b"});
    EXPECT_EQ(r.action, CliAction::UsageError);
    EXPECT_EQ(r.error, "Unexpected argument: http://b");
}

TEST(PluginCli, InvalidValues)
{
    EXPECT_EQ(parse({"-t", "ten", "http://ci"}).action, CliAction::UsageError);
    EXPECT_EQ(parse({"-t", "0", "http://ci"}).action, CliAction::UsageError);
    EXPECT_EQ(parse({"--failedwarn=150", "http://ci"}).action, CliAction::UsageError);
    EXPECT_EQ(parse({"--debug=yes", "http://ci"}).action, CliAction::UsageError);
    EXPECT_EQ(parse({"http://ci", "--timeout"}).action, CliAction::UsageError);
    EXPECT_EQ(parse({"-x", "http://ci"}).error, "Unknown option: x");
    EXPECT_EQ(parse({"--verbose", "http://ci"}).error, "Unknown option: verbose");
}

TEST(PluginCli, InformationalActions)
{
    EXPECT_EQ(parse({"-h"}).action, CliAction::Help);
    EXPECT_EQ(parse({"--version", "http://ci"}).action, CliAction::Version);
    EXPECT_EQ(parse({"--man"}).action, CliAction::Manual);
}

TEST(PluginCli, DoubleDashEndsOptions)
{
    auto r = parse({"--", "-weird-host"});
    ASSERT_EQ(r.action, CliAction::Run);
    EXPECT_EQ(r.options.url, "-weird-host");
}

TEST(PluginCli, PrintActionsExitUnknown)
{
    std::ostringstream out;
    CliResult r;
    r.action = CliAction::Version;
    EXPECT_EQ(print_cli_action(r, info_for(false), out), 3);
    EXPECT_EQ(out.str(), "check_jenkins version 1.7.1\n");

    out.str("");
    r.action = CliAction::UsageError;
    r.error = "Missing Jenkins url parameter";
    EXPECT_EQ(print_cli_action(r, info_for(true), out), 3);
    EXPECT_EQ(out.str().rfind("UNKNOWN: Missing Jenkins url parameter\n", 0), 0u);
    EXPECT_NE(out.str().find("--days=<days>"), std::string::npos);
}

TEST(PluginCli, UsageListsDaysOnlyForFreshnessProbe)
{
    EXPECT_EQ(usage_text(info_for(false)).find("--days"), std::string::npos);
    EXPECT_NE(usage_text(info_for(true)).find("--days"), std::string::npos);
    EXPECT_NE(manual_text(info_for(true)).find("EXIT STATUS"), std::string::npos);
}
