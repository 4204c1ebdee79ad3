#include "../shared/cpp/probe_sdk/include/jenkins_client.hpp"
#include "../shared/cpp/probe_sdk/include/jenkins_jobs.hpp"
#include "../shared/cpp/probe_sdk/include/trace.hpp"

#include <gtest/gtest.h>

TEST(JenkinsClient, ApiUrl)
{
    Trace trace("test", false);
    ClientConfig cfg;
    cfg.base_url = "https://ci.example.com/jenkins/";
    JenkinsClient client(cfg, trace);
    EXPECT_EQ(client.api_url(JOB_SUMMARY_TREE),
              "https://ci.example.com/jenkins/api/json?tree=jobs[color,name]");
    EXPECT_EQ(client.api_url(JOB_LAST_BUILD_TREE),
              "https://ci.example.com/jenkins/api/json?tree=jobs[disabled,name,lastBuild[result,timestamp]]");
}

TEST(JenkinsClient, ResolveProxy)
{
    EXPECT_EQ(resolve_proxy(std::string("http://p:3128"), true, "http://env:8080").value_or("?"), "http://p:3128");
    EXPECT_EQ(resolve_proxy(std::nullopt, true, "http://env:8080").value_or("?"), "");
    EXPECT_EQ(resolve_proxy(std::nullopt, false, "http://env:8080").value_or("?"), "http://env:8080");
    EXPECT_FALSE(resolve_proxy(std::nullopt, false, ""));
}

TEST(JenkinsClient, FetchErrorMessage)
{
    FetchError e("http://ci/api/json?tree=jobs[color,name]", "HTTP 403");
    EXPECT_STREQ(e.what(), "Failed retrieving http://ci/api/json?tree=jobs[color,name] (HTTP 403)");
    EXPECT_EQ(e.reason(), "HTTP 403");
    EXPECT_EQ(e.url(), "http://ci/api/json?tree=jobs[color,name]");
}

// Nothing listens on port 1 of the loopback address.
TEST(JenkinsClient, ConnectionRefusedIsFetchError)
{
    Trace trace("test", false);
    ClientConfig cfg;
    cfg.base_url = "http://127.0.0.1:1";
    cfg.timeout_s = 2;
    cfg.no_proxy = true;
    JenkinsClient client(cfg, trace);
    EXPECT_THROW(client.fetch(JOB_SUMMARY_TREE), FetchError);
}
