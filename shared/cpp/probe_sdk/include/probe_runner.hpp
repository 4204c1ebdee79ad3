#pragma once
#include "plugin_cli.hpp"
#include "plugin_output.hpp"
#include <functional>
#include <iosfwd>
#include <string>

class Trace;

// Classifies one API response body fetched from `url`.
using ProbeCheck = std::function<Verdict(const std::string& body,
                                         const std::string& url,
                                         const PluginOptions& opts,
                                         const Trace& trace)>;

// Parses the command line, fetches {url}/api/json?tree=<tree>, runs `check`
// and prints the result to `out`. Returns the process exit code.
int run_probe(int argc, const char* const* argv, const PluginInfo& info,
              const std::string& tree, const ProbeCheck& check, std::ostream& out);

// Prints the outcome of a non-Run CLI action; returns the exit code.
int print_cli_action(const CliResult& cli, const PluginInfo& info, std::ostream& out);
