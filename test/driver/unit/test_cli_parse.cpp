/***
 * Name: test_cli_parse
 * Purpose: Command-line parsing: options, values, inputs and usage errors.
 */
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "agentrun/driver/cli.h"

using agentrun::driver::CliOptions;
using agentrun::driver::ParseCli;

namespace {

bool parse(std::vector<const char*> args, CliOptions& opts, std::string* errText = nullptr) {
  args.insert(args.begin(), "agentrun");
  std::ostringstream err;
  const bool ok = ParseCli(static_cast<int>(args.size()), args.data(), opts, err);
  if (errText != nullptr) *errText = err.str();
  return ok;
}

}  // namespace

TEST(CliParse, InputFileOnly) {
  CliOptions opts;
  ASSERT_TRUE(parse({"job.py"}, opts));
  EXPECT_EQ(opts.input, "job.py");
  EXPECT_FALSE(opts.check_only);
  EXPECT_FALSE(opts.metrics);
  EXPECT_EQ(opts.docker, "docker");
  EXPECT_FALSE(opts.container.has_value());
}

TEST(CliParse, StdinDash) {
  CliOptions opts;
  ASSERT_TRUE(parse({"-"}, opts));
  EXPECT_EQ(opts.input, "-");
}

TEST(CliParse, ValueOptionsBothForms) {
  CliOptions opts;
  ASSERT_TRUE(parse({"--container", "box", "--whitelist=requests,numpy", "--cached", "[\"numpy\"]", "--cpu-quota=1000",
                     "--memory", "64m", "--memswap=128m", "--timeout", "3", "--docker", "/usr/bin/podman", "x.py"},
                    opts));
  EXPECT_EQ(opts.container.value_or(""), "box");
  EXPECT_EQ(opts.whitelist.value_or(""), "requests,numpy");
  EXPECT_EQ(opts.cached.value_or(""), "[\"numpy\"]");
  EXPECT_EQ(opts.cpu_quota.value_or(""), "1000");
  EXPECT_EQ(opts.memory.value_or(""), "64m");
  EXPECT_EQ(opts.memswap.value_or(""), "128m");
  EXPECT_EQ(opts.timeout.value_or(""), "3");
  EXPECT_EQ(opts.docker, "/usr/bin/podman");
  EXPECT_EQ(opts.input, "x.py");
}

TEST(CliParse, SwitchesAndMetrics) {
  CliOptions opts;
  ASSERT_TRUE(parse({"--check", "-v", "--metrics=json", "a.py"}, opts));
  EXPECT_TRUE(opts.check_only);
  EXPECT_TRUE(opts.verbose);
  EXPECT_TRUE(opts.metrics);
  EXPECT_EQ(opts.metrics_format, CliOptions::MetricsFormat::Json);

  ASSERT_TRUE(parse({"--deps", "-q", "--metrics", "a.py"}, opts));
  EXPECT_TRUE(opts.deps_only);
  EXPECT_TRUE(opts.quiet);
  EXPECT_EQ(opts.metrics_format, CliOptions::MetricsFormat::Text);
}

TEST(CliParse, HelpShortCircuits) {
  CliOptions opts;
  EXPECT_FALSE(parse({"--bogus", "-h"}, opts));
  ASSERT_TRUE(parse({"-h", "--bogus"}, opts));
  EXPECT_TRUE(opts.show_help);
  ASSERT_TRUE(parse({"--help"}, opts));
  EXPECT_TRUE(opts.show_help);
}

TEST(CliParse, EndOfOptions) {
  CliOptions opts;
  ASSERT_TRUE(parse({"--check", "--", "-odd-name.py"}, opts));
  EXPECT_EQ(opts.input, "-odd-name.py");
  std::string err;
  EXPECT_FALSE(parse({"--", "a.py", "b.py"}, opts, &err));
  EXPECT_NE(err.find("only one input file is supported"), std::string::npos);
}

TEST(CliParse, UsageErrors) {
  CliOptions opts;
  std::string err;
  EXPECT_FALSE(parse({}, opts, &err));
  EXPECT_NE(err.find("no input file"), std::string::npos);

  EXPECT_FALSE(parse({"--frobnicate", "a.py"}, opts, &err));
  EXPECT_NE(err.find("unknown option '--frobnicate'"), std::string::npos);

  EXPECT_FALSE(parse({"a.py", "b.py"}, opts, &err));
  EXPECT_NE(err.find("only one input file is supported"), std::string::npos);

  EXPECT_FALSE(parse({"a.py", "--timeout"}, opts, &err));
  EXPECT_NE(err.find("missing value after '--timeout'"), std::string::npos);

  EXPECT_FALSE(parse({"--metrics=xml", "a.py"}, opts, &err));
  EXPECT_NE(err.find("unknown metrics format 'xml'"), std::string::npos);

  EXPECT_FALSE(parse({"-v", "-q", "a.py"}, opts, &err));
  EXPECT_NE(err.find("mutually exclusive"), std::string::npos);

  EXPECT_FALSE(parse({"--check", "--deps", "a.py"}, opts, &err));
  EXPECT_NE(err.find("--check and --deps are mutually exclusive"), std::string::npos);
}

TEST(CliParse, ResetsPreviousState) {
  CliOptions opts;
  ASSERT_TRUE(parse({"--check", "--container", "x", "a.py"}, opts));
  ASSERT_TRUE(parse({"b.py"}, opts));
  EXPECT_FALSE(opts.check_only);
  EXPECT_FALSE(opts.container.has_value());
}

TEST(CliUsage, ListsOptionsUnderBasename) {
  std::ostringstream out;
  agentrun::driver::PrintUsage(out, "/usr/local/bin/agentrun");
  const std::string text = out.str();
  EXPECT_EQ(text.rfind("Usage: agentrun [options]", 0), 0u);
  for (const char* opt : {"--container", "--whitelist", "--cached", "--cpu-quota", "--memory", "--memswap",
                          "--timeout", "--docker", "--check", "--deps", "--metrics", "--verbose", "--quiet"}) {
    EXPECT_NE(text.find(opt), std::string::npos) << opt;
  }
}
