// test_cli_fcalc.cpp - CLI integration tests for fcalc

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliRun
{
  int exit_code = 0;
  std::string out;
};

/// Run fcalc with pre-quoted arguments; stdout is captured, stderr dropped
CliRun run_cli(const std::string & quoted_args, const fs::path & work_dir)
{
  CliRun run;
#ifndef FIELDCALC_CLI_PATH
  (void)quoted_args;
  (void)work_dir;
  return run;
#else
  const fs::path out_file = work_dir / "stdout.txt";
  const std::string cmd = "cd " + shell_quote(work_dir.string()) + " && " +
                          shell_quote(FIELDCALC_CLI_PATH) + " " + quoted_args + " > " +
                          shell_quote(out_file.string()) + " 2>/dev/null";

  const int rc = std::system(cmd.c_str());
  run.out = read_all(out_file);

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    run.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    run.exit_code = WEXITSTATUS(rc);
  } else {
    run.exit_code = 128;
  }
#else
  run.exit_code = rc;
#endif
  return run;
#endif
}

class CliFcalc : public ::testing::Test
{
protected:
  void SetUp() override
  {
#ifndef FIELDCALC_CLI_PATH
    GTEST_SKIP() << "fcalc path not configured";
#endif
    dir_ = make_temp_dir("fieldcalc_cli");
  }

  void TearDown() override
  {
    if (!dir_.empty()) {
      std::error_code ec;
      fs::remove_all(dir_, ec);
    }
  }

  fs::path dir_;
};

constexpr const char * k_entity = R"(
entity: sample
fields:
  depth_from: {type: number, value: 5.0}
  depth_to: {type: number, value: 10.0}
  interval:
    formula: depth_to - depth_from
  midpoint:
    formula: depth_from + interval / 2
outputs:
  interval:
    - formula: interval
      target: TEXT
)";

}  // namespace

TEST_F(CliFcalc, EvalPrintsTheValue)
{
  const auto r = run_cli("eval " + shell_quote("depth_from + depth_to") +
                           " --set depth_from=5.0 --set depth_to=10.0",
                         dir_);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.out, "15.0\n");
}

TEST_F(CliFcalc, EvalErrorExitsWithOne)
{
  const auto r = run_cli("eval " + shell_quote("x / 0") + " --set x=10", dir_);
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_TRUE(r.out.empty());
}

TEST_F(CliFcalc, EvalJson)
{
  const auto r = run_cli("eval " + shell_quote("abs(-5)") + " --json", dir_);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_NE(r.out.find("\"value\": 5"), std::string::npos);
  EXPECT_NE(r.out.find("\"type\": \"number\""), std::string::npos);
}

TEST_F(CliFcalc, ParsePrintsTreeAndReferences)
{
  const auto r = run_cli("parse " + shell_quote("b + a * 2"), dir_);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.out, "(+ b (* a 2))\nreferences: a, b\n");
}

TEST_F(CliFcalc, OrderAndRunUseTheEntityFile)
{
  write_all(dir_ / "fcalc.yaml", k_entity);

  const auto order = run_cli("order fcalc.yaml", dir_);
  EXPECT_EQ(order.exit_code, 0);
  EXPECT_EQ(order.out, "interval\nmidpoint\n");

  // run finds fcalc.yaml on its own
  const auto run = run_cli("run", dir_);
  EXPECT_EQ(run.exit_code, 0);
  EXPECT_EQ(run.out, "interval = 5.0\nmidpoint = 7.5\ninterval -> \"5.0\"\n");
}

TEST_F(CliFcalc, CheckReportsCycles)
{
  write_all(dir_ / "fcalc.yaml", "fields:\n  a: {formula: b}\n  b: {formula: a}\n");
  const auto r = run_cli("check", dir_);
  EXPECT_EQ(r.exit_code, 1);
}

TEST_F(CliFcalc, CheckOk)
{
  write_all(dir_ / "fcalc.yaml", k_entity);
  const auto r = run_cli("check", dir_);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.out, "sample: OK\n");
}

TEST_F(CliFcalc, UsageErrors)
{
  EXPECT_EQ(run_cli("", dir_).exit_code, 2);
  EXPECT_EQ(run_cli("frobnicate", dir_).exit_code, 2);
  EXPECT_EQ(run_cli("eval 1 --bogus", dir_).exit_code, 2);
  EXPECT_EQ(run_cli("--help", dir_).exit_code, 0);
}
