#include <unistd.h>
#include <thread>
#include <chrono>
#include <set>
#include <cstdlib>
#include <fstream>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <polyrun/paths.h>
#include <polyrun/runner.h>
#include <polyrun/scheduler.h>
#include <polyrun/utils.h>
#include "utils.h"

using namespace std::chrono_literals;
using nlohmann::json;

// These do not start a sandbox
TEST(RunnerTest, MissingToolchain) {
  LanguageRegistry registry = LanguageRegistry::Builtin();
  ASSERT_TRUE(registry.LoadJson({{"languages", {{
    {"id", "missing"},
    {"extension", ".txt"},
    {"stages", {{{"name", "compile"}, {"executable", "polyrun-no-such-compiler"}},
                {{"name", "run"}, {"executable", "./{program}"}}}},
  }}}}));
  SandboxRunner runner;
  CancelToken cancel;
  const LanguageProfile* profile = registry.Resolve("missing");
  ASSERT_NE(profile, nullptr);
  ExecutionRequest req("missing", "x", std::nullopt, "test");
  ExecutionResult res = runner.Run(registry, *profile, req, cancel);
  EXPECT_EQ(res.outcome, Outcome::INTERNAL_ERROR);
  EXPECT_EQ(res.stage, "compile");
  EXPECT_NE(res.message.find("polyrun-no-such-compiler"), std::string::npos);
  EXPECT_FALSE(res.exit_code);
}

TEST(RunnerTest, CancelledBeforeStart) {
  const LanguageRegistry& registry = *BuiltinRegistry();
  SandboxRunner runner;
  CancelToken cancel;
  cancel.Cancel();
  cancel.Cancel();
  EXPECT_TRUE(cancel.IsCancelled());
  ExecutionRequest req("sh", "echo hi", std::nullopt, "test");
  ExecutionResult res = runner.Run(registry, *registry.Resolve("sh"), req, cancel);
  EXPECT_EQ(res.outcome, Outcome::CANCELLED);
}

namespace {

class SandboxTest : public ::testing::Test {
 protected:
  LanguageRegistry registry_;
  std::shared_ptr<SandboxRunner> runner_;

  void SetUp() override {
    if (geteuid() != 0) GTEST_SKIP() << "sandbox tests must be run as root";
    if (!fs::exists(SandboxHelperPath())) GTEST_SKIP() << "sandbox helper not built";
    registry_ = LanguageRegistry::Builtin();
    runner_ = std::make_shared<SandboxRunner>();
  }

  bool Available(const std::string& language) {
    const LanguageProfile* profile = registry_.Resolve(language);
    return profile && IsAvailable(*profile);
  }

  ExecutionResult Run(const std::string& language, const std::string& source,
                      std::optional<std::string> input = std::nullopt, const Limits& limits = Limits(),
                      const CancelToken* cancel = nullptr) {
    const LanguageProfile* profile = registry_.Resolve(language);
    if (!profile) return ExecutionResult(Outcome::NOT_FOUND);
    ExecutionRequest req(language, source, std::move(input), "test");
    req.limits = registry_.EffectiveLimits(*profile, limits);
    CancelToken token;
    return runner_->Run(registry_, *profile, req, cancel ? *cancel : token);
  }
};

// processes whose real uid belongs to the sandbox pool
int SandboxProcesses() {
  int ret = 0;
  std::error_code ec;
  for (auto& entry : fs::directory_iterator("/proc", ec)) {
    std::ifstream fin(entry.path() / "status");
    for (std::string line; std::getline(fin, line);) {
      if (line.compare(0, 4, "Uid:") != 0) continue;
      int uid = std::stoi(line.substr(4));
      if (uid >= SandboxRunner::kUidBase && uid < SandboxRunner::kUidBase + SandboxRunner::kUidPoolSize) ret++;
      break;
    }
  }
  return ret;
}

// allows the kernel a moment to reap the killed jail
bool NoSandboxProcessLeft() {
  for (int i = 0; i < 20; i++) {
    if (!SandboxProcesses()) return true;
    std::this_thread::sleep_for(50ms);
  }
  return false;
}

} // namespace

#define REQUIRE_LANGUAGE(lang) \
  if (!Available(lang)) GTEST_SKIP() << lang << " is not installed"

TEST_F(SandboxTest, HelloPython) {
  REQUIRE_LANGUAGE("python3");
  ExecutionResult res = Run("python3", "print(\"hello\")\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS) << res.message << res.error;
  EXPECT_EQ(res.output, "hello\n");
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stage, "run");
  EXPECT_GT(res.wall_time, 0);
}

TEST_F(SandboxTest, Stdin) {
  REQUIRE_LANGUAGE("sh");
  ExecutionResult res = Run("sh", "read a; read b; echo \"$b $a\"\n", "first\nsecond\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS) << res.message << res.error;
  EXPECT_EQ(res.output, "second first\n");
  // no input means an empty stdin
  res = Run("sh", "cat; echo done\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS);
  EXPECT_EQ(res.output, "done\n");
}

TEST_F(SandboxTest, Stderr) {
  REQUIRE_LANGUAGE("sh");
  ExecutionResult res = Run("sh", "echo out; echo err >&2\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS);
  EXPECT_EQ(res.output, "out\n");
  EXPECT_EQ(res.error, "err\n");
}

TEST_F(SandboxTest, ExitCode) {
  REQUIRE_LANGUAGE("sh");
  ExecutionResult res = Run("sh", "echo partial; exit 3\n");
  EXPECT_EQ(res.outcome, Outcome::RUNTIME_ERROR);
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_FALSE(res.term_signal);
  EXPECT_EQ(res.output, "partial\n");
}

TEST_F(SandboxTest, Signal) {
  REQUIRE_LANGUAGE("c");
  ExecutionResult res = Run("c", "int main() { volatile int* p = 0; *p = 1; return 0; }\n");
  EXPECT_EQ(res.outcome, Outcome::RUNTIME_ERROR);
  EXPECT_EQ(res.term_signal, 11);
  EXPECT_EQ(res.exit_code, 128 + 11);
}

TEST_F(SandboxTest, Timeout) {
  REQUIRE_LANGUAGE("python3");
  auto start = std::chrono::steady_clock::now();
  ExecutionResult res = Run("python3", "while True:\n    pass\n", std::nullopt, Limits(1'000'000, 1'000'000, 0));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(res.outcome, Outcome::TIMEOUT);
  EXPECT_FALSE(res.exit_code);
  EXPECT_LT(elapsed, 5s);
}

TEST_F(SandboxTest, SleepTimeout) {
  REQUIRE_LANGUAGE("sh");
  ExecutionResult res = Run("sh", "sleep 30\n", std::nullopt, Limits(1'000'000, 0, 0));
  EXPECT_EQ(res.outcome, Outcome::TIMEOUT);
  EXPECT_LT(res.wall_time, 5'000'000);
}

TEST_F(SandboxTest, Truncation) {
  REQUIRE_LANGUAGE("python3");
  ExecutionResult res = Run("python3", "print('a' * 100000)\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS);
  EXPECT_EQ(res.output, std::string(kMaxOutput, 'a') + TruncationMarker(kMaxOutput));
}

TEST_F(SandboxTest, MemoryLimit) {
  REQUIRE_LANGUAGE("python3");
  ExecutionResult res = Run("python3", "a = b'x' * (512 * 1024 * 1024)\nprint(len(a))\n",
                            std::nullopt, Limits(0, 0, 64 * 1024));
  EXPECT_TRUE(res.outcome == Outcome::RESOURCE_EXCEEDED || res.outcome == Outcome::RUNTIME_ERROR)
      << OutcomeName(res.outcome);
  EXPECT_EQ(res.output, "");
}

TEST_F(SandboxTest, CompileError) {
  REQUIRE_LANGUAGE("c");
  ExecutionResult res = Run("c", "int main() { return }\n");
  EXPECT_EQ(res.outcome, Outcome::COMPILE_ERROR);
  EXPECT_EQ(res.stage, "compile");
  EXPECT_FALSE(res.error.empty());
  EXPECT_FALSE(res.exit_code);
  EXPECT_FALSE(res.term_signal);
}

TEST_F(SandboxTest, CompiledProgram) {
  REQUIRE_LANGUAGE("cpp");
  ExecutionResult res = Run("c++",
      "#include <iostream>\n"
      "int main() { int a, b; std::cin >> a >> b; std::cout << a + b << std::endl; }\n",
      "3 4\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS) << res.message << res.error;
  EXPECT_EQ(res.output, "7\n");
  EXPECT_EQ(res.stage, "run");
}

namespace {

// the stdout of the source is run as the next stage
json GeneratorLanguage() {
  return {{"languages", {{
    {"id", "gen"},
    {"extension", ".sh"},
    {"stages", {
      {{"name", "generate"}, {"executable", "sh"}, {"args", {"{source}"}},
       {"feeds_next", true}, {"feed_file", "next.sh"}},
      {{"name", "run"}, {"executable", "sh"}, {"args", {"{feed}"}}},
    }},
  }}}};
}

} // namespace

TEST_F(SandboxTest, FeedsNextStage) {
  ASSERT_TRUE(registry_.LoadJson(GeneratorLanguage()));
  REQUIRE_LANGUAGE("gen");
  ExecutionResult res = Run("gen", "echo 'read x; echo fed $x'\n", "input\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS) << res.message << res.error;
  EXPECT_EQ(res.output, "fed input\n");
}

TEST_F(SandboxTest, FailedFeedingStageOutput) {
  ASSERT_TRUE(registry_.LoadJson(GeneratorLanguage()));
  REQUIRE_LANGUAGE("gen");
  ExecutionResult res = Run("gen", "yes aaaaaaa | head -c 100000; exit 1\n");
  EXPECT_EQ(res.outcome, Outcome::COMPILE_ERROR) << res.message << res.error;
  EXPECT_EQ(res.stage, "generate");
  std::string marker = TruncationMarker(kMaxOutput);
  ASSERT_EQ(res.output.size(), kMaxOutput + marker.size());
  EXPECT_EQ(res.output.substr(kMaxOutput), marker);
}

TEST_F(SandboxTest, Environment) {
  REQUIRE_LANGUAGE("sh");
  setenv("POLYRUN_TEST_SECRET", "leaked", 1);
  ExecutionResult res = Run("sh", "env\n");
  unsetenv("POLYRUN_TEST_SECRET");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS) << res.message << res.error;
  EXPECT_EQ(res.output.find("POLYRUN_TEST_SECRET"), std::string::npos);
  EXPECT_NE(res.output.find("HOME=/workdir\n"), std::string::npos);
  EXPECT_NE(res.output.find("TMPDIR=/workdir\n"), std::string::npos);
}

TEST_F(SandboxTest, Isolation) {
  REQUIRE_LANGUAGE("sh");
  ExecutionResult res = Run("sh", "echo secret > left_behind; ls\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS);
  // a later execution starts from a fresh work area
  res = Run("sh", "ls; [ -e left_behind ] && echo dirty || echo clean\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS);
  EXPECT_EQ(res.output, "prog.sh\nclean\n");
  // the work areas are gone
  std::error_code ec;
  EXPECT_TRUE(!fs::exists(kBoxRoot, ec) || fs::is_empty(kBoxRoot, ec));
}

TEST_F(SandboxTest, NoNetwork) {
  REQUIRE_LANGUAGE("python3");
  ExecutionResult res = Run("python3",
      "import socket\n"
      "try:\n"
      "    socket.create_connection(('1.1.1.1', 53), timeout=2)\n"
      "    print('connected')\n"
      "except OSError:\n"
      "    print('blocked')\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS);
  EXPECT_EQ(res.output, "blocked\n");
}

TEST_F(SandboxTest, Idempotent) {
  REQUIRE_LANGUAGE("sh");
  ExecutionResult a = Run("sh", "echo $((6 * 7)); exit 2\n");
  ExecutionResult b = Run("sh", "echo $((6 * 7)); exit 2\n");
  EXPECT_EQ(a.outcome, b.outcome);
  EXPECT_EQ(a.output, b.output);
  EXPECT_EQ(a.exit_code, b.exit_code);
}

TEST_F(SandboxTest, Cancel) {
  REQUIRE_LANGUAGE("sh");
  CancelToken cancel;
  std::thread thread([&cancel]() {
    std::this_thread::sleep_for(300ms);
    cancel.Cancel();
  });
  auto start = std::chrono::steady_clock::now();
  ExecutionResult res = Run("sh", "sleep 20\n", std::nullopt, Limits(), &cancel);
  auto elapsed = std::chrono::steady_clock::now() - start;
  thread.join();
  EXPECT_EQ(res.outcome, Outcome::CANCELLED);
  EXPECT_LT(elapsed, 5s);
}

TEST_F(SandboxTest, Concurrent) {
  REQUIRE_LANGUAGE("sh");
  auto registry = std::make_shared<const LanguageRegistry>(registry_);
  Scheduler scheduler(registry, runner_, 4, 2);
  std::vector<PendingExecution> handles;
  for (int i = 0; i < 8; i++) {
    ExecutionRequest req("sh", "echo token" + std::to_string(i) + " > mine; sleep 0.2; ls; cat mine\n",
                         std::nullopt, "caller" + std::to_string(i));
    handles.push_back(scheduler.Submit(std::move(req)));
  }
  for (int i = 0; i < 8; i++) {
    ExecutionResult res = handles[i].Get();
    EXPECT_EQ(res.outcome, Outcome::SUCCESS) << res.message << res.error;
    EXPECT_EQ(res.output, "mine\nprog.sh\ntoken" + std::to_string(i) + "\n");
  }
  scheduler.Shutdown();
}

TEST_F(SandboxTest, NoOrphansAfterTimeout) {
  REQUIRE_LANGUAGE("sh");
  ExecutionResult res = Run("sh", "sleep 100 & sleep 100 & wait\n", std::nullopt, Limits(1'000'000, 0, 0));
  EXPECT_EQ(res.outcome, Outcome::TIMEOUT);
  EXPECT_TRUE(NoSandboxProcessLeft());
}

TEST_F(SandboxTest, NoOrphansAfterCancel) {
  REQUIRE_LANGUAGE("sh");
  CancelToken cancel;
  std::thread thread([&cancel]() {
    std::this_thread::sleep_for(300ms);
    cancel.Cancel();
  });
  ExecutionResult res = Run("sh", "sleep 100 & sleep 100 & wait\n", std::nullopt, Limits(), &cancel);
  thread.join();
  EXPECT_EQ(res.outcome, Outcome::CANCELLED);
  EXPECT_TRUE(NoSandboxProcessLeft());
}

TEST_F(SandboxTest, NoOrphansAfterExit) {
  REQUIRE_LANGUAGE("sh");
  ExecutionResult res = Run("sh", "sleep 100 &\necho started\n");
  EXPECT_EQ(res.outcome, Outcome::SUCCESS) << res.message << res.error;
  EXPECT_EQ(res.output, "started\n");
  EXPECT_LT(res.wall_time, 5'000'000);
  EXPECT_TRUE(NoSandboxProcessLeft());
}
