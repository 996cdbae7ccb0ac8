#include <map>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "../src/line_server.h"
#include "utils.h"

using nlohmann::json;

namespace {

class LineServerTest : public ::testing::Test {
 protected:
  std::shared_ptr<FakeRunner> runner_;
  std::unique_ptr<Scheduler> scheduler_;
  std::vector<json> replies_;

  void SetUp() override {
    runner_ = std::make_shared<FakeRunner>();
    scheduler_ = std::make_unique<Scheduler>(BuiltinRegistry(), runner_, 2, 2);
  }
  void TearDown() override {
    runner_->Release();
    scheduler_->Shutdown();
  }

  // returns the number of error replies
  int Serve(const std::vector<std::string>& lines) {
    std::string input;
    for (auto& i : lines) input += i + "\n";
    std::istringstream in(input);
    std::ostringstream out;
    int ret = ServeLoop(*scheduler_, in, out);
    replies_.clear();
    std::istringstream res(out.str());
    for (std::string line; std::getline(res, line);) replies_.push_back(json::parse(line));
    return ret;
  }

  const json* Reply(const json& id) const {
    for (auto& i : replies_) {
      if (i.contains("id") && i["id"] == id) return &i;
    }
    return nullptr;
  }
};

std::string Line(const json& obj) { return obj.dump(); }

} // namespace

TEST_F(LineServerTest, Requests) {
  int errors = Serve({
    Line({{"id", 1}, {"language", "python3"}, {"source", "hello"}}),
    Line({{"id", "two"}, {"language", "py"}, {"source", "echo"}, {"stdin", "abc"}}),
    Line({{"id", 3}, {"language", "no-such-language"}, {"source", "x"}}),
    "",
  });
  EXPECT_EQ(errors, 0);
  ASSERT_EQ(replies_.size(), 3u);
  const json* reply = Reply(1);
  ASSERT_NE(reply, nullptr);
  EXPECT_EQ((*reply)["outcome"], "SUCCESS");
  EXPECT_EQ((*reply)["output"], "hello");
  reply = Reply("two");
  ASSERT_NE(reply, nullptr);
  EXPECT_EQ((*reply)["output"], "abc");
  reply = Reply(3);
  ASSERT_NE(reply, nullptr);
  EXPECT_EQ((*reply)["outcome"], "NOT_FOUND");
}

TEST_F(LineServerTest, Malformed) {
  int errors = Serve({
    "{not json",
    "[1, 2]",
    Line({{"language", "python3"}, {"source", "x"}}),
    Line({{"id", 4}, {"source", "x"}}),
    Line({{"id", 5}, {"language", "python3"}, {"source", 12}}),
  });
  EXPECT_EQ(errors, 5);
  ASSERT_EQ(replies_.size(), 5u);
  for (auto& i : replies_) {
    EXPECT_TRUE(i.contains("error"));
    EXPECT_FALSE(i.contains("outcome"));
  }
  EXPECT_NE(Reply(4), nullptr);
  EXPECT_NE(Reply(5), nullptr);
}

TEST_F(LineServerTest, Limits) {
  int errors = Serve({
    Line({{"id", 1}, {"language", "python3"}, {"source", "x"}, {"limits", {{"wall_time_ms", 1500}}}}),
    Line({{"id", 2}, {"language", "python3"}, {"source", "x"}, {"limits", {{"wall_time_ms", -1}}}}),
  });
  EXPECT_EQ(errors, 0);
  EXPECT_EQ((*Reply(1))["outcome"], "SUCCESS");
  EXPECT_EQ((*Reply(2))["outcome"], "REJECTED");
  auto limits = runner_->StartedLimits();
  ASSERT_EQ(limits.size(), 1u);
  EXPECT_EQ(limits[0].wall_time, 1'500'000);
}

TEST_F(LineServerTest, Cancel) {
  int errors = Serve({
    Line({{"id", 1}, {"language", "python3"}, {"source", "block"}}),
    Line({{"id", 1}, {"cancel", true}}),
    Line({{"id", 9}, {"cancel", true}}),
  });
  EXPECT_EQ(errors, 1);
  ASSERT_EQ(replies_.size(), 2u);
  EXPECT_EQ((*Reply(1))["outcome"], "CANCELLED");
  EXPECT_TRUE(Reply(9)->contains("error"));
}

TEST_F(LineServerTest, DuplicateId) {
  int errors = Serve({
    Line({{"id", 1}, {"language", "python3"}, {"source", "block"}}),
    Line({{"id", 1}, {"language", "python3"}, {"source", "x"}}),
  });
  EXPECT_EQ(errors, 1);
  ASSERT_EQ(replies_.size(), 2u);
  int cancelled = 0, duplicated = 0;
  for (auto& i : replies_) {
    if (i.contains("outcome") && i["outcome"] == "CANCELLED") cancelled++;
    if (i.contains("error") && i["error"] == "duplicate id") duplicated++;
  }
  EXPECT_EQ(cancelled, 1);
  EXPECT_EQ(duplicated, 1);
}

TEST_F(LineServerTest, EndOfInputCancels) {
  int errors = Serve({
    Line({{"id", 1}, {"language", "python3"}, {"source", "block"}, {"caller", "A"}}),
    Line({{"id", 2}, {"language", "python3"}, {"source", "block"}, {"caller", "B"}}),
    Line({{"id", 3}, {"language", "python3"}, {"source", "block"}, {"caller", "C"}}),
  });
  EXPECT_EQ(errors, 0);
  ASSERT_EQ(replies_.size(), 3u);
  for (auto& i : replies_) EXPECT_EQ(i["outcome"], "CANCELLED");
}

TEST_F(LineServerTest, ManyCallers) {
  constexpr int kRequests = 50;
  std::vector<std::string> lines;
  for (int i = 0; i < kRequests; i++) {
    lines.push_back(Line({{"id", i}, {"language", "python3"}, {"source", "sleep:5"},
                          {"caller", "caller-" + std::to_string(i)}}));
  }
  int errors = Serve(lines);
  EXPECT_EQ(errors, 0);
  ASSERT_EQ(replies_.size(), (size_t)kRequests);
  std::map<int, int> seen;
  for (auto& i : replies_) {
    ASSERT_TRUE(i.contains("outcome"));
    // queued requests are cancelled once the input ends
    EXPECT_TRUE(i["outcome"] == "SUCCESS" || i["outcome"] == "CANCELLED") << i.dump();
    seen[i["id"].get<int>()]++;
  }
  ASSERT_EQ(seen.size(), (size_t)kRequests);
  for (auto& i : seen) EXPECT_EQ(i.second, 1);
  EXPECT_LE(runner_->MaxRunning(), 2);
}
