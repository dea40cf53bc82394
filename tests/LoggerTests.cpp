#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "Logger.hpp"

using namespace std;

namespace {

string readFile(const filesystem::path &path) {
  ifstream file(path);
  stringstream contents;
  contents << file.rdbuf();
  return contents.str();
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = filesystem::temp_directory_path() / ("relayproxy-log-" + to_string(::getpid()));
    filesystem::remove_all(dir);
    path = dir / "nested" / "log.txt";
    Logger::configure(path.string(), false);
  }

  void TearDown() override {
    Logger::configure("", false);
    filesystem::remove_all(dir);
  }

  filesystem::path dir;
  filesystem::path path;
};

TEST_F(LoggerTest, writesTaggedLinesAndCreatesDirectory) {
  Logger logger("42");
  logger.logTargetResolved("example.org", 443);
  logger.logFailure(ProxyError::OriginUnreachable, "could not connect");
  logger.logRelaySummary(10, 2048, 1.5);

  string contents = readFile(path);
  EXPECT_NE(contents.find("[42]: Target resolved to example.org:443"), string::npos);
  EXPECT_NE(contents.find("[42]: ERROR origin unreachable: could not connect"), string::npos);
  EXPECT_NE(contents.find("SUMMARY up=10b down=2048b dur=1.50s"), string::npos);
}

TEST_F(LoggerTest, requestLineIsSanitized) {
  Logger logger("7");
  logger.logRequest(string("GET http://a/\x01\x7f HTTP/1.1\r\nCookie: secret\r\n"));
  logger.logRequest(string(2000, 'x'));

  string contents = readFile(path);
  EXPECT_NE(contents.find("Request: GET http://a/ HTTP/1.1\n"), string::npos);
  EXPECT_EQ(contents.find("secret"), string::npos);
  EXPECT_NE(contents.find(string(512, 'x') + "...\n"), string::npos);
  EXPECT_EQ(contents.find(string(513, 'x')), string::npos);
}

TEST(LoggerSink, unwritableFileIsReportedOnce) {
  const string bad_path = "/proc/relayproxy-cannot-write/log.txt";
  Logger::configure(bad_path, false);
  Logger logger("1");

  testing::internal::CaptureStderr();
  logger.logAccepted("127.0.0.1:1234");  // must not throw
  logger.logConnectionClosed("example.org", 443);
  logger.logFailure(ProxyError::RelayTimeout, "idle");
  string diagnostics = testing::internal::GetCapturedStderr();

  size_t first = diagnostics.find("cannot open " + bad_path);
  ASSERT_NE(first, string::npos);
  EXPECT_EQ(diagnostics.find("cannot open", first + 1), string::npos);

  // Reconfiguring arms the report again
  Logger::configure(bad_path, false);
  testing::internal::CaptureStderr();
  logger.logConnectionClosed("example.org", 443);
  EXPECT_NE(testing::internal::GetCapturedStderr().find("cannot open"), string::npos);

  Logger::configure("", false);
}
