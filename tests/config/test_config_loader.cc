#include <gtest/gtest.h>

#include <stdlib.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "relay/config/config_loader.h"

using namespace relay;
using namespace relay::config;

namespace {

class ConfigLoaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    char pattern[] = "/tmp/relay-config-XXXXXX";
    ASSERT_NE(mkdtemp(pattern), nullptr);
    dir_ = pattern;
  }

  void TearDown() override {
    for (const auto& path : files_) {
      std::remove(path.c_str());
    }
    ::rmdir(dir_.c_str());
    for (const char* name : {"RELAY_TEST_CMD", "RELAY_TEST_UNSET",
                             "BRIDGE_MAX_IN_FLIGHT", "BRIDGE_AUTH_MODE",
                             "BRIDGE_AUTH_SECRET", "BRIDGE_LOG_LEVEL"}) {
      ::unsetenv(name);
    }
  }

  std::string write(const std::string& name, const std::string& content) {
    std::string path = dir_ + "/" + name;
    std::ofstream(path) << content;
    files_.push_back(path);
    return path;
  }

  static CommandLine parse(std::vector<const char*> args) {
    args.insert(args.begin(), "mcp_relay");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
  }

  std::string dir_;
  std::vector<std::string> files_;
};

}  // namespace

TEST_F(ConfigLoaderTest, LoadsYamlConfig) {
  auto path = write("relay.yaml", R"(
process:
  command: "python3 server.py"
  env:
    API_MODE: "1"
  grace_period_ms: 2000
session:
  max_queue_size: 50
  session_timeout: 60
broker:
  max_in_flight: 8
filters:
  blocked_domains: [evil.com]
  redact_phones: false
  filters:
    rate_limiter: true
logging:
  level: debug
  format: json
health_check:
  enabled: false
)");

  auto config = loadConfigFile(path);
  EXPECT_EQ(config.process.command, "python3 server.py");
  EXPECT_EQ(config.process.environment.at("API_MODE"), "1");
  EXPECT_EQ(config.process.grace_period, std::chrono::milliseconds(2000));
  EXPECT_EQ(config.session.queue_capacity, 50u);
  EXPECT_EQ(config.session.max_idle, std::chrono::seconds(60));
  EXPECT_EQ(config.broker.max_in_flight, 8u);
  EXPECT_EQ(config.filters.blocked_domains, std::vector<std::string>{"evil.com"});
  EXPECT_FALSE(config.filters.redact_phones);
  EXPECT_TRUE(config.filters.filters.at("rate_limiter"));
  EXPECT_EQ(config.logging.level, logging::LogLevel::Debug);
  EXPECT_EQ(config.logging.format, "json");
  EXPECT_FALSE(config.health_check.enabled);
}

TEST_F(ConfigLoaderTest, LoadsJsonConfigWithDefaults) {
  auto path = write("relay.json", R"({"process":{"args":["/bin/cat"]}})");
  auto config = loadConfigFile(path);
  EXPECT_EQ(config.process.argv, std::vector<std::string>{"/bin/cat"});
  EXPECT_EQ(config.session.queue_capacity, 100u);
  EXPECT_EQ(config.broker.max_in_flight, 128u);
  EXPECT_TRUE(config.health_check.enabled);
}

TEST_F(ConfigLoaderTest, QuotedYamlScalarsStayStrings) {
  auto path = write("types.yaml", "a: \"42\"\nb: 42\nc: 1.5\nd: ~\ne: 'true'\n");
  auto document = loadDocument(path);
  EXPECT_TRUE(document.at("a").isString());
  EXPECT_TRUE(document.at("b").isInteger());
  EXPECT_TRUE(document.at("c").isFloat());
  EXPECT_TRUE(document.at("d").isNull());
  EXPECT_TRUE(document.at("e").isString());
}

TEST_F(ConfigLoaderTest, EmptyYamlIsAnEmptyObject) {
  auto path = write("empty.yaml", "");
  EXPECT_TRUE(loadDocument(path).isObject());
}

TEST_F(ConfigLoaderTest, EnvironmentSubstitution) {
  ::setenv("RELAY_TEST_CMD", "node index.js", 1);
  EXPECT_EQ(substituteEnvironment("run ${RELAY_TEST_CMD} now"),
            "run node index.js now");
  EXPECT_EQ(substituteEnvironment("${RELAY_TEST_UNSET:-fallback}"), "fallback");
  EXPECT_EQ(substituteEnvironment("no refs $HOME"), "no refs $HOME");

  try {
    substituteEnvironment("${RELAY_TEST_UNSET}", "process.command");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e.field(), "process.command");
  }

  auto path = write("env.yaml", "process:\n  command: ${RELAY_TEST_CMD}\n");
  EXPECT_EQ(loadConfigFile(path).process.command, "node index.js");
}

TEST_F(ConfigLoaderTest, MalformedDocumentsThrow) {
  EXPECT_THROW(loadDocument(dir_ + "/missing.yaml"), ConfigError);
  EXPECT_THROW(loadDocument(write("bad.json", "{not json")), ConfigError);
  EXPECT_THROW(loadDocument(write("bad.yaml", "a: [1, 2\n")), ConfigError);
}

TEST_F(ConfigLoaderTest, WrongTypesNameTheField) {
  auto path = write("wrong.json", R"({"session":{"max_queue_size":"big"}})");
  try {
    loadConfigFile(path);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e.field(), "session.max_queue_size");
  }
}

TEST_F(ConfigLoaderTest, FilterSettingsDocumentBareOrNested) {
  auto bare = write("bare.yaml",
                    "blocked_keywords: [secret]\nfilters:\n  blacklist: false\n");
  auto settings = loadFilterSettings(bare);
  EXPECT_EQ(settings.blocked_keywords, std::vector<std::string>{"secret"});
  EXPECT_FALSE(settings.filters.at("blacklist"));

  auto nested = write("nested.yaml",
                      "filters:\n  blocked_keywords: [secret]\n  max_depth: 8\n");
  settings = loadFilterSettings(nested);
  EXPECT_EQ(settings.blocked_keywords, std::vector<std::string>{"secret"});
  EXPECT_EQ(settings.max_depth, 8u);
}

TEST_F(ConfigLoaderTest, ParsesCommandLine) {
  auto cli = parse({"--cmd", "python3 s.py", "--max-queue-size", "10",
                    "--session-timeout", "30", "--max-in-flight", "4",
                    "--log-level", "warning", "--no-health-check"});
  EXPECT_EQ(cli.command.value_or(""), "python3 s.py");
  EXPECT_EQ(cli.max_queue_size.value_or(0), 10u);
  EXPECT_EQ(cli.session_timeout_seconds.value_or(0), 30u);
  EXPECT_EQ(cli.max_in_flight.value_or(0), 4u);
  EXPECT_EQ(cli.log_level.value_or(""), "warning");
  EXPECT_TRUE(cli.no_health_check);
  EXPECT_FALSE(cli.help);

  auto child = parse({"--", "/usr/bin/server", "--stdio"});
  EXPECT_EQ(child.child_argv,
            (std::vector<std::string>{"/usr/bin/server", "--stdio"}));

  EXPECT_TRUE(parse({"-h"}).help);
}

TEST_F(ConfigLoaderTest, BadCommandLineThrows) {
  EXPECT_THROW(parse({"--bogus"}), ConfigError);
  EXPECT_THROW(parse({"--cmd"}), ConfigError);
  EXPECT_THROW(parse({"--max-queue-size", "-3"}), ConfigError);
  EXPECT_THROW(parse({"--max-in-flight", "many"}), ConfigError);
}

TEST_F(ConfigLoaderTest, LayersApplyInOrder) {
  auto path = write("layers.yaml",
                    "process:\n  command: from-file\nbroker:\n  max_in_flight: 8\n"
                    "session:\n  max_queue_size: 20\n");
  ::setenv("BRIDGE_MAX_IN_FLIGHT", "16", 1);
  ::setenv("BRIDGE_LOG_LEVEL", "error", 1);

  auto cli = parse({"--config", path.c_str(), "--max-queue-size", "5"});
  auto config = resolveConfig(cli);
  EXPECT_EQ(config.process.command, "from-file");
  EXPECT_EQ(config.broker.max_in_flight, 16u);
  EXPECT_EQ(config.session.queue_capacity, 5u);
  EXPECT_EQ(config.logging.level, logging::LogLevel::Error);

  auto overridden = resolveConfig(
      parse({"--config", path.c_str(), "--max-in-flight", "2", "--", "/bin/cat"}));
  EXPECT_EQ(overridden.broker.max_in_flight, 2u);
  EXPECT_TRUE(overridden.process.command.empty());
  EXPECT_EQ(overridden.process.argv, std::vector<std::string>{"/bin/cat"});
}

TEST_F(ConfigLoaderTest, AuthFromEnvironmentIsValidated) {
  ::setenv("BRIDGE_AUTH_MODE", "bearer", 1);
  EXPECT_THROW(resolveConfig(parse({"--cmd", "cat"})), ConfigError);

  ::setenv("BRIDGE_AUTH_SECRET", "s3cret", 1);
  auto config = resolveConfig(parse({"--cmd", "cat"}));
  EXPECT_EQ(config.auth.mode, AuthMode::Bearer);
  EXPECT_EQ(config.auth.secret, "s3cret");

  ::setenv("BRIDGE_AUTH_MODE", "kerberos", 1);
  EXPECT_THROW(resolveConfig(parse({"--cmd", "cat"})), ConfigError);
}
