#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

#include "relay/core/error_codes.h"
#include "relay/filter/filter_pipeline.h"
#include "relay/filter/metadata_filter.h"
#include "relay/filter/pii_redaction_filter.h"
#include "relay/filter/rate_limit_filter.h"

using namespace relay;
using namespace relay::filter;

namespace {

// Scribbles on the message, then throws
class FaultyFilter : public MessageFilter {
 public:
  std::string name() const override { return "faulty"; }
  std::string description() const override { return "always throws"; }
  bool appliesTo(Direction) const override { return true; }

  FilterStatus apply(FilterContext& context, json::JsonValue& message) override {
    context.recordAction("faulty_touched");
    message = json::JsonValue("tampered");
    throw std::runtime_error("boom");
  }
};

// Appends a marker to every string so tests can see it ran
class MarkingFilter : public MessageFilter {
 public:
  std::string name() const override { return "marker"; }
  std::string description() const override { return "marks strings"; }
  bool appliesTo(Direction) const override { return true; }

  FilterStatus apply(FilterContext& context, json::JsonValue& message) override {
    if (message.isObject()) {
      message.set("marked", true);
      context.recordAction("marked");
    }
    return FilterStatus::Continue;
  }
};

json::JsonValue response(const std::string& text) {
  return json::JsonObjectBuilder()
      .add("jsonrpc", "2.0")
      .add("id", 1)
      .add("result", json::JsonObjectBuilder().add("text", text).build())
      .build();
}

json::JsonValue request(const std::string& query) {
  return json::JsonObjectBuilder()
      .add("jsonrpc", "2.0")
      .add("id", 1)
      .add("method", "search")
      .add("params", json::JsonObjectBuilder().add("q", query).build())
      .build();
}

bool hasAction(const FilterResult& result, const std::string& action) {
  return std::find(result.actions_taken.begin(), result.actions_taken.end(),
                   action) != result.actions_taken.end();
}

}  // namespace

TEST(FilterPipelineTest, DefaultChainOrderAndEnablement) {
  auto pipeline = FilterPipeline::createDefault();
  auto filters = pipeline->listFilters();

  std::vector<std::string> names;
  for (const auto& info : filters) {
    names.push_back(info.name);
  }
  EXPECT_EQ(names, (std::vector<std::string>{
                       "rate_limiter", "blacklist", "html_sanitizer",
                       "pii_redactor", "secret_masker", "response_size",
                       "metadata_stamper"}));

  EXPECT_FALSE(filters[0].enabled);
  EXPECT_TRUE(filters[1].enabled);
  EXPECT_FALSE(filters[6].enabled);
  ASSERT_EQ(filters[1].directions.size(), 1u);
  EXPECT_EQ(filters[1].directions.front(), Direction::ClientToServer);
  EXPECT_EQ(filters[3].directions.size(), 2u);
}

TEST(FilterPipelineTest, BlockedRequestReportsFilterAndReason) {
  FilterSettings settings;
  settings.blocked_keywords = {"forbidden"};
  auto pipeline = FilterPipeline::createDefault(settings);

  auto result = pipeline->process(Direction::ClientToServer, "s1",
                                  request("a forbidden query"));
  EXPECT_TRUE(result.blocked);
  EXPECT_EQ(result.blocked_by, "blacklist");
  EXPECT_EQ(result.block_reason, "blocked keyword: forbidden");

  auto metrics = pipeline->metrics();
  EXPECT_EQ(metrics.blocked, 1u);
  EXPECT_EQ(metrics.client_to_server, 1u);
  EXPECT_EQ(metrics.per_filter["blacklist"].blocks, 1u);
}

TEST(FilterPipelineTest, RequestsRunTheChainInDeclaredOrder) {
  FilterSettings settings;
  settings.blocked_keywords = {"forbidden"};
  settings.filters[RateLimitFilter::kName] = true;
  settings.rate_limit.requests_per_second = 0.001;
  settings.rate_limit.burst = 1;
  auto pipeline = FilterPipeline::createDefault(settings);

  // The rate limiter spends a token before the blacklist looks at the text
  auto first = pipeline->process(Direction::ClientToServer, "s1",
                                 request("a forbidden query"));
  EXPECT_TRUE(first.blocked);
  EXPECT_EQ(first.blocked_by, "blacklist");

  auto second = pipeline->process(Direction::ClientToServer, "s1",
                                  request("a forbidden query"));
  EXPECT_TRUE(second.blocked);
  EXPECT_EQ(second.blocked_by, "rate_limiter");
  EXPECT_EQ(second.block_reason, "rate limit exceeded");

  auto metrics = pipeline->metrics();
  EXPECT_EQ(metrics.per_filter["blacklist"].blocks, 1u);
  EXPECT_EQ(metrics.per_filter["rate_limiter"].blocks, 1u);
}

TEST(FilterPipelineTest, ResponsesAreRedactedAndSanitized) {
  auto pipeline = FilterPipeline::createDefault();
  auto result = pipeline->process(
      Direction::ServerToClient, "s1",
      response("<script>x</script>Mail   bob@example.com"));

  EXPECT_FALSE(result.blocked);
  EXPECT_EQ(result.message.at("result").at("text").getString(),
            "Mail [EMAIL_REDACTED]");
  EXPECT_TRUE(hasAction(result, actions::kSanitized));
  EXPECT_TRUE(hasAction(result, actions::kPiiRedacted));
  EXPECT_EQ(result.redaction_counts.at("email"), 1u);

  auto metrics = pipeline->metrics();
  EXPECT_EQ(metrics.pii_redactions, 1u);
  EXPECT_EQ(metrics.sanitizations, 1u);
}

TEST(FilterPipelineTest, RepeatedResponseIsServedFromCache) {
  auto pipeline = FilterPipeline::createDefault();
  auto message = response("reach me at bob@example.com");

  auto first = pipeline->process(Direction::ServerToClient, "s1", message);
  auto second = pipeline->process(Direction::ServerToClient, "s2", message);

  EXPECT_FALSE(first.from_cache);
  EXPECT_TRUE(second.from_cache);
  EXPECT_EQ(first.message, second.message);

  auto metrics = pipeline->metrics();
  EXPECT_EQ(metrics.cache_hits, 1u);
  EXPECT_EQ(metrics.cache_misses, 1u);
  EXPECT_EQ(metrics.cache_size, 1u);
}

TEST(FilterPipelineTest, CacheHitsReportTheOriginalWork) {
  auto pipeline = FilterPipeline::createDefault();
  auto message = response("<script>x</script>reach me at bob@example.com");

  pipeline->process(Direction::ServerToClient, "s1", message);
  auto second = pipeline->process(Direction::ServerToClient, "s2", message);

  ASSERT_TRUE(second.from_cache);
  EXPECT_TRUE(hasAction(second, actions::kCacheHit));
  EXPECT_TRUE(hasAction(second, actions::kPiiRedacted));
  EXPECT_TRUE(hasAction(second, actions::kSanitized));
  EXPECT_EQ(second.redaction_counts.at("email"), 1u);

  // Every delivered copy counts, cached or not
  auto metrics = pipeline->metrics();
  EXPECT_EQ(metrics.pii_redactions, 2u);
  EXPECT_EQ(metrics.sanitizations, 2u);
}

TEST(FilterPipelineTest, SessionDependentFiltersRunOnCacheHits) {
  FilterSettings settings;
  settings.filters[MetadataFilter::kName] = true;
  auto pipeline = FilterPipeline::createDefault(settings);
  auto message = response("hello");

  pipeline->process(Direction::ServerToClient, "s1", message);
  auto cached = pipeline->process(Direction::ServerToClient, "s2", message);

  ASSERT_TRUE(cached.from_cache);
  EXPECT_EQ(cached.message.at("bridge_meta").at("session").getString(), "s2");
}

TEST(FilterPipelineTest, ReplacingConfigInvalidatesCache) {
  auto pipeline = FilterPipeline::createDefault();
  auto message = response("bob@example.com");
  uint64_t before = pipeline->configVersion();

  pipeline->process(Direction::ServerToClient, "s1", message);

  FilterSettings relaxed;
  relaxed.redact_emails = false;
  pipeline->replaceConfig(relaxed);
  EXPECT_GT(pipeline->configVersion(), before);

  auto result = pipeline->process(Direction::ServerToClient, "s1", message);
  EXPECT_FALSE(result.from_cache);
  EXPECT_EQ(result.config_version, pipeline->configVersion());
  EXPECT_EQ(result.message.at("result").at("text").getString(),
            "bob@example.com");
}

TEST(FilterPipelineTest, ToggleFilter) {
  auto pipeline = FilterPipeline::createDefault();
  ASSERT_FALSE(isError(pipeline->setFilterEnabled(PiiRedactionFilter::kName,
                                                  false)));

  auto result = pipeline->process(Direction::ServerToClient, "s1",
                                  response("bob@example.com"));
  EXPECT_EQ(result.message.at("result").at("text").getString(),
            "bob@example.com");
  EXPECT_EQ(pipeline->config()->settings().filters.at("pii_redactor"), false);

  auto missing = pipeline->setFilterEnabled("no_such_filter", true);
  ASSERT_TRUE(isError(missing));
  EXPECT_EQ(errorOf(missing).code, errors::kFilterNotFound);
}

TEST(FilterPipelineTest, FaultingFilterFailsOpen) {
  std::vector<MessageFilterPtr> filters;
  filters.push_back(std::make_unique<FaultyFilter>());
  filters.push_back(std::make_unique<MarkingFilter>());
  FilterPipeline pipeline(std::move(filters));

  auto message = request("anything");
  auto result = pipeline.process(Direction::ClientToServer, "s1", message);

  EXPECT_FALSE(result.blocked);
  EXPECT_TRUE(result.message.at("marked").getBool());
  result.message.erase("marked");
  EXPECT_EQ(result.message, message);
  EXPECT_FALSE(hasAction(result, "faulty_touched"));
  EXPECT_TRUE(hasAction(result, "marked"));

  auto metrics = pipeline.metrics();
  EXPECT_EQ(metrics.filter_faults, 1u);
  EXPECT_EQ(metrics.per_filter["faulty"].faults, 1u);
  EXPECT_EQ(metrics.per_filter["marker"].modifications, 1u);
}

TEST(FilterPipelineTest, MetricsResetAndJson) {
  auto pipeline = FilterPipeline::createDefault();
  pipeline->process(Direction::ClientToServer, "s1", request("hi"));
  pipeline->process(Direction::ServerToClient, "s1", response("hi"));

  auto json = pipeline->metrics().toJson();
  EXPECT_EQ(json.at("total_messages").getInt(), 2);
  EXPECT_EQ(json.at("client_to_server").getInt(), 1);
  EXPECT_EQ(json.at("server_to_client").getInt(), 1);

  pipeline->resetMetrics();
  auto metrics = pipeline->metrics();
  EXPECT_EQ(metrics.total_messages, 0u);
  EXPECT_TRUE(metrics.per_filter.empty());
}
