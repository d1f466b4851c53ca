#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "runtime/actor_runtime_config.hpp"
#include "support/duration_format.hpp"

namespace ActorHost::Test {

using Runtime::ActorReentrancyConfig;
using Runtime::ActorRuntimeConfig;
using Support::DurationFormat;
using namespace std::chrono_literals;

TEST(DURATIONFORMAT, to_string) {
  ASSERT_EQ(DurationFormat::to_string(1h), "1h0m0s");
  ASSERT_EQ(DurationFormat::to_string(30s), "0h0m30s");
  ASSERT_EQ(DurationFormat::to_string(90min), "1h30m0s");
  ASSERT_EQ(DurationFormat::to_string(1500ms), "0h0m1s500ms");
  ASSERT_EQ(DurationFormat::to_string(0ms), "0h0m0s");
  ASSERT_EQ(DurationFormat::to_string(-2s), "-0h0m2s");
}

TEST(DURATIONFORMAT, parse) {
  ASSERT_EQ(DurationFormat::parse("1h0m0s"), std::chrono::milliseconds(1h));
  ASSERT_EQ(DurationFormat::parse("0h0m1s500ms"), 1500ms);
  ASSERT_EQ(DurationFormat::parse("2m"), std::chrono::milliseconds(2min));
  ASSERT_EQ(DurationFormat::parse("2500us"), 2ms);
  ASSERT_EQ(DurationFormat::parse("-5s"), std::chrono::milliseconds(-5s));

  ASSERT_FALSE(DurationFormat::parse(""));
  ASSERT_FALSE(DurationFormat::parse("h"));
  ASSERT_FALSE(DurationFormat::parse("5d"));
  ASSERT_FALSE(DurationFormat::parse("5"));
  ASSERT_FALSE(DurationFormat::parse("-"));
  ASSERT_FALSE(DurationFormat::parse("-ms"));
}

TEST(DURATIONFORMAT, parse_out_of_range) {
  ASSERT_FALSE(DurationFormat::parse("99999999999999999999s"));
  ASSERT_FALSE(DurationFormat::parse("9999999999h"));
  ASSERT_FALSE(DurationFormat::parse("2562047h2562047h"));
  ASSERT_EQ(DurationFormat::parse("2562047h"),
            std::chrono::milliseconds(std::chrono::hours(2562047)));
}

TEST(ACTORRUNTIMECONFIG, defaults) {
  ActorRuntimeConfig config;
  ASSERT_EQ(config.actor_idle_timeout(), 1h);
  ASSERT_EQ(config.actor_scan_interval(), 30s);
  ASSERT_EQ(config.drain_ongoing_call_timeout(), 1min);
  ASSERT_TRUE(config.drain_rebalanced_actors());
  ASSERT_FALSE(config.reentrancy());
  ASSERT_FALSE(config.reminders_storage_partitions());
  ASSERT_TRUE(config.entities().empty());
}

TEST(ACTORRUNTIMECONFIG, default_payload) {
  auto payload = ActorRuntimeConfig().to_payload();
  ASSERT_EQ(payload.get_str_attr("actorIdleTimeout"), "1h0m0s");
  ASSERT_EQ(payload.get_str_attr("actorScanInterval"), "0h0m30s");
  ASSERT_EQ(payload.get_str_attr("drainOngoingCallTimeout"), "0h1m0s");
  ASSERT_EQ(payload.get_bool_attr("drainRebalancedActors"), true);
  ASSERT_TRUE(payload.get_string_list_attr("entities"));
  ASSERT_TRUE(payload.get_string_list_attr("entities")->empty());
  ASSERT_FALSE(payload.has_attr("reentrancy"));
  ASSERT_FALSE(payload.has_attr("remindersStoragePartitions"));
}

TEST(ACTORRUNTIMECONFIG, optional_fields) {
  ActorRuntimeConfig config;
  ActorReentrancyConfig reentrancy;
  reentrancy.enabled = true;
  reentrancy.max_stack_depth = 8;
  config.set_reentrancy(reentrancy);
  config.set_reminders_storage_partitions(7);
  config.update_entities({"Counter", "Echo"});

  auto payload = config.to_payload();
  auto nested = payload.get_nested_component("reentrancy");
  ASSERT_TRUE(nested);
  ASSERT_EQ((*nested)->get_bool_attr("enabled"), true);
  ASSERT_EQ((*nested)->get_int_attr("maxStackDepth"), 8);
  ASSERT_EQ(payload.get_int_attr("remindersStoragePartitions"), 7);
  ASSERT_EQ(*payload.get_string_list_attr("entities"),
            (std::vector<std::string>{"Counter", "Echo"}));

  config.set_reentrancy(std::nullopt);
  ASSERT_FALSE(config.to_payload().has_attr("reentrancy"));
}

TEST(ACTORRUNTIMECONFIG, copy) {
  ActorRuntimeConfig config;
  config.set_actor_scan_interval(10s);
  config.update_entities({"A"});

  ActorRuntimeConfig copy(config);
  ASSERT_EQ(copy.actor_scan_interval(), 10s);
  ASSERT_EQ(copy.entities(), std::vector<std::string>{"A"});

  ActorRuntimeConfig assigned;
  assigned = config;
  config.update_entities({});
  ASSERT_EQ(assigned.entities(), std::vector<std::string>{"A"});
}

}  // namespace ActorHost::Test
