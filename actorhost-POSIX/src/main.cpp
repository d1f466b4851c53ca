#include <fmt/format.h>

#include <boost/program_options.hpp>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ingress/callback_router.hpp"
#include "runtime/actor_runtime.hpp"
#include "runtime/actor_runtime_config.hpp"
#include "serialization/msgpack_serializer.hpp"
#include "support/logger.hpp"
#include "support/posix_actor_types.hpp"
#include "support/string_helper.hpp"

boost::program_options::variables_map parse_arguments(int arg_count,
                                                      char** args) {
  boost::program_options::options_description desc("Options");
  // clang-format off
  desc.add_options()
  ("help", "produce this help message.")
  (
    "log-level", boost::program_options::value<std::string>(),
    "Log threshold (TRACE, DEBUG, INFO, WARNING, ERROR, FATAL)."
  )
  (
    "register", boost::program_options::value<std::string>(),
    "Comma-separated list of bundled actor types to host (Counter, Echo)."
  )
  (
    "script", boost::program_options::value<std::string>(),
    "Read callback requests from this file instead of stdin."
  )
  (
    "actor-idle-timeout", boost::program_options::value<uint32_t>(),
    "Seconds before an idle actor is deactivated."
  )
  (
    "actor-scan-interval", boost::program_options::value<uint32_t>(),
    "Seconds between idle actor scans."
  )
  (
    "drain-ongoing-call-timeout", boost::program_options::value<uint32_t>(),
    "Seconds to wait for ongoing calls when rebalancing."
  )
  (
    "drain-rebalanced-actors", boost::program_options::value<bool>(),
    "Drain actors that are moved to another host."
  )
  (
    "reentrancy", boost::program_options::bool_switch(),
    "Allow reentrant actor calls."
  )
  (
    "reentrancy-max-stack-depth", boost::program_options::value<int32_t>(),
    "Maximum reentrancy depth."
  )
  (
    "reminders-storage-partitions", boost::program_options::value<int32_t>(),
    "Number of partitions used to store reminders."
  ); // NOLINT
  // clang-format on

  boost::program_options::variables_map arguments;
  boost::program_options::store(
      boost::program_options::parse_command_line(arg_count, args, desc),
      arguments);
  boost::program_options::notify(arguments);

  if (arguments.count("help") != 0u) {
    std::cout << desc << "\n";
    exit(1);
  }
  return arguments;
}

std::shared_ptr<ActorHost::Runtime::ActorRuntimeConfig> build_config(
    const boost::program_options::variables_map& arguments) {
  auto config = std::make_shared<ActorHost::Runtime::ActorRuntimeConfig>();
  if (arguments.count("actor-idle-timeout") != 0u) {
    config->set_actor_idle_timeout(
        std::chrono::seconds(arguments["actor-idle-timeout"].as<uint32_t>()));
  }
  if (arguments.count("actor-scan-interval") != 0u) {
    config->set_actor_scan_interval(
        std::chrono::seconds(arguments["actor-scan-interval"].as<uint32_t>()));
  }
  if (arguments.count("drain-ongoing-call-timeout") != 0u) {
    config->set_drain_ongoing_call_timeout(std::chrono::seconds(
        arguments["drain-ongoing-call-timeout"].as<uint32_t>()));
  }
  if (arguments.count("drain-rebalanced-actors") != 0u) {
    config->set_drain_rebalanced_actors(
        arguments["drain-rebalanced-actors"].as<bool>());
  }
  if (arguments["reentrancy"].as<bool>()) {
    ActorHost::Runtime::ActorReentrancyConfig reentrancy;
    reentrancy.enabled = true;
    if (arguments.count("reentrancy-max-stack-depth") != 0u) {
      reentrancy.max_stack_depth =
          arguments["reentrancy-max-stack-depth"].as<int32_t>();
    }
    config->set_reentrancy(reentrancy);
  }
  if (arguments.count("reminders-storage-partitions") != 0u) {
    config->set_reminders_storage_partitions(
        arguments["reminders-storage-partitions"].as<int32_t>());
  }
  return config;
}

// key=value pairs; integers and true/false keep their type.
ActorHost::Serialization::Payload parse_request_attributes(
    const std::vector<std::string>& tokens) {
  ActorHost::Serialization::Payload payload;
  for (const auto& token : tokens) {
    auto split_pos = token.find_first_of('=');
    if (split_pos == std::string::npos) {
      ActorHost::Support::Logger::warning("MAIN", "Ignoring attribute %s",
                                          token.c_str());
      continue;
    }
    std::string key = token.substr(0, split_pos);
    std::string value = token.substr(split_pos + 1);

    int32_t number = 0;
    auto [end, error] =
        std::from_chars(value.data(), value.data() + value.size(), number);
    if (!value.empty() && error == std::errc() &&
        end == value.data() + value.size()) {
      payload.set_attr(key, number);
    } else if (value == "true" || value == "false") {
      payload.set_attr(key, value == "true");
    } else {
      payload.set_attr(key, std::string_view(value));
    }
  }
  return payload;
}

void run_script(std::istream* input, ActorHost::Ingress::CallbackRouter* router,
                const ActorHost::Serialization::Serializer& serializer) {
  std::string line;
  while (std::getline(*input, line)) {
    std::istringstream tokens(line);
    std::string http_method;
    std::string path;
    if (!(tokens >> http_method) || http_method.front() == '#') {
      continue;
    }
    if (!(tokens >> path)) {
      ActorHost::Support::Logger::warning("MAIN", "Missing path in \"%s\"",
                                          line.c_str());
      continue;
    }
    std::vector<std::string> attributes;
    for (std::string token; tokens >> token;) {
      attributes.push_back(std::move(token));
    }

    ActorHost::Serialization::Bytes body;
    if (!attributes.empty()) {
      body = serializer.serialize(parse_request_attributes(attributes));
    }

    auto response = router->handle(http_method, path, body);
    std::string rendered = "-";
    if (!response.body.empty()) {
      auto decoded = serializer.deserialize(response.body);
      rendered = decoded ? decoded->to_string()
                         : fmt::format("<{} bytes>", response.body.size());
    }
    std::cout << fmt::format("{} {} -> {} {}", http_method, path,
                             response.status, rendered)
              << std::endl;
  }
}

int main(int arg_count, char** args) {
  boost::program_options::variables_map arguments;
  try {
    arguments = parse_arguments(arg_count, args);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  if (arguments.count("log-level") != 0u &&
      !ActorHost::Support::Logger::set_level(
          arguments["log-level"].as<std::string>())) {
    std::cerr << "Unknown log level "
              << arguments["log-level"].as<std::string>() << "\n";
    return 1;
  }

  ActorHost::Runtime::ActorRuntime runtime(build_config(arguments));
  ActorHost::Support::Logger::info("MAIN", "Starting actorhost");

  if (arguments.count("register") != 0u) {
    auto raw = arguments["register"].as<std::string>();
    for (std::string_view actor_type :
         ActorHost::Support::StringHelper::string_split(raw)) {
      if (!ActorHost::Support::PosixActorTypes::register_actor_type(
              &runtime, actor_type)) {
        return 1;
      }
    }
  }

  ActorHost::Ingress::CallbackRouter router(&runtime);
  const auto& serializer =
      *ActorHost::Serialization::MsgPackSerializer::shared_instance();

  if (arguments.count("script") != 0u) {
    auto script_path = arguments["script"].as<std::string>();
    std::ifstream script(script_path);
    if (!script.is_open()) {
      ActorHost::Support::Logger::error("MAIN", "Cannot open script %s",
                                        script_path.c_str());
      return 1;
    }
    run_script(&script, &router, serializer);
  } else {
    run_script(&std::cin, &router, serializer);
  }
  return 0;
}
