#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include <hospes/vm/instance.hpp>

namespace hospes::runtime {

enum class overflow_policy : std::uint8_t
{
  queue,
  reject
};

std::string_view to_string( overflow_policy p ) noexcept;

// Throws std::invalid_argument for anything other than "queue" or "reject".
overflow_policy overflow_policy_from_string( std::string_view name );

struct runtime_options
{
  vm::resource_limits limits;
  std::size_t max_concurrent_instances = 4;
  std::size_t pool_size                = 4;
  bool cache_validated_modules         = true;
  std::size_t module_cache_size        = 32;
  overflow_policy overflow             = overflow_policy::queue;
  std::size_t queue_capacity           = 64;
};

namespace option {

constexpr std::string_view max_memory_pages         = "max-memory-pages";
constexpr std::string_view max_stack_bytes          = "max-stack-bytes";
constexpr std::string_view step_budget              = "step-budget";
constexpr std::string_view call_timeout_ms          = "call-timeout-ms";
constexpr std::string_view max_concurrent_instances = "max-concurrent-instances";
constexpr std::string_view pool_size                = "pool-size";
constexpr std::string_view cache_validated_modules  = "cache-validated-modules";
constexpr std::string_view module_cache_size        = "module-cache-size";
constexpr std::string_view overflow_policy          = "overflow-policy";
constexpr std::string_view queue_capacity           = "queue-capacity";

} // namespace option

// Overrides the given options with every key present in the node.
runtime_options load_options( const YAML::Node& node, runtime_options options = {} );

// Throws std::invalid_argument when the options cannot describe a working runtime.
void check_options( const runtime_options& options );

} // namespace hospes::runtime
