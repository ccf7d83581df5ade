#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include <hospes/crypto/hash.hpp>
#include <hospes/error.hpp>
#include <hospes/runtime/options.hpp>
#include <hospes/schema/types.hpp>
#include <hospes/schema/value.hpp>
#include <hospes/vm/binding.hpp>
#include <hospes/vm/host_api.hpp>
#include <hospes/vm/instance.hpp>

namespace hospes::runtime {

class module_cache;

struct component_handle
{
  crypto::digest id{};

  bool operator==( const component_handle& ) const = default;
};

struct runtime_stats
{
  std::size_t loaded       = 0;
  std::size_t idle         = 0;
  std::size_t live         = 0;
  std::size_t executing    = 0;
  std::size_t queued       = 0;
  std::size_t cache_hits   = 0;
  std::size_t cache_misses = 0;
  std::size_t discarded    = 0;
};

using call_result = result< std::vector< schema::value > >;

/**
 * Loads components and runs calls on pooled instances.
 *
 * The pools, the admission queue and the counters are guarded by one mutex.
 * At most max-concurrent-instances calls execute at once; excess calls wait in
 * a bounded FIFO queue or are rejected, depending on the overflow policy.
 * Asynchronous calls take their place in line when they are submitted.
 * Faulted instances are discarded when their call ends and replaced on demand.
 */
class host_runtime final
{
public:
  explicit host_runtime( runtime_options options = {}, std::shared_ptr< vm::host_api > hapi = nullptr );
  host_runtime( const host_runtime& ) = delete;
  host_runtime( host_runtime&& )      = delete;

  ~host_runtime();

  host_runtime& operator=( const host_runtime& ) = delete;
  host_runtime& operator=( host_runtime&& )      = delete;

  result< component_handle > load( std::span< const std::byte > module_bytes, schema::interface_schema schema );
  result< void > unload( const component_handle& handle );

  call_result
  invoke( const component_handle& handle, std::string_view function, std::span< const schema::value > args );

  std::future< call_result >
  invoke_async( const component_handle& handle, std::string function, std::vector< schema::value > args );

  // Stops admitting calls, waits for running ones and tears every instance down.
  void shutdown() noexcept;

  vm::component_ptr component( const component_handle& handle ) const;
  const runtime_options& options() const noexcept;
  runtime_stats stats() const;

private:
  struct pool
  {
    vm::component_ptr component;
    std::vector< vm::instance_ptr > idle;
    std::size_t live = 0;
  };

  using pool_ptr = std::shared_ptr< pool >;

  // Shared by a timed call and the worker running it.
  struct call_state
  {
    bool finished  = false;
    bool timed_out = false;
  };

  using clock = std::chrono::steady_clock;

  /**
   * One call's claim on the runtime.
   *
   * A slot holds a place in the admission queue until the call is admitted,
   * then the reserved execution slot and the instance running the call.
   * Whatever it still holds is given back when it is destroyed, so a call that
   * unwinds, or a task that never runs, cannot leak its place.
   */
  class slot final
  {
  public:
    explicit slot( host_runtime& rt ) noexcept;
    slot( slot&& other ) noexcept;
    slot( const slot& ) = delete;

    ~slot();

    slot& operator=( const slot& ) = delete;
    slot& operator=( slot&& )      = delete;

  private:
    friend class host_runtime;

    host_runtime* _runtime;
    pool_ptr _owner;
    vm::instance_ptr _instance;
    std::optional< std::uint64_t > _ticket;
    bool _reserved = false;
    std::shared_ptr< call_state > _state;
  };

  runtime_options _options;
  std::shared_ptr< vm::host_api > _hapi;
  std::unique_ptr< module_cache > _cache;

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::map< crypto::digest, pool_ptr > _pools;
  std::deque< std::uint64_t > _waiting;
  std::uint64_t _next_ticket = 0;
  std::size_t _executing     = 0;
  std::size_t _discarded     = 0;
  bool _stopped              = false;

  boost::asio::thread_pool _workers;
  boost::asio::thread_pool _dispatcher;

  bool admissible( const pool& p ) const noexcept;

  // Both expect _mutex to be held.
  result< void > enqueue( slot& s, const component_handle& handle, std::string_view function );
  void reserve( slot& s ) noexcept;

  result< void > admit( slot& s, std::string_view function, const std::optional< clock::time_point >& deadline );

  call_result run( slot& s,
                   std::string_view function,
                   std::span< const schema::value > args,
                   const std::optional< clock::time_point >& deadline );

  void give_back( slot& s ) noexcept;
};

} // namespace hospes::runtime
