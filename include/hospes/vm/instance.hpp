#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <string_view>
#include <vector>

#include <fizzy/fizzy.h>

#include <hospes/error.hpp>
#include <hospes/schema/value.hpp>
#include <hospes/vm/binding.hpp>
#include <hospes/vm/bridge.hpp>
#include <hospes/vm/host_api.hpp>

namespace hospes::vm {

constexpr std::uint32_t max_memory_pages_limit = 65'536;
constexpr int call_stack_limit                 = 2'048;
constexpr std::uint64_t stack_frame_bytes      = 512;

struct resource_limits
{
  std::uint32_t max_memory_pages = 256;
  std::uint64_t max_stack_bytes  = 1'024ull * 1'024ull;
  std::uint64_t step_budget      = 100'000'000;
  std::chrono::milliseconds call_timeout{ 0 };
};

enum class instance_state : std::uint8_t
{
  created,
  ready,
  executing,
  faulted,
  destroyed
};

std::string_view to_string( instance_state s ) noexcept;

/**
 * One live guest bound to a private linear memory.
 *
 * An instance runs at most one call at a time. The execution token is tried,
 * never waited on, so a concurrent call fails with instance_busy. Traps,
 * budget exhaustion and guest exits leave the instance faulted for good.
 */
class instance final: private guest_memory
{
public:
  instance( const component_ptr& c, const resource_limits& limits, const std::shared_ptr< host_api >& hapi ) noexcept;
  instance( const instance& ) = delete;
  instance( instance&& )      = delete;

  ~instance() override;

  instance& operator=( const instance& ) = delete;
  instance& operator=( instance&& )      = delete;

  static result< std::shared_ptr< instance > >
  instantiate( const component_ptr& c, const resource_limits& limits, const std::shared_ptr< host_api >& hapi );

  result< std::vector< schema::value > > call( std::string_view function, std::span< const schema::value > args );

  void teardown() noexcept;

  // Marks an instance whose caller gave up on it. It faults once the current call ends.
  void abandon() noexcept;

  instance_state state() const noexcept;
  const resource_limits& limits() const noexcept;
  const component_ptr& owner() const noexcept;

  std::uint64_t steps_used() const noexcept;

  // Safe to read from any thread once the exiting call has returned.
  std::optional< std::int32_t > exit_code() const noexcept;
  std::uint32_t memory_pages() const noexcept;

  FizzyExecutionResult wasi_args_get( const FizzyValue* args ) noexcept;
  FizzyExecutionResult wasi_args_sizes_get( const FizzyValue* args ) noexcept;
  FizzyExecutionResult wasi_environ_get( const FizzyValue* args ) noexcept;
  FizzyExecutionResult wasi_environ_sizes_get( const FizzyValue* args ) noexcept;
  FizzyExecutionResult wasi_fd_write( const FizzyValue* args ) noexcept;
  FizzyExecutionResult wasi_proc_exit( const FizzyValue* args ) noexcept;

private:
  component_ptr _component;
  resource_limits _limits;
  std::shared_ptr< host_api > _hapi;
  FizzyInstance* _instance        = nullptr;
  FizzyExecutionContext* _context = nullptr;
  std::mutex _token;
  std::atomic< instance_state > _state    = instance_state::created;
  std::atomic< bool > _abandoned          = false;
  std::atomic< std::uint64_t > _steps     = 0;
  std::atomic< bool > _exited             = false;
  std::atomic< std::int32_t > _exit_value = 0;

  result< void > instantiate_module();

  int initial_depth() const noexcept;
  std::error_code begin_metering() noexcept;
  void end_metering() noexcept;

  std::error_code execute( std::uint32_t function_index,
                           std::span< const FizzyValue > args,
                           std::optional< FizzyValue >& out ) noexcept;

  void fault_instance() noexcept;

  void* native_pointer( std::uint32_t ptr, std::uint64_t size ) const noexcept;

  template< typename T >
    requires( std::is_pointer_v< T > )
  T native_pointer_as( std::uint32_t ptr, std::uint64_t size = sizeof( std::remove_pointer_t< T > ) ) const noexcept
  {
    return static_cast< T >( native_pointer( ptr, size ) );
  }

  FizzyExecutionResult write_strings( const std::vector< std::string >& strings, const FizzyValue* args ) noexcept;
  FizzyExecutionResult write_string_sizes( const std::vector< std::string >& strings, const FizzyValue* args ) noexcept;

  std::span< std::byte > data() noexcept override;
  std::expected< std::uint32_t, std::error_code > allocate( std::uint32_t size, std::uint32_t alignment ) override;
  std::error_code release( std::uint32_t offset, std::uint32_t size, std::uint32_t alignment ) override;
  bool can_release() const noexcept override;
};

using instance_ptr = std::shared_ptr< instance >;

} // namespace hospes::vm
