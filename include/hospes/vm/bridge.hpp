#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include <fizzy/fizzy.h>

#include <hospes/error.hpp>
#include <hospes/schema/types.hpp>
#include <hospes/schema/value.hpp>

namespace hospes::vm {

/**
 * The view of a guest linear memory and its allocator exports.
 *
 * data() may move after any allocate() call since the guest can grow its
 * memory, so callers must not hold on to it across allocations.
 */
class guest_memory
{
public:
  guest_memory()                      = default;
  guest_memory( const guest_memory& ) = delete;
  guest_memory( guest_memory&& )      = delete;
  virtual ~guest_memory()             = default;

  guest_memory& operator=( const guest_memory& ) = delete;
  guest_memory& operator=( guest_memory&& )      = delete;

  virtual std::span< std::byte > data() noexcept = 0;

  virtual std::expected< std::uint32_t, std::error_code > allocate( std::uint32_t size, std::uint32_t alignment ) = 0;
  virtual std::error_code release( std::uint32_t offset, std::uint32_t size, std::uint32_t alignment )              = 0;
  virtual bool can_release() const noexcept                                                                        = 0;
};

struct allocation
{
  std::uint32_t offset    = 0;
  std::uint32_t size      = 0;
  std::uint32_t alignment = 1;
};

/**
 * Tracks the guest buffers that belong to one call.
 *
 * Staged argument buffers and adopted result buffers are released through
 * the guest deallocator when the call ends, on every path. After the guest
 * faults the buffers must be abandoned instead since the guest can no longer
 * run.
 */
class call_context final
{
public:
  explicit call_context( guest_memory& memory ) noexcept;
  call_context( const call_context& ) = delete;
  call_context( call_context&& )      = delete;
  ~call_context();

  call_context& operator=( const call_context& ) = delete;
  call_context& operator=( call_context&& )      = delete;

  guest_memory& memory() noexcept;

  std::expected< std::uint32_t, std::error_code > stage( std::uint32_t size, std::uint32_t alignment );
  void adopt( const allocation& a );

  std::error_code release();
  void abandon() noexcept;

  const std::vector< allocation >& allocations() const noexcept;

private:
  guest_memory* _memory;
  std::vector< allocation > _allocations;
};

// Flattens host values into core arguments, staging non-scalars in guest memory.
result< std::vector< FizzyValue > >
lower( call_context& context, const schema::function_signature& signature, std::span< const schema::value > args );

// Reads results back out of guest memory. Guest owned buffers found along the
// way are adopted by the context.
result< std::vector< schema::value > > lift( call_context& context,
                                             const schema::function_signature& signature,
                                             const std::optional< FizzyValue >& core_result );

} // namespace hospes::vm
