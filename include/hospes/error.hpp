#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace hospes {

enum class runtime_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  schema_mismatch,
  instantiation_fault,
  encoding_fault,
  memory_bounds_fault,
  instance_busy,
  capacity_exceeded,
  timeout,
  budget_exceeded,
  trapped,
  guest_exit,
  instance_faulted,
  instance_destroyed,
  invalid_module,
  invalid_schema,
  unknown_component,
  function_not_found,
  invalid_arguments,
  runtime_stopped
};

enum class fault_phase : std::uint8_t
{
  none,
  load,
  validate,
  instantiate,
  queue,
  lower,
  execute,
  lift,
  release
};

const std::error_category& runtime_category() noexcept;

std::error_code make_error_code( runtime_errc e );

std::string_view to_string( fault_phase p ) noexcept;

/**
 * The failure of a runtime operation.
 *
 * Besides the error code a fault records where in the call pipeline it was
 * raised, the guest function involved (if any) and a detail naming the limit,
 * offset or export that caused it.
 */
class fault final
{
public:
  fault( runtime_errc e ); // NOLINT(google-explicit-constructor)
  fault( std::error_code ec ); // NOLINT(google-explicit-constructor)
  fault( std::error_code ec, fault_phase phase, std::string function = {}, std::string detail = {} );

  const std::error_code& code() const noexcept;
  fault_phase phase() const noexcept;
  const std::string& function() const noexcept;
  const std::string& detail() const noexcept;

  std::string message() const;

  fault& in( fault_phase phase ) &;
  fault&& in( fault_phase phase ) &&;
  fault& during( std::string_view function ) &;
  fault&& during( std::string_view function ) &&;

  bool operator==( runtime_errc e ) const noexcept;

private:
  std::error_code _code;
  fault_phase _phase = fault_phase::none;
  std::string _function;
  std::string _detail;
};

template< typename T >
using result = std::expected< T, fault >;

} // namespace hospes

template<>
struct std::is_error_code_enum< hospes::runtime_errc >: public std::true_type
{};
