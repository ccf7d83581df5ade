#include <hospes/error.hpp>

#include <utility>

namespace hospes {

struct _runtime_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "hospes";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< runtime_errc >( condition ) )
    {
      case runtime_errc::ok:
        return "ok"s;
      case runtime_errc::schema_mismatch:
        return "schema mismatch"s;
      case runtime_errc::instantiation_fault:
        return "instantiation fault"s;
      case runtime_errc::encoding_fault:
        return "encoding fault"s;
      case runtime_errc::memory_bounds_fault:
        return "memory bounds fault"s;
      case runtime_errc::instance_busy:
        return "instance busy"s;
      case runtime_errc::capacity_exceeded:
        return "capacity exceeded"s;
      case runtime_errc::timeout:
        return "timeout"s;
      case runtime_errc::budget_exceeded:
        return "step budget exceeded"s;
      case runtime_errc::trapped:
        return "trapped"s;
      case runtime_errc::guest_exit:
        return "guest exited"s;
      case runtime_errc::instance_faulted:
        return "instance faulted"s;
      case runtime_errc::instance_destroyed:
        return "instance destroyed"s;
      case runtime_errc::invalid_module:
        return "invalid module"s;
      case runtime_errc::invalid_schema:
        return "invalid schema"s;
      case runtime_errc::unknown_component:
        return "unknown component"s;
      case runtime_errc::function_not_found:
        return "function not found"s;
      case runtime_errc::invalid_arguments:
        return "invalid arguments"s;
      case runtime_errc::runtime_stopped:
        return "runtime stopped"s;
    }
    std::unreachable();
  }
};

const std::error_category& runtime_category() noexcept
{
  static _runtime_category category;
  return category;
}

std::error_code make_error_code( runtime_errc e )
{
  return std::error_code( static_cast< int >( e ), runtime_category() );
}

std::string_view to_string( fault_phase p ) noexcept
{
  using namespace std::string_view_literals;
  switch( p )
  {
    case fault_phase::none:
      return "none"sv;
    case fault_phase::load:
      return "load"sv;
    case fault_phase::validate:
      return "validate"sv;
    case fault_phase::instantiate:
      return "instantiate"sv;
    case fault_phase::queue:
      return "queue"sv;
    case fault_phase::lower:
      return "lower"sv;
    case fault_phase::execute:
      return "execute"sv;
    case fault_phase::lift:
      return "lift"sv;
    case fault_phase::release:
      return "release"sv;
  }
  std::unreachable();
}

fault::fault( runtime_errc e ):
    _code( make_error_code( e ) )
{}

fault::fault( std::error_code ec ):
    _code( ec )
{}

fault::fault( std::error_code ec, fault_phase phase, std::string function, std::string detail ):
    _code( ec ),
    _phase( phase ),
    _function( std::move( function ) ),
    _detail( std::move( detail ) )
{}

const std::error_code& fault::code() const noexcept
{
  return _code;
}

fault_phase fault::phase() const noexcept
{
  return _phase;
}

const std::string& fault::function() const noexcept
{
  return _function;
}

const std::string& fault::detail() const noexcept
{
  return _detail;
}

std::string fault::message() const
{
  std::string msg = _code.message();

  if( _phase != fault_phase::none )
    msg += " during " + std::string( to_string( _phase ) );

  if( !_function.empty() )
    msg += " of '" + _function + "'";

  if( !_detail.empty() )
    msg += ": " + _detail;

  return msg;
}

fault& fault::in( fault_phase phase ) &
{
  if( _phase == fault_phase::none )
    _phase = phase;

  return *this;
}

fault&& fault::in( fault_phase phase ) &&
{
  return std::move( in( phase ) );
}

fault& fault::during( std::string_view function ) &
{
  if( _function.empty() )
    _function = function;

  return *this;
}

fault&& fault::during( std::string_view function ) &&
{
  return std::move( during( function ) );
}

bool fault::operator==( runtime_errc e ) const noexcept
{
  return _code == make_error_code( e );
}

} // namespace hospes
