#include <hospes/log/log.hpp>
#include <hospes/vm/binding.hpp>

#include <algorithm>
#include <utility>

namespace hospes::vm {

namespace {

using schema::core_type;

const function_type allocator_type{
  { core_type::i32, core_type::i32, core_type::i32, core_type::i32 },
  core_type::i32
};

const function_type deallocator_type{
  { core_type::i32, core_type::i32, core_type::i32 },
  std::nullopt
};

const function_type initializer_type{ {}, std::nullopt };

fault mismatch( std::string_view function, std::string detail )
{
  return fault( runtime_errc::schema_mismatch, fault_phase::validate, std::string( function ), std::move( detail ) );
}

} // namespace

const function_binding* binding_table::find( std::string_view name ) const noexcept
{
  auto it = std::ranges::find_if( _functions,
                                  [ & ]( const function_binding& b )
                                  {
                                    return b.signature.name == name;
                                  } );

  if( it == _functions.end() )
    return nullptr;

  return &*it;
}

const std::vector< function_binding >& binding_table::functions() const noexcept
{
  return _functions;
}

std::optional< std::uint32_t > binding_table::allocator() const noexcept
{
  return _allocator;
}

std::optional< std::uint32_t > binding_table::deallocator() const noexcept
{
  return _deallocator;
}

std::optional< std::uint32_t > binding_table::initializer() const noexcept
{
  return _initializer;
}

result< binding_table > validate( const module& m, const schema::interface_schema& schema )
{
  binding_table table;
  bool uses_memory      = false;
  bool stages_arguments = false;

  for( const auto& signature: schema.functions() )
  {
    auto index = m.find_function( signature.name );
    if( !index )
      return std::unexpected( mismatch( signature.name, "module does not export the function" ) );

    auto flat   = schema::flatten( signature );
    auto actual = m.type_of( *index );
    if( !actual || actual->inputs != flat.params || actual->output != flat.result )
      return std::unexpected( mismatch( signature.name,
                                        "expected core signature " + flat.to_string() + ", module exports "
                                          + ( actual ? actual->to_string() : std::string( "an unsupported type" ) ) ) );

    uses_memory      |= flat.uses_memory;
    stages_arguments |= flat.stages_arguments;
    table._functions.push_back( function_binding{ signature, std::move( flat ), *index } );
  }

  if( uses_memory && !m.has_memory() )
    return std::unexpected( mismatch( {}, "module passes values through memory but defines none" ) );

  if( auto index = m.find_function( schema.allocator() ); index )
  {
    if( m.type_of( *index ) != allocator_type )
      return std::unexpected( mismatch( schema.allocator(), "allocator must have core signature " + allocator_type.to_string() ) );

    table._allocator = index;
  }
  else if( stages_arguments )
    return std::unexpected( mismatch( schema.allocator(), "module does not export the allocator" ) );

  if( !schema.deallocator().empty() )
  {
    if( auto index = m.find_function( schema.deallocator() ); index )
    {
      if( m.type_of( *index ) != deallocator_type )
        return std::unexpected(
          mismatch( schema.deallocator(), "deallocator must have core signature " + deallocator_type.to_string() ) );

      table._deallocator = index;
    }
  }

  if( auto index = m.find_function( initializer_export ); index )
  {
    if( m.type_of( *index ) != initializer_type )
      return std::unexpected( mismatch( initializer_export, "initializer must take and return nothing" ) );

    table._initializer = index;
  }

  return table;
}

crypto::digest component_id( const crypto::digest& module_id, const schema::interface_schema& schema )
{
  auto fingerprint = schema.fingerprint();

  crypto::hasher_reset();
  crypto::hasher_update( module_id );
  crypto::hasher_update( fingerprint );
  return crypto::hasher_finalize();
}

result< component_ptr > make_component( module_ptr code, schema::interface_schema schema )
{
  auto bindings = validate( *code, schema );
  if( !bindings )
    return std::unexpected( bindings.error() );

  auto id = component_id( code->id(), schema );

  LOG_DEBUG( log::instance(),
             "Validated component {} with {} functions",
             log::hex{ id.data(), id.size() },
             bindings->functions().size() );

  return std::make_shared< const component >(
    component{ std::move( code ), std::move( schema ), std::move( *bindings ), id } );
}

} // namespace hospes::vm
