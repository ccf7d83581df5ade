#include <hospes/log/log.hpp>
#include <hospes/memory/memory.hpp>
#include <hospes/vm/module.hpp>

#include <algorithm>

namespace hospes::vm {

namespace {

extern_kind to_extern_kind( FizzyExternalKind k ) noexcept
{
  switch( k )
  {
    case FizzyExternalKindFunction:
      return extern_kind::function;
    case FizzyExternalKindTable:
      return extern_kind::table;
    case FizzyExternalKindMemory:
      return extern_kind::memory;
    case FizzyExternalKindGlobal:
      return extern_kind::global;
  }
  std::unreachable();
}

std::optional< schema::core_type > to_core_type( FizzyValueType t ) noexcept
{
  switch( t )
  {
    case FizzyValueTypeI32:
      return schema::core_type::i32;
    case FizzyValueTypeI64:
      return schema::core_type::i64;
    case FizzyValueTypeF32:
      return schema::core_type::f32;
    case FizzyValueTypeF64:
      return schema::core_type::f64;
    default:
      return {};
  }
}

} // namespace

std::string function_type::to_string() const
{
  schema::flat_signature flat;
  flat.params = inputs;
  flat.result = output;
  return flat.to_string();
}

module::module( const FizzyModule* m, const crypto::digest& id ):
    _module( m ),
    _id( id )
{
  auto export_count = fizzy_get_export_count( _module );
  _exports.reserve( export_count );
  for( std::uint32_t i = 0; i < export_count; i++ )
  {
    auto desc = fizzy_get_export_description( _module, i );
    _exports.push_back( export_entry{ desc.name, to_extern_kind( desc.kind ), desc.index } );
  }

  auto import_count = fizzy_get_import_count( _module );
  _imports.reserve( import_count );
  for( std::uint32_t i = 0; i < import_count; i++ )
  {
    auto desc = fizzy_get_import_description( _module, i );
    _imports.push_back( import_entry{ desc.module, desc.name, to_extern_kind( desc.kind ) } );
  }
}

module::~module()
{
  fizzy_free_module( _module );
}

const FizzyModule* module::get() const noexcept
{
  return _module;
}

const crypto::digest& module::id() const noexcept
{
  return _id;
}

const std::vector< export_entry >& module::exports() const noexcept
{
  return _exports;
}

const std::vector< import_entry >& module::imports() const noexcept
{
  return _imports;
}

bool module::has_memory() const noexcept
{
  return fizzy_module_has_memory( _module );
}

bool module::has_start_function() const noexcept
{
  return fizzy_module_has_start_function( _module );
}

std::optional< std::uint32_t > module::find_function( std::string_view name ) const noexcept
{
  auto it = std::ranges::find_if( _exports,
                                  [ & ]( const export_entry& e )
                                  {
                                    return e.kind == extern_kind::function && e.name == name;
                                  } );

  if( it == _exports.end() )
    return {};

  return it->index;
}

std::optional< function_type > module::type_of( std::uint32_t function_index ) const
{
  auto type = fizzy_get_function_type( _module, function_index );

  function_type ft;
  ft.inputs.reserve( type.inputs_size );

  for( std::size_t i = 0; i < type.inputs_size; i++ )
  {
    auto input = to_core_type( type.inputs[ i ] ); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if( !input )
      return {};

    ft.inputs.push_back( *input );
  }

  if( type.output != FizzyValueTypeVoid )
  {
    ft.output = to_core_type( type.output );
    if( !ft.output )
      return {};
  }

  return ft;
}

result< module_ptr > parse_module( std::span< const std::byte > bytecode )
{
  if( bytecode.empty() )
    return std::unexpected( fault( runtime_errc::invalid_module, fault_phase::load, {}, "module is empty" ) );

  FizzyError error;
  auto ptr = fizzy_parse( memory::pointer_cast< const std::uint8_t* >( bytecode.data() ), bytecode.size(), &error );

  if( !ptr )
    return std::unexpected(
      fault( runtime_errc::invalid_module, fault_phase::load, {}, static_cast< const char* >( error.message ) ) );

  auto mod = std::make_shared< const module >( ptr, crypto::hash( bytecode ) );
  LOG_DEBUG( log::instance(),
             "Parsed module {} ({} exports, {} imports)",
             log::hex{ mod->id().data(), mod->id().size() },
             mod->exports().size(),
             mod->imports().size() );

  return mod;
}

} // namespace hospes::vm
