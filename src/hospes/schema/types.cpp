#include <hospes/error.hpp>
#include <hospes/schema/types.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace hospes::schema {

std::string_view to_string( kind k ) noexcept
{
  using namespace std::string_view_literals;
  switch( k )
  {
    case kind::boolean:
      return "bool"sv;
    case kind::s32:
      return "s32"sv;
    case kind::s64:
      return "s64"sv;
    case kind::u32:
      return "u32"sv;
    case kind::u64:
      return "u64"sv;
    case kind::f32:
      return "f32"sv;
    case kind::f64:
      return "f64"sv;
    case kind::string:
      return "string"sv;
    case kind::bytes:
      return "bytes"sv;
    case kind::list:
      return "list"sv;
    case kind::record:
      return "record"sv;
    case kind::variant:
      return "variant"sv;
  }
  std::unreachable();
}

std::optional< kind > primitive_from_string( std::string_view name ) noexcept
{
  for( auto k: { kind::boolean,
                 kind::s32,
                 kind::s64,
                 kind::u32,
                 kind::u64,
                 kind::f32,
                 kind::f64,
                 kind::string,
                 kind::bytes } )
  {
    if( to_string( k ) == name )
      return k;
  }

  return {};
}

type_descriptor::type_descriptor( kind k ):
    _kind( k )
{}

type_descriptor type_descriptor::list_of( type_descriptor element )
{
  type_descriptor t( kind::list );
  t._element.push_back( std::move( element ) );
  return t;
}

type_descriptor type_descriptor::record_of( std::vector< field > fields )
{
  type_descriptor t( kind::record );
  t._fields = std::move( fields );
  return t;
}

type_descriptor type_descriptor::variant_of( std::vector< variant_case > cases )
{
  type_descriptor t( kind::variant );
  t._cases = std::move( cases );
  return t;
}

kind type_descriptor::tag() const noexcept
{
  return _kind;
}

bool type_descriptor::is_scalar() const noexcept
{
  switch( _kind )
  {
    case kind::boolean:
    case kind::s32:
    case kind::s64:
    case kind::u32:
    case kind::u64:
    case kind::f32:
    case kind::f64:
      return true;
    default:
      return false;
  }
}

const type_descriptor& type_descriptor::element() const
{
  if( _kind != kind::list || _element.empty() )
    throw std::logic_error( "type is not a list" );

  return _element.front();
}

const std::vector< field >& type_descriptor::fields() const
{
  return _fields;
}

const std::vector< variant_case >& type_descriptor::cases() const
{
  return _cases;
}

std::error_code type_descriptor::check() const
{
  switch( _kind )
  {
    case kind::list:
      if( _element.size() != 1 )
        return runtime_errc::invalid_schema;
      return _element.front().check();
    case kind::record:
      {
        if( _fields.empty() )
          return runtime_errc::invalid_schema;

        std::set< std::string_view > names;
        for( const auto& f: _fields )
        {
          if( f.name.empty() || !names.insert( f.name ).second )
            return runtime_errc::invalid_schema;

          if( auto error = f.type.check(); error )
            return error;
        }
        break;
      }
    case kind::variant:
      {
        if( _cases.empty() )
          return runtime_errc::invalid_schema;

        std::set< std::string_view > names;
        for( const auto& c: _cases )
        {
          if( c.name.empty() || !names.insert( c.name ).second )
            return runtime_errc::invalid_schema;

          if( c.payload )
            if( auto error = c.payload->check(); error )
              return error;
        }
        break;
      }
    default:
      break;
  }

  return runtime_errc::ok;
}

std::string type_descriptor::to_string() const
{
  std::string s( schema::to_string( _kind ) );

  switch( _kind )
  {
    case kind::list:
      s += "<" + element().to_string() + ">";
      break;
    case kind::record:
      s += "{";
      for( std::size_t i = 0; i < _fields.size(); i++ )
      {
        if( i )
          s += ",";
        s += _fields[ i ].name + ":" + _fields[ i ].type.to_string();
      }
      s += "}";
      break;
    case kind::variant:
      s += "{";
      for( std::size_t i = 0; i < _cases.size(); i++ )
      {
        if( i )
          s += ",";
        s += _cases[ i ].name;
        if( _cases[ i ].payload )
          s += ":" + _cases[ i ].payload->to_string();
      }
      s += "}";
      break;
    default:
      break;
  }

  return s;
}

bool type_descriptor::operator==( const type_descriptor& other ) const
{
  return _kind == other._kind && _element == other._element && _fields == other._fields && _cases == other._cases;
}

interface_schema::interface_schema():
    _allocator( default_allocator ),
    _deallocator( default_deallocator )
{}

std::error_code interface_schema::add( function_signature signature )
{
  if( signature.name.empty() || find( signature.name ) )
    return runtime_errc::invalid_schema;

  for( const auto& t: signature.params )
    if( auto error = t.check(); error )
      return error;

  for( const auto& t: signature.returns )
    if( auto error = t.check(); error )
      return error;

  _functions.emplace_back( std::move( signature ) );
  return runtime_errc::ok;
}

const function_signature* interface_schema::find( std::string_view name ) const noexcept
{
  auto it = std::ranges::find( _functions, name, &function_signature::name );
  if( it == _functions.end() )
    return nullptr;

  return &*it;
}

const std::vector< function_signature >& interface_schema::functions() const noexcept
{
  return _functions;
}

const std::string& interface_schema::allocator() const noexcept
{
  return _allocator;
}

void interface_schema::set_allocator( std::string name )
{
  _allocator = std::move( name );
}

const std::string& interface_schema::deallocator() const noexcept
{
  return _deallocator;
}

void interface_schema::set_deallocator( std::string name )
{
  _deallocator = std::move( name );
}

namespace {

// Member names are length prefixed, so a name holding ':' or ',' cannot
// alias a different shape the way the canonical text can.
void hash_type( const type_descriptor& t )
{
  crypto::hasher_update( static_cast< std::uint8_t >( t.tag() ) );

  switch( t.tag() )
  {
    case kind::list:
      hash_type( t.element() );
      break;
    case kind::record:
      crypto::hasher_update( static_cast< std::uint64_t >( t.fields().size() ) );
      for( const auto& f: t.fields() )
      {
        crypto::hasher_update( std::string_view( f.name ) );
        hash_type( f.type );
      }
      break;
    case kind::variant:
      crypto::hasher_update( static_cast< std::uint64_t >( t.cases().size() ) );
      for( const auto& c: t.cases() )
      {
        crypto::hasher_update( std::string_view( c.name ) );
        crypto::hasher_update( static_cast< std::uint8_t >( c.payload.has_value() ) );
        if( c.payload )
          hash_type( *c.payload );
      }
      break;
    default:
      break;
  }
}

} // namespace

crypto::digest interface_schema::fingerprint() const
{
  crypto::hasher_reset();
  crypto::hasher_update( std::string_view( _allocator ) );
  crypto::hasher_update( std::string_view( _deallocator ) );
  crypto::hasher_update( static_cast< std::uint64_t >( _functions.size() ) );

  for( const auto& fn: _functions )
  {
    crypto::hasher_update( std::string_view( fn.name ) );

    crypto::hasher_update( static_cast< std::uint64_t >( fn.params.size() ) );
    for( const auto& t: fn.params )
      hash_type( t );

    crypto::hasher_update( static_cast< std::uint64_t >( fn.returns.size() ) );
    for( const auto& t: fn.returns )
      hash_type( t );
  }

  return crypto::hasher_finalize();
}

} // namespace hospes::schema
