#include <hospes/encode/hex.hpp>
#include <hospes/schema/loader.hpp>

#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace hospes::schema {

namespace {

constexpr std::string_view list_prefix = "list<";
constexpr std::string_view list_suffix = ">";

type_descriptor parse_type_name( std::string_view name )
{
  if( auto k = primitive_from_string( name ); k )
    return *k;

  if( name.starts_with( list_prefix ) && name.ends_with( list_suffix ) )
  {
    name.remove_prefix( list_prefix.size() );
    name.remove_suffix( list_suffix.size() );
    return type_descriptor::list_of( parse_type_name( name ) );
  }

  throw std::invalid_argument( "unknown type '" + std::string( name ) + "'" );
}

std::string required_name( const YAML::Node& node, std::string_view what )
{
  if( !node[ "name" ] || !node[ "name" ].IsScalar() )
    throw std::invalid_argument( std::string( what ) + " is missing a name" );

  return node[ "name" ].as< std::string >();
}

std::vector< type_descriptor > parse_types( const YAML::Node& node, std::string_view what )
{
  std::vector< type_descriptor > types;
  if( !node || node.IsNull() )
    return types;

  if( !node.IsSequence() )
    throw std::invalid_argument( std::string( what ) + " must be a sequence of types" );

  for( const auto& t: node )
    types.push_back( parse_type( t ) );

  return types;
}

template< typename T >
T convert( const YAML::Node& node, const type_descriptor& type )
{
  try
  {
    return node.as< T >();
  }
  catch( const YAML::BadConversion& )
  {
    throw std::invalid_argument( "expected a value of type " + type.to_string() );
  }
}

byte_buffer parse_bytes( const YAML::Node& node, const type_descriptor& type )
{
  if( node.IsScalar() )
  {
    auto bytes = encode::from_hex( node.Scalar() );
    if( !bytes )
      throw std::invalid_argument( "malformed hex bytes: " + bytes.error().detail() );

    return std::move( *bytes );
  }

  if( !node.IsSequence() )
    throw std::invalid_argument( "expected a value of type " + type.to_string() );

  byte_buffer bytes;
  bytes.reserve( node.size() );
  for( const auto& b: node )
  {
    auto v = convert< unsigned int >( b, type );
    if( v > std::numeric_limits< std::uint8_t >::max() )
      throw std::invalid_argument( "byte value " + std::to_string( v ) + " is out of range" );

    bytes.push_back( static_cast< std::byte >( v ) );
  }

  return bytes;
}

value parse_variant( const YAML::Node& node, const type_descriptor& type )
{
  std::string name;
  std::optional< YAML::Node > payload;

  if( node.IsScalar() )
    name = node.Scalar();
  else if( node.IsMap() && node[ "case" ] )
  {
    name = node[ "case" ].as< std::string >();
    if( auto v = node[ "value" ]; v && !v.IsNull() )
      payload = v;
  }
  else
    throw std::invalid_argument( "expected a variant written as a case name or {case, value}" );

  const auto& cases = type.cases();
  for( std::uint32_t i = 0; i < cases.size(); i++ )
  {
    if( cases[ i ].name != name )
      continue;

    if( !cases[ i ].payload )
    {
      if( payload )
        throw std::invalid_argument( "variant case '" + name + "' takes no value" );

      return value::variant( i );
    }

    if( !payload )
      throw std::invalid_argument( "variant case '" + name + "' requires a value" );

    return value::variant( i, parse_value( *payload, *cases[ i ].payload ) );
  }

  throw std::invalid_argument( "unknown variant case '" + name + "' for " + type.to_string() );
}

} // namespace

type_descriptor parse_type( const YAML::Node& node )
{
  if( node.IsScalar() )
    return parse_type_name( node.Scalar() );

  if( !node.IsMap() || node.size() != 1 )
    throw std::invalid_argument( "a type is a name or a single key map of list, record or variant" );

  if( auto element = node[ "list" ]; element )
    return type_descriptor::list_of( parse_type( element ) );

  if( auto members = node[ "record" ]; members )
  {
    if( !members.IsSequence() )
      throw std::invalid_argument( "record fields must be a sequence" );

    std::vector< field > fields;
    for( const auto& m: members )
    {
      if( !m[ "type" ] )
        throw std::invalid_argument( "record field is missing a type" );

      fields.push_back( field{ required_name( m, "record field" ), parse_type( m[ "type" ] ) } );
    }

    return type_descriptor::record_of( std::move( fields ) );
  }

  if( auto members = node[ "variant" ]; members )
  {
    if( !members.IsSequence() )
      throw std::invalid_argument( "variant cases must be a sequence" );

    std::vector< variant_case > cases;
    for( const auto& m: members )
    {
      variant_case c{ required_name( m, "variant case" ), {} };
      if( m[ "type" ] )
        c.payload = parse_type( m[ "type" ] );

      cases.push_back( std::move( c ) );
    }

    return type_descriptor::variant_of( std::move( cases ) );
  }

  throw std::invalid_argument( "unknown type constructor" );
}

interface_schema load_schema( const YAML::Node& node )
{
  if( !node.IsMap() )
    throw std::invalid_argument( "schema document must be a map" );

  interface_schema schema;

  if( auto allocator = node[ "allocator" ]; allocator )
    schema.set_allocator( allocator.as< std::string >() );

  if( auto deallocator = node[ "deallocator" ]; deallocator )
    schema.set_deallocator( deallocator.IsNull() ? std::string() : deallocator.as< std::string >() );

  auto functions = node[ "functions" ];
  if( !functions || !functions.IsSequence() )
    throw std::invalid_argument( "schema requires a sequence of functions" );

  for( const auto& fn: functions )
  {
    function_signature signature{ required_name( fn, "function" ),
                                  parse_types( fn[ "params" ], "params" ),
                                  parse_types( fn[ "returns" ], "returns" ) };

    auto name = signature.name;
    if( auto error = schema.add( std::move( signature ) ); error )
      throw std::invalid_argument( "function '" + name + "' is invalid: " + error.message() );
  }

  return schema;
}

interface_schema load_schema_file( const std::filesystem::path& path )
{
  return load_schema( YAML::LoadFile( path.string() ) );
}

value parse_value( const YAML::Node& node, const type_descriptor& type )
{
  if( !node || node.IsNull() )
    throw std::invalid_argument( "missing value of type " + type.to_string() );

  switch( type.tag() )
  {
    case kind::boolean:
      return value::boolean( convert< bool >( node, type ) );
    case kind::s32:
      return value::s32( convert< std::int32_t >( node, type ) );
    case kind::s64:
      return value::s64( convert< std::int64_t >( node, type ) );
    case kind::u32:
      return value::u32( convert< std::uint32_t >( node, type ) );
    case kind::u64:
      return value::u64( convert< std::uint64_t >( node, type ) );
    case kind::f32:
      return value::f32( convert< float >( node, type ) );
    case kind::f64:
      return value::f64( convert< double >( node, type ) );
    case kind::string:
      return value::string( convert< std::string >( node, type ) );
    case kind::bytes:
      return value::bytes( parse_bytes( node, type ) );
    case kind::list:
      {
        if( !node.IsSequence() )
          throw std::invalid_argument( "expected a sequence for " + type.to_string() );

        std::vector< value > elements;
        elements.reserve( node.size() );
        for( const auto& e: node )
          elements.push_back( parse_value( e, type.element() ) );

        return value::list( std::move( elements ) );
      }
    case kind::record:
      {
        std::vector< value > fields;
        const auto& declared = type.fields();

        if( node.IsSequence() )
        {
          if( node.size() != declared.size() )
            throw std::invalid_argument( "expected " + std::to_string( declared.size() ) + " fields for "
                                         + type.to_string() );

          for( std::size_t i = 0; i < declared.size(); i++ )
            fields.push_back( parse_value( node[ i ], declared[ i ].type ) );
        }
        else if( node.IsMap() )
        {
          for( const auto& f: declared )
            fields.push_back( parse_value( node[ f.name ], f.type ) );
        }
        else
          throw std::invalid_argument( "expected a map for " + type.to_string() );

        return value::record( std::move( fields ) );
      }
    case kind::variant:
      return parse_variant( node, type );
  }
  std::unreachable();
}

} // namespace hospes::schema
