#include <hospes/encode/hex.hpp>
#include <hospes/schema/value.hpp>

#include <format>
#include <type_traits>
#include <utility>

namespace hospes::schema {

namespace {

std::string quote( const std::string& s )
{
  std::string out = "\"";
  for( char c: s )
  {
    if( c == '"' || c == '\\' )
      out.push_back( '\\' );
    out.push_back( c );
  }
  out.push_back( '"' );
  return out;
}

template< typename Render >
std::string join( const std::vector< value >& values, Render&& render )
{
  std::string out;
  for( std::size_t i = 0; i < values.size(); i++ )
  {
    if( i )
      out += ", ";
    out += render( i, values[ i ] );
  }
  return out;
}

std::string render( const value& v, const type_descriptor* type )
{
  return std::visit(
    [ & ]< typename T >( const T& data ) -> std::string
    {
      if constexpr( std::is_same_v< T, bool > )
        return data ? "true" : "false";
      else if constexpr( std::is_same_v< T, std::string > )
        return quote( data );
      else if constexpr( std::is_same_v< T, byte_buffer > )
        return "0x" + encode::to_hex( data );
      else if constexpr( std::is_same_v< T, list_value > )
      {
        const type_descriptor* element = type && type->tag() == kind::list ? &type->element() : nullptr;
        return "[" + join( data.elements, [ & ]( std::size_t, const value& e ) { return render( e, element ); } )
               + "]";
      }
      else if constexpr( std::is_same_v< T, record_value > )
      {
        const std::vector< field >* fields = type && type->tag() == kind::record ? &type->fields() : nullptr;
        return "{"
               + join( data.fields,
                       [ & ]( std::size_t i, const value& f )
                       {
                         if( fields && i < fields->size() )
                           return ( *fields )[ i ].name + ": " + render( f, &( *fields )[ i ].type );
                         return render( f, nullptr );
                       } )
               + "}";
      }
      else if constexpr( std::is_same_v< T, variant_value > )
      {
        std::string name = "#" + std::to_string( data.discriminant );
        const type_descriptor* payload = nullptr;
        if( type && type->tag() == kind::variant && data.discriminant < type->cases().size() )
        {
          const auto& c = type->cases()[ data.discriminant ];
          name          = c.name;
          payload       = c.payload ? &*c.payload : nullptr;
        }

        if( data.payload.empty() )
          return name;

        return name + "(" + render( data.payload.front(), payload ) + ")";
      }
      else
        return std::format( "{}", data );
    },
    v.data() );
}

} // namespace

bool operator==( const list_value& lhs, const list_value& rhs )
{
  return lhs.elements == rhs.elements;
}

bool operator==( const record_value& lhs, const record_value& rhs )
{
  return lhs.fields == rhs.fields;
}

bool operator==( const variant_value& lhs, const variant_value& rhs )
{
  return lhs.discriminant == rhs.discriminant && lhs.payload == rhs.payload;
}

value::value():
    _data( false )
{}

value::value( storage data ):
    _data( std::move( data ) )
{}

value value::boolean( bool b )
{
  return value( storage( std::in_place_type< bool >, b ) );
}

value value::s32( std::int32_t v )
{
  return value( storage( std::in_place_type< std::int32_t >, v ) );
}

value value::s64( std::int64_t v )
{
  return value( storage( std::in_place_type< std::int64_t >, v ) );
}

value value::u32( std::uint32_t v )
{
  return value( storage( std::in_place_type< std::uint32_t >, v ) );
}

value value::u64( std::uint64_t v )
{
  return value( storage( std::in_place_type< std::uint64_t >, v ) );
}

value value::f32( float v )
{
  return value( storage( std::in_place_type< float >, v ) );
}

value value::f64( double v )
{
  return value( storage( std::in_place_type< double >, v ) );
}

value value::string( std::string s )
{
  return value( storage( std::in_place_type< std::string >, std::move( s ) ) );
}

value value::bytes( byte_buffer b )
{
  return value( storage( std::in_place_type< byte_buffer >, std::move( b ) ) );
}

value value::list( std::vector< value > elements )
{
  return value( storage( std::in_place_type< list_value >, list_value{ std::move( elements ) } ) );
}

value value::record( std::vector< value > fields )
{
  return value( storage( std::in_place_type< record_value >, record_value{ std::move( fields ) } ) );
}

value value::variant( std::uint32_t discriminant )
{
  return value( storage( std::in_place_type< variant_value >, variant_value{ discriminant, {} } ) );
}

value value::variant( std::uint32_t discriminant, value payload )
{
  variant_value v{ discriminant, {} };
  v.payload.emplace_back( std::move( payload ) );
  return value( storage( std::in_place_type< variant_value >, std::move( v ) ) );
}

const value::storage& value::data() const noexcept
{
  return _data;
}

std::string value::to_string() const
{
  return render( *this, nullptr );
}

std::string value::to_string( const type_descriptor& type ) const
{
  return render( *this, &type );
}

bool value::operator==( const value& other ) const
{
  return _data == other._data;
}

} // namespace hospes::schema
