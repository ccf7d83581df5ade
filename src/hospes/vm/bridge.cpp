#include <hospes/log/log.hpp>
#include <hospes/memory/memory.hpp>
#include <hospes/schema/layout.hpp>
#include <hospes/vm/bridge.hpp>

#include <algorithm>
#include <bit>
#include <cstring>
#include <limits>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

#include <boost/endian/conversion.hpp>
#include <boost/locale/utf.hpp>

namespace hospes::vm {

namespace {

using schema::kind;
using schema::type_descriptor;
using schema::value;

using offset_length = std::pair< std::uint32_t, std::uint32_t >;

// Lists lifted from the guest grow past this as elements decode.
constexpr std::uint32_t list_reserve_limit = 4'096;

bool validate_utf( std::string_view str )
{
  auto it = str.begin();
  while( it != str.end() )
  {
    const boost::locale::utf::code_point cp = boost::locale::utf::utf_traits< char >::decode( it, str.end() );
    if( cp == boost::locale::utf::illegal )
      return false;
    else if( cp == boost::locale::utf::incomplete )
      return false;
  }
  return true;
}

fault encoding( std::string detail )
{
  return fault( runtime_errc::encoding_fault, fault_phase::none, {}, std::move( detail ) );
}

fault type_mismatch( const type_descriptor& type, const value& v )
{
  return encoding( "expected " + type.to_string() + ", found " + v.to_string() );
}

fault with_context( const fault& f, const std::string& where )
{
  return fault( f.code(), f.phase(), f.function(), where + ": " + f.detail() );
}

unsigned char* raw( std::span< std::byte > s )
{
  return memory::pointer_cast< unsigned char* >( s.data() );
}

result< std::span< std::byte > > guest_span( guest_memory& mem, std::uint64_t offset, std::uint64_t size )
{
  auto data = mem.data();
  if( offset + size > data.size() )
    return std::unexpected( fault( runtime_errc::memory_bounds_fault,
                                   fault_phase::none,
                                   {},
                                   "range [" + std::to_string( offset ) + ", " + std::to_string( offset + size )
                                     + ") lies outside guest memory of " + std::to_string( data.size() )
                                     + " bytes" ) );

  return data.subspan( offset, size );
}

template< typename T >
const T* as( const value& v ) noexcept
{
  return v.holds< T >() ? &v.get< T >() : nullptr;
}

result< std::uint32_t > stage( call_context& context, std::uint64_t size, std::uint32_t alignment )
{
  if( size > std::numeric_limits< std::uint32_t >::max() )
    return std::unexpected( fault( runtime_errc::memory_bounds_fault,
                                   fault_phase::none,
                                   {},
                                   std::to_string( size ) + " bytes cannot be addressed by the guest" ) );

  auto offset = context.stage( static_cast< std::uint32_t >( size ), alignment );
  if( !offset )
    return std::unexpected(
      fault( offset.error(), fault_phase::none, {}, "allocating " + std::to_string( size ) + " bytes" ) );

  auto region = guest_span( context.memory(), *offset, size );
  if( !region )
    return std::unexpected( region.error() );

  std::ranges::fill( *region, std::byte{ 0 } );
  return *offset;
}

result< std::uint32_t > stage_copy( call_context& context, std::span< const std::byte > bytes )
{
  auto offset = stage( context, bytes.size(), 1 );
  if( !offset )
    return std::unexpected( offset.error() );

  auto region = guest_span( context.memory(), *offset, bytes.size() );
  if( !region )
    return std::unexpected( region.error() );

  std::ranges::copy( bytes, region->begin() );
  return *offset;
}

result< void > write_value( call_context& context, const type_descriptor& type, const value& v, std::uint32_t offset );

result< offset_length > stage_indirect( call_context& context, const type_descriptor& type, const value& v )
{
  switch( type.tag() )
  {
    case kind::string:
      {
        auto str = as< std::string >( v );
        if( !str )
          return std::unexpected( type_mismatch( type, v ) );

        if( !validate_utf( *str ) )
          return std::unexpected( encoding( "string is not valid UTF-8" ) );

        if( str->empty() )
          return offset_length{ 0, 0 };

        auto offset = stage_copy( context, memory::as_bytes( *str ) );
        if( !offset )
          return std::unexpected( offset.error() );

        return offset_length{ *offset, static_cast< std::uint32_t >( str->size() ) };
      }
    case kind::bytes:
      {
        auto bytes = as< schema::byte_buffer >( v );
        if( !bytes )
          return std::unexpected( type_mismatch( type, v ) );

        if( bytes->empty() )
          return offset_length{ 0, 0 };

        auto offset = stage_copy( context, *bytes );
        if( !offset )
          return std::unexpected( offset.error() );

        return offset_length{ *offset, static_cast< std::uint32_t >( bytes->size() ) };
      }
    case kind::list:
      {
        auto list = as< schema::list_value >( v );
        if( !list )
          return std::unexpected( type_mismatch( type, v ) );

        if( list->elements.empty() )
          return offset_length{ 0, 0 };

        auto element = schema::layout_of( type.element() );
        auto offset  = stage( context, std::uint64_t( element.size ) * list->elements.size(), element.alignment );
        if( !offset )
          return std::unexpected( offset.error() );

        for( std::size_t i = 0; i < list->elements.size(); i++ )
        {
          auto address = *offset + static_cast< std::uint32_t >( i ) * element.size;
          if( auto r = write_value( context, type.element(), list->elements[ i ], address ); !r )
            return std::unexpected( with_context( r.error(), "element " + std::to_string( i ) ) );
        }

        return offset_length{ *offset, static_cast< std::uint32_t >( list->elements.size() ) };
      }
    default:
      std::unreachable();
  }
}

result< void > store_scalar( guest_memory& mem, const type_descriptor& type, const value& v, std::uint32_t offset )
{
  auto region = guest_span( mem, offset, schema::layout_of( type ).size );
  if( !region )
    return std::unexpected( region.error() );

  auto p = raw( *region );

  switch( type.tag() )
  {
    case kind::boolean:
      if( auto b = as< bool >( v ); b )
      {
        *p = *b ? 1 : 0; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return {};
      }
      break;
    case kind::s32:
      if( auto i = as< std::int32_t >( v ); i )
      {
        boost::endian::store_little_s32( p, *i );
        return {};
      }
      break;
    case kind::u32:
      if( auto i = as< std::uint32_t >( v ); i )
      {
        boost::endian::store_little_u32( p, *i );
        return {};
      }
      break;
    case kind::s64:
      if( auto i = as< std::int64_t >( v ); i )
      {
        boost::endian::store_little_s64( p, *i );
        return {};
      }
      break;
    case kind::u64:
      if( auto i = as< std::uint64_t >( v ); i )
      {
        boost::endian::store_little_u64( p, *i );
        return {};
      }
      break;
    case kind::f32:
      if( auto f = as< float >( v ); f )
      {
        boost::endian::store_little_u32( p, std::bit_cast< std::uint32_t >( *f ) );
        return {};
      }
      break;
    case kind::f64:
      if( auto f = as< double >( v ); f )
      {
        boost::endian::store_little_u64( p, std::bit_cast< std::uint64_t >( *f ) );
        return {};
      }
      break;
    default:
      std::unreachable();
  }

  return std::unexpected( type_mismatch( type, v ) );
}

result< void > write_value( call_context& context, const type_descriptor& type, const value& v, std::uint32_t offset )
{
  if( type.is_scalar() )
    return store_scalar( context.memory(), type, v, offset );

  switch( type.tag() )
  {
    case kind::string:
    case kind::bytes:
    case kind::list:
      {
        auto indirect = stage_indirect( context, type, v );
        if( !indirect )
          return std::unexpected( indirect.error() );

        auto region = guest_span( context.memory(), offset, schema::indirect_layout.size );
        if( !region )
          return std::unexpected( region.error() );

        auto p = raw( *region );
        boost::endian::store_little_u32( p, indirect->first );
        boost::endian::store_little_u32( p + schema::pointer_size, // NOLINT
                                         indirect->second );
        return {};
      }
    case kind::record:
      {
        auto record        = as< schema::record_value >( v );
        const auto& fields = type.fields();
        if( !record || record->fields.size() != fields.size() )
          return std::unexpected( type_mismatch( type, v ) );

        auto layout = schema::layout_of_record( fields );
        for( std::size_t i = 0; i < fields.size(); i++ )
        {
          if( auto r = write_value( context, fields[ i ].type, record->fields[ i ], offset + layout.offsets[ i ] ); !r )
            return std::unexpected( with_context( r.error(), "field '" + fields[ i ].name + "'" ) );
        }

        return {};
      }
    case kind::variant:
      {
        auto variant      = as< schema::variant_value >( v );
        const auto& cases = type.cases();
        if( !variant )
          return std::unexpected( type_mismatch( type, v ) );

        if( variant->discriminant >= cases.size() )
          return std::unexpected(
            encoding( "variant case " + std::to_string( variant->discriminant ) + " is not declared by "
                      + type.to_string() ) );

        const auto& c = cases[ variant->discriminant ];
        if( c.payload.has_value() == variant->payload.empty() )
          return std::unexpected( encoding( "variant case '" + c.name + "' payload does not match its declaration" ) );

        auto layout = schema::layout_of_variant( cases );
        auto region = guest_span( context.memory(), offset, layout.discriminant_size );
        if( !region )
          return std::unexpected( region.error() );

        auto p = raw( *region );
        switch( layout.discriminant_size )
        {
          case 1:
            *p = static_cast< unsigned char >( variant->discriminant );
            break;
          case 2:
            boost::endian::store_little_u16( p, static_cast< std::uint16_t >( variant->discriminant ) );
            break;
          default:
            boost::endian::store_little_u32( p, variant->discriminant );
            break;
        }

        if( c.payload )
        {
          if( auto r = write_value( context, *c.payload, variant->payload.front(), offset + layout.payload_offset ); !r )
            return std::unexpected( with_context( r.error(), "case '" + c.name + "'" ) );
        }

        return {};
      }
    default:
      std::unreachable();
  }
}

result< FizzyValue > lower_scalar( const type_descriptor& type, const value& v )
{
  FizzyValue out{};

  switch( type.tag() )
  {
    case kind::boolean:
      if( auto b = as< bool >( v ); b )
      {
        out.i32 = *b ? 1 : 0;
        return out;
      }
      break;
    case kind::s32:
      if( auto i = as< std::int32_t >( v ); i )
      {
        out.i32 = std::bit_cast< std::uint32_t >( *i );
        return out;
      }
      break;
    case kind::u32:
      if( auto i = as< std::uint32_t >( v ); i )
      {
        out.i32 = *i;
        return out;
      }
      break;
    case kind::s64:
      if( auto i = as< std::int64_t >( v ); i )
      {
        out.i64 = std::bit_cast< std::uint64_t >( *i );
        return out;
      }
      break;
    case kind::u64:
      if( auto i = as< std::uint64_t >( v ); i )
      {
        out.i64 = *i;
        return out;
      }
      break;
    case kind::f32:
      if( auto f = as< float >( v ); f )
      {
        out.f32 = *f;
        return out;
      }
      break;
    case kind::f64:
      if( auto f = as< double >( v ); f )
      {
        out.f64 = *f;
        return out;
      }
      break;
    default:
      std::unreachable();
  }

  return std::unexpected( type_mismatch( type, v ) );
}

result< value > lift_scalar( const type_descriptor& type, const FizzyValue& core )
{
  switch( type.tag() )
  {
    case kind::boolean:
      if( core.i32 > 1 )
        return std::unexpected( encoding( "invalid bool encoding " + std::to_string( core.i32 ) ) );
      return value::boolean( core.i32 == 1 );
    case kind::s32:
      return value::s32( std::bit_cast< std::int32_t >( core.i32 ) );
    case kind::u32:
      return value::u32( core.i32 );
    case kind::s64:
      return value::s64( std::bit_cast< std::int64_t >( core.i64 ) );
    case kind::u64:
      return value::u64( core.i64 );
    case kind::f32:
      return value::f32( core.f32 );
    case kind::f64:
      return value::f64( core.f64 );
    default:
      std::unreachable();
  }
}

result< value > read_value( call_context& context, const type_descriptor& type, std::uint32_t offset );

result< value > read_scalar( guest_memory& mem, const type_descriptor& type, std::uint32_t offset )
{
  auto region = guest_span( mem, offset, schema::layout_of( type ).size );
  if( !region )
    return std::unexpected( region.error() );

  auto p = raw( *region );
  FizzyValue core{};

  switch( type.tag() )
  {
    case kind::boolean:
      core.i32 = *p;
      break;
    case kind::s32:
    case kind::u32:
    case kind::f32:
      core.i32 = boost::endian::load_little_u32( p );
      if( type.tag() == kind::f32 )
        core.f32 = std::bit_cast< float >( core.i32 );
      break;
    default:
      core.i64 = boost::endian::load_little_u64( p );
      if( type.tag() == kind::f64 )
        core.f64 = std::bit_cast< double >( core.i64 );
      break;
  }

  return lift_scalar( type, core );
}

result< value > read_indirect( call_context& context, const type_descriptor& type, std::uint32_t offset )
{
  auto header = guest_span( context.memory(), offset, schema::indirect_layout.size );
  if( !header )
    return std::unexpected( header.error() );

  auto p      = raw( *header );
  auto ptr    = boost::endian::load_little_u32( p );
  auto length = boost::endian::load_little_u32( p + schema::pointer_size ); // NOLINT

  if( type.tag() == kind::list )
  {
    if( !length )
      return value::list( {} );

    auto element = schema::layout_of( type.element() );
    auto total   = std::uint64_t( element.size ) * length;
    if( auto region = guest_span( context.memory(), ptr, total ); !region )
      return std::unexpected( region.error() );

    std::vector< value > elements;
    elements.reserve( std::min( length, list_reserve_limit ) );
    for( std::uint32_t i = 0; i < length; i++ )
    {
      auto e = read_value( context, type.element(), ptr + i * element.size );
      if( !e )
        return std::unexpected( with_context( e.error(), "element " + std::to_string( i ) ) );

      elements.push_back( std::move( *e ) );
    }

    context.adopt( allocation{ ptr, static_cast< std::uint32_t >( total ), element.alignment } );
    return value::list( std::move( elements ) );
  }

  if( !length )
    return type.tag() == kind::string ? value::string( {} ) : value::bytes( {} );

  auto region = guest_span( context.memory(), ptr, length );
  if( !region )
    return std::unexpected( region.error() );

  if( type.tag() == kind::string )
  {
    std::string str( memory::as_string_view( *region ) );
    if( !validate_utf( str ) )
      return std::unexpected( encoding( "guest returned a string that is not valid UTF-8" ) );

    context.adopt( allocation{ ptr, length, 1 } );
    return value::string( std::move( str ) );
  }

  schema::byte_buffer bytes( region->begin(), region->end() );
  context.adopt( allocation{ ptr, length, 1 } );
  return value::bytes( std::move( bytes ) );
}

result< value > read_value( call_context& context, const type_descriptor& type, std::uint32_t offset )
{
  if( type.is_scalar() )
    return read_scalar( context.memory(), type, offset );

  switch( type.tag() )
  {
    case kind::string:
    case kind::bytes:
    case kind::list:
      return read_indirect( context, type, offset );
    case kind::record:
      {
        const auto& fields = type.fields();
        auto layout        = schema::layout_of_record( fields );
        if( auto region = guest_span( context.memory(), offset, layout.whole.size ); !region )
          return std::unexpected( region.error() );

        std::vector< value > values;
        values.reserve( fields.size() );
        for( std::size_t i = 0; i < fields.size(); i++ )
        {
          auto f = read_value( context, fields[ i ].type, offset + layout.offsets[ i ] );
          if( !f )
            return std::unexpected( with_context( f.error(), "field '" + fields[ i ].name + "'" ) );

          values.push_back( std::move( *f ) );
        }

        return value::record( std::move( values ) );
      }
    case kind::variant:
      {
        const auto& cases = type.cases();
        auto layout       = schema::layout_of_variant( cases );
        auto region       = guest_span( context.memory(), offset, layout.whole.size );
        if( !region )
          return std::unexpected( region.error() );

        auto p                     = raw( *region );
        std::uint32_t discriminant = 0;
        switch( layout.discriminant_size )
        {
          case 1:
            discriminant = *p;
            break;
          case 2:
            discriminant = boost::endian::load_little_u16( p );
            break;
          default:
            discriminant = boost::endian::load_little_u32( p );
            break;
        }

        if( discriminant >= cases.size() )
          return std::unexpected( encoding( "invalid variant discriminant " + std::to_string( discriminant ) + " for "
                                            + type.to_string() ) );

        const auto& c = cases[ discriminant ];
        if( !c.payload )
          return value::variant( discriminant );

        auto payload = read_value( context, *c.payload, offset + layout.payload_offset );
        if( !payload )
          return std::unexpected( with_context( payload.error(), "case '" + c.name + "'" ) );

        return value::variant( discriminant, std::move( *payload ) );
      }
    default:
      std::unreachable();
  }
}

} // namespace

call_context::call_context( guest_memory& memory ) noexcept:
    _memory( &memory )
{}

call_context::~call_context()
{
  if( _allocations.empty() )
    return;

  if( auto error = release(); error )
    LOG_WARNING( log::instance(), "Failed to release guest buffers: {}", error.message() );
}

guest_memory& call_context::memory() noexcept
{
  return *_memory;
}

std::expected< std::uint32_t, std::error_code > call_context::stage( std::uint32_t size, std::uint32_t alignment )
{
  auto offset = _memory->allocate( size, alignment );
  if( !offset )
    return offset;

  // The guest allocator signals exhaustion with a null pointer.
  if( *offset == 0 && size )
    return std::unexpected( make_error_code( runtime_errc::memory_bounds_fault ) );

  if( std::uint64_t( *offset ) + size > _memory->data().size() )
    return std::unexpected( make_error_code( runtime_errc::memory_bounds_fault ) );

  _allocations.push_back( allocation{ *offset, size, alignment } );
  return offset;
}

void call_context::adopt( const allocation& a )
{
  _allocations.push_back( a );
}

std::error_code call_context::release()
{
  std::error_code error;

  if( _memory->can_release() )
  {
    for( const auto& a: _allocations | std::views::reverse )
    {
      error = _memory->release( a.offset, a.size, a.alignment );
      if( error )
        break;
    }
  }

  _allocations.clear();
  return error;
}

void call_context::abandon() noexcept
{
  _allocations.clear();
}

const std::vector< allocation >& call_context::allocations() const noexcept
{
  return _allocations;
}

result< std::vector< FizzyValue > >
lower( call_context& context, const schema::function_signature& signature, std::span< const schema::value > args )
{
  if( args.size() != signature.params.size() )
    return std::unexpected( fault( runtime_errc::invalid_arguments,
                                   fault_phase::lower,
                                   signature.name,
                                   "expected " + std::to_string( signature.params.size() ) + " arguments, found "
                                     + std::to_string( args.size() ) ) );

  std::vector< FizzyValue > core;
  core.reserve( args.size() );

  for( std::size_t i = 0; i < args.size(); i++ )
  {
    const auto& type = signature.params[ i ];
    const auto& arg  = args[ i ];
    auto where       = "argument " + std::to_string( i );

    if( type.is_scalar() )
    {
      auto v = lower_scalar( type, arg );
      if( !v )
        return std::unexpected( with_context( v.error(), where ).in( fault_phase::lower ).during( signature.name ) );

      core.push_back( *v );
      continue;
    }

    switch( type.tag() )
    {
      case kind::string:
      case kind::bytes:
      case kind::list:
        {
          auto indirect = stage_indirect( context, type, arg );
          if( !indirect )
            return std::unexpected(
              with_context( indirect.error(), where ).in( fault_phase::lower ).during( signature.name ) );

          FizzyValue offset{};
          FizzyValue length{};
          offset.i32 = indirect->first;
          length.i32 = indirect->second;
          core.push_back( offset );
          core.push_back( length );
          break;
        }
      default:
        {
          auto layout = schema::layout_of( type );
          auto offset = stage( context, layout.size, layout.alignment );
          if( !offset )
            return std::unexpected(
              with_context( offset.error(), where ).in( fault_phase::lower ).during( signature.name ) );

          if( auto r = write_value( context, type, arg, *offset ); !r )
            return std::unexpected( with_context( r.error(), where ).in( fault_phase::lower ).during( signature.name ) );

          FizzyValue pointer{};
          pointer.i32 = *offset;
          core.push_back( pointer );
          break;
        }
    }
  }

  return core;
}

result< std::vector< schema::value > > lift( call_context& context,
                                             const schema::function_signature& signature,
                                             const std::optional< FizzyValue >& core_result )
{
  std::vector< schema::value > results;
  if( signature.returns.empty() )
    return results;

  if( !core_result )
    return std::unexpected(
      fault( runtime_errc::encoding_fault, fault_phase::lift, signature.name, "guest returned no value" ) );

  if( signature.returns.size() == 1 && signature.returns.front().is_scalar() )
  {
    auto v = lift_scalar( signature.returns.front(), *core_result );
    if( !v )
      return std::unexpected( fault( v.error() ).in( fault_phase::lift ).during( signature.name ) );

    results.push_back( std::move( *v ) );
    return results;
  }

  auto area   = core_result->i32;
  auto layout = schema::layout_of_record( signature.returns );
  if( auto region = guest_span( context.memory(), area, layout.whole.size ); !region )
    return std::unexpected(
      with_context( region.error(), "return area" ).in( fault_phase::lift ).during( signature.name ) );

  results.reserve( signature.returns.size() );
  for( std::size_t i = 0; i < signature.returns.size(); i++ )
  {
    auto v = read_value( context, signature.returns[ i ], area + layout.offsets[ i ] );
    if( !v )
      return std::unexpected( with_context( v.error(), "result " + std::to_string( i ) )
                                .in( fault_phase::lift )
                                .during( signature.name ) );

    results.push_back( std::move( *v ) );
  }

  return results;
}

} // namespace hospes::vm
