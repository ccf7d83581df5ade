#include <hospes/schema/layout.hpp>

#include <algorithm>
#include <utility>

namespace hospes::schema {

namespace {

constexpr std::size_t max_u8_cases  = 1ull << 8;
constexpr std::size_t max_u16_cases = 1ull << 16;

void append_flat_param( std::vector< core_type >& out, const type_descriptor& t )
{
  if( auto core = core_type_of( t ); core )
  {
    out.push_back( *core );
    return;
  }

  switch( t.tag() )
  {
    case kind::string:
    case kind::bytes:
    case kind::list:
      out.push_back( core_type::i32 );
      out.push_back( core_type::i32 );
      break;
    default:
      out.push_back( core_type::i32 );
      break;
  }
}

} // namespace

std::string_view to_string( core_type t ) noexcept
{
  using namespace std::string_view_literals;
  switch( t )
  {
    case core_type::i32:
      return "i32"sv;
    case core_type::i64:
      return "i64"sv;
    case core_type::f32:
      return "f32"sv;
    case core_type::f64:
      return "f64"sv;
  }
  std::unreachable();
}

std::uint32_t align_to( std::uint32_t offset, std::uint32_t alignment ) noexcept
{
  return ( offset + alignment - 1 ) / alignment * alignment;
}

layout layout_of( const type_descriptor& t )
{
  switch( t.tag() )
  {
    case kind::boolean:
      return { 1, 1 };
    case kind::s32:
    case kind::u32:
    case kind::f32:
      return { 4, 4 };
    case kind::s64:
    case kind::u64:
    case kind::f64:
      return { 8, 8 };
    case kind::string:
    case kind::bytes:
    case kind::list:
      return indirect_layout;
    case kind::record:
      return layout_of_record( t.fields() ).whole;
    case kind::variant:
      return layout_of_variant( t.cases() ).whole;
  }
  std::unreachable();
}

record_layout layout_of_record( std::span< const type_descriptor > members )
{
  record_layout r;
  r.offsets.reserve( members.size() );

  std::uint32_t offset = 0;
  for( const auto& m: members )
  {
    auto l            = layout_of( m );
    offset            = align_to( offset, l.alignment );
    r.whole.alignment = std::max( r.whole.alignment, l.alignment );
    r.offsets.push_back( offset );
    offset += l.size;
  }

  r.whole.size = align_to( offset, r.whole.alignment );
  return r;
}

record_layout layout_of_record( const std::vector< field >& fields )
{
  std::vector< type_descriptor > members;
  members.reserve( fields.size() );
  for( const auto& f: fields )
    members.push_back( f.type );

  return layout_of_record( members );
}

variant_layout layout_of_variant( const std::vector< variant_case >& cases )
{
  variant_layout v;

  if( cases.size() <= max_u8_cases )
    v.discriminant_size = 1;
  else if( cases.size() <= max_u16_cases )
    v.discriminant_size = 2;
  else
    v.discriminant_size = 4;

  layout payload{ 0, 1 };
  for( const auto& c: cases )
  {
    if( !c.payload )
      continue;

    auto l            = layout_of( *c.payload );
    payload.size      = std::max( payload.size, l.size );
    payload.alignment = std::max( payload.alignment, l.alignment );
  }

  v.payload_offset  = align_to( v.discriminant_size, payload.alignment );
  v.whole.alignment = std::max( v.discriminant_size, payload.alignment );
  v.whole.size      = align_to( v.payload_offset + payload.size, v.whole.alignment );
  return v;
}

std::optional< core_type > core_type_of( const type_descriptor& t ) noexcept
{
  switch( t.tag() )
  {
    case kind::boolean:
    case kind::s32:
    case kind::u32:
      return core_type::i32;
    case kind::s64:
    case kind::u64:
      return core_type::i64;
    case kind::f32:
      return core_type::f32;
    case kind::f64:
      return core_type::f64;
    default:
      return {};
  }
}

flat_signature flatten( const function_signature& signature )
{
  flat_signature flat;

  for( const auto& p: signature.params )
  {
    append_flat_param( flat.params, p );
    if( !p.is_scalar() )
      flat.stages_arguments = true;
  }

  if( signature.returns.size() == 1 && signature.returns.front().is_scalar() )
    flat.result = core_type_of( signature.returns.front() );
  else if( !signature.returns.empty() )
  {
    flat.result           = core_type::i32;
    flat.uses_return_area = true;
  }

  flat.uses_memory = flat.stages_arguments || flat.uses_return_area;
  return flat;
}

std::string flat_signature::to_string() const
{
  std::string s = "(";
  for( std::size_t i = 0; i < params.size(); i++ )
  {
    if( i )
      s += ", ";
    s += schema::to_string( params[ i ] );
  }
  s += ") -> ";
  s += result ? std::string( schema::to_string( *result ) ) : std::string( "()" );
  return s;
}

} // namespace hospes::schema
