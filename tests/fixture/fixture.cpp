// NOLINTBEGIN

#include <test/fixture.hpp>

#include <format>
#include <stdexcept>

#include <hospes/log/log.hpp>
#include <hospes/vm/module.hpp>

namespace test {

using namespace hospes;

std::vector< std::string > recording_host_api::arguments()
{
  return args;
}

std::vector< std::string > recording_host_api::environment()
{
  return env;
}

vm::wasi_errno
recording_host_api::fd_write( std::uint32_t fd, const std::vector< vm::io_vector >& iovs, std::uint32_t& nwritten )
{
  if( fd != static_cast< std::uint32_t >( vm::wasi_fd::out ) )
    return vm::wasi_errno::badf;

  std::lock_guard< std::mutex > lock( _mutex );
  nwritten = 0;
  for( const auto& iov: iovs )
  {
    for( auto b: iov )
      _out.push_back( static_cast< char >( b ) );

    nwritten += static_cast< std::uint32_t >( iov.size() );
  }

  return vm::wasi_errno::success;
}

void recording_host_api::proc_exit( std::int32_t exit_code )
{
  std::lock_guard< std::mutex > lock( _mutex );
  _exits.push_back( exit_code );
}

std::string recording_host_api::out() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _out;
}

std::vector< std::int32_t > recording_host_api::exits() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _exits;
}

fixture::fixture( const std::string& log_level )
{
  log::initialize();
  log::set_level( log_level );
}

fixture::~fixture() = default;

schema::type_descriptor fixture::tag_type()
{
  return schema::type_descriptor::record_of( {
    { "id", schema::kind::u32 },
    { "label", schema::kind::string }
  } );
}

schema::type_descriptor fixture::classify_type()
{
  return schema::type_descriptor::variant_of( {
    { "negative", std::nullopt },
    { "zero", std::nullopt },
    { "positive", schema::type_descriptor( schema::kind::u32 ) }
  } );
}

schema::interface_schema fixture::guest_schema()
{
  using schema::kind;

  const std::vector< schema::function_signature > signatures{
    { "echo_string", { kind::string }, { kind::string } },
    { "echo_bytes", { kind::bytes }, { kind::bytes } },
    { "add", { kind::s32, kind::s32 }, { kind::s32 } },
    { "scale", { kind::f64, kind::f64 }, { kind::f64 } },
    { "is_even", { kind::u32 }, { kind::boolean } },
    { "sum", { schema::type_descriptor::list_of( kind::u32 ) }, { kind::u64 } },
    { "tag", { tag_type() }, { tag_type() } },
    { "classify", { kind::s32 }, { classify_type() } },
    { "bad_variant", {}, { classify_type() } },
    { "print", { kind::string }, { kind::u32 } },
    { "arg_count", {}, { kind::s32 } },
    { "exit", { kind::s32 }, {} },
    { "fail", {}, {} },
    { "spin", {}, {} },
    { "count", {}, { kind::u32 } },
    { "recurse", { kind::u32 }, { kind::u32 } },
    { "bad_string", {}, { kind::string } },
    { "bad_utf8", {}, { kind::string } },
    { "grow", { kind::u32 }, { kind::s32 } },
    { "live_allocations", {}, { kind::s32 } },
    { "ready", {}, { kind::boolean } }
  };

  schema::interface_schema s;
  for( const auto& signature: signatures )
    if( auto error = s.add( signature ); error )
      throw std::logic_error( "invalid guest signature " + signature.name + ": " + error.message() );

  return s;
}

schema::interface_schema fixture::hasher_schema()
{
  schema::interface_schema s;
  if( auto error = s.add( { "compute_hash", { schema::kind::bytes }, { schema::kind::string } } ); error )
    throw std::logic_error( error.message() );

  return s;
}

std::string fixture::expected_hash( const std::vector< std::byte >& input )
{
  std::string digest;
  for( std::uint64_t lane = 0; lane < 4; lane++ )
  {
    std::uint64_t h = 0xcbf29ce484222325ull ^ lane;
    for( auto b: input )
      h = ( h ^ std::to_integer< std::uint64_t >( b ) ) * 0x100000001b3ull;

    digest += std::format( "{:016x}", h );
  }

  return digest;
}

vm::component_ptr fixture::make_guest_component() const
{
  auto code = vm::parse_module( guest_program() );
  if( !code )
    throw std::runtime_error( code.error().message() );

  auto c = vm::make_component( *code, guest_schema() );
  if( !c )
    throw std::runtime_error( c.error().message() );

  return *c;
}

vm::instance_ptr fixture::make_guest_instance( const vm::resource_limits& limits ) const
{
  auto inst = vm::instance::instantiate( make_guest_component(), limits, _host );
  if( !inst )
    throw std::runtime_error( inst.error().message() );

  return *inst;
}

} // namespace test

// NOLINTEND
