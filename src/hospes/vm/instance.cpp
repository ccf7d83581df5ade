// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
#include <hospes/log/log.hpp>
#include <hospes/memory/memory.hpp>
#include <hospes/vm/instance.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <exception>
#include <string>
#include <limits>
#include <utility>

#include <boost/endian/conversion.hpp>

namespace hospes::vm {

namespace {

constexpr std::string_view wasi_module = "wasi_snapshot_preview1";
constexpr std::uint32_t iovec_size     = 8;
constexpr std::uint64_t page_size      = 65'536;

template< FizzyExecutionResult ( instance::*Method )( const FizzyValue* ) noexcept >
FizzyExecutionResult host_function( void* voidptr_context,
                                    FizzyInstance* /* fizzy_instance */,
                                    const FizzyValue* args,
                                    FizzyExecutionContext* /* fizzy_context */ ) noexcept
{
  auto* context = static_cast< instance* >( voidptr_context );
  return ( context->*Method )( args );
}

constexpr std::array< FizzyValueType, 1 > one_i32{ FizzyValueTypeI32 };
constexpr std::array< FizzyValueType, 2 > two_i32{ FizzyValueTypeI32, FizzyValueTypeI32 };
constexpr std::array< FizzyValueType, 4 > four_i32{ FizzyValueTypeI32,
                                                    FizzyValueTypeI32,
                                                    FizzyValueTypeI32,
                                                    FizzyValueTypeI32 };

FizzyExecutionResult trap() noexcept
{
  FizzyExecutionResult result;
  result.trapped   = true;
  result.has_value = false;
  result.value.i64 = 0;
  return result;
}

FizzyExecutionResult errno_result( wasi_errno e ) noexcept
{
  FizzyExecutionResult result;
  result.trapped   = false;
  result.has_value = true;
  result.value.i64 = 0;
  result.value.i32 = static_cast< std::uint32_t >( e );
  return result;
}

fault instantiation( std::string detail )
{
  return fault( runtime_errc::instantiation_fault, fault_phase::instantiate, {}, std::move( detail ) );
}

std::string describe( const std::error_code& ec, const resource_limits& limits, std::optional< std::int32_t > exit_code )
{
  if( ec == runtime_errc::budget_exceeded )
    return "step budget of " + std::to_string( limits.step_budget ) + " exhausted";

  if( ec == runtime_errc::guest_exit && exit_code )
    return "guest exited with code " + std::to_string( *exit_code );

  return "guest execution trapped";
}

} // namespace

std::string_view to_string( instance_state s ) noexcept
{
  using namespace std::string_view_literals;
  switch( s )
  {
    case instance_state::created:
      return "created"sv;
    case instance_state::ready:
      return "ready"sv;
    case instance_state::executing:
      return "executing"sv;
    case instance_state::faulted:
      return "faulted"sv;
    case instance_state::destroyed:
      return "destroyed"sv;
  }
  std::unreachable();
}

instance::instance( const component_ptr& c,
                    const resource_limits& limits,
                    const std::shared_ptr< host_api >& hapi ) noexcept:
    _component( c ),
    _limits( limits ),
    _hapi( hapi )
{}

instance::~instance()
{
  teardown();
}

result< std::shared_ptr< instance > >
instance::instantiate( const component_ptr& c, const resource_limits& limits, const std::shared_ptr< host_api >& hapi )
{
  if( !c || !hapi )
    return std::unexpected( instantiation( "a component and a host api are required" ) );

  if( limits.step_budget == 0 )
    return std::unexpected( instantiation( "step budget must be positive" ) );

  if( limits.max_memory_pages > max_memory_pages_limit )
    return std::unexpected( instantiation( "memory limit of " + std::to_string( limits.max_memory_pages )
                                           + " pages exceeds the engine maximum of "
                                           + std::to_string( max_memory_pages_limit ) ) );

  if( limits.max_stack_bytes < stack_frame_bytes )
    return std::unexpected( instantiation( "stack limit of " + std::to_string( limits.max_stack_bytes )
                                           + " bytes leaves no room for a call frame" ) );

  auto inst = std::make_shared< instance >( c, limits, hapi );
  if( auto r = inst->instantiate_module(); !r )
    return std::unexpected( r.error() );

  if( auto initializer = c->bindings.initializer(); initializer )
  {
    std::optional< FizzyValue > out;
    std::error_code error = inst->begin_metering();
    if( !error )
    {
      error = inst->execute( *initializer, {}, out );
      inst->end_metering();
    }

    if( error )
    {
      inst->fault_instance();
      return std::unexpected(
        instantiation( std::string( initializer_export ) + " failed: " + describe( error, limits, inst->exit_code() ) ) );
    }
  }

  inst->_state = instance_state::ready;

  LOG_DEBUG( log::instance(),
             "Instantiated component {} with {} pages of memory",
             log::hex{ c->id.data(), c->id.size() },
             inst->memory_pages() );

  return inst;
}

result< void > instance::instantiate_module()
{
  static const std::array< FizzyImportedFunction, 6 > host_functions{
    FizzyImportedFunction{ wasi_module.data(),
                          "args_get",
                          { { FizzyValueTypeI32, two_i32.data(), two_i32.size() },
                            host_function< &instance::wasi_args_get >,
                            nullptr } },
    FizzyImportedFunction{ wasi_module.data(),
                          "args_sizes_get",
                          { { FizzyValueTypeI32, two_i32.data(), two_i32.size() },
                            host_function< &instance::wasi_args_sizes_get >,
                            nullptr } },
    FizzyImportedFunction{ wasi_module.data(),
                          "environ_get",
                          { { FizzyValueTypeI32, two_i32.data(), two_i32.size() },
                            host_function< &instance::wasi_environ_get >,
                            nullptr } },
    FizzyImportedFunction{ wasi_module.data(),
                          "environ_sizes_get",
                          { { FizzyValueTypeI32, two_i32.data(), two_i32.size() },
                            host_function< &instance::wasi_environ_sizes_get >,
                            nullptr } },
    FizzyImportedFunction{ wasi_module.data(),
                          "fd_write",
                          { { FizzyValueTypeI32, four_i32.data(), four_i32.size() },
                            host_function< &instance::wasi_fd_write >,
                            nullptr } },
    FizzyImportedFunction{ wasi_module.data(),
                          "proc_exit",
                          { { FizzyValueTypeVoid, one_i32.data(), one_i32.size() },
                            host_function< &instance::wasi_proc_exit >,
                            nullptr } }
  };

  // The host context differs per instance.
  auto imports = host_functions;
  for( auto& fn: imports )
    fn.external_function.context = this;

  auto clone = fizzy_clone_module( _component->code->get() );
  if( !clone )
    return std::unexpected( instantiation( "could not copy the module" ) );

  FizzyError fizzy_err;

  // Consumes the clone, on failure as well.
  _instance = fizzy_resolve_instantiate( clone,
                                         imports.data(),
                                         imports.size(),
                                         nullptr,
                                         nullptr,
                                         nullptr,
                                         0,
                                         _limits.max_memory_pages,
                                         &fizzy_err );

  if( !_instance )
    return std::unexpected( instantiation( static_cast< const char* >( fizzy_err.message ) ) );

  return {};
}

int instance::initial_depth() const noexcept
{
  auto frames = std::min< std::uint64_t >( call_stack_limit, _limits.max_stack_bytes / stack_frame_bytes );
  return call_stack_limit - static_cast< int >( frames );
}

std::error_code instance::begin_metering() noexcept
{
  auto ticks = static_cast< std::int64_t >(
    std::min< std::uint64_t >( _limits.step_budget, std::numeric_limits< std::int64_t >::max() ) );

  _context = fizzy_create_metered_execution_context( initial_depth(), ticks );
  if( !_context )
    return runtime_errc::instantiation_fault;

  return runtime_errc::ok;
}

void instance::end_metering() noexcept
{
  if( !_context )
    return;

  auto remaining = *fizzy_get_execution_context_ticks( _context );
  auto budget    = std::min< std::uint64_t >( _limits.step_budget, std::numeric_limits< std::int64_t >::max() );
  _steps         = remaining > 0 ? budget - static_cast< std::uint64_t >( remaining ) : budget;

  fizzy_free_execution_context( _context );
  _context = nullptr;
}

std::error_code instance::execute( std::uint32_t function_index,
                                   std::span< const FizzyValue > args,
                                   std::optional< FizzyValue >& out ) noexcept
{
  out.reset();

  auto r = fizzy_execute( _instance, function_index, args.empty() ? nullptr : args.data(), _context );
  if( !r.trapped )
  {
    if( r.has_value )
      out = r.value;

    return runtime_errc::ok;
  }

  if( _exited )
    return runtime_errc::guest_exit;

  if( *fizzy_get_execution_context_ticks( _context ) < 0 )
    return runtime_errc::budget_exceeded;

  return runtime_errc::trapped;
}

void instance::fault_instance() noexcept
{
  _state = instance_state::faulted;
}

result< std::vector< schema::value > > instance::call( std::string_view function,
                                                       std::span< const schema::value > args )
{
  std::unique_lock< std::mutex > token( _token, std::try_to_lock );
  if( !token.owns_lock() )
    return std::unexpected( fault( runtime_errc::instance_busy,
                                   fault_phase::execute,
                                   std::string( function ),
                                   "another call is executing on this instance" ) );

  if( _abandoned && _state != instance_state::destroyed )
    fault_instance();

  switch( _state.load() )
  {
    case instance_state::faulted:
      return std::unexpected( fault( runtime_errc::instance_faulted, fault_phase::execute, std::string( function ) ) );
    case instance_state::destroyed:
    case instance_state::created:
      return std::unexpected( fault( runtime_errc::instance_destroyed, fault_phase::execute, std::string( function ) ) );
    default:
      break;
  }

  const auto* binding = _component->bindings.find( function );
  if( !binding )
    return std::unexpected( fault( runtime_errc::function_not_found,
                                   fault_phase::execute,
                                   std::string( function ),
                                   "the schema declares no such function" ) );

  if( auto error = begin_metering(); error )
    return std::unexpected(
      fault( error, fault_phase::execute, std::string( function ), "could not create an execution context" ) );

  _state  = instance_state::executing;
  _exited = false;

  result< std::vector< schema::value > > outcome;

  try
  {
    call_context context( *this );

    if( auto lowered = lower( context, binding->signature, args ); !lowered )
    {
      if( _state == instance_state::faulted )
        context.abandon();

      outcome = std::unexpected( lowered.error() );
    }
    else
    {
      std::optional< FizzyValue > core;
      if( auto error = execute( binding->index, *lowered, core ); error )
      {
        fault_instance();
        context.abandon();
        outcome = std::unexpected(
          fault( error, fault_phase::execute, std::string( function ), describe( error, _limits, exit_code() ) ) );
      }
      else if( auto values = lift( context, binding->signature, core ); !values )
        outcome = std::unexpected( values.error() );
      else if( auto error = context.release(); error )
        outcome = std::unexpected( fault( error,
                                          fault_phase::release,
                                          std::string( function ),
                                          "releasing guest buffers failed" ) );
      else
        outcome = std::move( *values );
    }
  }
  catch( ... )
  {
    // Nothing is known about the guest once a call unwinds.
    end_metering();
    fault_instance();
    throw;
  }

  end_metering();

  if( _abandoned )
    fault_instance();
  else if( _state == instance_state::executing )
    _state = instance_state::ready;

  if( !outcome )
    LOG_DEBUG( log::instance(), "Call failed: {}", outcome.error().message() );

  return outcome;
}

void instance::teardown() noexcept
{
  std::lock_guard< std::mutex > token( _token );

  if( _state == instance_state::destroyed )
    return;

  if( _context )
  {
    fizzy_free_execution_context( _context );
    _context = nullptr;
  }

  if( _instance )
  {
    fizzy_free_instance( _instance );
    _instance = nullptr;
  }

  _state = instance_state::destroyed;
}

void instance::abandon() noexcept
{
  _abandoned = true;

  std::unique_lock< std::mutex > token( _token, std::try_to_lock );
  if( token.owns_lock() && _state != instance_state::destroyed )
    fault_instance();
}

instance_state instance::state() const noexcept
{
  return _state;
}

const resource_limits& instance::limits() const noexcept
{
  return _limits;
}

const component_ptr& instance::owner() const noexcept
{
  return _component;
}

std::uint64_t instance::steps_used() const noexcept
{
  return _steps;
}

std::optional< std::int32_t > instance::exit_code() const noexcept
{
  if( !_exited.load( std::memory_order_acquire ) )
    return std::nullopt;

  return _exit_value.load( std::memory_order_relaxed );
}

std::uint32_t instance::memory_pages() const noexcept
{
  if( !_instance )
    return 0;

  return static_cast< std::uint32_t >( fizzy_get_instance_memory_size( _instance ) / page_size );
}

void* instance::native_pointer( std::uint32_t ptr, std::uint64_t size ) const noexcept
{
  if( !_instance )
    return nullptr;

  auto memory_data = fizzy_get_instance_memory_data( _instance );
  if( !memory_data )
    return nullptr;

  if( std::uint64_t( ptr ) + size > fizzy_get_instance_memory_size( _instance ) )
    return nullptr;

  return static_cast< void* >( memory_data + ptr );
}

FizzyExecutionResult instance::write_string_sizes( const std::vector< std::string >& strings,
                                                   const FizzyValue* args ) noexcept
{
  auto count = native_pointer_as< unsigned char* >( args[ 0 ].i32, sizeof( std::uint32_t ) );
  if( !count )
    return trap();

  auto buffer_size = native_pointer_as< unsigned char* >( args[ 1 ].i32, sizeof( std::uint32_t ) );
  if( !buffer_size )
    return trap();

  std::uint64_t total = 0;
  for( const auto& s: strings )
    total += s.size() + 1;

  boost::endian::store_little_u32( count, static_cast< std::uint32_t >( strings.size() ) );
  boost::endian::store_little_u32( buffer_size, static_cast< std::uint32_t >( total ) );

  return errno_result( wasi_errno::success );
}

FizzyExecutionResult instance::write_strings( const std::vector< std::string >& strings,
                                              const FizzyValue* args ) noexcept
{
  std::uint64_t total = 0;
  for( const auto& s: strings )
    total += s.size() + 1;

  std::uint32_t pointers = args[ 0 ].i32;
  std::uint32_t buffer   = args[ 1 ].i32;

  auto pointer_table = native_pointer_as< unsigned char* >( pointers, strings.size() * sizeof( std::uint32_t ) );
  if( !pointer_table )
    return trap();

  auto out = native_pointer_as< char* >( buffer, total );
  if( !out )
    return trap();

  std::uint32_t offset = 0;
  for( std::size_t i = 0; i < strings.size(); i++ )
  {
    boost::endian::store_little_u32( pointer_table + i * sizeof( std::uint32_t ), buffer + offset );
    std::ranges::copy( strings[ i ], out + offset );
    out[ offset + strings[ i ].size() ] = '\0';
    offset += static_cast< std::uint32_t >( strings[ i ].size() + 1 );
  }

  return errno_result( wasi_errno::success );
}

FizzyExecutionResult instance::wasi_args_get( const FizzyValue* args ) noexcept
{
  try
  {
    return write_strings( _hapi->arguments(), args );
  }
  catch( const std::exception& e )
  {
    LOG_WARNING( log::instance(), "Host arguments failed: {}", e.what() );
    return errno_result( wasi_errno::io );
  }
}

FizzyExecutionResult instance::wasi_args_sizes_get( const FizzyValue* args ) noexcept
{
  try
  {
    return write_string_sizes( _hapi->arguments(), args );
  }
  catch( const std::exception& e )
  {
    LOG_WARNING( log::instance(), "Host arguments failed: {}", e.what() );
    return errno_result( wasi_errno::io );
  }
}

FizzyExecutionResult instance::wasi_environ_get( const FizzyValue* args ) noexcept
{
  try
  {
    return write_strings( _hapi->environment(), args );
  }
  catch( const std::exception& e )
  {
    LOG_WARNING( log::instance(), "Host environment failed: {}", e.what() );
    return errno_result( wasi_errno::io );
  }
}

FizzyExecutionResult instance::wasi_environ_sizes_get( const FizzyValue* args ) noexcept
{
  try
  {
    return write_string_sizes( _hapi->environment(), args );
  }
  catch( const std::exception& e )
  {
    LOG_WARNING( log::instance(), "Host environment failed: {}", e.what() );
    return errno_result( wasi_errno::io );
  }
}

FizzyExecutionResult instance::wasi_fd_write( const FizzyValue* args ) noexcept
{
  std::uint32_t fd       = args[ 0 ].i32;
  std::uint32_t iovs     = args[ 1 ].i32;
  std::uint32_t iovs_len = args[ 2 ].i32;

  auto table = native_pointer_as< const unsigned char* >( iovs, std::uint64_t( iovs_len ) * iovec_size );
  if( !table )
    return trap();

  std::vector< io_vector > io_vectors;
  io_vectors.reserve( iovs_len );
  for( std::uint32_t i = 0; i < iovs_len; i++ )
  {
    auto buf = boost::endian::load_little_u32( table + i * iovec_size );
    auto len = boost::endian::load_little_u32( table + i * iovec_size + sizeof( std::uint32_t ) );

    auto native_address = native_pointer_as< const std::byte* >( buf, len );
    if( !native_address )
      return trap();

    io_vectors.emplace_back( native_address, len );
  }

  auto nwritten = native_pointer_as< unsigned char* >( args[ 3 ].i32, sizeof( std::uint32_t ) );
  if( !nwritten )
    return trap();

  std::uint32_t written = 0;
  wasi_errno error      = wasi_errno::success;

  try
  {
    error = _hapi->fd_write( fd, io_vectors, written );
  }
  catch( const std::exception& e )
  {
    LOG_WARNING( log::instance(), "Host fd_write failed: {}", e.what() );
    error = wasi_errno::io;
  }

  boost::endian::store_little_u32( nwritten, written );
  return errno_result( error );
}

FizzyExecutionResult instance::wasi_proc_exit( const FizzyValue* args ) noexcept
{
  auto exit_code = std::bit_cast< std::int32_t >( args[ 0 ].i32 );
  _exit_value.store( exit_code, std::memory_order_relaxed );
  _exited.store( true, std::memory_order_release );

  try
  {
    _hapi->proc_exit( exit_code );
  }
  catch( const std::exception& e )
  {
    LOG_WARNING( log::instance(), "Host proc_exit failed: {}", e.what() );
  }

  // Unwinds the guest; the call reports guest_exit.
  return trap();
}

std::span< std::byte > instance::data() noexcept
{
  if( !_instance )
    return {};

  auto memory_data = fizzy_get_instance_memory_data( _instance );
  if( !memory_data )
    return {};

  return std::span< std::byte >( memory::pointer_cast< std::byte* >( memory_data ),
                                 fizzy_get_instance_memory_size( _instance ) );
}

std::expected< std::uint32_t, std::error_code > instance::allocate( std::uint32_t size, std::uint32_t alignment )
{
  if( _state == instance_state::faulted )
    return std::unexpected( make_error_code( runtime_errc::instance_faulted ) );

  auto allocator = _component->bindings.allocator();
  if( !allocator )
    return std::unexpected( make_error_code( runtime_errc::schema_mismatch ) );

  std::array< FizzyValue, 4 > args{};
  args[ 0 ].i32 = 0;
  args[ 1 ].i32 = 0;
  args[ 2 ].i32 = alignment;
  args[ 3 ].i32 = size;

  std::optional< FizzyValue > out;
  if( auto error = execute( *allocator, args, out ); error )
  {
    fault_instance();
    return std::unexpected( error );
  }

  if( !out )
    return std::unexpected( make_error_code( runtime_errc::memory_bounds_fault ) );

  return out->i32;
}

std::error_code instance::release( std::uint32_t offset, std::uint32_t size, std::uint32_t alignment )
{
  if( _state == instance_state::faulted )
    return runtime_errc::instance_faulted;

  auto deallocator = _component->bindings.deallocator();
  if( !deallocator )
    return runtime_errc::ok;

  std::array< FizzyValue, 3 > args{};
  args[ 0 ].i32 = offset;
  args[ 1 ].i32 = size;
  args[ 2 ].i32 = alignment;

  std::optional< FizzyValue > out;
  if( auto error = execute( *deallocator, args, out ); error )
  {
    fault_instance();
    return error;
  }

  return runtime_errc::ok;
}

bool instance::can_release() const noexcept
{
  return _component->bindings.deallocator().has_value();
}

} // namespace hospes::vm

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
