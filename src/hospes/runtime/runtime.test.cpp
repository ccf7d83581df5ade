// NOLINTBEGIN

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <functional>
#include <future>
#include <mutex>
#include <new>
#include <stdexcept>
#include <thread>
#include <vector>

#include <hospes/runtime/runtime.hpp>

#include <test/fixture.hpp>

using namespace hospes;
using namespace std::chrono_literals;
using schema::value;

namespace {

// When set, the next allocation on this thread larger than this many bytes fails.
thread_local std::size_t fail_allocation_over = 0;

} // namespace

void* operator new( std::size_t size )
{
  if( fail_allocation_over && size > fail_allocation_over )
  {
    fail_allocation_over = 0;
    throw std::bad_alloc();
  }

  if( auto* p = std::malloc( size ? size : 1 ) )
    return p;

  throw std::bad_alloc();
}

void operator delete( void* p ) noexcept
{
  std::free( p );
}

void operator delete( void* p, std::size_t ) noexcept
{
  std::free( p );
}

namespace {

// Holds every fd_write inside the guest until opened, pinning the calling instance.
class gated_host_api final: public vm::host_api
{
public:
  std::vector< std::string > arguments() override
  {
    return {};
  }

  std::vector< std::string > environment() override
  {
    return {};
  }

  vm::wasi_errno fd_write( std::uint32_t, const std::vector< vm::io_vector >& iovs, std::uint32_t& nwritten ) override
  {
    std::unique_lock< std::mutex > lock( _mutex );
    _entered++;
    _cv.notify_all();
    _cv.wait( lock,
              [ & ]
              {
                return _open;
              } );

    nwritten = 0;
    for( const auto& iov: iovs )
      nwritten += static_cast< std::uint32_t >( iov.size() );

    return vm::wasi_errno::success;
  }

  void proc_exit( std::int32_t ) override {}

  void wait_entered( std::size_t count )
  {
    std::unique_lock< std::mutex > lock( _mutex );
    _cv.wait( lock,
              [ & ]
              {
                return _entered >= count;
              } );
  }

  void open()
  {
    {
      std::lock_guard< std::mutex > lock( _mutex );
      _open = true;
    }
    _cv.notify_all();
  }

private:
  std::mutex _mutex;
  std::condition_variable _cv;
  std::size_t _entered = 0;
  bool _open           = false;
};

value single( const runtime::call_result& r )
{
  if( !r )
    throw std::runtime_error( r.error().message() );

  if( r->size() != 1 )
    throw std::runtime_error( "expected a single result" );

  return r->front();
}

bool eventually( const std::function< bool() >& condition )
{
  auto deadline = std::chrono::steady_clock::now() + 10s;
  while( !condition() )
  {
    if( std::chrono::steady_clock::now() > deadline )
      return false;

    std::this_thread::sleep_for( 1ms );
  }

  return true;
}

} // namespace

class host_runtime: public ::testing::Test,
                    public test::fixture
{
public:
  host_runtime( const host_runtime& ) = delete;
  host_runtime( host_runtime&& )      = delete;
  host_runtime()                      = default;

  ~host_runtime() override = default;

  host_runtime& operator=( const host_runtime& ) = delete;
  host_runtime& operator=( host_runtime&& )      = delete;

  void TearDown() override
  {
    _gate->open();
    _runtime.reset();
  }

  hospes::runtime::host_runtime& start( hospes::runtime::runtime_options options = {}, bool gated = false )
  {
    std::shared_ptr< vm::host_api > hapi = _host;
    if( gated )
      hapi = _gate;

    _runtime = std::make_unique< hospes::runtime::host_runtime >( std::move( options ), hapi );
    return *_runtime;
  }

  static hospes::runtime::runtime_options serial( hospes::runtime::overflow_policy overflow )
  {
    hospes::runtime::runtime_options options;
    options.max_concurrent_instances = 1;
    options.pool_size                = 1;
    options.overflow                 = overflow;
    return options;
  }

  hospes::runtime::component_handle load_guest()
  {
    auto handle = _runtime->load( guest_program(), guest_schema() );
    if( !handle )
      throw std::runtime_error( handle.error().message() );

    return *handle;
  }

  std::shared_ptr< gated_host_api > _gate = std::make_shared< gated_host_api >();
  std::unique_ptr< hospes::runtime::host_runtime > _runtime;
};

TEST_F( host_runtime, load_and_invoke )
{
  auto& rt    = start();
  auto handle = load_guest();

  auto stats = rt.stats();
  EXPECT_EQ( stats.loaded, 1u );
  EXPECT_EQ( stats.live, 1u );
  EXPECT_EQ( stats.idle, 1u );

  EXPECT_EQ( single( rt.invoke( handle, "add", std::vector< value >{ value::s32( 2 ), value::s32( 3 ) } ) ),
             value::s32( 5 ) );
  EXPECT_EQ( single( rt.invoke( handle, "echo_string", std::vector< value >{ value::string( "round trip" ) } ) ),
             value::string( "round trip" ) );

  // The same instance serves consecutive calls.
  EXPECT_EQ( single( rt.invoke( handle, "count", {} ) ), value::u32( 1 ) );
  EXPECT_EQ( single( rt.invoke( handle, "count", {} ) ), value::u32( 2 ) );

  stats = rt.stats();
  EXPECT_EQ( stats.live, 1u );
  EXPECT_EQ( stats.executing, 0u );

  ASSERT_NE( rt.component( handle ), nullptr );
  EXPECT_EQ( rt.component( handle )->id, handle.id );
}

TEST_F( host_runtime, load_is_idempotent )
{
  auto& rt = start();

  auto first  = load_guest();
  auto second = load_guest();
  EXPECT_EQ( first, second );
  EXPECT_EQ( rt.stats().loaded, 1u );

  // The same module under another schema is another component.
  schema::interface_schema narrow;
  ASSERT_FALSE( narrow.add( { "add", { schema::kind::s32, schema::kind::s32 }, { schema::kind::s32 } } ) );
  auto third = rt.load( guest_program(), narrow );
  ASSERT_TRUE( third ) << third.error().message();
  EXPECT_NE( *third, first );
  EXPECT_EQ( rt.stats().loaded, 2u );

  auto missing = rt.invoke( *third, "count", {} );
  ASSERT_FALSE( missing );
  EXPECT_EQ( missing.error().code(), runtime_errc::function_not_found );
}

TEST_F( host_runtime, module_cache )
{
  auto& rt    = start();
  auto handle = load_guest();
  ASSERT_TRUE( rt.unload( handle ) );
  EXPECT_EQ( rt.stats().loaded, 0u );

  EXPECT_EQ( load_guest(), handle );

  auto stats = rt.stats();
  EXPECT_EQ( stats.cache_misses, 1u );
  EXPECT_EQ( stats.cache_hits, 1u );

  hospes::runtime::runtime_options options;
  options.cache_validated_modules = false;
  auto& uncached                  = start( options );
  load_guest();
  EXPECT_EQ( uncached.stats().cache_misses, 0u );
  EXPECT_EQ( uncached.stats().cache_hits, 0u );
}

TEST_F( host_runtime, load_faults )
{
  auto& rt = start();

  auto empty = rt.load( {}, guest_schema() );
  ASSERT_FALSE( empty );
  EXPECT_EQ( empty.error().code(), runtime_errc::invalid_module );
  EXPECT_EQ( empty.error().phase(), fault_phase::load );

  schema::interface_schema wrong;
  ASSERT_FALSE( wrong.add( { "add", { schema::kind::f32 }, {} } ) );
  auto mismatched = rt.load( guest_program(), wrong );
  ASSERT_FALSE( mismatched );
  EXPECT_EQ( mismatched.error().code(), runtime_errc::schema_mismatch );
  EXPECT_EQ( mismatched.error().phase(), fault_phase::validate );

  schema::interface_schema noop;
  ASSERT_FALSE( noop.add( { "noop", {}, {} } ) );
  auto trapped = rt.load( init_trap_program(), noop );
  ASSERT_FALSE( trapped );
  EXPECT_EQ( trapped.error().code(), runtime_errc::instantiation_fault );
  EXPECT_EQ( trapped.error().phase(), fault_phase::instantiate );

  EXPECT_EQ( rt.stats().loaded, 0u );
}

TEST_F( host_runtime, invalid_options )
{
  hospes::runtime::runtime_options options;
  options.pool_size = 0;
  EXPECT_THROW( hospes::runtime::host_runtime{ options }, std::invalid_argument );
}

TEST_F( host_runtime, hashes_input )
{
  auto& rt    = start();
  auto handle = rt.load( hasher_program(), hasher_schema() );
  ASSERT_TRUE( handle ) << handle.error().message();

  const std::vector< std::byte > input{ std::byte{ 1 }, std::byte{ 2 }, std::byte{ 3 }, std::byte{ 4 }, std::byte{ 5 } };

  auto digest = single( rt.invoke( *handle, "compute_hash", std::vector< value >{ value::bytes( input ) } ) );
  EXPECT_EQ( digest, value::string( expected_hash( input ) ) );
  EXPECT_EQ( digest, value::string( "0f66dcbf4f6b7d888abcf3c869fcf007cb7fdef304d35ab646c6863ed129cb05" ) );

  auto empty = single( rt.invoke( *handle, "compute_hash", std::vector< value >{ value::bytes( {} ) } ) );
  EXPECT_EQ( empty, value::string( "cbf29ce484222325cbf29ce484222324cbf29ce484222327cbf29ce484222326" ) );
}

TEST_F( host_runtime, concurrent_calls )
{
  hospes::runtime::runtime_options options;
  options.max_concurrent_instances = 4;
  options.pool_size                = 4;

  auto& rt    = start( options );
  auto handle = rt.load( hasher_program(), hasher_schema() );
  ASSERT_TRUE( handle ) << handle.error().message();

  std::vector< std::vector< std::byte > > inputs;
  std::vector< std::future< hospes::runtime::call_result > > futures;
  for( std::size_t i = 0; i < 32; i++ )
  {
    inputs.emplace_back( i + 1, std::byte( i ) );
    futures.push_back( rt.invoke_async( *handle, "compute_hash", { value::bytes( inputs.back() ) } ) );
  }

  for( std::size_t i = 0; i < futures.size(); i++ )
    EXPECT_EQ( single( futures[ i ].get() ), value::string( expected_hash( inputs[ i ] ) ) );

  auto stats = rt.stats();
  EXPECT_LE( stats.live, 4u );
  EXPECT_GE( stats.live, 1u );
  EXPECT_EQ( stats.executing, 0u );
  EXPECT_EQ( stats.queued, 0u );
  EXPECT_EQ( stats.discarded, 0u );
}

TEST_F( host_runtime, pool_grows_to_concurrency )
{
  hospes::runtime::runtime_options options;
  options.max_concurrent_instances = 2;
  options.pool_size                = 2;

  auto& rt    = start( options, true );
  auto handle = load_guest();

  auto first  = rt.invoke_async( handle, "print", { value::string( "a" ) } );
  auto second = rt.invoke_async( handle, "print", { value::string( "bc" ) } );
  _gate->wait_entered( 2 );

  auto stats = rt.stats();
  EXPECT_EQ( stats.live, 2u );
  EXPECT_EQ( stats.executing, 2u );
  EXPECT_EQ( stats.idle, 0u );

  _gate->open();
  EXPECT_EQ( single( first.get() ), value::u32( 1 ) );
  EXPECT_EQ( single( second.get() ), value::u32( 2 ) );

  stats = rt.stats();
  EXPECT_EQ( stats.idle, 2u );
  EXPECT_EQ( stats.executing, 0u );
}

TEST_F( host_runtime, pool_size_bounds_instances )
{
  hospes::runtime::runtime_options options;
  options.max_concurrent_instances = 2;
  options.pool_size                = 1;

  auto& rt    = start( options, true );
  auto handle = load_guest();

  auto printing = rt.invoke_async( handle, "print", { value::string( "x" ) } );
  _gate->wait_entered( 1 );

  // A slot is free but the pool may not grow, so the call waits for the instance.
  auto adding = rt.invoke_async( handle, "add", { value::s32( 20 ), value::s32( 22 ) } );
  ASSERT_TRUE( eventually(
    [ & ]
    {
      return rt.stats().queued == 1;
    } ) );
  EXPECT_EQ( rt.stats().live, 1u );

  _gate->open();
  EXPECT_EQ( single( printing.get() ), value::u32( 1 ) );
  EXPECT_EQ( single( adding.get() ), value::s32( 42 ) );
  EXPECT_EQ( rt.stats().live, 1u );
}

TEST_F( host_runtime, reject_when_saturated )
{
  auto& rt    = start( serial( hospes::runtime::overflow_policy::reject ), true );
  auto handle = load_guest();

  auto printing = rt.invoke_async( handle, "print", { value::string( "busy" ) } );
  _gate->wait_entered( 1 );

  auto rejected = rt.invoke( handle, "add", std::vector< value >{ value::s32( 1 ), value::s32( 2 ) } );
  ASSERT_FALSE( rejected );
  EXPECT_EQ( rejected.error().code(), runtime_errc::capacity_exceeded );
  EXPECT_EQ( rejected.error().phase(), fault_phase::queue );
  EXPECT_EQ( rejected.error().function(), "add" );
  EXPECT_EQ( rejected.error().detail(), "no execution slot is free and the overflow policy is reject" );

  auto refused = rt.invoke_async( handle, "add", { value::s32( 1 ), value::s32( 2 ) } );
  ASSERT_EQ( refused.wait_for( 0s ), std::future_status::ready );
  auto refusal = refused.get();
  ASSERT_FALSE( refusal );
  EXPECT_EQ( refusal.error().code(), runtime_errc::capacity_exceeded );
  EXPECT_EQ( refusal.error().phase(), fault_phase::queue );

  _gate->open();
  EXPECT_EQ( single( printing.get() ), value::u32( 4 ) );
  EXPECT_EQ( single( rt.invoke( handle, "add", std::vector< value >{ value::s32( 1 ), value::s32( 2 ) } ) ),
             value::s32( 3 ) );
}

TEST_F( host_runtime, queue_is_fifo_and_bounded )
{
  auto options           = serial( hospes::runtime::overflow_policy::queue );
  options.queue_capacity = 2;

  auto& rt    = start( options, true );
  auto handle = load_guest();

  auto printing = rt.invoke_async( handle, "print", { value::string( "hold" ) } );
  _gate->wait_entered( 1 );

  auto first = rt.invoke_async( handle, "count", {} );
  ASSERT_TRUE( eventually(
    [ & ]
    {
      return rt.stats().queued == 1;
    } ) );

  auto second = rt.invoke_async( handle, "count", {} );
  ASSERT_TRUE( eventually(
    [ & ]
    {
      return rt.stats().queued == 2;
    } ) );

  auto overflow = rt.invoke( handle, "count", {} );
  ASSERT_FALSE( overflow );
  EXPECT_EQ( overflow.error().code(), runtime_errc::capacity_exceeded );
  EXPECT_EQ( overflow.error().phase(), fault_phase::queue );
  EXPECT_EQ( overflow.error().detail(), "admission queue is full at 2 calls" );

  _gate->open();
  EXPECT_EQ( single( printing.get() ), value::u32( 4 ) );

  // One instance serves the queue in arrival order.
  EXPECT_EQ( single( first.get() ), value::u32( 1 ) );
  EXPECT_EQ( single( second.get() ), value::u32( 2 ) );
  EXPECT_EQ( rt.stats().queued, 0u );
}

TEST_F( host_runtime, async_calls_share_the_queue )
{
  auto options           = serial( hospes::runtime::overflow_policy::queue );
  options.queue_capacity = 4;

  auto& rt    = start( options, true );
  auto handle = load_guest();

  auto printing = rt.invoke_async( handle, "print", { value::string( "hold" ) } );
  _gate->wait_entered( 1 );

  std::vector< std::future< hospes::runtime::call_result > > counts;
  for( std::size_t i = 0; i < 7; i++ )
    counts.push_back( rt.invoke_async( handle, "count", {} ) );

  // Places in line are taken on submission, so the overflow is refused at once.
  EXPECT_EQ( rt.stats().queued, 4u );
  for( std::size_t i = 4; i < counts.size(); i++ )
  {
    ASSERT_EQ( counts[ i ].wait_for( 0s ), std::future_status::ready );
    auto refused = counts[ i ].get();
    ASSERT_FALSE( refused );
    EXPECT_EQ( refused.error().code(), runtime_errc::capacity_exceeded );
    EXPECT_EQ( refused.error().phase(), fault_phase::queue );
    EXPECT_EQ( refused.error().detail(), "admission queue is full at 4 calls" );
  }

  _gate->open();
  EXPECT_EQ( single( printing.get() ), value::u32( 4 ) );

  // Dispatcher threads race, but admission follows submission order.
  for( std::uint32_t i = 0; i < 4; i++ )
    EXPECT_EQ( single( counts[ i ].get() ), value::u32( i + 1 ) );

  auto stats = rt.stats();
  EXPECT_EQ( stats.queued, 0u );
  EXPECT_EQ( stats.executing, 0u );
}

TEST_F( host_runtime, unwinding_calls_free_their_slot )
{
  auto& rt    = start( serial( hospes::runtime::overflow_policy::reject ) );
  auto handle = load_guest();

  const std::vector< value > payload{ value::bytes( schema::byte_buffer( 2 * 1'024 * 1'024, std::byte{ 7 } ) ) };

  // Grows guest memory up front so the failing call only allocates on the host when lifting.
  ASSERT_EQ( single( rt.invoke( handle, "echo_bytes", payload ) ), payload.front() );

  fail_allocation_over = 1'024 * 1'024;
  EXPECT_THROW( rt.invoke( handle, "echo_bytes", payload ), std::bad_alloc );
  fail_allocation_over = 0;

  auto stats = rt.stats();
  EXPECT_EQ( stats.executing, 0u );
  EXPECT_EQ( stats.live, 0u );
  EXPECT_EQ( stats.discarded, 1u );

  // Under the reject policy a leaked slot would refuse this call.
  EXPECT_EQ( single( rt.invoke( handle, "count", {} ) ), value::u32( 1 ) );
  EXPECT_EQ( rt.stats().live, 1u );
  EXPECT_EQ( rt.stats().executing, 0u );
}

TEST_F( host_runtime, timeouts )
{
  auto options                = serial( hospes::runtime::overflow_policy::queue );
  options.limits.call_timeout = 100ms;

  auto& rt    = start( options, true );
  auto handle = load_guest();

  auto stuck = rt.invoke_async( handle, "print", { value::string( "never" ) } );
  _gate->wait_entered( 1 );

  auto waited = rt.invoke( handle, "add", std::vector< value >{ value::s32( 1 ), value::s32( 1 ) } );
  ASSERT_FALSE( waited );
  EXPECT_EQ( waited.error().code(), runtime_errc::timeout );
  EXPECT_EQ( waited.error().phase(), fault_phase::queue );

  auto abandoned = stuck.get();
  ASSERT_FALSE( abandoned );
  EXPECT_EQ( abandoned.error().code(), runtime_errc::timeout );
  EXPECT_EQ( abandoned.error().phase(), fault_phase::execute );
  EXPECT_EQ( abandoned.error().detail(), "call exceeded the 100 ms timeout" );

  // The abandoned instance holds its slot until the guest returns, then it is discarded.
  EXPECT_EQ( rt.stats().executing, 1u );
  _gate->open();
  ASSERT_TRUE( eventually(
    [ & ]
    {
      return rt.stats().executing == 0;
    } ) );

  auto stats = rt.stats();
  EXPECT_EQ( stats.discarded, 1u );
  EXPECT_EQ( stats.live, 0u );

  EXPECT_EQ( single( rt.invoke( handle, "count", {} ) ), value::u32( 1 ) );
  EXPECT_EQ( rt.stats().live, 1u );
}

TEST_F( host_runtime, faulted_instances_are_replaced )
{
  auto& rt    = start();
  auto handle = load_guest();

  EXPECT_EQ( single( rt.invoke( handle, "count", {} ) ), value::u32( 1 ) );

  auto trapped = rt.invoke( handle, "fail", {} );
  ASSERT_FALSE( trapped );
  EXPECT_EQ( trapped.error().code(), runtime_errc::trapped );

  auto stats = rt.stats();
  EXPECT_EQ( stats.discarded, 1u );
  EXPECT_EQ( stats.live, 0u );

  // The replacement starts from a fresh guest state.
  EXPECT_EQ( single( rt.invoke( handle, "count", {} ) ), value::u32( 1 ) );
  EXPECT_EQ( single( rt.invoke( handle, "ready", {} ) ), value::boolean( true ) );

  auto exited = rt.invoke( handle, "exit", std::vector< value >{ value::s32( 7 ) } );
  ASSERT_FALSE( exited );
  EXPECT_EQ( exited.error().code(), runtime_errc::guest_exit );
  EXPECT_EQ( _host->exits(), std::vector< std::int32_t >{ 7 } );
  EXPECT_EQ( rt.stats().discarded, 2u );
}

TEST_F( host_runtime, call_faults_keep_the_instance )
{
  auto& rt    = start();
  auto handle = load_guest();

  EXPECT_EQ( single( rt.invoke( handle, "count", {} ) ), value::u32( 1 ) );

  auto mistyped = rt.invoke( handle, "add", std::vector< value >{ value::string( "two" ), value::s32( 2 ) } );
  ASSERT_FALSE( mistyped );
  EXPECT_EQ( mistyped.error().code(), runtime_errc::encoding_fault );
  EXPECT_EQ( mistyped.error().phase(), fault_phase::lower );

  auto malformed = rt.invoke( handle, "bad_utf8", {} );
  ASSERT_FALSE( malformed );
  EXPECT_EQ( malformed.error().code(), runtime_errc::encoding_fault );
  EXPECT_EQ( malformed.error().phase(), fault_phase::lift );

  auto missing = rt.invoke( handle, "nope", {} );
  ASSERT_FALSE( missing );
  EXPECT_EQ( missing.error().code(), runtime_errc::function_not_found );

  EXPECT_EQ( rt.stats().discarded, 0u );
  EXPECT_EQ( single( rt.invoke( handle, "count", {} ) ), value::u32( 2 ) );
}

TEST_F( host_runtime, unload )
{
  auto& rt    = start();
  auto handle = load_guest();

  ASSERT_TRUE( rt.unload( handle ) );
  EXPECT_EQ( rt.component( handle ), nullptr );

  auto stats = rt.stats();
  EXPECT_EQ( stats.loaded, 0u );
  EXPECT_EQ( stats.live, 0u );

  auto gone = rt.invoke( handle, "count", {} );
  ASSERT_FALSE( gone );
  EXPECT_EQ( gone.error().code(), runtime_errc::unknown_component );

  auto again = rt.unload( handle );
  ASSERT_FALSE( again );
  EXPECT_EQ( again.error().code(), runtime_errc::unknown_component );
}

TEST_F( host_runtime, unload_while_queued )
{
  auto& rt    = start( serial( hospes::runtime::overflow_policy::queue ), true );
  auto handle = load_guest();

  auto printing = rt.invoke_async( handle, "print", { value::string( "hold" ) } );
  _gate->wait_entered( 1 );

  auto queued = rt.invoke_async( handle, "count", {} );
  ASSERT_TRUE( eventually(
    [ & ]
    {
      return rt.stats().queued == 1;
    } ) );

  ASSERT_TRUE( rt.unload( handle ) );

  auto dropped = queued.get();
  ASSERT_FALSE( dropped );
  EXPECT_EQ( dropped.error().code(), runtime_errc::unknown_component );
  EXPECT_EQ( dropped.error().phase(), fault_phase::queue );

  // The running call completes on its instance, which is then torn down.
  _gate->open();
  EXPECT_EQ( single( printing.get() ), value::u32( 4 ) );
  EXPECT_EQ( rt.stats().live, 0u );
}

TEST_F( host_runtime, shutdown )
{
  auto& rt    = start( serial( hospes::runtime::overflow_policy::queue ), true );
  auto handle = load_guest();

  auto printing = rt.invoke_async( handle, "print", { value::string( "last" ) } );
  _gate->wait_entered( 1 );

  auto queued = rt.invoke_async( handle, "count", {} );
  ASSERT_TRUE( eventually(
    [ & ]
    {
      return rt.stats().queued == 1;
    } ) );

  std::thread stopping(
    [ & ]
    {
      rt.shutdown();
    } );

  auto dropped = queued.get();
  EXPECT_FALSE( dropped );
  if( !dropped )
    EXPECT_EQ( dropped.error().code(), runtime_errc::runtime_stopped );

  _gate->open();
  stopping.join();

  EXPECT_EQ( single( printing.get() ), value::u32( 4 ) );

  auto after = rt.invoke( handle, "count", {} );
  ASSERT_FALSE( after );
  EXPECT_EQ( after.error().code(), runtime_errc::runtime_stopped );

  auto later = rt.invoke_async( handle, "count", {} ).get();
  ASSERT_FALSE( later );
  EXPECT_EQ( later.error().code(), runtime_errc::runtime_stopped );

  auto reload = rt.load( guest_program(), guest_schema() );
  ASSERT_FALSE( reload );
  EXPECT_EQ( reload.error().code(), runtime_errc::runtime_stopped );

  auto stats = rt.stats();
  EXPECT_EQ( stats.loaded, 0u );
  EXPECT_EQ( stats.executing, 0u );

  rt.shutdown();
}

// NOLINTEND
