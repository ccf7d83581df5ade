#include <hospes/log/log.hpp>
#include <hospes/runtime/runtime.hpp>
#include <hospes/vm/module.hpp>

#include "module_cache.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/post.hpp>

namespace hospes::runtime {

namespace {

constexpr std::size_t max_dispatch_threads = 16;

runtime_options checked( runtime_options options )
{
  check_options( options );
  return options;
}

fault queue_fault( runtime_errc e, std::string_view function, std::string detail = {} )
{
  return fault( e, fault_phase::queue, std::string( function ), std::move( detail ) );
}

} // namespace

host_runtime::host_runtime( runtime_options options, std::shared_ptr< vm::host_api > hapi ):
    _options( checked( std::move( options ) ) ),
    _hapi( hapi ? std::move( hapi ) : std::make_shared< vm::logging_host_api >() ),
    _workers( _options.max_concurrent_instances ),
    _dispatcher( _options.max_concurrent_instances + std::min( _options.queue_capacity, max_dispatch_threads ) )
{
  if( _options.cache_validated_modules )
    _cache = std::make_unique< module_cache >( _options.module_cache_size );

  LOG_INFO( log::instance(),
            "Runtime started - Concurrency: {}, Pool size: {}, Overflow: {}, Step budget: {}",
            _options.max_concurrent_instances,
            _options.pool_size,
            to_string( _options.overflow ),
            _options.limits.step_budget );
}

host_runtime::~host_runtime()
{
  shutdown();
}

result< component_handle > host_runtime::load( std::span< const std::byte > module_bytes,
                                               schema::interface_schema schema )
{
  {
    std::lock_guard< std::mutex > lock( _mutex );
    if( _stopped )
      return std::unexpected( fault( runtime_errc::runtime_stopped, fault_phase::load ) );
  }

  component_handle handle{ vm::component_id( crypto::hash( module_bytes ), schema ) };

  {
    std::lock_guard< std::mutex > lock( _mutex );
    if( _pools.contains( handle.id ) )
    {
      LOG_DEBUG( log::instance(), "Component {} is already loaded", log::hex{ handle.id.data(), handle.id.size() } );
      return handle;
    }
  }

  vm::component_ptr component;
  if( _cache )
    component = _cache->get_component( handle.id );

  if( component )
  {
    LOG_DEBUG( log::instance(), "Validated module cache hit for {}", log::hex{ handle.id.data(), handle.id.size() } );
  }
  else
  {
    auto code = vm::parse_module( module_bytes );
    if( !code )
      return std::unexpected( code.error() );

    auto made = vm::make_component( *code, std::move( schema ) );
    if( !made )
      return std::unexpected( made.error() );

    component = *made;
    if( _cache )
      _cache->put_component( handle.id, component );
  }

  auto first = vm::instance::instantiate( component, _options.limits, _hapi );
  if( !first )
    return std::unexpected( first.error() );

  auto p       = std::make_shared< pool >();
  p->component = component;
  p->idle.push_back( *first );
  p->live = 1;

  bool inserted = false;
  bool stopped  = false;
  {
    std::lock_guard< std::mutex > lock( _mutex );
    stopped = _stopped;
    if( !stopped )
      inserted = _pools.try_emplace( handle.id, p ).second;
  }

  if( !inserted )
    ( *first )->teardown();

  if( stopped )
    return std::unexpected( fault( runtime_errc::runtime_stopped, fault_phase::load ) );

  if( inserted )
    LOG_INFO( log::instance(),
              "Loaded component {} with {} functions",
              log::hex{ handle.id.data(), handle.id.size() },
              component->bindings.functions().size() );

  return handle;
}

result< void > host_runtime::unload( const component_handle& handle )
{
  std::vector< vm::instance_ptr > idle;

  {
    std::lock_guard< std::mutex > lock( _mutex );
    auto it = _pools.find( handle.id );
    if( it == _pools.end() )
      return std::unexpected(
        fault( runtime_errc::unknown_component, fault_phase::none, {}, "no component is loaded under this handle" ) );

    idle = std::move( it->second->idle );
    it->second->live -= idle.size();
    _pools.erase( it );
  }

  _cv.notify_all();

  for( auto& inst: idle )
    inst->teardown();

  LOG_INFO( log::instance(), "Unloaded component {}", log::hex{ handle.id.data(), handle.id.size() } );

  return {};
}

host_runtime::slot::slot( host_runtime& rt ) noexcept:
    _runtime( &rt )
{}

host_runtime::slot::slot( slot&& other ) noexcept:
    _runtime( other._runtime ),
    _owner( other._owner ),
    _instance( std::move( other._instance ) ),
    _ticket( std::exchange( other._ticket, std::nullopt ) ),
    _reserved( std::exchange( other._reserved, false ) ),
    _state( std::move( other._state ) )
{}

host_runtime::slot::~slot()
{
  _runtime->give_back( *this );
}

bool host_runtime::admissible( const pool& p ) const noexcept
{
  if( _executing >= _options.max_concurrent_instances )
    return false;

  return !p.idle.empty() || p.live < _options.pool_size;
}

result< void > host_runtime::enqueue( slot& s, const component_handle& handle, std::string_view function )
{
  if( _stopped )
    return std::unexpected( queue_fault( runtime_errc::runtime_stopped, function ) );

  auto it = _pools.find( handle.id );
  if( it == _pools.end() )
    return std::unexpected(
      queue_fault( runtime_errc::unknown_component, function, "no component is loaded under this handle" ) );

  s._owner = it->second;

  if( !s._owner->component->bindings.find( function ) )
    return std::unexpected( fault( runtime_errc::function_not_found,
                                   fault_phase::execute,
                                   std::string( function ),
                                   "the schema declares no such function" ) );

  if( _waiting.empty() && admissible( *s._owner ) )
  {
    reserve( s );
    return {};
  }

  if( _options.overflow == overflow_policy::reject )
    return std::unexpected( queue_fault( runtime_errc::capacity_exceeded,
                                         function,
                                         "no execution slot is free and the overflow policy is reject" ) );

  if( _waiting.size() >= _options.queue_capacity )
    return std::unexpected( queue_fault( runtime_errc::capacity_exceeded,
                                         function,
                                         "admission queue is full at " + std::to_string( _options.queue_capacity )
                                           + " calls" ) );

  s._ticket = _next_ticket++;
  _waiting.push_back( *s._ticket );
  return {};
}

void host_runtime::reserve( slot& s ) noexcept
{
  auto& p = *s._owner;
  if( !p.idle.empty() )
  {
    s._instance = std::move( p.idle.back() );
    p.idle.pop_back();
  }
  else
  {
    p.live++;
  }

  _executing++;
  s._reserved = true;
}

result< void >
host_runtime::admit( slot& s, std::string_view function, const std::optional< clock::time_point >& deadline )
{
  std::unique_lock< std::mutex > lock( _mutex );

  if( s._ticket )
  {
    auto ticket     = *s._ticket;
    pool_ptr latest = s._owner;

    auto ready = [ & ]()
    {
      if( _stopped )
        return true;

      auto it = _pools.find( s._owner->component->id );
      latest  = it == _pools.end() ? nullptr : it->second;
      if( !latest )
        return true;

      return _waiting.front() == ticket && admissible( *latest );
    };

    bool admitted = true;
    if( deadline )
      admitted = _cv.wait_until( lock, *deadline, ready );
    else
      _cv.wait( lock, ready );

    _waiting.erase( std::ranges::find( _waiting, ticket ) );
    s._ticket.reset();
    _cv.notify_all();

    if( _stopped )
      return std::unexpected( queue_fault( runtime_errc::runtime_stopped, function ) );

    if( !latest )
      return std::unexpected(
        queue_fault( runtime_errc::unknown_component, function, "the component was unloaded while the call was queued" ) );

    if( !admitted )
      return std::unexpected( queue_fault( runtime_errc::timeout,
                                           function,
                                           "no execution slot became free within "
                                             + std::to_string( _options.limits.call_timeout.count() ) + " ms" ) );

    s._owner = latest;
    reserve( s );
  }

  lock.unlock();

  if( s._instance )
    return {};

  // Replacements are created outside the lock with their slot already reserved.
  const auto& component = s._owner->component;
  auto created          = vm::instance::instantiate( component, _options.limits, _hapi );
  if( !created )
  {
    LOG_WARNING( log::instance(),
                 "Could not create an instance of component {}: {}",
                 log::hex{ component->id.data(), component->id.size() },
                 created.error().message() );

    return std::unexpected( std::move( created.error() ).during( function ) );
  }

  LOG_DEBUG( log::instance(),
             "Created a new instance of component {}",
             log::hex{ component->id.data(), component->id.size() } );

  s._instance = std::move( *created );
  return {};
}

void host_runtime::give_back( slot& s ) noexcept
{
  if( !s._reserved )
  {
    if( s._ticket )
    {
      {
        std::lock_guard< std::mutex > lock( _mutex );
        _waiting.erase( std::ranges::find( _waiting, *s._ticket ) );
      }

      s._ticket.reset();
      _cv.notify_all();
    }

    return;
  }

  s._reserved = false;
  auto& owner = *s._owner;

  // The instance was never created.
  if( !s._instance )
  {
    {
      std::lock_guard< std::mutex > lock( _mutex );
      owner.live--;
      _executing--;
    }

    _cv.notify_all();
    return;
  }

  auto inst      = std::move( s._instance );
  bool discard   = false;
  auto condition = inst->state();

  {
    std::lock_guard< std::mutex > lock( _mutex );
    _executing--;

    bool timed_out = false;
    if( s._state )
    {
      s._state->finished = true;
      timed_out          = s._state->timed_out;
    }

    auto it      = _pools.find( owner.component->id );
    bool current = it != _pools.end() && it->second == s._owner;

    if( !current || _stopped || timed_out || condition != vm::instance_state::ready )
    {
      discard = true;
      owner.live--;
      if( condition == vm::instance_state::faulted || timed_out )
        _discarded++;
    }
    else
    {
      owner.idle.push_back( inst );
    }
  }

  _cv.notify_all();

  if( discard )
  {
    inst->teardown();

    if( condition == vm::instance_state::faulted )
      LOG_INFO( log::instance(),
                "Discarded a faulted instance of component {}, a replacement is created on demand",
                log::hex{ owner.component->id.data(), owner.component->id.size() } );
  }
}

call_result host_runtime::run( slot& s,
                               std::string_view function,
                               std::span< const schema::value > args,
                               const std::optional< clock::time_point >& deadline )
{
  if( !deadline )
    return s._instance->call( function, args );

  auto inst  = s._instance;
  auto state = std::make_shared< call_state >();
  s._state   = state;

  auto held = std::make_shared< slot >( std::move( s ) );
  auto task = std::make_shared< std::packaged_task< call_result() > >(
    [ held,
      name   = std::string( function ),
      values = std::vector< schema::value >( args.begin(), args.end() ) ]()
    {
      // Returned to the runtime before the outcome is published.
      slot running( std::move( *held ) );
      return running._instance->call( name, values );
    } );

  auto future = task->get_future();
  boost::asio::post( _workers, [ task ]() { ( *task )(); } );

  if( future.wait_until( *deadline ) == std::future_status::ready )
    return future.get();

  {
    std::lock_guard< std::mutex > lock( _mutex );
    if( !state->finished )
    {
      state->timed_out = true;
      inst->abandon();

      LOG_WARNING( log::instance(),
                   "Call to '{}' exceeded the {} ms timeout, abandoning its instance",
                   function,
                   _options.limits.call_timeout.count() );

      return std::unexpected( fault( runtime_errc::timeout,
                                     fault_phase::execute,
                                     std::string( function ),
                                     "call exceeded the " + std::to_string( _options.limits.call_timeout.count() )
                                       + " ms timeout" ) );
    }
  }

  // The call finished while the timeout was being handled.
  return future.get();
}

call_result
host_runtime::invoke( const component_handle& handle, std::string_view function, std::span< const schema::value > args )
{
  std::optional< clock::time_point > deadline;
  if( _options.limits.call_timeout.count() > 0 )
    deadline = clock::now() + _options.limits.call_timeout;

  slot s( *this );

  {
    std::lock_guard< std::mutex > lock( _mutex );
    if( auto queued = enqueue( s, handle, function ); !queued )
      return std::unexpected( queued.error() );
  }

  if( auto admitted = admit( s, function, deadline ); !admitted )
    return std::unexpected( admitted.error() );

  return run( s, function, args, deadline );
}

std::future< call_result >
host_runtime::invoke_async( const component_handle& handle, std::string function, std::vector< schema::value > args )
{
  // Timeouts count from submission.
  std::optional< clock::time_point > deadline;
  if( _options.limits.call_timeout.count() > 0 )
    deadline = clock::now() + _options.limits.call_timeout;

  auto pending = std::make_shared< slot >( *this );
  auto task    = std::make_shared< std::packaged_task< call_result() > >(
    [ this, pending, deadline, name = function, values = std::move( args ) ]() -> call_result
    {
      slot s( std::move( *pending ) );
      if( auto admitted = admit( s, name, deadline ); !admitted )
        return std::unexpected( admitted.error() );

      return run( s, name, values, deadline );
    } );

  auto future = task->get_future();

  // The call takes its place in line, or is refused, before it is handed to a dispatcher thread.
  std::lock_guard< std::mutex > lock( _mutex );

  if( auto queued = enqueue( *pending, handle, function ); !queued )
  {
    std::promise< call_result > refused;
    refused.set_value( std::unexpected( queued.error() ) );
    return refused.get_future();
  }

  // Posted under the lock so shutdown cannot join the dispatcher before the task is queued.
  boost::asio::post( _dispatcher, [ task ]() { ( *task )(); } );

  return future;
}

void host_runtime::shutdown() noexcept
{
  {
    std::lock_guard< std::mutex > lock( _mutex );
    if( _stopped )
      return;

    _stopped = true;
  }

  _cv.notify_all();

  _dispatcher.join();
  _workers.join();

  std::map< crypto::digest, pool_ptr > pools;
  {
    std::lock_guard< std::mutex > lock( _mutex );
    pools.swap( _pools );
  }

  for( auto& [ id, p ]: pools )
  {
    for( auto& inst: p->idle )
      inst->teardown();

    p->live -= p->idle.size();
    p->idle.clear();
  }

  LOG_INFO( log::instance(), "Runtime stopped" );
}

vm::component_ptr host_runtime::component( const component_handle& handle ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  auto it = _pools.find( handle.id );
  if( it == _pools.end() )
    return nullptr;

  return it->second->component;
}

const runtime_options& host_runtime::options() const noexcept
{
  return _options;
}

runtime_stats host_runtime::stats() const
{
  runtime_stats s;

  {
    std::lock_guard< std::mutex > lock( _mutex );
    s.loaded    = _pools.size();
    s.executing = _executing;
    s.queued    = _waiting.size();
    s.discarded = _discarded;

    for( const auto& [ id, p ]: _pools )
    {
      s.idle += p->idle.size();
      s.live += p->live;
    }
  }

  if( _cache )
  {
    s.cache_hits   = _cache->hits();
    s.cache_misses = _cache->misses();
  }

  return s;
}

} // namespace hospes::runtime
