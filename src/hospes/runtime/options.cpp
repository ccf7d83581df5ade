#include <hospes/runtime/options.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace hospes::runtime {

namespace {

template< typename T >
void read( const YAML::Node& node, std::string_view key, T& out )
{
  auto value = node[ std::string( key ) ];
  if( !value )
    return;

  try
  {
    out = value.as< T >();
  }
  catch( const YAML::BadConversion& )
  {
    throw std::invalid_argument( "option '" + std::string( key ) + "' has an invalid value" );
  }
}

} // namespace

std::string_view to_string( overflow_policy p ) noexcept
{
  using namespace std::string_view_literals;
  switch( p )
  {
    case overflow_policy::queue:
      return "queue"sv;
    case overflow_policy::reject:
      return "reject"sv;
  }
  std::unreachable();
}

overflow_policy overflow_policy_from_string( std::string_view name )
{
  if( name == to_string( overflow_policy::queue ) )
    return overflow_policy::queue;

  if( name == to_string( overflow_policy::reject ) )
    return overflow_policy::reject;

  throw std::invalid_argument( "unknown overflow policy '" + std::string( name ) + "'" );
}

runtime_options load_options( const YAML::Node& node, runtime_options options )
{
  if( !node || node.IsNull() )
    return options;

  if( !node.IsMap() )
    throw std::invalid_argument( "runtime options must be a map" );

  read( node, option::max_memory_pages, options.limits.max_memory_pages );
  read( node, option::max_stack_bytes, options.limits.max_stack_bytes );
  read( node, option::step_budget, options.limits.step_budget );

  std::uint64_t timeout_ms = options.limits.call_timeout.count();
  read( node, option::call_timeout_ms, timeout_ms );
  options.limits.call_timeout = std::chrono::milliseconds( timeout_ms );

  read( node, option::max_concurrent_instances, options.max_concurrent_instances );
  read( node, option::pool_size, options.pool_size );
  read( node, option::cache_validated_modules, options.cache_validated_modules );
  read( node, option::module_cache_size, options.module_cache_size );
  read( node, option::queue_capacity, options.queue_capacity );

  std::string policy( to_string( options.overflow ) );
  read( node, option::overflow_policy, policy );
  options.overflow = overflow_policy_from_string( policy );

  return options;
}

void check_options( const runtime_options& options )
{
  if( !options.max_concurrent_instances )
    throw std::invalid_argument( std::string( option::max_concurrent_instances ) + " must be positive" );

  if( !options.pool_size )
    throw std::invalid_argument( std::string( option::pool_size ) + " must be positive" );

  if( options.cache_validated_modules && !options.module_cache_size )
    throw std::invalid_argument( std::string( option::module_cache_size ) + " must be positive when caching" );

  if( !options.limits.step_budget )
    throw std::invalid_argument( std::string( option::step_budget ) + " must be positive" );

  if( options.limits.max_memory_pages > vm::max_memory_pages_limit )
    throw std::invalid_argument( std::string( option::max_memory_pages ) + " may not exceed "
                                 + std::to_string( vm::max_memory_pages_limit ) );

  if( options.limits.max_stack_bytes < vm::stack_frame_bytes )
    throw std::invalid_argument( std::string( option::max_stack_bytes ) + " must be at least "
                                 + std::to_string( vm::stack_frame_bytes ) );
}

} // namespace hospes::runtime
