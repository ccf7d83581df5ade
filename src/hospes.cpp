#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <ostream>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <hospes/log/log.hpp>
#include <hospes/runtime/options.hpp>
#include <hospes/runtime/runtime.hpp>
#include <hospes/schema/loader.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto help_option       = "help,h"s;
constexpr auto version_option    = "version,v"s;
constexpr auto module_option     = "module,m"s;
constexpr auto schema_option     = "schema,s"s;
constexpr auto function_option   = "function,f"s;
constexpr auto arg_option        = "arg,a"s;
constexpr auto config_option     = "config,c"s;
constexpr auto log_level_option  = "log-level,l"s;
constexpr auto log_level_default = "info"s;
constexpr auto service_section   = "hospes"s;
constexpr auto global_section    = "global"s;

} // namespace constants

namespace {

std::string long_name( const std::string& option )
{
  return option.substr( 0, option.find( ',' ) );
}

std::vector< std::byte > read_file( const std::filesystem::path& path )
{
  std::ifstream ifs( path, std::ios::binary );
  if( !ifs )
    throw std::runtime_error( "unable to open " + path.string() );

  std::vector< char > contents( ( std::istreambuf_iterator< char >( ifs ) ), std::istreambuf_iterator< char >() );

  std::vector< std::byte > bytes( contents.size() );
  std::ranges::transform( contents, bytes.begin(), []( char c ) { return std::byte( c ); } );
  return bytes;
}

template< typename T >
void override_option( const boost::program_options::variables_map& args, std::string_view key, T& out )
{
  if( args.count( std::string( key ) ) )
    out = args[ std::string( key ) ].as< T >();
}

std::string config_log_level( const YAML::Node& service_config, const YAML::Node& global_config )
{
  const auto key = long_name( constants::log_level_option );

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< std::string >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< std::string >();

  return constants::log_level_default;
}

} // namespace

using namespace boost;
using namespace hospes;

auto main( int argc, char** argv ) -> int
{
  log::initialize();

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()                , "Print this help message and exit" )
      ( constants::version_option.data()             , "Print version string and exit" )
      ( constants::module_option.data()              , program_options::value< std::string >(), "The WebAssembly module to load" )
      ( constants::schema_option.data()              , program_options::value< std::string >(), "The YAML interface schema of the module" )
      ( constants::function_option.data()            , program_options::value< std::string >(), "The exported function to invoke" )
      ( constants::arg_option.data()                 , program_options::value< std::vector< std::string > >(), "A YAML argument value, repeated once per parameter" )
      ( constants::config_option.data()              , program_options::value< std::string >(), "A YAML configuration file" )
      ( constants::log_level_option.data()           , program_options::value< std::string >(), "The log filtering level" )
      ( runtime::option::max_memory_pages.data()     , program_options::value< std::uint32_t >(), "Linear memory limit in 64 KiB pages" )
      ( runtime::option::max_stack_bytes.data()      , program_options::value< std::uint64_t >(), "Call stack limit in bytes" )
      ( runtime::option::step_budget.data()          , program_options::value< std::uint64_t >(), "Execution steps allowed per call" )
      ( runtime::option::call_timeout_ms.data()      , program_options::value< std::uint64_t >(), "Wall clock limit per call in milliseconds, 0 to disable" )
      ( runtime::option::max_concurrent_instances.data(), program_options::value< std::size_t >(), "Instances allowed to execute at once" )
      ( runtime::option::pool_size.data()            , program_options::value< std::size_t >(), "Instances kept per loaded component" )
      ( runtime::option::cache_validated_modules.data(), program_options::value< bool >(), "Keep validated modules for reloading" )
      ( runtime::option::module_cache_size.data()    , program_options::value< std::size_t >(), "Validated modules kept in the cache" )
      ( runtime::option::overflow_policy.data()      , program_options::value< std::string >(), "Either 'queue' or 'reject'" )
      ( runtime::option::queue_capacity.data()       , program_options::value< std::size_t >(), "Calls allowed to wait for an execution slot" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );
    program_options::notify( args );

    if( args.count( long_name( constants::help_option ) ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( long_name( constants::version_option ) ) )
    {
      std::println( "v0.1.0" );
      return EXIT_SUCCESS;
    }

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node service_config;

    if( args.count( long_name( constants::config_option ) ) )
    {
      config         = YAML::LoadFile( args[ long_name( constants::config_option ) ].as< std::string >() );
      global_config  = config[ constants::global_section ];
      service_config = config[ constants::service_section ];
    }

    runtime::runtime_options opts;
    if( global_config )
      opts = runtime::load_options( global_config, opts );
    if( service_config )
      opts = runtime::load_options( service_config, opts );

    override_option( args, runtime::option::max_memory_pages, opts.limits.max_memory_pages );
    override_option( args, runtime::option::max_stack_bytes, opts.limits.max_stack_bytes );
    override_option( args, runtime::option::step_budget, opts.limits.step_budget );
    override_option( args, runtime::option::max_concurrent_instances, opts.max_concurrent_instances );
    override_option( args, runtime::option::pool_size, opts.pool_size );
    override_option( args, runtime::option::cache_validated_modules, opts.cache_validated_modules );
    override_option( args, runtime::option::module_cache_size, opts.module_cache_size );
    override_option( args, runtime::option::queue_capacity, opts.queue_capacity );

    if( args.count( std::string( runtime::option::call_timeout_ms ) ) )
      opts.limits.call_timeout =
        std::chrono::milliseconds( args[ std::string( runtime::option::call_timeout_ms ) ].as< std::uint64_t >() );

    if( args.count( std::string( runtime::option::overflow_policy ) ) )
      opts.overflow = runtime::overflow_policy_from_string(
        args[ std::string( runtime::option::overflow_policy ) ].as< std::string >() );

    auto log_level = config_log_level( service_config, global_config );
    if( args.count( long_name( constants::log_level_option ) ) )
      log_level = args[ long_name( constants::log_level_option ) ].as< std::string >();

    log::set_level( log_level );

    if( config.IsNull() )
      LOG_DEBUG( log::instance(), "No configuration file given, using default values" );

    for( const auto& required: { constants::module_option, constants::schema_option, constants::function_option } )
      if( !args.count( long_name( required ) ) )
        throw std::invalid_argument( "--" + long_name( required ) + " is required" );

    const auto module_path = std::filesystem::path( args[ long_name( constants::module_option ) ].as< std::string >() );
    const auto schema_path = std::filesystem::path( args[ long_name( constants::schema_option ) ].as< std::string >() );
    const auto function    = args[ long_name( constants::function_option ) ].as< std::string >();

    auto bytecode  = read_file( module_path );
    auto interface = schema::load_schema_file( schema_path );

    const auto* signature = interface.find( function );
    if( !signature )
      throw std::invalid_argument( "the schema declares no function named '" + function + "'" );

    std::vector< std::string > raw_args;
    if( args.count( long_name( constants::arg_option ) ) )
      raw_args = args[ long_name( constants::arg_option ) ].as< std::vector< std::string > >();

    if( raw_args.size() != signature->params.size() )
      throw std::invalid_argument( "'" + function + "' takes " + std::to_string( signature->params.size() )
                                   + " arguments, " + std::to_string( raw_args.size() ) + " given" );

    std::vector< schema::value > values;
    values.reserve( raw_args.size() );
    for( std::size_t i = 0; i < raw_args.size(); ++i )
      values.push_back( schema::parse_value( YAML::Load( raw_args[ i ] ), signature->params[ i ] ) );

    runtime::host_runtime host( opts );

    auto handle = host.load( bytecode, interface );
    if( !handle )
    {
      LOG_ERROR( log::instance(), "Unable to load {}: {}", module_path.string(), handle.error().message() );
      std::println( std::cerr, "{}", handle.error().message() );
      return EXIT_FAILURE;
    }

    auto results = host.invoke( *handle, function, values );
    if( !results )
    {
      LOG_ERROR( log::instance(), "Call to '{}' failed: {}", function, results.error().message() );
      std::println( std::cerr, "{}", results.error().message() );
      return EXIT_FAILURE;
    }

    for( std::size_t i = 0; i < results->size(); ++i )
      std::println( "{}", ( *results )[ i ].to_string( signature->returns[ i ] ) );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Invalid YAML: {}", e.what() );
    return EXIT_FAILURE;
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
