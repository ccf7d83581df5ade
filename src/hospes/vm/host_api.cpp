#include <hospes/log/log.hpp>
#include <hospes/memory/memory.hpp>
#include <hospes/vm/host_api.hpp>

#include <string_view>

namespace hospes::vm {

std::vector< std::string > logging_host_api::arguments()
{
  return {};
}

std::vector< std::string > logging_host_api::environment()
{
  return {};
}

wasi_errno
logging_host_api::fd_write( std::uint32_t fd, const std::vector< io_vector >& iovs, std::uint32_t& nwritten )
{
  if( fd != static_cast< std::uint32_t >( wasi_fd::out ) && fd != static_cast< std::uint32_t >( wasi_fd::err ) )
    return wasi_errno::badf;

  std::string text;
  for( const auto& iov: iovs )
    text += memory::as_string_view( iov );

  nwritten = static_cast< std::uint32_t >( text.size() );

  while( !text.empty() && text.back() == '\n' )
    text.pop_back();

  if( fd == static_cast< std::uint32_t >( wasi_fd::out ) )
    LOG_INFO( log::instance(), "[guest] {}", text );
  else
    LOG_WARNING( log::instance(), "[guest] {}", text );

  return wasi_errno::success;
}

void logging_host_api::proc_exit( std::int32_t exit_code )
{
  LOG_DEBUG( log::instance(), "Guest requested exit with code {}", exit_code );
}

} // namespace hospes::vm
