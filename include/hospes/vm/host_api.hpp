#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace hospes::vm {

enum class wasi_errno : std::uint16_t // NOLINT(performance-enum-size)
{
  success = 0,
  badf    = 8,
  fault   = 21,
  inval   = 28,
  io      = 29,
  nosys   = 52
};

enum class wasi_fd : std::uint32_t // NOLINT(performance-enum-size)
{
  in,
  out,
  err
};

using io_vector = std::span< const std::byte >;

/**
 * The embedder's side of the WASI preview1 functions a guest may import.
 *
 * Implementations are shared by every instance of a runtime and must be safe
 * to call from several threads at once.
 */
class host_api
{
public:
  host_api()                  = default;
  host_api( const host_api& ) = delete;
  host_api( host_api&& )      = delete;
  virtual ~host_api()         = default;

  host_api& operator=( const host_api& ) = delete;
  host_api& operator=( host_api&& )      = delete;

  virtual std::vector< std::string > arguments()   = 0;
  virtual std::vector< std::string > environment() = 0;

  virtual wasi_errno fd_write( std::uint32_t fd, const std::vector< io_vector >& iovs, std::uint32_t& nwritten ) = 0;

  virtual void proc_exit( std::int32_t exit_code ) = 0;
};

// Forwards guest stdout and stderr to the logger. No arguments, no environment.
class logging_host_api final: public host_api
{
public:
  std::vector< std::string > arguments() override;
  std::vector< std::string > environment() override;
  wasi_errno fd_write( std::uint32_t fd, const std::vector< io_vector >& iovs, std::uint32_t& nwritten ) override;
  void proc_exit( std::int32_t exit_code ) override;
};

} // namespace hospes::vm
