#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <hospes/runtime/runtime.hpp>
#include <hospes/schema/types.hpp>
#include <hospes/schema/value.hpp>
#include <hospes/vm/binding.hpp>
#include <hospes/vm/host_api.hpp>
#include <hospes/vm/instance.hpp>

#include <test/programs.hpp>

namespace test {

// Captures what a guest writes through WASI instead of logging it.
class recording_host_api final: public hospes::vm::host_api
{
public:
  std::vector< std::string > arguments() override;
  std::vector< std::string > environment() override;
  hospes::vm::wasi_errno
  fd_write( std::uint32_t fd, const std::vector< hospes::vm::io_vector >& iovs, std::uint32_t& nwritten ) override;
  void proc_exit( std::int32_t exit_code ) override;

  std::string out() const;
  std::vector< std::int32_t > exits() const;

  std::vector< std::string > args{ "guest", "--flag" };
  std::vector< std::string > env{ "HOME=/nowhere" };

private:
  mutable std::mutex _mutex;
  std::string _out;
  std::vector< std::int32_t > _exits;
};

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& log_level = "warning" );
  ~fixture();

  // The interface of tests/wasm/guest.wat.
  static hospes::schema::interface_schema guest_schema();

  // compute_hash(bytes) -> string
  static hospes::schema::interface_schema hasher_schema();

  static hospes::schema::type_descriptor tag_type();
  static hospes::schema::type_descriptor classify_type();

  // The value tests/wasm/hasher.wat computes, recomputed on the host.
  static std::string expected_hash( const std::vector< std::byte >& input );

  hospes::vm::component_ptr make_guest_component() const;
  hospes::vm::instance_ptr make_guest_instance( const hospes::vm::resource_limits& limits = {} ) const;

  std::shared_ptr< recording_host_api > _host = std::make_shared< recording_host_api >();
};

} // namespace test
