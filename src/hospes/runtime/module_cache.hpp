#pragma once

#include <cstddef>
#include <list>
#include <map>
#include <mutex>

#include <hospes/crypto/hash.hpp>
#include <hospes/vm/binding.hpp>

namespace hospes::runtime {

constexpr std::size_t default_module_cache_size = 32;

// Least recently used cache of validated components keyed by component id.
class module_cache
{
private:
  using lru_list_type   = std::list< crypto::digest >;
  using module_map_type = std::map< crypto::digest, std::pair< vm::component_ptr, lru_list_type::iterator > >;

  lru_list_type _lru_list;
  module_map_type _module_map;
  mutable std::mutex _mutex;
  const std::size_t _cache_size;
  std::size_t _hits   = 0;
  std::size_t _misses = 0;

public:
  module_cache( std::size_t size = default_module_cache_size );
  module_cache( const module_cache& ) = delete;
  module_cache( module_cache&& )      = delete;

  ~module_cache();

  module_cache& operator=( const module_cache& ) = delete;
  module_cache& operator=( module_cache&& )      = delete;

  vm::component_ptr get_component( const crypto::digest& id );
  void put_component( const crypto::digest& id, const vm::component_ptr& component );

  std::size_t size() const;
  std::size_t hits() const;
  std::size_t misses() const;
};

} // namespace hospes::runtime
