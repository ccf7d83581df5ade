#include "module_cache.hpp"

namespace hospes::runtime {

module_cache::module_cache( std::size_t size ):
    _cache_size( size )
{}

module_cache::~module_cache()
{
  std::lock_guard< std::mutex > lock( _mutex );
  _module_map.clear();
}

vm::component_ptr module_cache::get_component( const crypto::digest& id )
{
  std::lock_guard< std::mutex > lock( _mutex );

  auto it = _module_map.find( id );
  if( it == _module_map.end() )
  {
    _misses++;
    return vm::component_ptr();
  }

  _hits++;
  if( it->second.second != _lru_list.begin() )
    _lru_list.splice( _lru_list.begin(), _lru_list, it->second.second );

  return it->second.first;
}

void module_cache::put_component( const crypto::digest& id, const vm::component_ptr& component )
{
  std::lock_guard< std::mutex > lock( _mutex );

  if( auto it = _module_map.find( id ); it != _module_map.end() )
  {
    it->second.first = component;
    _lru_list.splice( _lru_list.begin(), _lru_list, it->second.second );
    return;
  }

  if( _lru_list.size() >= _cache_size && !_lru_list.empty() )
  {
    _module_map.erase( _lru_list.back() );
    _lru_list.pop_back();
  }

  _lru_list.push_front( id );
  _module_map.insert_or_assign( id, std::make_pair( component, _lru_list.begin() ) );
}

std::size_t module_cache::size() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _lru_list.size();
}

std::size_t module_cache::hits() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _hits;
}

std::size_t module_cache::misses() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _misses;
}

} // namespace hospes::runtime
