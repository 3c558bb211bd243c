#ifndef _VKGUARD_SRC_RESOLVE_INCLUDED_
#define _VKGUARD_SRC_RESOLVE_INCLUDED_

#include <vkguard/common.hpp>

namespace vkguard::private_
{
template< typename pfn_type, typename vk_parent, typename get_proc_addr_type >
void resolve( get_proc_addr_type const get_proc_addr, vk_parent const parent, char const* const name, pfn_type& target ) noexcept
{
    target = reinterpret_cast< pfn_type >( get_proc_addr( parent, name ) );
}

// Core entry points: a null result means the driver is not what it claims to be.
template< typename pfn_type, typename vk_parent, typename get_proc_addr_type >
void resolve_required( get_proc_addr_type const get_proc_addr, vk_parent const parent, char const* const name, pfn_type& target )
{
    resolve( get_proc_addr, parent, name, target );
    if( nullptr == target )
    {
        throw loader_error( std::string( "driver does not expose " ) + name );
    }
}

} // namespace vkguard::private_

#endif // _VKGUARD_SRC_RESOLVE_INCLUDED_
