#ifndef _VKGUARD_SRC_ENUMERATE_INCLUDED_
#define _VKGUARD_SRC_ENUMERATE_INCLUDED_

#include <vkguard/common.hpp>

#include <vector>

namespace vkguard::private_
{
// Two-call enumeration, repeated while the driver answers VK_INCOMPLETE.
template< typename property_type, typename enumerate_type, typename... arg_types >
std::vector< property_type > enumerate( enumerate_type const enumerate_fn, dbg::object const object, char const* const what, arg_types... args )
{
    std::vector< property_type > list;
    VkResult status = VK_INCOMPLETE;
    while( VK_INCOMPLETE == status )
    {
        uint32_t count = 0;
        check( enumerate_fn( args..., &count, nullptr ), object, what );
        list.resize( count );
        if( 0 == count )
        {
            return list;
        }
        status = enumerate_fn( args..., &count, list.data() );
        list.resize( count );
    }
    check( status, object, what );
    return list;
}

} // namespace vkguard::private_

#endif // _VKGUARD_SRC_ENUMERATE_INCLUDED_
