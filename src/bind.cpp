#include "bind.hpp"

namespace vkguard::private_
{
void check_bind( VkDevice const owner, memory_requirements const& requirements, memory const& memory, VkDeviceSize const offset )
{
    if( !memory )
    {
        throw validation_error( "memory", "no allocation" );
    }
    if( memory.source_native() != owner )
    {
        throw validation_error( "memory", "allocated on another device" );
    }
    if( !requirements.allows( memory.memory_type_index() ) )
    {
        throw validation_error( "memory", "memory type not allowed by the requirements" );
    }
    if( 0 != requirements.alignment && 0 != offset % requirements.alignment )
    {
        throw validation_error( "offset", "not aligned to the requirements" );
    }
    if( memory.size() < offset || memory.size() - offset < requirements.size )
    {
        throw validation_error( "offset", "range overflows the allocation" );
    }
}

} // namespace vkguard::private_
