#ifndef _VKGUARD_SRC_BIND_INCLUDED_
#define _VKGUARD_SRC_BIND_INCLUDED_

#include <vkguard/device.hpp>
#include <vkguard/memory.hpp>

namespace vkguard::private_
{
// Preconditions of a checked bind of a resource of device owner with the given requirements.
// The bound state itself is the caller's.
void check_bind( VkDevice owner, memory_requirements const& requirements, memory const& memory, VkDeviceSize offset );

} // namespace vkguard::private_

#endif // _VKGUARD_SRC_BIND_INCLUDED_
