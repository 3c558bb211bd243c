#ifndef _VKGUARD_PRESENTATION_INCLUDED_
#define _VKGUARD_PRESENTATION_INCLUDED_

#include <vkguard/common.hpp>
#include <vkguard/loader.hpp>

#include <span>

// Capability contract for windowing integration. The core knows no windowing toolkit: it only
// names the extensions a surface needs. Surface creation and swapchains live elsewhere; the
// surface they produce goes back into physical_device::find_queue_family().
namespace vkguard::presentation
{
// VK_KHR_surface plus the platform surface extension of every VK_USE_PLATFORM_* defined at build time.
[[nodiscard]] std::span< extension::id_type const > instance_extensions() noexcept;

// VK_KHR_swapchain.
[[nodiscard]] std::span< extension::id_type const > device_extensions() noexcept;

} // namespace vkguard::presentation

#endif // _VKGUARD_PRESENTATION_INCLUDED_
