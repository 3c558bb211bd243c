#ifndef _VKGUARD_IMAGE_INCLUDED_
#define _VKGUARD_IMAGE_INCLUDED_

#include <vkguard/builder.hpp>
#include <vkguard/commands.hpp>
#include <vkguard/common.hpp>
#include <vkguard/device.hpp>
#include <vkguard/handles.hpp>
#include <vkguard/memory.hpp>

#include <span>

namespace vkguard
{
class image : public private_::derived_handle< VkDevice, VkImage >
{
public:
    using base_type = private_::derived_handle< VkDevice, VkImage >;

    enum class usage_flag : uint32_t
    {
        TRANSFER_SRC = VK_IMAGE_USAGE_TRANSFER_SRC_BIT,
        TRANSFER_DST = VK_IMAGE_USAGE_TRANSFER_DST_BIT,
        SAMPLED = VK_IMAGE_USAGE_SAMPLED_BIT,
        STORAGE = VK_IMAGE_USAGE_STORAGE_BIT,
        COLOR_ATTACHMENT = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT,
        DEPTH_STENCIL_ATTACHMENT = VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT,
        TRANSIENT_ATTACHMENT = VK_IMAGE_USAGE_TRANSIENT_ATTACHMENT_BIT,
        INPUT_ATTACHMENT = VK_IMAGE_USAGE_INPUT_ATTACHMENT_BIT
    };
    using usage_flags = enum_flags< usage_flag >;

    class builder : public basic_builder< VkImageCreateInfo >
    {
    public:
        builder() noexcept;

        builder& image_type( VkImageType const type ) noexcept
        {
            info_.imageType = type;
            return *this;
        }

        builder& format( VkFormat const format ) noexcept
        {
            info_.format = format;
            return *this;
        }

        builder& extent( extent3d const extent ) noexcept
        {
            info_.extent = extent;
            return *this;
        }

        builder& extent( extent2d const extent ) noexcept
        {
            info_.extent = extent3d{ extent.width, extent.height, 1 };
            return *this;
        }

        builder& mip_levels( uint32_t const levels ) noexcept
        {
            info_.mipLevels = levels;
            return *this;
        }

        builder& array_layers( uint32_t const layers ) noexcept
        {
            info_.arrayLayers = layers;
            return *this;
        }

        builder& samples( VkSampleCountFlagBits const samples ) noexcept
        {
            info_.samples = samples;
            return *this;
        }

        builder& tiling( VkImageTiling const tiling ) noexcept
        {
            info_.tiling = tiling;
            return *this;
        }

        builder& usage( usage_flags const usage ) noexcept
        {
            info_.usage = usage();
            return *this;
        }

        builder& sharing( std::span< queue_family::id_type const > const families ) noexcept
        {
            info_.sharingMode = families.empty() ? VK_SHARING_MODE_EXCLUSIVE : VK_SHARING_MODE_CONCURRENT;
            info_.queueFamilyIndexCount = static_cast< uint32_t >( families.size() );
            info_.pQueueFamilyIndices = families.empty() ? nullptr : families.data();
            return *this;
        }

        builder& initial_layout( VkImageLayout const layout ) noexcept
        {
            info_.initialLayout = layout;
            return *this;
        }

        image build( device const& device ) const;
    };

    image( image&& ) noexcept = default;
    image& operator=( image&& ) noexcept = default;

    [[nodiscard]] VkFormat format() const noexcept { return format_; }
    [[nodiscard]] extent3d extent() const noexcept { return extent_; }
    [[nodiscard]] uint32_t mip_levels() const noexcept { return mip_levels_; }
    [[nodiscard]] uint32_t array_layers() const noexcept { return array_layers_; }
    [[nodiscard]] usage_flags usage() const noexcept { return usage_; }
    [[nodiscard]] bool is_bound() const noexcept { return bound_; }

    [[nodiscard]] memory_requirements requirements() const;

    // Checked and one-way, as buffer::bind_memory().
    void bind_memory( memory const& memory, VkDeviceSize offset = 0 );
    [[nodiscard]] VkResult bind_memory_unchecked( memory const& memory, VkDeviceSize offset ) noexcept;

private:
    image( device const& device, VkImageCreateInfo const& info );

    device_commands const* commands_{ nullptr };
    VkFormat format_{ VK_FORMAT_UNDEFINED };
    extent3d extent_{};
    uint32_t mip_levels_{ 1 };
    uint32_t array_layers_{ 1 };
    usage_flags usage_;
    bool bound_{ false };
};

} // namespace vkguard

#endif // _VKGUARD_IMAGE_INCLUDED_
