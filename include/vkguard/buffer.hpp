#ifndef _VKGUARD_BUFFER_INCLUDED_
#define _VKGUARD_BUFFER_INCLUDED_

#include <vkguard/builder.hpp>
#include <vkguard/commands.hpp>
#include <vkguard/common.hpp>
#include <vkguard/device.hpp>
#include <vkguard/handles.hpp>
#include <vkguard/memory.hpp>

#include <span>

namespace vkguard
{
class buffer : public private_::derived_handle< VkDevice, VkBuffer >
{
public:
    using base_type = private_::derived_handle< VkDevice, VkBuffer >;

    enum class usage_flag : uint32_t
    {
        TRANSFER_SRC = VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
        TRANSFER_DST = VK_BUFFER_USAGE_TRANSFER_DST_BIT,
        UNIFORM_TEXEL = VK_BUFFER_USAGE_UNIFORM_TEXEL_BUFFER_BIT,
        STORAGE_TEXEL = VK_BUFFER_USAGE_STORAGE_TEXEL_BUFFER_BIT,
        UNIFORM = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT,
        STORAGE = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
        INDEX = VK_BUFFER_USAGE_INDEX_BUFFER_BIT,
        VERTEX = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
        INDIRECT = VK_BUFFER_USAGE_INDIRECT_BUFFER_BIT
    };
    using usage_flags = enum_flags< usage_flag >;

    class builder : public basic_builder< VkBufferCreateInfo >
    {
    public:
        builder() noexcept
            : basic_builder( VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO )
        {
            info_.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        }

        builder& size( VkDeviceSize const bytes ) noexcept
        {
            info_.size = bytes;
            return *this;
        }

        builder& usage( usage_flags const usage ) noexcept
        {
            info_.usage = usage();
            return *this;
        }

        builder& flags( VkBufferCreateFlags const flags ) noexcept
        {
            info_.flags = flags;
            return *this;
        }

        // Concurrent sharing between the given (borrowed) families; an empty list means exclusive.
        builder& sharing( std::span< queue_family::id_type const > const families ) noexcept
        {
            info_.sharingMode = families.empty() ? VK_SHARING_MODE_EXCLUSIVE : VK_SHARING_MODE_CONCURRENT;
            info_.queueFamilyIndexCount = static_cast< uint32_t >( families.size() );
            info_.pQueueFamilyIndices = families.empty() ? nullptr : families.data();
            return *this;
        }

        buffer build( device const& device ) const;
    };

    buffer( buffer&& ) noexcept = default;
    buffer& operator=( buffer&& ) noexcept = default;

    [[nodiscard]] VkDeviceSize size() const noexcept { return size_; }
    [[nodiscard]] usage_flags usage() const noexcept { return usage_; }
    [[nodiscard]] bool is_bound() const noexcept { return bound_; }

    [[nodiscard]] memory_requirements requirements() const;

    // Checked and one-way: a second call fails with already_bound_error whatever the memory.
    void bind_memory( memory const& memory, VkDeviceSize offset = 0 );

    // Unchecked: direct vkBindBufferMemory without the checks. Rebinding, a foreign memory or a bad
    // offset is undefined behaviour. The native result is returned as is; a success still marks the
    // buffer bound, so a later bind_memory() fails with already_bound_error.
    [[nodiscard]] VkResult bind_memory_unchecked( memory const& memory, VkDeviceSize offset ) noexcept;

private:
    buffer( device const& device, VkBufferCreateInfo const& info );

    device_commands const* commands_{ nullptr };
    VkDeviceSize size_{ 0 };
    usage_flags usage_;
    bool bound_{ false };
};

} // namespace vkguard

#endif // _VKGUARD_BUFFER_INCLUDED_
