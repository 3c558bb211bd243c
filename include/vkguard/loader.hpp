#ifndef _VKGUARD_LOADER_INCLUDED_
#define _VKGUARD_LOADER_INCLUDED_

#include <vkguard/commands.hpp>
#include <vkguard/common.hpp>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace vkguard
{
struct layer : public VkLayerProperties
{
public:
    using id_type = char const*;

    static constexpr id_type const vendor_standard_layer = "VK_LAYER_KHRONOS_validation";
    static constexpr id_type const vendor_api_dump = "VK_LAYER_LUNARG_api_dump";

    [[nodiscard]] std::string_view name() const { return std::string_view( static_cast< char const* >( layerName ) ); }
    [[nodiscard]] std::string_view desc() const { return std::string_view( static_cast< char const* >( description ) ); }

    [[nodiscard]] version spec_version() const { return version( specVersion ); }
    [[nodiscard]] version impl_version() const { return version( implementationVersion ); }
};
static_assert( sizeof( layer ) == sizeof( VkLayerProperties ) );

struct extension : public VkExtensionProperties
{
    using id_type = char const*;

    static constexpr id_type const debug_report = VK_EXT_DEBUG_REPORT_EXTENSION_NAME;
    static constexpr id_type const khr_surface = VK_KHR_SURFACE_EXTENSION_NAME;

    [[nodiscard]] std::string_view name() const { return std::string_view( static_cast< char const* >( extensionName ) ); }
    [[nodiscard]] version spec_version() const { return version( specVersion ); }
};
static_assert( sizeof( extension ) == sizeof( VkExtensionProperties ) );

[[nodiscard]] bool contains( std::vector< extension > const& extensions, std::string_view name ) noexcept;

/// Entry into the driver: owns the driver library (when it opened it) and the global function table.
///
/// Every other table is derived from the entry point held here, so nothing may outlive the loader.
/// instance::builder::build() takes the loader over and releases it after the instance is gone.
class loader
{
public:
    // Opens the platform driver library. The path in VKGUARD_VULKAN_LIBRARY takes precedence.
    static loader load( version minimum = version( 1, 0, 0 ) );
    static loader load( char const* library_path, version minimum = version( 1, 0, 0 ) );

    // Adopts an entry point obtained elsewhere; no library is opened or closed.
    explicit loader( PFN_vkGetInstanceProcAddr entry_point, version minimum = version( 1, 0, 0 ) );

    loader( loader&& ) noexcept = default;
    loader& operator=( loader&& ) noexcept = default;
    loader( loader const& ) = delete;
    loader& operator=( loader const& ) = delete;
    ~loader();

    [[nodiscard]] global_commands const& commands() const noexcept { return commands_; }
    [[nodiscard]] PFN_vkGetInstanceProcAddr get_instance_proc_addr() const noexcept { return commands_.vkGetInstanceProcAddr; }
    [[nodiscard]] version instance_version() const noexcept { return instance_version_; }

    // Queried on the first call and cached afterwards.
    std::vector< extension > const& enumerate_instance_extension_properties();
    [[nodiscard]] std::vector< extension > enumerate_instance_extension_properties( layer::id_type layer_id ) const;
    [[nodiscard]] std::vector< layer > enumerate_instance_layer_properties() const;

    bool supports_extension( std::string_view name );
    [[nodiscard]] bool supports_layer( std::string_view name ) const;

private:
    struct library_closer
    {
        void operator()( void* library ) const noexcept;
    };

    loader( std::unique_ptr< void, library_closer > library, PFN_vkGetInstanceProcAddr entry_point, version minimum );

    std::unique_ptr< void, library_closer > library_;
    global_commands commands_;
    version instance_version_;
    std::optional< std::vector< extension > > extensions_;
};

} // namespace vkguard

#endif // _VKGUARD_LOADER_INCLUDED_
