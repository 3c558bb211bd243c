#ifndef _VKGUARD_INSTANCE_INCLUDED_
#define _VKGUARD_INSTANCE_INCLUDED_

#include <vkguard/builder.hpp>
#include <vkguard/commands.hpp>
#include <vkguard/common.hpp>
#include <vkguard/debug_report.hpp>
#include <vkguard/handles.hpp>
#include <vkguard/loader.hpp>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vkguard
{
class physical_device;

// Value descriptor of the application. The names are borrowed, not copied.
class application_info
{
public:
    application_info() = default;

    explicit application_info( char const* const name, version const app_version = version(), version const api = version( 1, 0, 0 ) )
        : name_( name )
        , version_( app_version )
        , api_version_( api )
    {}

    application_info& engine( char const* const name, version const engine_version )
    {
        engine_name_ = name;
        engine_version_ = engine_version;
        return *this;
    }

    [[nodiscard]] char const* name() const noexcept { return name_; }
    [[nodiscard]] version app_version() const noexcept { return version_; }
    [[nodiscard]] char const* engine_name() const noexcept { return engine_name_; }
    [[nodiscard]] version engine_version() const noexcept { return engine_version_; }
    [[nodiscard]] version api_version() const noexcept { return api_version_; }

    [[nodiscard]] VkApplicationInfo native() const noexcept
    {
        return VkApplicationInfo{ .sType = VK_STRUCTURE_TYPE_APPLICATION_INFO,
                                  .pNext = nullptr,
                                  .pApplicationName = name_,
                                  .applicationVersion = ( uint32_t )version_,
                                  .pEngineName = engine_name_,
                                  .engineVersion = ( uint32_t )engine_version_,
                                  .apiVersion = ( uint32_t )api_version_ };
    }

private:
    char const* name_{ "" };
    version version_;
    char const* engine_name_{ "" };
    version engine_version_;
    version api_version_{ 1, 0, 0 };
};

/// Owner of a VkInstance and of its function table.
///
/// Devices, physical devices and debug reports keep a pointer to the table: all of them have to be
/// gone before the instance is destroyed. The instance owns the loader it was built from.
class instance
{
public:
    class builder : public basic_builder< VkInstanceCreateInfo >
    {
    public:
        builder() noexcept;

        builder& application_info( vkguard::application_info const& info ) noexcept
        {
            app_info_ = info.native();
            return *this;
        }

        // The names are borrowed; they have to outlive build(). Use names the loader advertises.
        builder& enabled_extensions( std::span< extension::id_type const > const names ) noexcept
        {
            info_.enabledExtensionCount = static_cast< uint32_t >( names.size() );
            info_.ppEnabledExtensionNames = names.empty() ? nullptr : names.data();
            return *this;
        }

        builder& enabled_layers( std::span< layer::id_type const > const names ) noexcept
        {
            info_.enabledLayerCount = static_cast< uint32_t >( names.size() );
            info_.ppEnabledLayerNames = names.empty() ? nullptr : names.data();
            return *this;
        }

        // Enables VK_EXT_debug_report and prints every reported message on standard output.
        builder& print_debug_report( bool const enable ) noexcept
        {
            print_debug_report_ = enable;
            return *this;
        }

        builder& debug_report_flags( dbg::flags const flags ) noexcept
        {
            debug_report_flags_ = flags;
            return *this;
        }

        instance build( vkguard::loader&& loader );

    private:
        VkApplicationInfo app_info_;
        bool print_debug_report_{ false };
        dbg::flags debug_report_flags_{ dbg::default_flags };
    };

    instance( instance&& ) noexcept = default;
    instance& operator=( instance&& ) = delete;
    instance( instance const& ) = delete;
    instance& operator=( instance const& ) = delete;
    ~instance();

    explicit operator bool() const noexcept { return static_cast< bool >( handle_ ); }

    [[nodiscard]] VkInstance native() const noexcept { return handle_.native(); }
    [[nodiscard]] instance_commands const& commands() const noexcept { return *commands_; }
    [[nodiscard]] vkguard::loader const& loader() const noexcept { return loader_; }
    [[nodiscard]] version api_version() const noexcept { return api_version_; }

    [[nodiscard]] bool is_extension_enabled( std::string_view name ) const noexcept;
    [[nodiscard]] std::vector< std::string > const& enabled_extensions() const noexcept { return extensions_; }

    [[nodiscard]] bool has_debug_report() const noexcept { return default_report_.has_value(); }
    [[nodiscard]] dbg::report const* debug_report() const noexcept { return default_report_ ? &*default_report_ : nullptr; }

    // Complete list, empty when there is no device. Fails only when enumeration itself fails.
    [[nodiscard]] std::vector< physical_device > enumerate_physical_devices() const;

private:
    instance( vkguard::loader&& loader, private_::source_handle< VkInstance >&& handle, VkInstanceCreateInfo const& info, bool print_debug_report,
              dbg::flags debug_report_flags );

    // Declaration order is destruction order reversed: report, then instance, then table, then loader.
    vkguard::loader loader_;
    std::unique_ptr< instance_commands > commands_;
    private_::source_handle< VkInstance > handle_;
    std::vector< std::string > extensions_;
    version api_version_;
    std::optional< dbg::report > default_report_;
};

} // namespace vkguard

#endif // _VKGUARD_INSTANCE_INCLUDED_
