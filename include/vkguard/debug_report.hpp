#ifndef _VKGUARD_DEBUG_REPORT_INCLUDED_
#define _VKGUARD_DEBUG_REPORT_INCLUDED_

#include <vkguard/commands.hpp>
#include <vkguard/common.hpp>
#include <vkguard/handles.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace vkguard
{
class instance;

namespace dbg
{
// Return true to ask the driver to abort the call that triggered the message.
using callback_type = std::function< bool( flag flag, object const, uint64_t const object_id, size_t const location, int32_t const message_code,
                                           std::string_view layer_prefix, std::string_view message ) >;

inline constexpr flags default_flags = flags( static_cast< uint32_t >( VK_DEBUG_REPORT_ERROR_BIT_EXT | VK_DEBUG_REPORT_WARNING_BIT_EXT |
                                                                       VK_DEBUG_REPORT_PERFORMANCE_WARNING_BIT_EXT ) );

// Prints severity, layer prefix, message code and text on standard output. Thread safe.
bool print_to_stdout( flag flag, object const object, uint64_t const object_id, size_t const location, int32_t const message_code,
                      std::string_view layer_prefix, std::string_view message );

/// Registration of a VK_EXT_debug_report callback.
///
/// The driver may call the callback from any thread, including threads it owns, concurrently with
/// the application: state shared with the callback needs its own synchronisation.
/// Destroying the report unregisters the callback; this has to happen before the instance is
/// destroyed, which is not checked.
class report : public private_::derived_handle< VkInstance, VkDebugReportCallbackEXT >
{
public:
    using base_type = private_::derived_handle< VkInstance, VkDebugReportCallbackEXT >;

    report( vkguard::instance const& instance, flags flags, callback_type cb );
    report( VkInstance instance, instance_commands const& commands, flags flags, callback_type cb );

    report( report&& ) noexcept = default;
    report& operator=( report&& ) noexcept = default;

    [[nodiscard]] flags filter() const noexcept { return flags_; }

    // Injects a message into the driver's debug report stream. Returns false when the
    // driver exposes no vkDebugReportMessageEXT.
    bool insert( flag flag, object object, int32_t message_code, std::string_view layer_prefix, std::string const& message ) const;

private:
    struct state
    {
        callback_type callback;
    };

    static VKAPI_ATTR VkBool32 VKAPI_CALL dispatch( VkDebugReportFlagsEXT flag, VkDebugReportObjectTypeEXT object_type, uint64_t object,
                                                     size_t location, int32_t message_code, char const* player_prefix, char const* pmessage,
                                                     void* puser_data );

    // Heap held: the driver keeps its address as user data across moves of the report.
    std::unique_ptr< state > state_;
    PFN_vkDebugReportMessageEXT message_{ nullptr };
    flags flags_;
};

} // namespace dbg
} // namespace vkguard

#endif // _VKGUARD_DEBUG_REPORT_INCLUDED_
