#ifndef _VKGUARD_COMMON_INCLUDED_
#define _VKGUARD_COMMON_INCLUDED_

#ifndef VK_NO_PROTOTYPES
#define VK_NO_PROTOTYPES
#endif
#include <vulkan/vulkan.h>

#include <compare>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace vkguard
{
class version
{
private:
    uint32_t packed_{ 0 };
    static constexpr unsigned short const major_bit_offset = 22;
    static constexpr unsigned short const minor_bit_offset = 12;
    static constexpr unsigned short const patch_bit_offset = 0;

    static constexpr uint32_t const minor_bit_mask = ( 1U << ( unsigned )( major_bit_offset - minor_bit_offset ) ) - 1U;
    static constexpr uint32_t const patch_bit_mask = ( 1U << minor_bit_offset ) - 1U;

public:
    constexpr version() = default;

    constexpr version( unsigned short const major, unsigned short const minor, unsigned short const patch )
        : packed_( ( unsigned )( major << major_bit_offset ) | ( unsigned )( minor << minor_bit_offset ) | ( unsigned )( patch << patch_bit_offset ) )
    {}

    constexpr explicit version( uint32_t const packed )
        : packed_( packed )
    {}

    [[nodiscard]] constexpr unsigned short major() const { return ( packed_ >> major_bit_offset ); }

    [[nodiscard]] constexpr unsigned short minor() const { return ( ( packed_ >> minor_bit_offset ) & minor_bit_mask ); }

    [[nodiscard]] constexpr unsigned short patch() const { return ( packed_ & patch_bit_mask ); }

    constexpr explicit operator uint32_t() const { return packed_; }

    constexpr auto operator<=>( version const& ) const = default;
};

std::string to_string( version v );

template< typename enum_type, typename std::enable_if< std::is_enum< enum_type >::value, int >::type = 0 >
class enum_flags
{
private:
    using value_type = std::underlying_type_t< enum_type >;
    value_type flags_;

public:
    constexpr enum_flags()
        : flags_( 0 )
    {}
    constexpr enum_flags( enum_type const flag )
        : flags_( static_cast< value_type >( flag ) )
    {}
    constexpr explicit enum_flags( value_type const flags )
        : flags_( flags )
    {}

    constexpr value_type operator()() const { return flags_; }
    constexpr enum_flags operator~() const { return enum_flags( ~flags_ ); }

    [[nodiscard]] constexpr bool contains( enum_flags const other ) const { return ( flags_ & other.flags_ ) == other.flags_; }
    [[nodiscard]] constexpr bool any() const { return 0 != flags_; }

    constexpr bool operator==( enum_flags const& ) const = default;
};

template< typename enum_type, typename std::enable_if< std::is_enum< enum_type >::value, int >::type = 0 >
constexpr enum_flags< enum_type > operator|( enum_flags< enum_type > const lhs, enum_flags< enum_type > const rhs )
{
    return enum_flags< enum_type >( lhs() | rhs() );
}

template< typename enum_type, typename std::enable_if< std::is_enum< enum_type >::value, int >::type = 0 >
constexpr enum_flags< enum_type > operator|( enum_flags< enum_type > const lhs, enum_type const rhs )
{
    return lhs | enum_flags< enum_type >( rhs );
}

template< typename enum_type, typename std::enable_if< std::is_enum< enum_type >::value, int >::type = 0 >
constexpr enum_flags< enum_type > operator|=( enum_flags< enum_type >& lhs, enum_flags< enum_type > const rhs )
{
    lhs = lhs | rhs;
    return lhs;
}

template< typename enum_type, typename std::enable_if< std::is_enum< enum_type >::value, int >::type = 0 >
constexpr enum_flags< enum_type > operator&( enum_flags< enum_type > const lhs, enum_flags< enum_type > const rhs )
{
    return enum_flags< enum_type >( lhs() & rhs() );
}

template< typename enum_type, typename std::enable_if< std::is_enum< enum_type >::value, int >::type = 0 >
constexpr enum_flags< enum_type > operator&( enum_flags< enum_type > const lhs, enum_type const rhs )
{
    return lhs & enum_flags< enum_type >( rhs );
}

enum class result
{
    SUCCESS = VK_SUCCESS,
    NOT_READY = VK_NOT_READY,
    TIMEOUT = VK_TIMEOUT,
    EVENT_SET = VK_EVENT_SET,
    EVENT_RESET = VK_EVENT_RESET,
    INCOMPLETE = VK_INCOMPLETE,
    ERROR_OUT_OF_HOST_MEMORY = VK_ERROR_OUT_OF_HOST_MEMORY,
    ERROR_OUT_OF_DEVICE_MEMORY = VK_ERROR_OUT_OF_DEVICE_MEMORY,
    ERROR_INITIALIZATION_FAILED = VK_ERROR_INITIALIZATION_FAILED,
    ERROR_DEVICE_LOST = VK_ERROR_DEVICE_LOST,
    ERROR_MEMORY_MAP_FAILED = VK_ERROR_MEMORY_MAP_FAILED,
    ERROR_LAYER_NOT_PRESENT = VK_ERROR_LAYER_NOT_PRESENT,
    ERROR_EXTENSION_NOT_PRESENT = VK_ERROR_EXTENSION_NOT_PRESENT,
    ERROR_FEATURE_NOT_PRESENT = VK_ERROR_FEATURE_NOT_PRESENT,
    ERROR_INCOMPATIBLE_DRIVER = VK_ERROR_INCOMPATIBLE_DRIVER,
    ERROR_TOO_MANY_OBJECTS = VK_ERROR_TOO_MANY_OBJECTS,
    ERROR_FORMAT_NOT_SUPPORTED = VK_ERROR_FORMAT_NOT_SUPPORTED,
    ERROR_SURFACE_LOST_KHR = VK_ERROR_SURFACE_LOST_KHR,
    ERROR_NATIVE_WINDOW_IN_USE_KHR = VK_ERROR_NATIVE_WINDOW_IN_USE_KHR,
    SUBOPTIMAL_KHR = VK_SUBOPTIMAL_KHR,
    ERROR_OUT_OF_DATE_KHR = VK_ERROR_OUT_OF_DATE_KHR,
    ERROR_INCOMPATIBLE_DISPLAY_KHR = VK_ERROR_INCOMPATIBLE_DISPLAY_KHR,
    ERROR_VALIDATION_FAILED_EXT = VK_ERROR_VALIDATION_FAILED_EXT
};

[[nodiscard]] char const* to_string( result r ) noexcept;

namespace dbg
{
enum class flag : uint32_t
{
    INFO = VK_DEBUG_REPORT_INFORMATION_BIT_EXT,
    WARN = VK_DEBUG_REPORT_WARNING_BIT_EXT,
    PERF = VK_DEBUG_REPORT_PERFORMANCE_WARNING_BIT_EXT,
    ERR = VK_DEBUG_REPORT_ERROR_BIT_EXT,
    DEBUG = VK_DEBUG_REPORT_DEBUG_BIT_EXT
};

using flags = enum_flags< flag >;

[[nodiscard]] char const* to_string( flag f ) noexcept;

enum class object
{
    UNKNOWN = VK_DEBUG_REPORT_OBJECT_TYPE_UNKNOWN_EXT,
    INSTANCE = VK_DEBUG_REPORT_OBJECT_TYPE_INSTANCE_EXT,
    PHYSICAL_DEVICE = VK_DEBUG_REPORT_OBJECT_TYPE_PHYSICAL_DEVICE_EXT,
    DEVICE = VK_DEBUG_REPORT_OBJECT_TYPE_DEVICE_EXT,
    QUEUE = VK_DEBUG_REPORT_OBJECT_TYPE_QUEUE_EXT,
    DEVICE_MEMORY = VK_DEBUG_REPORT_OBJECT_TYPE_DEVICE_MEMORY_EXT,
    BUFFER = VK_DEBUG_REPORT_OBJECT_TYPE_BUFFER_EXT,
    IMAGE = VK_DEBUG_REPORT_OBJECT_TYPE_IMAGE_EXT,
    SURFACE_KHR = VK_DEBUG_REPORT_OBJECT_TYPE_SURFACE_KHR_EXT,
    DEBUG_REPORT_EXT = VK_DEBUG_REPORT_OBJECT_TYPE_DEBUG_REPORT_EXT
};

} // namespace dbg

// Root of everything the library throws.
struct exception : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// The driver library or one of its required entry points could not be found.
struct loader_error : public exception
{
    using exception::exception;
};

// A builder or a checked call was handed an unset or invalid field. Raised before any driver call.
struct validation_error : public exception
{
    validation_error( std::string_view const field, std::string const& reason )
        : exception( std::string( field ) + ": " + reason )
        , field_( field )
    {}

    [[nodiscard]] std::string const& field() const noexcept { return field_; }

private:
    std::string field_;
};

// A native call returned a failure code.
struct driver_error : public exception
{
    vkguard::result result;
    dbg::object object;

    driver_error( enum result const result, dbg::object const object, char const* const error_str )
        : exception( std::string( error_str ) + " (" + to_string( result ) + ")" )
        , result( result )
        , object( object )
    {}

    driver_error( VkResult const status, dbg::object const object, char const* const error_str )
        : driver_error( static_cast< vkguard::result >( status ), object, error_str )
    {}
};

struct out_of_host_memory : public driver_error
{
    out_of_host_memory( dbg::object const object, char const* const error_str )
        : driver_error( result::ERROR_OUT_OF_HOST_MEMORY, object, error_str )
    {}
};

struct out_of_device_memory : public driver_error
{
    out_of_device_memory( dbg::object const object, char const* const error_str )
        : driver_error( result::ERROR_OUT_OF_DEVICE_MEMORY, object, error_str )
    {}
};

struct already_bound_error : public exception
{
    explicit already_bound_error( dbg::object const object )
        : exception( object == dbg::object::IMAGE ? "image is already bound to memory" : "buffer is already bound to memory" )
    {}
};

struct already_mapped_error : public exception
{
    already_mapped_error()
        : exception( "memory is already mapped" )
    {}
};

// Throws the exception matching status unless it is VK_SUCCESS.
void check( VkResult status, dbg::object object, char const* what );

using extent2d = VkExtent2D;
using extent3d = VkExtent3D;

} // namespace vkguard

#endif // _VKGUARD_COMMON_INCLUDED_
