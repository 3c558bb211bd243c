#ifndef _VKGUARD_HANDLES_INCLUDED_
#define _VKGUARD_HANDLES_INCLUDED_

#include <vkguard/common.hpp>

#include <cstdint>
#include <type_traits>
#include <utility>

namespace vkguard
{
namespace private_
{
template< typename vk_handle >
class unique_handle
{
public:
    using native_type = vk_handle;

    unique_handle() noexcept
        : native_( VK_NULL_HANDLE )
    {}
    unique_handle( unique_handle const& ) = delete;
    unique_handle& operator=( unique_handle const& ) = delete;
    unique_handle( unique_handle&& handle ) noexcept
        : native_( handle.native_ )
    {
        handle.native_ = VK_NULL_HANDLE;
    }

    explicit operator bool() const noexcept { return ( VK_NULL_HANDLE != native_ ); }

    [[nodiscard]] native_type native() const noexcept { return native_; }
    [[nodiscard]] native_type* pnative() noexcept { return &native_; }

protected:
    explicit unique_handle( native_type const native ) noexcept
        : native_( native )
    {}

    unique_handle& operator=( unique_handle&& handle ) noexcept
    {
        native_ = handle.native_;
        handle.native_ = VK_NULL_HANDLE;
        return *this;
    }

    ~unique_handle() noexcept = default;

    native_type release() noexcept { return std::exchange( native_, VK_NULL_HANDLE ); }

private:
    native_type native_;
};

template< typename vk_handle >
using vk_source_deleter = void( VKAPI_PTR* )( vk_handle, VkAllocationCallbacks const* );

// Owns a top-level handle (instance, device). The destroy entry point is copied out of the
// function table at creation, so the handle stays destroyable whatever happens to the table.
template< typename vk_handle >
class source_handle : public unique_handle< vk_handle >
{
public:
    using base_type = unique_handle< vk_handle >;
    using native_type = typename base_type::native_type;
    using deleter_type = vk_source_deleter< vk_handle >;

    source_handle() noexcept = default;

    source_handle( native_type const native, deleter_type const deleter ) noexcept
        : base_type( native )
        , deleter_( deleter )
    {}

    source_handle( source_handle const& ) = delete;
    source_handle& operator=( source_handle const& ) = delete;

    source_handle( source_handle&& handle ) noexcept
        : base_type( std::move( handle ) )
        , deleter_( std::exchange( handle.deleter_, nullptr ) )
    {}

    source_handle& operator=( source_handle&& handle ) noexcept
    {
        if( this != &handle )
        {
            free();
            base_type::operator=( std::move( handle ) );
            deleter_ = std::exchange( handle.deleter_, nullptr );
        }
        return *this;
    }

    ~source_handle() noexcept { free(); }

    void reset() noexcept
    {
        free();
        this->release();
    }

private:
    deleter_type deleter_{ nullptr };

    void free() noexcept
    {
        if( *this && nullptr != deleter_ )
        {
            deleter_( this->native(), nullptr );
        }
    }
};

template< typename vk_source_handle, typename vk_derived_handle >
using vk_derived_deleter = void( VKAPI_PTR* )( vk_source_handle, vk_derived_handle, VkAllocationCallbacks const* );

// Owns a handle created from a parent handle (device memory, buffer, debug report ...).
// The parent is not owned: it has to outlive this object.
template< typename vk_source_handle, typename vk_derived_handle >
class derived_handle : public unique_handle< vk_derived_handle >
{
public:
    using base_type = unique_handle< vk_derived_handle >;
    using source_native_type = vk_source_handle;
    using native_type = vk_derived_handle;
    using deleter_type = vk_derived_deleter< vk_source_handle, vk_derived_handle >;

    derived_handle( derived_handle const& ) = delete;
    derived_handle& operator=( derived_handle const& ) = delete;

    derived_handle( derived_handle&& handle ) noexcept
        : base_type( std::move( handle ) )
        , source_native_( std::exchange( handle.source_native_, VK_NULL_HANDLE ) )
        , deleter_( std::exchange( handle.deleter_, nullptr ) )
    {}

    derived_handle& operator=( derived_handle&& handle ) noexcept
    {
        if( this != &handle )
        {
            free();
            base_type::operator=( std::move( handle ) );
            source_native_ = std::exchange( handle.source_native_, VK_NULL_HANDLE );
            deleter_ = std::exchange( handle.deleter_, nullptr );
        }
        return *this;
    }

    ~derived_handle() noexcept { free(); }

    explicit operator bool() const noexcept { return source_native_ != VK_NULL_HANDLE && base_type::operator bool(); }

    void reset() noexcept
    {
        free();
        this->release();
        source_native_ = VK_NULL_HANDLE;
    }

    [[nodiscard]] source_native_type source_native() const noexcept { return source_native_; }

protected:
    derived_handle() noexcept = default;

    derived_handle( source_native_type const source_native, deleter_type const deleter ) noexcept
        : base_type()
        , source_native_( source_native )
        , deleter_( deleter )
    {}

private:
    source_native_type source_native_{ VK_NULL_HANDLE };
    deleter_type deleter_{ nullptr };

    void free() noexcept
    {
        if( *this && nullptr != deleter_ )
        {
            deleter_( source_native_, this->native(), nullptr );
        }
    }
};

// Numeric identity of a handle, for logging. Non-dispatchable handles are plain integers on 32-bit targets.
template< typename vk_handle >
[[nodiscard]] uint64_t handle_id( vk_handle const handle ) noexcept
{
    if constexpr( std::is_pointer_v< vk_handle > )
    {
        return static_cast< uint64_t >( reinterpret_cast< std::uintptr_t >( handle ) );
    }
    else
    {
        return static_cast< uint64_t >( handle );
    }
}

} // namespace private_
} // namespace vkguard

#endif // _VKGUARD_HANDLES_INCLUDED_
