#ifndef _VKGUARD_BUILDER_INCLUDED_
#define _VKGUARD_BUILDER_INCLUDED_

#include <vkguard/common.hpp>

#include <span>
#include <string>
#include <string_view>

namespace vkguard
{
/// Staged construction over a native create-info aggregate.
///
/// Setters of the concrete builders write straight into info_; list arguments are borrowed
/// (count and pointer are stored, the storage stays the caller's) so nothing is allocated while
/// configuring. build() of the concrete builder validates the required fields first and then
/// issues exactly one create call. Borrowed storage has to stay alive until build() returns.
template< typename create_info_type >
class basic_builder
{
public:
    using create_info = create_info_type;

    [[nodiscard]] create_info const& info() const noexcept { return info_; }

protected:
    explicit basic_builder( VkStructureType const type ) noexcept
        : info_{}
    {
        info_.sType = type;
    }

    basic_builder( basic_builder const& ) = default;
    basic_builder& operator=( basic_builder const& ) = default;
    ~basic_builder() = default;

    static void require( bool const condition, std::string_view const field, char const* const reason )
    {
        if( !condition )
        {
            throw validation_error( field, reason );
        }
    }

    // Every name of a borrowed name list has to be set.
    static void require_names( std::span< char const* const > const names, std::string_view const field )
    {
        for( auto const* name: names )
        {
            require( nullptr != name, field, "null name in list" );
        }
    }

    create_info info_;
};

} // namespace vkguard

#endif // _VKGUARD_BUILDER_INCLUDED_
