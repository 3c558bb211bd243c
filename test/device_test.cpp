#include "fixture.hpp"

#include <array>
#include <stdexcept>
#include <string_view>

namespace vkguard::test
{
namespace
{
using ability = queue_family::ability_flag;
using memory_flag = physical_device::memory_property::flag;

class device_test : public mock_test
{
protected:
    static constexpr std::array< device::queue::priority_type, 1 > const one{ 1.0F };
    static constexpr std::array< device::queue::priority_type, 2 > const two{ 1.0F, 0.5F };
};

TEST_F( device_test, physical_device_descriptor )
{
    auto const instance = make_instance();
    auto const physical = first_physical_device( instance );
    ASSERT_TRUE( physical );
    EXPECT_EQ( physical_device::kind::DISCRETE_GPU, physical.properties().kind() );
    EXPECT_EQ( version( 1, 1, 0 ), physical.properties().api_version() );
    EXPECT_EQ( VK_TRUE, physical.features().samplerAnisotropy );
    ASSERT_EQ( 3U, physical.queue_families().size() );
    EXPECT_TRUE( physical.queue_families()[ 0 ].does( queue_family::ability_flags( ability::SUPPORTS_GRAPHICS ) | ability::SUPPORTS_TRANSFER ) );
    EXPECT_FALSE( physical.queue_families()[ 2 ].does( ability::SUPPORTS_COMPUTATION ) );
    EXPECT_EQ( 2U, physical.queue_families()[ 0 ].count() );

    EXPECT_TRUE( physical.supports_extension( VK_KHR_SWAPCHAIN_EXTENSION_NAME ) );
    EXPECT_FALSE( physical.supports_extension( "VK_KHR_not_there" ) );
}

TEST_F( device_test, memory_type_selection )
{
    auto const instance = make_instance();
    auto const physical = first_physical_device( instance );
    EXPECT_EQ( mock::device_local_type, physical.find_memory_type_index( ~0U, memory_flag::DEVICE_LOCAL ) );
    EXPECT_EQ( mock::host_coherent_type,
               physical.find_memory_type_index( ~0U, physical_device::memory_property::flags( memory_flag::HOST_VISIBLE ) | memory_flag::HOST_COHERENT ) );
    EXPECT_EQ( mock::host_cached_type, physical.find_memory_type_index( ~0U, memory_flag::HOST_CACHED ) );
    // Type 1 excluded by the bits: the next host visible type wins.
    EXPECT_EQ( mock::host_cached_type, physical.find_memory_type_index( 0b101U, memory_flag::HOST_VISIBLE ) );
    EXPECT_EQ( physical_device::memory_property::no_memory_type, physical.find_memory_type_index( ~0U, memory_flag::LAZILY_ALLOCATED ) );
}

TEST_F( device_test, queue_family_search_prefers_exact_match )
{
    auto const instance = make_instance();
    auto const physical = first_physical_device( instance );
    EXPECT_EQ( 0U, physical.find_queue_family( ability::SUPPORTS_GRAPHICS ) );
    EXPECT_EQ( 2U, physical.find_queue_family( ability::SUPPORTS_TRANSFER ) );
    EXPECT_EQ( 1U, physical.find_queue_family( queue_family::ability_flags( ability::SUPPORTS_COMPUTATION ) | ability::SUPPORTS_TRANSFER ) );
    EXPECT_EQ( 0U, physical.find_queue_family( ability::SUPPORTS_COMPUTATION ) );
    EXPECT_FALSE( physical.find_queue_family( ability::SUPPORTS_SPARSE_BINDING ).has_value() );
}

TEST_F( device_test, queue_family_search_with_surface )
{
    auto const surface = mock::make_handle< VkSurfaceKHR >( 0x77 );
    {
        auto const instance = make_instance();
        auto const physical = first_physical_device( instance );
        EXPECT_THROW( [[maybe_unused]] auto const family = physical.find_queue_family( ability::SUPPORTS_TRANSFER, surface ), validation_error );
        EXPECT_THROW( [[maybe_unused]] auto const supported = physical.supports_presentation( 0, surface ), validation_error );
    }

    auto const instance = make_instance( false, presentation::instance_extensions() );
    ASSERT_TRUE( instance.commands().has_surface() );
    auto const physical = first_physical_device( instance );
    EXPECT_TRUE( physical.supports_presentation( 0, surface ) );
    EXPECT_FALSE( physical.supports_presentation( 2, surface ) );
    // Only family 0 presents in the mock, although family 2 is the exact transfer match.
    EXPECT_EQ( 0U, physical.find_queue_family( ability::SUPPORTS_TRANSFER, surface ) );

    driver().config.surface_support = false;
    EXPECT_FALSE( physical.find_queue_family( ability::SUPPORTS_TRANSFER, surface ).has_value() );
}

TEST_F( device_test, presentation_extension_names )
{
    auto const instance_extensions = presentation::instance_extensions();
    ASSERT_FALSE( instance_extensions.empty() );
    EXPECT_EQ( std::string_view( VK_KHR_SURFACE_EXTENSION_NAME ), instance_extensions.front() );
    auto const device_extensions = presentation::device_extensions();
    ASSERT_EQ( 1U, device_extensions.size() );
    EXPECT_EQ( std::string_view( VK_KHR_SWAPCHAIN_EXTENSION_NAME ), device_extensions.front() );
}

TEST_F( device_test, queues_follow_request_order )
{
    auto const instance = make_instance();
    auto const physical = first_physical_device( instance );
    std::array< device::queue::request, 3 > const requests{ device::queue::request( 2, one ), device::queue::request( 0, two ),
                                                            device::queue::request( 1, one ) };
    auto const device = device::builder( physical ).add_queues( requests ).build();
    ASSERT_TRUE( device );

    auto const& sets = device.queues();
    ASSERT_EQ( requests.size(), sets.size() );
    for( size_t i = 0; i < requests.size(); ++i )
    {
        EXPECT_EQ( requests[ i ].family_index(), sets[ i ].family_index );
        ASSERT_EQ( requests[ i ].priorities().size(), sets[ i ].queues.size() );
        for( uint32_t q = 0; q < sets[ i ].queues.size(); ++q )
        {
            EXPECT_TRUE( sets[ i ].queues[ q ] );
            EXPECT_EQ( requests[ i ].family_index(), sets[ i ].queues[ q ].family_index() );
            EXPECT_EQ( q, sets[ i ].queues[ q ].index() );
        }
    }
    EXPECT_NE( device.get_queue( 1, 0 ).native(), device.get_queue( 1, 1 ).native() );
    EXPECT_THROW( [[maybe_unused]] auto const& queue = device.get_queue( 3 ), std::out_of_range );
    EXPECT_THROW( [[maybe_unused]] auto const& queue = device.get_queue( 0, 1 ), std::out_of_range );

    ASSERT_EQ( 1U, driver().devices.size() );
    auto const& recorded = driver().devices.begin()->second.queue_requests;
    ASSERT_EQ( 3U, recorded.size() );
    EXPECT_EQ( 2U, recorded[ 0 ].first );
    EXPECT_EQ( 2U, recorded[ 1 ].second );
}

TEST_F( device_test, queue_request_validation )
{
    auto const instance = make_instance();
    auto const physical = first_physical_device( instance );
    auto const calls = driver().create_calls;

    auto const expect_invalid = [ & ]( std::span< device::queue::request const > const requests ) {
        try
        {
            [[maybe_unused]] auto const device = device::builder( physical ).add_queues( requests ).build();
            ADD_FAILURE() << "invalid queue request accepted";
        }
        catch( validation_error const& ex )
        {
            EXPECT_EQ( "add_queues", ex.field() );
        }
    };

    expect_invalid( {} );

    std::array< device::queue::request, 1 > const no_priority{ device::queue::request( 0, std::span< device::queue::priority_type const >() ) };
    expect_invalid( no_priority );

    static constexpr std::array< device::queue::priority_type, 1 > const too_high{ 1.5F };
    std::array< device::queue::request, 1 > const out_of_range{ device::queue::request( 0, too_high ) };
    expect_invalid( out_of_range );

    std::array< device::queue::request, 2 > const duplicate{ device::queue::request( 1, one ), device::queue::request( 1, one ) };
    expect_invalid( duplicate );

    EXPECT_EQ( calls, driver().create_calls );
}

TEST_F( device_test, queue_requests_beyond_the_descriptor )
{
    auto const instance = make_instance();
    auto const physical = first_physical_device( instance );
    auto const calls = driver().create_calls;

    std::array< device::queue::request, 1 > const unknown_family{ device::queue::request( 7, one ) };
    std::array< device::queue::request, 1 > const too_many{ device::queue::request( 1, two ) };
    for( auto const requests: { std::span< device::queue::request const >( unknown_family ), std::span< device::queue::request const >( too_many ) } )
    {
        try
        {
            [[maybe_unused]] auto const device = device::builder( physical ).add_queues( requests ).build();
            ADD_FAILURE() << "queue request beyond the family accepted";
        }
        catch( driver_error const& ex )
        {
            EXPECT_EQ( result::ERROR_INITIALIZATION_FAILED, ex.result );
            EXPECT_EQ( dbg::object::DEVICE, ex.object );
        }
    }
    EXPECT_EQ( calls, driver().create_calls );
}

TEST_F( device_test, null_extension_name_is_invalid )
{
    auto const instance = make_instance();
    auto const physical = first_physical_device( instance );
    std::array< device::queue::request, 1 > const requests{ device::queue::request( 0, one ) };
    std::array< extension::id_type, 1 > const extensions{ nullptr };
    EXPECT_THROW( device::builder( physical ).add_queues( requests ).enabled_extensions( extensions ).build(), validation_error );
}

TEST_F( device_test, extensions_and_features )
{
    auto const instance = make_instance();
    auto const physical = first_physical_device( instance );
    std::array< device::queue::request, 1 > const requests{ device::queue::request( 0, one ) };
    physical_device::feature features;
    features.samplerAnisotropy = VK_TRUE;
    auto const device = device::builder( physical )
                            .add_queues( requests )
                            .enabled_extensions( presentation::device_extensions() )
                            .enabled_features( features )
                            .build();
    EXPECT_TRUE( device.is_extension_enabled( VK_KHR_SWAPCHAIN_EXTENSION_NAME ) );
    EXPECT_FALSE( device.is_extension_enabled( "VK_KHR_not_there" ) );
    EXPECT_EQ( physical.native(), device.physical().native() );
}

TEST_F( device_test, waiting_for_idle )
{
    auto const instance = make_instance();
    auto const device = make_device( first_physical_device( instance ) );
    device.wait_idle();
    device.get_queue( 0 ).wait_idle();
    EXPECT_EQ( 2U, driver().wait_calls );

    driver().config.wait_result = VK_ERROR_DEVICE_LOST;
    try
    {
        device.get_queue( 0 ).wait_idle();
        FAIL() << "lost device hidden";
    }
    catch( driver_error const& ex )
    {
        EXPECT_EQ( result::ERROR_DEVICE_LOST, ex.result );
        EXPECT_EQ( dbg::object::QUEUE, ex.object );
    }
    EXPECT_THROW( device::queue().wait_idle(), validation_error );
}

TEST_F( device_test, out_of_host_memory_on_creation )
{
    auto const instance = make_instance();
    auto const physical = first_physical_device( instance );
    driver().config.out_of_host_memory = true;
    EXPECT_THROW( make_device( physical ), out_of_host_memory );
}

TEST_F( device_test, missing_device_entry_point_still_destroys_the_device )
{
    auto const instance = make_instance();
    auto const physical = first_physical_device( instance );
    driver().config.hidden_entry_points = { "vkBindImageMemory" };
    EXPECT_THROW( make_device( physical ), loader_error );
    EXPECT_EQ( 1U, driver().count_events( "VkDevice", false ) );
}

TEST_F( device_test, device_goes_before_instance )
{
    {
        auto const instance = make_instance();
        auto const device = make_device( first_physical_device( instance ) );
    }
    auto const& events = driver().events;
    ASSERT_EQ( 4U, events.size() );
    EXPECT_EQ( "VkDevice", events[ 2 ].type );
    EXPECT_FALSE( events[ 2 ].created );
    EXPECT_EQ( "VkInstance", events[ 3 ].type );
}

} // namespace
} // namespace vkguard::test
