#include "fixture.hpp"

#include <algorithm>
#include <cstdlib>

namespace vkguard::test
{
namespace
{
class loader_test : public mock_test
{};

TEST_F( loader_test, adopts_entry_point_and_reads_instance_version )
{
    auto loader = make_loader();
    EXPECT_EQ( driver().entry_point(), loader.get_instance_proc_addr() );
    EXPECT_EQ( version( 1, 1, 0 ), loader.instance_version() );
    EXPECT_NE( nullptr, loader.commands().vkCreateInstance );
    EXPECT_NE( nullptr, loader.commands().vkEnumerateInstanceVersion );
}

TEST_F( loader_test, vulkan_1_0_loader_without_version_query )
{
    driver().config.instance_version = 0;
    auto loader = make_loader();
    EXPECT_EQ( nullptr, loader.commands().vkEnumerateInstanceVersion );
    EXPECT_EQ( version( 1, 0, 0 ), loader.instance_version() );
}

TEST_F( loader_test, rejects_version_below_minimum )
{
    EXPECT_THROW( vkguard::loader( driver().entry_point(), version( 1, 2, 0 ) ), loader_error );
    EXPECT_NO_THROW( vkguard::loader( driver().entry_point(), version( 1, 1, 0 ) ) );
}

TEST_F( loader_test, missing_global_entry_point )
{
    driver().config.hidden_entry_points = { "vkCreateInstance" };
    try
    {
        vkguard::loader loader( driver().entry_point() );
        FAIL() << "loader accepted a driver without vkCreateInstance";
    }
    catch( loader_error const& ex )
    {
        EXPECT_NE( std::string( ex.what() ).find( "vkCreateInstance" ), std::string::npos );
    }
}

TEST_F( loader_test, null_entry_point )
{
    EXPECT_THROW( vkguard::loader( static_cast< PFN_vkGetInstanceProcAddr >( nullptr ) ), loader_error );
}

TEST_F( loader_test, library_that_does_not_exist )
{
    EXPECT_THROW( vkguard::loader::load( "/nonexistent/vkguard/libvulkan.so.1" ), loader_error );
}

TEST_F( loader_test, configured_library_takes_precedence )
{
    ::setenv( "VKGUARD_VULKAN_LIBRARY", "/nonexistent/vkguard/libvulkan.so.1", 1 );
    try
    {
        [[maybe_unused]] auto const loader = vkguard::loader::load();
        ::unsetenv( "VKGUARD_VULKAN_LIBRARY" );
        FAIL() << "configured library ignored";
    }
    catch( loader_error const& ex )
    {
        ::unsetenv( "VKGUARD_VULKAN_LIBRARY" );
        EXPECT_NE( std::string( ex.what() ).find( "/nonexistent/vkguard/libvulkan.so.1" ), std::string::npos );
    }
}

TEST_F( loader_test, extension_list_is_cached )
{
    auto loader = make_loader();
    auto const& first = loader.enumerate_instance_extension_properties();
    ASSERT_EQ( 2U, first.size() );
    EXPECT_TRUE( contains( first, extension::debug_report ) );
    EXPECT_TRUE( contains( first, extension::khr_surface ) );

    // The host changes, the cache does not.
    driver().config.instance_extensions.push_back( "VK_KHR_get_physical_device_properties2" );
    auto const& second = loader.enumerate_instance_extension_properties();
    EXPECT_EQ( &first, &second );
    ASSERT_EQ( first.size(), second.size() );
    EXPECT_TRUE( std::equal( first.begin(), first.end(), second.begin(),
                             []( extension const& lhs, extension const& rhs ) { return lhs.name() == rhs.name(); } ) );
    EXPECT_FALSE( loader.supports_extension( "VK_KHR_get_physical_device_properties2" ) );
}

TEST_F( loader_test, layers_and_layer_extensions )
{
    auto const loader = make_loader();
    auto const layers = loader.enumerate_instance_layer_properties();
    ASSERT_EQ( 1U, layers.size() );
    EXPECT_EQ( layer::vendor_standard_layer, layers.front().name() );
    EXPECT_EQ( "mock layer", layers.front().desc() );
    EXPECT_TRUE( loader.supports_layer( layer::vendor_standard_layer ) );
    EXPECT_FALSE( loader.supports_layer( "VK_LAYER_missing" ) );

    EXPECT_TRUE( loader.enumerate_instance_extension_properties( layer::vendor_standard_layer ).empty() );
    try
    {
        [[maybe_unused]] auto const ignored = loader.enumerate_instance_extension_properties( "VK_LAYER_missing" );
        FAIL() << "unknown layer accepted";
    }
    catch( driver_error const& ex )
    {
        EXPECT_EQ( result::ERROR_LAYER_NOT_PRESENT, ex.result );
        EXPECT_EQ( dbg::object::INSTANCE, ex.object );
    }
}

TEST_F( loader_test, moved_loader_keeps_its_table )
{
    auto loader = make_loader();
    auto moved = std::move( loader );
    EXPECT_EQ( driver().entry_point(), moved.get_instance_proc_addr() );
    EXPECT_TRUE( moved.supports_extension( extension::debug_report ) );
}

} // namespace
} // namespace vkguard::test
