#ifndef _VKGUARD_TEST_FIXTURE_INCLUDED_
#define _VKGUARD_TEST_FIXTURE_INCLUDED_

#include "mock_driver.hpp"

#include <vkguard/elements.hpp>

#include <gtest/gtest.h>

#include <array>

namespace vkguard::test
{
// Every test starts on a fresh mock driver and has to leave no driver object behind.
class mock_test : public ::testing::Test
{
protected:
    void SetUp() override { mock::driver::get().reset(); }

    void TearDown() override { EXPECT_EQ( 0U, driver().live_objects() ); }

    static mock::driver& driver() { return mock::driver::get(); }

    static vkguard::loader make_loader() { return vkguard::loader( driver().entry_point() ); }

    static vkguard::instance make_instance( bool const print_debug_report = false, std::span< extension::id_type const > const extensions = {} )
    {
        return vkguard::instance::builder()
            .application_info( vkguard::application_info( "vkguard-test", version( 0, 1, 0 ) ) )
            .enabled_extensions( extensions )
            .print_debug_report( print_debug_report )
            .build( make_loader() );
    }

    static physical_device first_physical_device( vkguard::instance const& instance )
    {
        auto devices = instance.enumerate_physical_devices();
        if( devices.empty() )
        {
            throw std::logic_error( "mock driver reports no physical device" );
        }
        return devices.front();
    }

    // One queue of the first family.
    static vkguard::device make_device( physical_device const& physical )
    {
        static constexpr std::array< device::queue::priority_type, 1 > const priorities{ 1.0F };
        std::array< device::queue::request, 1 > const requests{ device::queue::request( 0, priorities ) };
        return device::builder( physical ).add_queues( requests ).build();
    }
};

} // namespace vkguard::test

#endif // _VKGUARD_TEST_FIXTURE_INCLUDED_
