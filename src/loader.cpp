#include <vkguard/loader.hpp>

#include "enumerate.hpp"
#include "log.hpp"
#include "resolve.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

#if defined( _WIN32 )
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace
{
void* open_library( char const* const path ) noexcept
{
#if defined( _WIN32 )
    return static_cast< void* >( ::LoadLibraryA( path ) );
#else
    return dlopen( path, RTLD_NOW | RTLD_LOCAL );
#endif
}

PFN_vkGetInstanceProcAddr find_entry_point( void* const library ) noexcept
{
#if defined( _WIN32 )
    return reinterpret_cast< PFN_vkGetInstanceProcAddr >( ::GetProcAddress( static_cast< HMODULE >( library ), "vkGetInstanceProcAddr" ) );
#else
    return reinterpret_cast< PFN_vkGetInstanceProcAddr >( dlsym( library, "vkGetInstanceProcAddr" ) );
#endif
}

constexpr char const* const default_library_names[] = {
#if defined( _WIN32 )
    "vulkan-1.dll",
#elif defined( __APPLE__ )
    "libvulkan.1.dylib",
    "libvulkan.dylib",
    "libMoltenVK.dylib",
#else
    "libvulkan.so.1",
    "libvulkan.so",
#endif
};

} // namespace

namespace vkguard
{
bool contains( std::vector< extension > const& extensions, std::string_view const name ) noexcept
{
    return std::any_of( extensions.begin(), extensions.end(), [ name ]( extension const& e ) { return e.name() == name; } );
}

void loader::library_closer::operator()( void* const library ) const noexcept
{
#if defined( _WIN32 )
    ::FreeLibrary( static_cast< HMODULE >( library ) );
#else
    dlclose( library );
#endif
}

loader loader::load( version const minimum )
{
    if( auto const* const configured = std::getenv( "VKGUARD_VULKAN_LIBRARY" ); nullptr != configured && '\0' != *configured )
    {
        return load( configured, minimum );
    }
    for( auto const* const name: default_library_names )
    {
        if( auto* const library = open_library( name ); nullptr != library )
        {
            private_::log().debug( "opened vulkan library {}", name );
            std::unique_ptr< void, library_closer > owned( library );
            auto const entry_point = find_entry_point( library );
            if( nullptr == entry_point )
            {
                throw loader_error( std::string( name ) + " does not export vkGetInstanceProcAddr" );
            }
            return loader( std::move( owned ), entry_point, minimum );
        }
    }
    throw loader_error( "no vulkan driver library found" );
}

loader loader::load( char const* const library_path, version const minimum )
{
    std::unique_ptr< void, library_closer > library( open_library( library_path ) );
    if( !library )
    {
        throw loader_error( std::string( "cannot open vulkan library " ) + library_path );
    }
    auto const entry_point = find_entry_point( library.get() );
    if( nullptr == entry_point )
    {
        throw loader_error( std::string( library_path ) + " does not export vkGetInstanceProcAddr" );
    }
    private_::log().debug( "opened vulkan library {}", library_path );
    return loader( std::move( library ), entry_point, minimum );
}

loader::loader( PFN_vkGetInstanceProcAddr const entry_point, version const minimum )
    : loader( std::unique_ptr< void, library_closer >(), entry_point, minimum )
{}

loader::loader( std::unique_ptr< void, library_closer > library, PFN_vkGetInstanceProcAddr const entry_point, version const minimum )
    : library_( std::move( library ) )
    , commands_()
    , instance_version_( 1, 0, 0 )
    , extensions_()
{
    if( nullptr == entry_point )
    {
        throw loader_error( "null vkGetInstanceProcAddr" );
    }
    commands_.vkGetInstanceProcAddr = entry_point;
    VkInstance const global = VK_NULL_HANDLE;
    private_::resolve_required( entry_point, global, "vkCreateInstance", commands_.vkCreateInstance );
    private_::resolve_required( entry_point, global, "vkEnumerateInstanceExtensionProperties", commands_.vkEnumerateInstanceExtensionProperties );
    private_::resolve_required( entry_point, global, "vkEnumerateInstanceLayerProperties", commands_.vkEnumerateInstanceLayerProperties );
    private_::resolve( entry_point, global, "vkEnumerateInstanceVersion", commands_.vkEnumerateInstanceVersion );

    if( nullptr != commands_.vkEnumerateInstanceVersion )
    {
        uint32_t packed = 0;
        check( commands_.vkEnumerateInstanceVersion( &packed ), dbg::object::INSTANCE, "instance version query" );
        instance_version_ = version( packed );
    }
    if( instance_version_ < minimum )
    {
        throw loader_error( "vulkan " + to_string( instance_version_ ) + " is older than the required " + to_string( minimum ) );
    }
    private_::log().debug( "vulkan loader ready, instance version {}", to_string( instance_version_ ) );
}

loader::~loader()
{
    if( library_ )
    {
        private_::log().trace( "closing vulkan library" );
    }
}

std::vector< extension > const& loader::enumerate_instance_extension_properties()
{
    if( !extensions_ )
    {
        extensions_ = enumerate_instance_extension_properties( nullptr );
    }
    return *extensions_;
}

std::vector< extension > loader::enumerate_instance_extension_properties( layer::id_type const layer_id ) const
{
    return private_::enumerate< extension >( commands_.vkEnumerateInstanceExtensionProperties, dbg::object::INSTANCE, "extension enumeration", layer_id );
}

std::vector< layer > loader::enumerate_instance_layer_properties() const
{
    return private_::enumerate< layer >( commands_.vkEnumerateInstanceLayerProperties, dbg::object::INSTANCE, "enumeration of layer" );
}

bool loader::supports_extension( std::string_view const name )
{
    return contains( enumerate_instance_extension_properties(), name );
}

bool loader::supports_layer( std::string_view const name ) const
{
    auto const layers = enumerate_instance_layer_properties();
    return std::any_of( layers.begin(), layers.end(), [ name ]( layer const& l ) { return l.name() == name; } );
}

} // namespace vkguard
