#ifndef _VKGUARD_ELEMENTS_INCLUDED_
#define _VKGUARD_ELEMENTS_INCLUDED_

#include <vkguard/common.hpp>
#include <vkguard/handles.hpp>
#include <vkguard/commands.hpp>
#include <vkguard/builder.hpp>
#include <vkguard/loader.hpp>
#include <vkguard/debug_report.hpp>
#include <vkguard/instance.hpp>
#include <vkguard/physical_device.hpp>
#include <vkguard/device.hpp>
#include <vkguard/memory.hpp>
#include <vkguard/buffer.hpp>
#include <vkguard/image.hpp>
#include <vkguard/presentation.hpp>

#endif // _VKGUARD_ELEMENTS_INCLUDED_
