#pragma once

/**
 * @file lumen.h
 * @brief Umbrella header for the Lumen renderer
 */

#include <lumen/binding_layouts.h>
#include <lumen/camera.h>
#include <lumen/command_list.h>
#include <lumen/config.h>
#include <lumen/device.h>
#include <lumen/error.h>
#include <lumen/frame_renderer.h>
#include <lumen/frame_slots.h>
#include <lumen/frame_timer.h>
#include <lumen/gpu_structs.h>
#include <lumen/headless_device.h>
#include <lumen/pipeline_registry.h>
#include <lumen/primitives.h>
#include <lumen/render_context.h>
#include <lumen/resource_manager.h>
#include <lumen/scene.h>
#include <lumen/shaders.h>
#include <lumen/stereo_view.h>
#include <lumen/submission_tracker.h>
#include <lumen/types.h>
#include <lumen/uniform_frame_state.h>
#include <lumen/webgpu_device.h>
