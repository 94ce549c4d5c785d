#pragma once

#include <stdint.h>

// dynamic loader, kilnSystemDL() binds it to dlopen/dlsym/dlclose
struct KILN_DL
{
	void*(*open)(const char* path);
	void*(*sym)(void* lib, const char* name);
	void(*close)(void* lib);
};

const KILN_DL* kilnSystemDL();

typedef void(*KILN_FRAME_DONE)(void* data, void* callback, uint32_t serial);

// same layout as wl_callback_listener
struct KILN_WL_LISTENER
{
	KILN_FRAME_DONE done;
};

typedef void* (*KILN_WL_MARSHAL_CONSTRUCTOR)(void* proxy, uint32_t opcode, const void* iface, ...);
typedef int (*KILN_WL_ADD_LISTENER)(void* proxy, void(**implementation)(void), void* data);
typedef void (*KILN_WL_DESTROY)(void* proxy);

struct KILN_WAYLAND
{
	const KILN_DL* dl;
	void* lib;

	KILN_WL_MARSHAL_CONSTRUCTOR marshal_constructor;
	KILN_WL_ADD_LISTENER add_listener;
	KILN_WL_DESTROY destroy;
	const void* callback_interface;

	// handed to libwayland by address, must not move until kilnWaylandClose()
	KILN_WL_LISTENER* listener;
};

// wl_surface.frame
#define KILN_WL_SURFACE_FRAME 3

// path=0 tries libwayland-client.so then libwayland-client.so.0
// returns 0 if the library or any symbol is missing
KILN_WAYLAND* kilnWaylandOpen(const KILN_DL* dl, const char* path, KILN_FRAME_DONE done);

// returns the wl_callback proxy or 0 if no callback will ever fire
void* kilnWaylandRequestFrame(KILN_WAYLAND* wl, void* surface, void* data);

void kilnWaylandDestroy(KILN_WAYLAND* wl, void* request);

// caller must destroy outstanding requests first
void kilnWaylandClose(KILN_WAYLAND* wl);
