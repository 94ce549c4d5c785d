#pragma once

#include <stdint.h>

#include "platform.h"

#ifdef _WIN32
#include <SDL.h>
#else
#include <SDL2/SDL.h>
#endif

enum KILN_WM
{
	KILN_WM_UNKNOWN = 0,
	KILN_WM_X11,
	KILN_WM_WAYLAND,
	KILN_WM_OTHER
};

struct KILN_WMINFO
{
	KILN_WM subsystem;
	void* wl_display; // valid only for KILN_WM_WAYLAND
	void* wl_surface;
};

// windowing backend, kilnSdlNative() binds it to SDL2
struct KILN_NATIVE
{
	bool(*init)(uint32_t flags);
	void(*quit)();
	bool(*poll_event)(SDL_Event* ev); // never blocks
	void(*set_hint)(const char* name, const char* value);
	void(*get_version)(int* major, int* minor, int* patch);
	void(*disable_screensaver)();
	const char*(*get_error)();

	void*(*create_window)(const char* title, int w, int h); // hidden
	void(*destroy_window)(void* win);
	void(*show_window)(void* win);
	void(*swap_window)(void* win);
	void(*show_cursor)(bool show);
	int(*get_display_index)(void* win);
	const char*(*get_display_name)(int index);
	bool(*get_wm_info)(void* win, KILN_WMINFO* info);

	void*(*joy_open)(int device_index);
	int(*joy_instance)(void* joy);
	void(*joy_close)(void* joy);

	void(*free_string)(void* str);
};

const KILN_NATIVE* kilnSdlNative();

KeyInfo kilnKeyFromScancode(int scancode);
KeyInfo kilnKeyFromChar(int ch);
KeyInfo kilnKeyFromKeycode(int sym, int scancode);
