#include <stdlib.h>

#include "native.h"

#ifdef _WIN32
#include <SDL_syswm.h>
#else
#include <SDL2/SDL_syswm.h>
#endif

struct KILN_WND
{
	SDL_Window* win;
	SDL_GLContext rc;
};

static bool Init(uint32_t flags)
{
	return SDL_Init(flags) == 0;
}

static void Quit()
{
	SDL_Quit();
}

static bool PollEvent(SDL_Event* ev)
{
	return SDL_PollEvent(ev) == 1;
}

static void SetHint(const char* name, const char* value)
{
	SDL_SetHint(name, value);
}

static void GetVersion(int* major, int* minor, int* patch)
{
	SDL_version v;
	SDL_GetVersion(&v);
	*major = v.major;
	*minor = v.minor;
	*patch = v.patch;
}

static void DisableScreenSaver()
{
	SDL_DisableScreenSaver();
}

static const char* GetError()
{
	return SDL_GetError();
}

static void* CreateWindow(const char* title, int w, int h)
{
	SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

	SDL_Window* win = SDL_CreateWindow(title,
		SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED, w, h,
		SDL_WINDOW_ALLOW_HIGHDPI |
		SDL_WINDOW_OPENGL |
		SDL_WINDOW_RESIZABLE |
		SDL_WINDOW_HIDDEN);

	if (!win)
		return 0;

	SDL_GLContext rc = SDL_GL_CreateContext(win);
	if (!rc)
	{
		SDL_DestroyWindow(win);
		return 0;
	}

	// note
	// rc is now current

	KILN_WND* wnd = (KILN_WND*)malloc(sizeof(KILN_WND));
	if (!wnd)
	{
		SDL_GL_DeleteContext(rc);
		SDL_DestroyWindow(win);
		return 0;
	}

	wnd->win = win;
	wnd->rc = rc;
	return wnd;
}

static void DestroyWindow(void* win)
{
	KILN_WND* wnd = (KILN_WND*)win;
	SDL_GL_DeleteContext(wnd->rc);
	SDL_DestroyWindow(wnd->win);
	free(wnd);
}

static void ShowWindow(void* win)
{
	SDL_ShowWindow(((KILN_WND*)win)->win);
}

static void SwapWindow(void* win)
{
	SDL_GL_SwapWindow(((KILN_WND*)win)->win);
}

static void ShowCursor(bool show)
{
	SDL_ShowCursor(show ? SDL_ENABLE : SDL_DISABLE);
}

static int GetDisplayIndex(void* win)
{
	return SDL_GetWindowDisplayIndex(((KILN_WND*)win)->win);
}

static const char* GetDisplayName(int index)
{
	return SDL_GetDisplayName(index);
}

static bool GetWMInfo(void* win, KILN_WMINFO* info)
{
	SDL_SysWMinfo sys;
	SDL_VERSION(&sys.version);

	if (!SDL_GetWindowWMInfo(((KILN_WND*)win)->win, &sys))
		return false;

	info->wl_display = 0;
	info->wl_surface = 0;

	switch (sys.subsystem)
	{
		case SDL_SYSWM_X11:
			info->subsystem = KILN_WM_X11;
			break;

		case SDL_SYSWM_WAYLAND:
			info->subsystem = KILN_WM_WAYLAND;
			#ifdef SDL_VIDEO_DRIVER_WAYLAND
			info->wl_display = sys.info.wl.display;
			info->wl_surface = sys.info.wl.surface;
			#endif
			break;

		case SDL_SYSWM_UNKNOWN:
			info->subsystem = KILN_WM_UNKNOWN;
			break;

		default:
			info->subsystem = KILN_WM_OTHER;
	}

	return true;
}

static void* JoyOpen(int device_index)
{
	return SDL_JoystickOpen(device_index);
}

static int JoyInstance(void* joy)
{
	return SDL_JoystickInstanceID((SDL_Joystick*)joy);
}

static void JoyClose(void* joy)
{
	SDL_JoystickClose((SDL_Joystick*)joy);
}

static void FreeString(void* str)
{
	SDL_free(str);
}

const KILN_NATIVE* kilnSdlNative()
{
	static const KILN_NATIVE native =
	{
		Init,
		Quit,
		PollEvent,
		SetHint,
		GetVersion,
		DisableScreenSaver,
		GetError,

		CreateWindow,
		DestroyWindow,
		ShowWindow,
		SwapWindow,
		ShowCursor,
		GetDisplayIndex,
		GetDisplayName,
		GetWMInfo,

		JoyOpen,
		JoyInstance,
		JoyClose,

		FreeString
	};

	return &native;
}
