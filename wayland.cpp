#include <stdlib.h>
#include <dlfcn.h>

#include "wayland.h"
#include "log.h"

static void* SystemOpen(const char* path)
{
	return dlopen(path, RTLD_LAZY);
}

static void* SystemSym(void* lib, const char* name)
{
	return dlsym(lib, name);
}

static void SystemClose(void* lib)
{
	dlclose(lib);
}

const KILN_DL* kilnSystemDL()
{
	static const KILN_DL dl = { SystemOpen, SystemSym, SystemClose };
	return &dl;
}

KILN_WAYLAND* kilnWaylandOpen(const KILN_DL* dl, const char* path, KILN_FRAME_DONE done)
{
	if (!dl || !done)
		return 0;

	void* lib = 0;
	if (path)
		lib = dl->open(path);
	else
	{
		lib = dl->open("libwayland-client.so");
		if (!lib)
			lib = dl->open("libwayland-client.so.0");
	}

	if (!lib)
	{
		kilnLog("libwayland-client not available, compositor pacing disabled");
		return 0;
	}

	KILN_WL_MARSHAL_CONSTRUCTOR marshal_constructor = (KILN_WL_MARSHAL_CONSTRUCTOR)dl->sym(lib, "wl_proxy_marshal_constructor");
	KILN_WL_ADD_LISTENER add_listener = (KILN_WL_ADD_LISTENER)dl->sym(lib, "wl_proxy_add_listener");
	KILN_WL_DESTROY destroy = (KILN_WL_DESTROY)dl->sym(lib, "wl_proxy_destroy");
	const void* callback_interface = dl->sym(lib, "wl_callback_interface");

	if (!marshal_constructor || !add_listener || !destroy || !callback_interface)
	{
		kilnLog("libwayland-client lacks frame callback symbols, compositor pacing disabled");
		dl->close(lib);
		return 0;
	}

	KILN_WL_LISTENER* listener = (KILN_WL_LISTENER*)malloc(sizeof(KILN_WL_LISTENER));
	KILN_WAYLAND* wl = (KILN_WAYLAND*)malloc(sizeof(KILN_WAYLAND));
	if (!listener || !wl)
	{
		free(listener);
		free(wl);
		dl->close(lib);
		return 0;
	}

	listener->done = done;

	wl->dl = dl;
	wl->lib = lib;
	wl->marshal_constructor = marshal_constructor;
	wl->add_listener = add_listener;
	wl->destroy = destroy;
	wl->callback_interface = callback_interface;
	wl->listener = listener;

	return wl;
}

void* kilnWaylandRequestFrame(KILN_WAYLAND* wl, void* surface, void* data)
{
	if (!wl || !surface)
		return 0;

	void* callback = wl->marshal_constructor(surface, KILN_WL_SURFACE_FRAME, wl->callback_interface, (void*)0);
	if (!callback)
		return 0;

	if (wl->add_listener(callback, (void(**)(void))wl->listener, data) != 0)
	{
		// proxy already had a listener, nothing would clear it
		wl->destroy(callback);
		return 0;
	}

	return callback;
}

void kilnWaylandDestroy(KILN_WAYLAND* wl, void* request)
{
	if (!wl || !request)
		return;
	wl->destroy(request);
}

void kilnWaylandClose(KILN_WAYLAND* wl)
{
	if (!wl)
		return;

	free(wl->listener);
	wl->listener = 0;

	if (wl->lib)
		wl->dl->close(wl->lib);

	free(wl);
}
