#include <stdlib.h>
#include <string.h>

#include "loop.h"
#include "joystick.h"
#include "log.h"

KILN_LOOP* kilnCreate(const KILN_NATIVE* native, const PlatformInterface* pi, const KILN_CONF* conf)
{
	int major = 0, minor = 0, patch = 0;
	native->get_version(&major, &minor, &patch);

	int version = 100 * major + 10 * minor + patch;
	if (version <= 204)
		kilnWarn("SDL %d.%d.%d detected, please use SDL 2.0.5 or higher.", major, minor, patch);

	native->set_hint(SDL_HINT_JOYSTICK_ALLOW_BACKGROUND_EVENTS, "1");

	if (!native->init(SDL_INIT_VIDEO | SDL_INIT_JOYSTICK | SDL_INIT_GAMECONTROLLER | SDL_INIT_HAPTIC))
	{
		kilnWarn("native init failed: %s", native->get_error());
		return 0;
	}

	native->disable_screensaver();

	KILN_LOOP* loop = new KILN_LOOP;

	loop->native = native;
	if (pi)
		loop->platform_api = *pi;
	else
		memset(&loop->platform_api, 0, sizeof(PlatformInterface));

	if (conf)
		loop->conf = *conf;
	else
		kilnDefaultConf(&loop->conf);

	loop->cookie = 0;
	loop->native_up = true;
	loop->win = 0;
	loop->state = KILN_NOT_STARTED;
	loop->exiting = 0;

	loop->active = false;
	loop->text_input = loop->conf.text_input;
	loop->num_keys = 0;
	memset(&loop->mouse, 0, sizeof(MouseState));

	kilnPacerInit(&loop->pacer, loop->conf.wayland_vsync);

	pthread_mutex_init(&loop->work_mutex, 0);
	loop->work_head = 0;
	loop->work_tail = 0;

	loop->win = native->create_window(loop->conf.title, loop->conf.width, loop->conf.height);
	if (!loop->win)
	{
		kilnWarn("couldn't create window: %s", native->get_error());
		kilnDestroy(loop);
		return 0;
	}

	kilnLog("SDL %d.%d.%d, window %dx%d", major, minor, patch, loop->conf.width, loop->conf.height);
	return loop;
}

bool kilnInitialize(KILN_LOOP* loop, const KILN_DL* dl)
{
	// already bridged, a new bridge would orphan the pinned listener
	if (loop->pacer.wl)
		return true;

	kilnPumpEvents(loop);

	KILN_WMINFO info;
	memset(&info, 0, sizeof(info));

	if (!loop->win || !loop->native->get_wm_info(loop->win, &info))
	{
		kilnLog("window manager info unavailable");
		return false;
	}

	if (info.subsystem != KILN_WM_WAYLAND || !info.wl_surface)
		return false;

	loop->pacer.surface = info.wl_surface;
	loop->pacer.wl = kilnWaylandOpen(dl ? dl : kilnSystemDL(), 0, kilnPacerFrameDone);

	if (loop->pacer.wl)
		kilnLog("wayland session, frame callbacks available (vsync %s)", loop->pacer.vsync ? "on" : "off");

	return loop->pacer.wl != 0;
}

static void RunWork(KILN_LOOP* loop)
{
	// detach the whole list, items posted meanwhile go to the next iteration
	pthread_mutex_lock(&loop->work_mutex);
	KILN_WORK* work = loop->work_head;
	loop->work_head = 0;
	loop->work_tail = 0;
	pthread_mutex_unlock(&loop->work_mutex);

	while (work)
	{
		KILN_WORK* next = work->next;
		work->fn(work->cookie);
		free(work);
		work = next;
	}
}

void kilnPost(KILN_LOOP* loop, void(*fn)(void* cookie), void* cookie)
{
	if (!fn)
		return;

	KILN_WORK* work = (KILN_WORK*)malloc(sizeof(KILN_WORK));
	if (!work)
	{
		kilnWarn("out of memory, dropping deferred work");
		return;
	}

	work->fn = fn;
	work->cookie = cookie;
	work->next = 0;

	pthread_mutex_lock(&loop->work_mutex);
	work->prev = loop->work_tail;
	if (loop->work_tail)
		loop->work_tail->next = work;
	else
		loop->work_head = work;
	loop->work_tail = work;
	pthread_mutex_unlock(&loop->work_mutex);
}

void kilnLoop(KILN_LOOP* loop)
{
	if (loop->state != KILN_NOT_STARTED)
		kilnFatal("kilnLoop() called in state %d, the loop can run only once", (int)loop->state);

	loop->state = KILN_RUNNING;

	if (loop->win)
		loop->native->show_window(loop->win);

	while (true)
	{
		kilnPumpEvents(loop);

		bool draw = kilnPacerBegin(&loop->pacer);

		if (loop->platform_api.tick)
			loop->platform_api.tick(loop, draw);

		RunWork(loop);

		if (loop->platform_api.dispose_contexts)
			loop->platform_api.dispose_contexts(loop);

		if (loop->exiting.load() > 0)
			break;
	}

	loop->state = KILN_EXITING;
	kilnLog("loop exited");
}

void kilnRun(KILN_LOOP* loop, RunMode mode)
{
	switch (mode)
	{
		case KILN_RUN_SYNC:
			kilnLoop(loop);
			break;
		case KILN_RUN_ASYNC:
			kilnStartLoop(loop);
			break;
		default:
			kilnFatal("unknown run mode %d", (int)mode);
	}
}

void kilnStartLoop(KILN_LOOP* loop)
{
	kilnFatal("run mode KILN_RUN_ASYNC (%d) is not supported, the SDL platform runs synchronously only", (int)KILN_RUN_ASYNC);
}

void kilnExit(KILN_LOOP* loop)
{
	loop->exiting.fetch_add(1);
}

bool kilnIsExiting(const KILN_LOOP* loop)
{
	return loop->exiting.load() > 0;
}

LoopState kilnGetState(const KILN_LOOP* loop)
{
	return loop->state;
}

void kilnDispose(KILN_LOOP* loop)
{
	if (loop->state == KILN_DISPOSED)
		return;

	// the listener must outlive any request referencing it
	if (loop->pacer.frame_callback)
	{
		kilnWaylandDestroy(loop->pacer.wl, loop->pacer.frame_callback);
		loop->pacer.frame_callback = 0;
	}

	if (loop->pacer.wl)
	{
		kilnWaylandClose(loop->pacer.wl);
		loop->pacer.wl = 0;
		loop->pacer.surface = 0;
	}

	if (loop->win)
	{
		loop->native->destroy_window(loop->win);
		loop->win = 0;
	}

	kilnJoyCloseAll(loop->native);

	if (loop->native_up)
	{
		loop->native->quit();
		loop->native_up = false;
	}

	loop->state = KILN_DISPOSED;
}

void kilnDestroy(KILN_LOOP* loop)
{
	if (!loop)
		return;

	kilnDispose(loop);

	// never executed
	KILN_WORK* work = loop->work_head;
	while (work)
	{
		KILN_WORK* next = work->next;
		free(work);
		work = next;
	}

	pthread_mutex_destroy(&loop->work_mutex);

	delete loop;
}

void kilnSetCookie(KILN_LOOP* loop, void* cookie)
{
	loop->cookie = cookie;
}

void* kilnGetCookie(KILN_LOOP* loop)
{
	return loop->cookie;
}

bool kilnIsActive(const KILN_LOOP* loop)
{
	return loop->active;
}

const KeyInfo* kilnGetKeys(const KILN_LOOP* loop, int* count)
{
	if (count)
		*count = loop->num_keys;
	return loop->keys;
}

bool kilnIsKeyDown(const KILN_LOOP* loop, KeyInfo ki)
{
	for (int i = 0; i < loop->num_keys; i++)
	{
		if (loop->keys[i] == ki)
			return true;
	}
	return false;
}

void kilnGetMouse(const KILN_LOOP* loop, MouseState* ms)
{
	*ms = loop->mouse;
}

void kilnTakeScroll(KILN_LOOP* loop, int* x, int* y)
{
	if (x)
		*x = loop->mouse.scroll_x;
	if (y)
		*y = loop->mouse.scroll_y;
	loop->mouse.scroll_x = 0;
	loop->mouse.scroll_y = 0;
}

void kilnSetTextInput(KILN_LOOP* loop, bool enable)
{
	loop->text_input = enable;
}

bool kilnGetTextInput(const KILN_LOOP* loop)
{
	return loop->text_input;
}

void kilnPresent(KILN_LOOP* loop)
{
	if (loop->win)
		loop->native->swap_window(loop->win);
}

void kilnSetMouseVisible(KILN_LOOP* loop, bool visible)
{
	loop->native->show_cursor(visible);
}

void kilnPresentationChanged(KILN_LOOP* loop, bool fullscreen, int w, int h)
{
	if (!loop->win)
		return;

	int index = loop->native->get_display_index(loop->win);
	const char* name = index >= 0 ? loop->native->get_display_name(index) : 0;

	if (loop->platform_api.screen_change)
		loop->platform_api.screen_change(loop, name ? name : "", w, h, fullscreen);
}
