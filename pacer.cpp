#include "pacer.h"

void kilnPacerInit(KILN_PACER* p, bool vsync)
{
	p->vsync = vsync;
	p->surface = 0;
	p->wl = 0;
	p->frame_callback = 0;
}

bool kilnPacerAwaiting(const KILN_PACER* p)
{
	return p->frame_callback != 0;
}

bool kilnPacerBegin(KILN_PACER* p)
{
	if (!p->vsync)
		return true;

	// still waiting for the previous frame callback
	if (p->frame_callback)
		return false;

	if (p->wl && p->surface)
		p->frame_callback = kilnWaylandRequestFrame(p->wl, p->surface, p);

	return true;
}

void kilnPacerFrameDone(void* data, void* callback, uint32_t serial)
{
	// note:
	// SDL dispatches the wayland display queue from inside SDL_PollEvent,
	// so this runs on the loop thread and frame_callback needs no lock.
	// A backend dispatching from another thread would break that.

	KILN_PACER* p = (KILN_PACER*)data;

	// callback == p->frame_callback, there is only one registration
	kilnWaylandDestroy(p->wl, callback);
	p->frame_callback = 0;
}
