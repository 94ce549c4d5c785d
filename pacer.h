#pragma once

#include <stdint.h>

#include "wayland.h"

struct KILN_PACER
{
	bool vsync;
	void* surface; // wl_surface of the window, 0 if not on wayland
	KILN_WAYLAND* wl;

	// non-zero while waiting for the compositor to say it's time to draw
	void* frame_callback;
};

void kilnPacerInit(KILN_PACER* p, bool vsync);

// once per iteration after pumping events, returns false if drawing
// must be skipped this iteration
bool kilnPacerBegin(KILN_PACER* p);

bool kilnPacerAwaiting(const KILN_PACER* p);

// KILN_WL_LISTENER::done target, 'data' is the pacer
void kilnPacerFrameDone(void* data, void* callback, uint32_t serial);
