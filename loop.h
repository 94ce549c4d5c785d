#pragma once

#include <atomic>
#include <pthread.h>

#include "platform.h"
#include "native.h"
#include "config.h"
#include "pacer.h"

// deferred work item, see kilnPost()
struct KILN_WORK
{
	KILN_WORK* prev;
	KILN_WORK* next;

	void(*fn)(void* cookie);
	void* cookie;
};

struct KILN_LOOP
{
	const KILN_NATIVE* native;
	PlatformInterface platform_api;
	KILN_CONF conf;
	void* cookie;

	bool native_up; // native->init() succeeded, native->quit() pending
	void* win;

	LoopState state;

	// incremented from any thread, > 0 ends the loop
	std::atomic<int> exiting;

	// written by the translator on the loop thread only
	bool active;
	bool text_input;
	KeyInfo keys[KILN_MAPEND];
	int num_keys;
	MouseState mouse;

	KILN_PACER pacer;

	pthread_mutex_t work_mutex; // guards work_head/work_tail, see kilnPost()
	KILN_WORK* work_head;
	KILN_WORK* work_tail;
};
