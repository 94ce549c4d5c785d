#include <stdio.h>
#include <string.h>

#ifdef __linux__
#include <GL/gl.h>
#elif defined(__APPLE__)
#include <OpenGL/gl.h>
#endif

#include "platform.h"
#include "native.h"
#include "config.h"
#include "log.h"

struct Demo
{
	int width;
	int height;
	int frames;
	int skipped;
	int heartbeats;
};

static void Tick(KILN_LOOP* loop, bool draw)
{
	Demo* demo = (Demo*)kilnGetCookie(loop);

	int sx, sy;
	kilnTakeScroll(loop, &sx, &sy);
	if (sx || sy)
		kilnLog("scroll %d,%d", sx, sy);

	if (!draw)
	{
		demo->skipped++;
		return;
	}

	MouseState ms;
	kilnGetMouse(loop, &ms);

	float r = demo->width > 0 ? (float)ms.x / demo->width : 0;
	float g = demo->height > 0 ? (float)ms.y / demo->height : 0;
	float b = ms.left == KILN_PRESSED ? 1.0f : kilnIsActive(loop) ? 0.3f : 0.0f;

	glViewport(0, 0, demo->width, demo->height);
	glClearColor(r, g, b, 1);
	glClear(GL_COLOR_BUFFER_BIT);

	kilnPresent(loop);
	demo->frames++;
}

static void Resize(KILN_LOOP* loop, int w, int h)
{
	Demo* demo = (Demo*)kilnGetCookie(loop);
	demo->width = w;
	demo->height = h;
	kilnLog("resize %dx%d", w, h);
}

static void Moved(KILN_LOOP* loop)
{
	kilnLog("moved");
}

static void KeybKey(KILN_LOOP* loop, KeyInfo ki, bool down)
{
	if (ki == KILN_ESCAPE && down)
		kilnExit(loop);
}

static void KeybChar(KILN_LOOP* loop, wchar_t ch, KeyInfo ki)
{
	kilnLog("char U+%04X (key %d)", (unsigned)ch, (int)ki);
}

static void KeybFocus(KILN_LOOP* loop, bool set)
{
	kilnLog(set ? "focus gained" : "focus lost");
}

static void FileDrop(KILN_LOOP* loop, const char* path)
{
	printf("dropped: %s\n", path);
}

static void ScreenChange(KILN_LOOP* loop, const char* display, int w, int h, bool fullscreen)
{
	kilnLog("display '%s' %dx%d%s", display, w, h, fullscreen ? " fullscreen" : "");
}

static void Heartbeat(void* cookie)
{
	Demo* demo = (Demo*)cookie;
	demo->heartbeats++;
	kilnLog("heartbeat from worker (%d)", demo->heartbeats);
}

struct Worker
{
	KILN_LOOP* loop;
	Demo* demo;
};

static void* WorkerMain(void* arg)
{
	Worker* w = (Worker*)arg;
	for (int i = 0; i < 3; i++)
		kilnPost(w->loop, Heartbeat, w->demo);
	return 0;
}

int main(int argc, char* argv[])
{
	KILN_CONF conf;
	kilnDefaultConf(&conf);

	const char* conf_path = kilnGetConfPath();
	for (int p = 1; p < argc; p++)
	{
		if (p + 1 < argc && strcmp(argv[p], "-conf") == 0)
			conf_path = argv[++p];
	}

	if (!kilnReadConf(&conf, conf_path))
		kilnWarn("couldn't read %s", conf_path);
	kilnApplyEnv(&conf);

	for (int p = 1; p < argc; p++)
	{
		if (strcmp(argv[p], "-vsync") == 0)
			conf.wayland_vsync = true;
		else
		if (strcmp(argv[p], "-novsync") == 0)
			conf.wayland_vsync = false;
		else
		if (strcmp(argv[p], "-text") == 0)
			conf.text_input = true;
		else
		if (strcmp(argv[p], "-verbose") == 0)
			conf.verbose = true;
		else
		if (strcmp(argv[p], "-conf") == 0)
			p++;
		else
			printf("unknown option %s\n", argv[p]);
	}

	kilnSetVerbose(conf.verbose);

	PlatformInterface pi;
	memset(&pi, 0, sizeof(pi));
	pi.tick = Tick;
	pi.resize = Resize;
	pi.moved = Moved;
	pi.screen_change = ScreenChange;
	pi.keyb_key = KeybKey;
	pi.keyb_char = KeybChar;
	pi.keyb_focus = KeybFocus;
	pi.file_drop = FileDrop;

	KILN_LOOP* loop = kilnCreate(kilnSdlNative(), &pi, &conf);
	if (!loop)
		return 1;

	Demo demo;
	memset(&demo, 0, sizeof(demo));
	demo.width = conf.width;
	demo.height = conf.height;
	kilnSetCookie(loop, &demo);

	if (!kilnInitialize(loop) && conf.wayland_vsync)
		kilnLog("wayland vsync requested but unavailable");

	kilnPresentationChanged(loop, false, conf.width, conf.height);

	Worker worker = { loop, &demo };
	KILN_THREAD* thread = kilnCreateThread(WorkerMain, &worker);

	kilnRun(loop, KILN_RUN_SYNC);

	if (thread)
		kilnWaitForThread(thread);

	printf("frames: %d drawn, %d skipped\n", demo.frames, demo.skipped);

	kilnDestroy(loop);
	return 0;
}
