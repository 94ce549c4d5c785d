#pragma once

#include <stdint.h>
#include <wchar.h>

struct KILN_LOOP;
struct KILN_NATIVE;
struct KILN_CONF;
struct KILN_DL;

enum KeyInfo
{
	KILN_NONE = 0,

	KILN_BACKSPACE,
	KILN_TAB,
	KILN_ENTER,

	KILN_PAUSE,
	KILN_ESCAPE,

	KILN_SPACE,
	KILN_PAGEUP,
	KILN_PAGEDOWN,
	KILN_END,
	KILN_HOME,
	KILN_LEFT,
	KILN_UP,
	KILN_RIGHT,
	KILN_DOWN,

	KILN_PRINT,
	KILN_INSERT,
	KILN_DELETE,

	KILN_0,
	KILN_1,
	KILN_2,
	KILN_3,
	KILN_4,
	KILN_5,
	KILN_6,
	KILN_7,
	KILN_8,
	KILN_9,

	KILN_A,
	KILN_B,
	KILN_C,
	KILN_D,
	KILN_E,
	KILN_F,
	KILN_G,
	KILN_H,
	KILN_I,
	KILN_J,
	KILN_K,
	KILN_L,
	KILN_M,
	KILN_N,
	KILN_O,
	KILN_P,
	KILN_Q,
	KILN_R,
	KILN_S,
	KILN_T,
	KILN_U,
	KILN_V,
	KILN_W,
	KILN_X,
	KILN_Y,
	KILN_Z,

	KILN_LWIN,
	KILN_RWIN,
	KILN_APPS,

	KILN_NUMPAD_0,
	KILN_NUMPAD_1,
	KILN_NUMPAD_2,
	KILN_NUMPAD_3,
	KILN_NUMPAD_4,
	KILN_NUMPAD_5,
	KILN_NUMPAD_6,
	KILN_NUMPAD_7,
	KILN_NUMPAD_8,
	KILN_NUMPAD_9,
	KILN_NUMPAD_MULTIPLY,
	KILN_NUMPAD_DIVIDE,
	KILN_NUMPAD_ADD,
	KILN_NUMPAD_SUBTRACT,
	KILN_NUMPAD_DECIMAL,
	KILN_NUMPAD_ENTER,

	KILN_F1,
	KILN_F2,
	KILN_F3,
	KILN_F4,
	KILN_F5,
	KILN_F6,
	KILN_F7,
	KILN_F8,
	KILN_F9,
	KILN_F10,
	KILN_F11,
	KILN_F12,
	KILN_F13,
	KILN_F14,
	KILN_F15,
	KILN_F16,
	KILN_F17,
	KILN_F18,
	KILN_F19,
	KILN_F20,
	KILN_F21,
	KILN_F22,
	KILN_F23,
	KILN_F24,

	KILN_CAPSLOCK,
	KILN_NUMLOCK,
	KILN_SCROLLLOCK,

	KILN_LSHIFT,
	KILN_RSHIFT,
	KILN_LCTRL,
	KILN_RCTRL,
	KILN_LALT,
	KILN_RALT,

	KILN_OEM_COLON,		// ';:' for US
	KILN_OEM_PLUS,		// '=+' any country
	KILN_OEM_COMMA,		// ',<' any country
	KILN_OEM_MINUS,		// '-_' any country
	KILN_OEM_PERIOD,	// '.>' any country
	KILN_OEM_SLASH,		// '/?' for US
	KILN_OEM_TILDE,		// '`~' for US

	KILN_OEM_OPEN,      //  '[{' for US
	KILN_OEM_CLOSE,     //  ']}' for US
	KILN_OEM_BACKSLASH, //  '\|' for US
	KILN_OEM_QUOTATION, //  ''"' for US

	KILN_MAPEND
};

enum ButtonState
{
	KILN_RELEASED = 0,
	KILN_PRESSED = 1
};

struct MouseState
{
	int x;
	int y;

	ButtonState left;
	ButtonState right;
	ButtonState middle;
	ButtonState x1;
	ButtonState x2;

	// accumulated in wheel units (120 per notch), see kilnTakeScroll()
	int scroll_x;
	int scroll_y;
};

enum LoopState
{
	KILN_NOT_STARTED = 0,
	KILN_RUNNING,
	KILN_EXITING,
	KILN_DISPOSED
};

enum RunMode
{
	KILN_RUN_SYNC = 0,
	KILN_RUN_ASYNC
};

// all callbacks are invoked on the loop thread, any of them can be null
struct PlatformInterface
{
	void(*tick)(KILN_LOOP* loop, bool draw); // update, and draw if 'draw'
	void(*dispose_contexts)(KILN_LOOP* loop);

	void(*resize)(KILN_LOOP* loop, int w, int h);
	void(*moved)(KILN_LOOP* loop);
	void(*screen_change)(KILN_LOOP* loop, const char* display, int w, int h, bool fullscreen);

	void(*keyb_key)(KILN_LOOP* loop, KeyInfo ki, bool down);
	void(*keyb_char)(KILN_LOOP* loop, wchar_t ch, KeyInfo ki);
	void(*keyb_focus)(KILN_LOOP* loop, bool set);

	void(*file_drop)(KILN_LOOP* loop, const char* path);
};

// returns 0 if the native subsystem or the window couldn't be created
KILN_LOOP* kilnCreate(const KILN_NATIVE* native, const PlatformInterface* pi, const KILN_CONF* conf);

// pumps once, detects the window manager and opens the compositor bridge,
// returns true if compositor frame pacing is available (dl=0: dlopen/dlsym)
bool kilnInitialize(KILN_LOOP* loop, const KILN_DL* dl = 0);

void kilnLoop(KILN_LOOP* loop); // blocks until exit
void kilnRun(KILN_LOOP* loop, RunMode mode);
void kilnStartLoop(KILN_LOOP* loop); // async variant, not supported
void kilnPumpEvents(KILN_LOOP* loop);

void kilnExit(KILN_LOOP* loop); // any thread
bool kilnIsExiting(const KILN_LOOP* loop);
LoopState kilnGetState(const KILN_LOOP* loop);

void kilnDispose(KILN_LOOP* loop);
void kilnDestroy(KILN_LOOP* loop);

void kilnSetCookie(KILN_LOOP* loop, void* cookie);
void* kilnGetCookie(KILN_LOOP* loop);

// input state, owned by the loop and written only on the loop thread
bool kilnIsActive(const KILN_LOOP* loop);
const KeyInfo* kilnGetKeys(const KILN_LOOP* loop, int* count);
bool kilnIsKeyDown(const KILN_LOOP* loop, KeyInfo ki);
void kilnGetMouse(const KILN_LOOP* loop, MouseState* ms);
void kilnTakeScroll(KILN_LOOP* loop, int* x, int* y); // returns and clears
void kilnSetTextInput(KILN_LOOP* loop, bool enable);
bool kilnGetTextInput(const KILN_LOOP* loop);

// executed on the loop thread, once per iteration, in submission order
void kilnPost(KILN_LOOP* loop, void(*fn)(void* cookie), void* cookie);

void kilnPresent(KILN_LOOP* loop); // swaps the window
void kilnSetMouseVisible(KILN_LOOP* loop, bool visible);
void kilnPresentationChanged(KILN_LOOP* loop, bool fullscreen, int w, int h);

// simple thread api
struct KILN_THREAD;
KILN_THREAD* kilnCreateThread(void* (*entry)(void*), void* arg);
void* kilnWaitForThread(KILN_THREAD* thread);
