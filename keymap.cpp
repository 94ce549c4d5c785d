#include "native.h"

// indexed by SDL_Scancode
static const KeyInfo SDL2KILN[] =
{
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,

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

	KILN_1,
	KILN_2,
	KILN_3,
	KILN_4,
	KILN_5,
	KILN_6,
	KILN_7,
	KILN_8,
	KILN_9,
	KILN_0,

	KILN_ENTER,
	KILN_ESCAPE,
	KILN_BACKSPACE,
	KILN_TAB,
	KILN_SPACE,

	KILN_OEM_MINUS,
	KILN_OEM_PLUS,
	KILN_OEM_OPEN,
	KILN_OEM_CLOSE,
	KILN_OEM_BACKSLASH,
	KILN_NONE, //NONUSHASH
	KILN_OEM_COLON,
	KILN_OEM_QUOTATION,
	KILN_OEM_TILDE,
	KILN_OEM_COMMA,
	KILN_OEM_PERIOD,
	KILN_OEM_SLASH,

	KILN_CAPSLOCK,

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

	KILN_PRINT,
	KILN_SCROLLLOCK,
	KILN_PAUSE,
	KILN_INSERT,

	KILN_HOME,
	KILN_PAGEUP,
	KILN_DELETE,
	KILN_END,
	KILN_PAGEDOWN,
	KILN_RIGHT,
	KILN_LEFT,
	KILN_DOWN,
	KILN_UP,

	KILN_NUMLOCK,

	KILN_NUMPAD_DIVIDE,
	KILN_NUMPAD_MULTIPLY,
	KILN_NUMPAD_SUBTRACT,
	KILN_NUMPAD_ADD,
	KILN_NUMPAD_ENTER,
	KILN_NUMPAD_1,
	KILN_NUMPAD_2,
	KILN_NUMPAD_3,
	KILN_NUMPAD_4,
	KILN_NUMPAD_5,
	KILN_NUMPAD_6,
	KILN_NUMPAD_7,
	KILN_NUMPAD_8,
	KILN_NUMPAD_9,
	KILN_NUMPAD_0,
	KILN_NUMPAD_DECIMAL,

	KILN_NONE, //NONUSBACKSLASH
	KILN_APPS,
	KILN_NONE, //POWER

	KILN_NONE, //EQUALS
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

	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE,
	KILN_NONE
};


KeyInfo kilnKeyFromScancode(int scancode)
{
	switch (scancode)
	{
		// handle big codes that didn't
		// fit well into mapping table
		case SDL_SCANCODE_LCTRL:	return KILN_LCTRL;
		case SDL_SCANCODE_LSHIFT:	return KILN_LSHIFT;
		case SDL_SCANCODE_LALT:		return KILN_LALT;
		case SDL_SCANCODE_LGUI:		return KILN_LWIN;
		case SDL_SCANCODE_RCTRL:	return KILN_RCTRL;
		case SDL_SCANCODE_RSHIFT:	return KILN_RSHIFT;
		case SDL_SCANCODE_RALT:		return KILN_RALT;
		case SDL_SCANCODE_RGUI:		return KILN_RWIN;
	}

	if (scancode < 0 || scancode >= (int)(sizeof(SDL2KILN) / sizeof(SDL2KILN[0])))
		return KILN_NONE;
	return SDL2KILN[scancode];
}

// best effort, US layout
KeyInfo kilnKeyFromChar(int ch)
{
	if (ch >= 'a' && ch <= 'z')
		return (KeyInfo)(KILN_A + ch - 'a');
	if (ch >= 'A' && ch <= 'Z')
		return (KeyInfo)(KILN_A + ch - 'A');
	if (ch >= '0' && ch <= '9')
		return (KeyInfo)(KILN_0 + ch - '0');

	switch (ch)
	{
		case 8:    return KILN_BACKSPACE;
		case 9:    return KILN_TAB;
		case 13:   return KILN_ENTER;
		case 27:   return KILN_ESCAPE;
		case 127:  return KILN_DELETE;
		case ' ':  return KILN_SPACE;

		case ';': case ':':  return KILN_OEM_COLON;
		case '=': case '+':  return KILN_OEM_PLUS;
		case ',': case '<':  return KILN_OEM_COMMA;
		case '-': case '_':  return KILN_OEM_MINUS;
		case '.': case '>':  return KILN_OEM_PERIOD;
		case '/': case '?':  return KILN_OEM_SLASH;
		case '`': case '~':  return KILN_OEM_TILDE;
		case '[': case '{':  return KILN_OEM_OPEN;
		case ']': case '}':  return KILN_OEM_CLOSE;
		case '\\': case '|': return KILN_OEM_BACKSLASH;
		case '\'': case '"': return KILN_OEM_QUOTATION;
	}

	return KILN_NONE;
}

// layout aware, the keycode names the key by what it types,
// keys without a character keycode fall back to the scancode
KeyInfo kilnKeyFromKeycode(int sym, int scancode)
{
	if (sym & SDLK_SCANCODE_MASK)
		return kilnKeyFromScancode(sym & ~SDLK_SCANCODE_MASK);

	KeyInfo ki = kilnKeyFromChar(sym);
	if (ki != KILN_NONE)
		return ki;

	return kilnKeyFromScancode(scancode);
}
