#include "loop.h"
#include "joystick.h"
#include "utf8.h"

// SDL reports one wheel notch as 1, xna style consumers expect 120
#define WHEEL_DELTA 120

static bool IsControl(int32_t ch)
{
	return (ch >= 0 && ch < 0x20) || ch == 0x7F;
}

static void KeyDown(KILN_LOOP* loop, const SDL_KeyboardEvent* ev)
{
	KeyInfo ki = kilnKeyFromKeycode(ev->keysym.sym, ev->keysym.scancode);
	if (ki == KILN_NONE)
		return;

	// auto repeat only repeats the character below
	if (!kilnIsKeyDown(loop, ki) && loop->num_keys < KILN_MAPEND)
	{
		loop->keys[loop->num_keys++] = ki;
		if (loop->platform_api.keyb_key)
			loop->platform_api.keyb_key(loop, ki, true);
	}

	// SDL doesn't report these to SDL_TEXTINPUT
	if (IsControl(ev->keysym.sym) && loop->platform_api.keyb_char)
		loop->platform_api.keyb_char(loop, (wchar_t)ev->keysym.sym, ki);
}

static void KeyUp(KILN_LOOP* loop, const SDL_KeyboardEvent* ev)
{
	KeyInfo ki = kilnKeyFromKeycode(ev->keysym.sym, ev->keysym.scancode);
	if (ki == KILN_NONE)
		return;

	for (int i = 0; i < loop->num_keys; i++)
	{
		if (loop->keys[i] == ki)
		{
			for (int j = i + 1; j < loop->num_keys; j++)
				loop->keys[j - 1] = loop->keys[j];
			loop->num_keys--;
			break;
		}
	}

	if (loop->platform_api.keyb_key)
		loop->platform_api.keyb_key(loop, ki, false);
}

static void MouseButton(KILN_LOOP* loop, const SDL_MouseButtonEvent* ev)
{
	ButtonState bs = ev->state ? KILN_PRESSED : KILN_RELEASED;

	switch (ev->button)
	{
		case SDL_BUTTON_LEFT:   loop->mouse.left = bs; break;
		case SDL_BUTTON_RIGHT:  loop->mouse.right = bs; break;
		case SDL_BUTTON_MIDDLE: loop->mouse.middle = bs; break;
		case SDL_BUTTON_X1:     loop->mouse.x1 = bs; break;
		case SDL_BUTTON_X2:     loop->mouse.x2 = bs; break;
		default:
			break;
	}
}

static void TextInput(KILN_LOOP* loop, const SDL_TextInputEvent* ev)
{
	if (!loop->text_input || !loop->platform_api.keyb_char)
		return;

	const uint8_t* text = (const uint8_t*)ev->text;
	const int size = (int)sizeof(ev->text);

	int pos = 0;
	while (pos < size && text[pos])
	{
		int len = kilnUTF8Length(text[pos]);

		// sequence cut by the terminator
		int avail = 1;
		while (avail < len && pos + avail < size && text[pos + avail])
			avail++;
		if (avail < len)
			break;

		int cp = kilnUTF8Decode(text + pos, len);

		// beyond 0xFFFF would need surrogates, drop it
		if (kilnUTF8IsWide(cp))
			loop->platform_api.keyb_char(loop, (wchar_t)cp, kilnKeyFromChar(cp));

		pos += len;
	}
}

static void DropFile(KILN_LOOP* loop, const SDL_DropEvent* ev)
{
	if (!ev->file)
		return;

	if (loop->platform_api.file_drop)
		loop->platform_api.file_drop(loop, ev->file);

	loop->native->free_string(ev->file);
}

static void WindowEvent(KILN_LOOP* loop, const SDL_WindowEvent* ev)
{
	switch (ev->event)
	{
		case SDL_WINDOWEVENT_RESIZED:
		case SDL_WINDOWEVENT_SIZE_CHANGED:
			if (loop->platform_api.resize)
				loop->platform_api.resize(loop, ev->data1, ev->data2);
			break;

		case SDL_WINDOWEVENT_FOCUS_GAINED:
		case SDL_WINDOWEVENT_FOCUS_LOST:
			loop->active = ev->event == SDL_WINDOWEVENT_FOCUS_GAINED;
			if (loop->platform_api.keyb_focus)
				loop->platform_api.keyb_focus(loop, loop->active);
			break;

		case SDL_WINDOWEVENT_MOVED:
			if (loop->platform_api.moved)
				loop->platform_api.moved(loop);
			break;

		case SDL_WINDOWEVENT_CLOSE:
			loop->exiting.fetch_add(1);
			break;
	}
}

void kilnPumpEvents(KILN_LOOP* loop)
{
	SDL_Event ev;
	while (loop->native->poll_event(&ev))
	{
		switch (ev.type)
		{
			case SDL_QUIT:
				loop->exiting.fetch_add(1);
				break;

			case SDL_JOYDEVICEADDED:
				kilnJoyAdd(loop->native, ev.jdevice.which);
				break;
			case SDL_JOYDEVICEREMOVED:
				kilnJoyRemove(loop->native, ev.jdevice.which);
				break;

			case SDL_CONTROLLERDEVICEREMOVED:
				kilnPadRemove(ev.cdevice.which);
				break;
			case SDL_CONTROLLERBUTTONUP:
			case SDL_CONTROLLERBUTTONDOWN:
			case SDL_CONTROLLERAXISMOTION:
				kilnPadPacket(ev.cdevice.which, ev.cdevice.timestamp);
				break;

			case SDL_MOUSEWHEEL:
				loop->mouse.scroll_y += ev.wheel.y * WHEEL_DELTA;
				loop->mouse.scroll_x += ev.wheel.x * WHEEL_DELTA;
				break;
			case SDL_MOUSEMOTION:
				loop->mouse.x = ev.motion.x;
				loop->mouse.y = ev.motion.y;
				break;
			case SDL_MOUSEBUTTONDOWN:
			case SDL_MOUSEBUTTONUP:
				MouseButton(loop, &ev.button);
				break;

			case SDL_KEYDOWN:
				KeyDown(loop, &ev.key);
				break;
			case SDL_KEYUP:
				KeyUp(loop, &ev.key);
				break;
			case SDL_TEXTINPUT:
				TextInput(loop, &ev.text);
				break;

			case SDL_DROPFILE:
				DropFile(loop, &ev.drop);
				break;

			case SDL_WINDOWEVENT:
				WindowEvent(loop, &ev.window);
				break;
		}
	}
}
