#pragma once

struct KILN_CONF
{
	bool wayland_vsync; // wait for compositor frame callbacks before drawing
	bool text_input;    // decode SDL_TEXTINPUT into keyb_char()
	bool verbose;

	char title[64];
	int width;
	int height;
};

void kilnDefaultConf(KILN_CONF* conf);
const char* kilnGetConfPath();

// missing file is not an error, returns false only if it exists and can't be read
bool kilnReadConf(KILN_CONF* conf, const char* path);
bool kilnParseConfLine(KILN_CONF* conf, const char* line);
void kilnApplyEnv(KILN_CONF* conf);

bool kilnParseBool(const char* str, bool* value);
