#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>

#include "config.h"
#include "log.h"

void kilnDefaultConf(KILN_CONF* conf)
{
	conf->wayland_vsync = false;
	conf->text_input = true;
	conf->verbose = false;
	strcpy(conf->title, "Kiln");
	conf->width = 800;
	conf->height = 600;
}

static char conf_path[1024] = "";
const char* kilnGetConfPath()
{
	if (conf_path[0] == 0)
	{
		const char* user_dir = getenv("SNAP_USER_DATA");
		if (!user_dir || user_dir[0] == 0)
		{
			user_dir = getenv("HOME");
			if (!user_dir || user_dir[0] == 0)
				snprintf(conf_path, sizeof(conf_path), "./kiln.cfg");
			else
				snprintf(conf_path, sizeof(conf_path), "%s/kiln.cfg", user_dir);
		}
		else
			snprintf(conf_path, sizeof(conf_path), "%s/kiln.cfg", user_dir);
	}

	return conf_path;
}

bool kilnParseBool(const char* str, bool* value)
{
	if (!str)
		return false;

	if (strcmp(str, "1") == 0 || strcmp(str, "true") == 0 || strcmp(str, "on") == 0 || strcmp(str, "yes") == 0)
	{
		*value = true;
		return true;
	}

	if (strcmp(str, "0") == 0 || strcmp(str, "false") == 0 || strcmp(str, "off") == 0 || strcmp(str, "no") == 0)
	{
		*value = false;
		return true;
	}

	return false;
}

static char* Trim(char* s)
{
	while (*s && isspace((unsigned char)*s))
		s++;
	int len = strlen(s);
	while (len > 0 && isspace((unsigned char)s[len - 1]))
		s[--len] = 0;
	return s;
}

static bool ParseInt(const char* str, int* value)
{
	char* end = 0;
	long v = strtol(str, &end, 10);
	if (end == str || *end || v <= 0 || v > 16384)
		return false;
	*value = (int)v;
	return true;
}

bool kilnParseConfLine(KILN_CONF* conf, const char* line)
{
	char buf[256];
	snprintf(buf, sizeof(buf), "%s", line);

	char* s = Trim(buf);
	if (s[0] == 0 || s[0] == '#')
		return true;

	char* eq = strchr(s, '=');
	if (!eq)
		return false;

	*eq = 0;
	char* key = Trim(s);
	char* val = Trim(eq + 1);

	if (strcmp(key, "wayland_vsync") == 0)
		return kilnParseBool(val, &conf->wayland_vsync);
	if (strcmp(key, "text_input") == 0)
		return kilnParseBool(val, &conf->text_input);
	if (strcmp(key, "verbose") == 0)
		return kilnParseBool(val, &conf->verbose);
	if (strcmp(key, "width") == 0)
		return ParseInt(val, &conf->width);
	if (strcmp(key, "height") == 0)
		return ParseInt(val, &conf->height);
	if (strcmp(key, "title") == 0)
	{
		snprintf(conf->title, sizeof(conf->title), "%s", val);
		return true;
	}

	return false;
}

bool kilnReadConf(KILN_CONF* conf, const char* path)
{
	FILE* f = fopen(path, "rb");
	if (!f)
	{
		kilnLog("no config at %s, using defaults", path);
		return true;
	}

	char line[256];
	int num = 0;
	while (fgets(line, sizeof(line), f))
	{
		num++;
		if (!kilnParseConfLine(conf, line))
			kilnWarn("%s:%d: ignoring malformed line", path, num);
	}

	bool ok = !ferror(f);
	fclose(f);
	return ok;
}

static void EnvBool(const char* name, bool* value)
{
	const char* env = getenv(name);
	if (!env || env[0] == 0)
		return;
	if (!kilnParseBool(env, value))
		kilnWarn("ignoring %s=%s", name, env);
}

void kilnApplyEnv(KILN_CONF* conf)
{
	EnvBool("KILN_WAYLAND_VSYNC", &conf->wayland_vsync);
	EnvBool("KILN_TEXT_INPUT", &conf->text_input);
	EnvBool("KILN_VERBOSE", &conf->verbose);
}
