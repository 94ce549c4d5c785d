#include "native.h"
#include "joystick.h"
#include "log.h"

struct KILN_JOY
{
	void* handle;
	int instance;

	bool pad;
	uint32_t packet;
	uint32_t stamp;
};

static KILN_JOY joys[KILN_MAX_JOYSTICKS];
static int num_joys = 0;

static KILN_JOY* Find(int instance)
{
	for (int i = 0; i < num_joys; i++)
	{
		if (joys[i].instance == instance)
			return joys + i;
	}
	return 0;
}

bool kilnJoyAdd(const KILN_NATIVE* native, int device_index)
{
	if (num_joys == KILN_MAX_JOYSTICKS)
	{
		kilnWarn("too many joysticks, ignoring device %d", device_index);
		return false;
	}

	void* handle = native->joy_open(device_index);
	if (!handle)
	{
		kilnLog("couldn't open joystick %d", device_index);
		return false;
	}

	int instance = native->joy_instance(handle);

	// SDL reports already opened devices again after SDL_Init
	if (Find(instance))
	{
		native->joy_close(handle);
		return false;
	}

	KILN_JOY* j = joys + num_joys++;
	j->handle = handle;
	j->instance = instance;
	j->pad = false;
	j->packet = 0;
	j->stamp = 0;

	kilnLog("joystick %d added (instance %d)", device_index, instance);
	return true;
}

bool kilnJoyRemove(const KILN_NATIVE* native, int instance)
{
	KILN_JOY* j = Find(instance);
	if (!j)
		return false;

	native->joy_close(j->handle);

	*j = joys[--num_joys];
	kilnLog("joystick instance %d removed", instance);
	return true;
}

int kilnJoyCount()
{
	return num_joys;
}

void kilnJoyCloseAll(const KILN_NATIVE* native)
{
	for (int i = 0; i < num_joys; i++)
		native->joy_close(joys[i].handle);
	num_joys = 0;
}

void kilnPadRemove(int instance)
{
	KILN_JOY* j = Find(instance);
	if (!j)
		return;

	j->pad = false;
	j->packet = 0;
	j->stamp = 0;
}

void kilnPadPacket(int instance, uint32_t stamp)
{
	KILN_JOY* j = Find(instance);
	if (!j)
		return;

	j->pad = true;
	j->packet++;
	j->stamp = stamp;
}

bool kilnPadGetPacket(int instance, uint32_t* packet, uint32_t* stamp)
{
	KILN_JOY* j = Find(instance);
	if (!j || !j->pad)
		return false;

	if (packet)
		*packet = j->packet;
	if (stamp)
		*stamp = j->stamp;
	return true;
}
