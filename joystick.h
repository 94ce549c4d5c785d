#pragma once

#include <stdint.h>

struct KILN_NATIVE;

#define KILN_MAX_JOYSTICKS 16

bool kilnJoyAdd(const KILN_NATIVE* native, int device_index);
bool kilnJoyRemove(const KILN_NATIVE* native, int instance);
int kilnJoyCount();
void kilnJoyCloseAll(const KILN_NATIVE* native);

// gamepad packet info, keyed by joystick instance id
void kilnPadRemove(int instance);
void kilnPadPacket(int instance, uint32_t stamp);
bool kilnPadGetPacket(int instance, uint32_t* packet, uint32_t* stamp);
