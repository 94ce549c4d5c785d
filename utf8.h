#pragma once

#include <stdint.h>

// number of bytes in a sequence starting with 'lead' (1..4)
int kilnUTF8Length(uint8_t lead);

// decodes one code point from 'len' bytes, returns -1 on malformed input,
// code points above 0xFFFF are decoded like any other
int kilnUTF8Decode(const uint8_t* seq, int len);

// true if 'cp' fits the 16 bit characters handed to keyb_char()
bool kilnUTF8IsWide(int cp);
