#include "utf8.h"

int kilnUTF8Length(uint8_t lead)
{
	if (lead < 0xC0)
		return 1;
	if (lead < 0xE0)
		return 2;
	if (lead < 0xF0)
		return 3;
	return 4;
}

static inline bool Continuation(uint8_t b)
{
	return b >= 0x80 && b < 0xC0;
}

int kilnUTF8Decode(const uint8_t* seq, int len)
{
	if (!seq || len < 1 || len > 4)
		return -1;

	uint8_t lead = seq[0];

	switch (len)
	{
		case 1:
			// 0x80..0xBF can't start a sequence
			return lead < 0x80 ? lead : -1;

		case 2:
			if (lead < 0xC0 || lead >= 0xE0 || !Continuation(seq[1]))
				return -1;
			return ((lead & 0x1F) << 6) | (seq[1] & 0x3F);

		case 3:
			if (lead < 0xE0 || lead >= 0xF0 || !Continuation(seq[1]) || !Continuation(seq[2]))
				return -1;
			return ((lead & 0x0F) << 12) | ((seq[1] & 0x3F) << 6) | (seq[2] & 0x3F);

		case 4:
			if (lead < 0xF0 || lead >= 0xF8 || !Continuation(seq[1]) || !Continuation(seq[2]) || !Continuation(seq[3]))
				return -1;
			return ((lead & 0x07) << 18) | ((seq[1] & 0x3F) << 12) | ((seq[2] & 0x3F) << 6) | (seq[3] & 0x3F);
	}

	return -1;
}

bool kilnUTF8IsWide(int cp)
{
	// 0xFFFF itself is excluded too
	return cp >= 0 && cp < 0xFFFF;
}
