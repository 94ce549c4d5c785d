#include <stdlib.h>
#include <pthread.h>

#include "platform.h"
#include "log.h"

struct KILN_THREAD
{
	pthread_t th;
};

KILN_THREAD* kilnCreateThread(void* (*entry)(void*), void* arg)
{
	KILN_THREAD* t = (KILN_THREAD*)malloc(sizeof(KILN_THREAD));
	if (!t)
		return 0;

	int err = pthread_create(&t->th, 0, entry, arg);
	if (err)
	{
		kilnWarn("pthread_create failed (%d)", err);
		free(t);
		return 0;
	}

	return t;
}

void* kilnWaitForThread(KILN_THREAD* thread)
{
	void* ret = 0;
	pthread_join(thread->th,&ret);
	free(thread);
	return ret;
}
