// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "LinuxFD.hxx"
#include "Error.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <sys/eventfd.h>
#include <sys/signalfd.h>

UniqueFileDescriptor
CreateEventFD(unsigned initval)
{
	int fd = eventfd(initval, EFD_NONBLOCK|EFD_CLOEXEC);
	if (fd < 0)
		throw MakeErrno("eventfd() failed");

	return UniqueFileDescriptor(AdoptTag{}, fd);
}

UniqueFileDescriptor
CreateSignalFD(const sigset_t &mask)
{
	int fd = ::signalfd(-1, &mask, SFD_NONBLOCK|SFD_CLOEXEC);
	if (fd < 0)
		throw MakeErrno("signalfd() failed");

	return UniqueFileDescriptor(AdoptTag{}, fd);
}
