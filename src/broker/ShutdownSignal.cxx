// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ShutdownSignal.hxx"
#include "system/LinuxFD.hxx"
#include "system/Error.hxx"

#include <cstdint>

#include <fcntl.h>

namespace Broker {

ShutdownSignal::ShutdownSignal()
	:fd(CreateEventFD())
{
}

UniqueFileDescriptor
ShutdownSignal::Subscribe() const
{
	UniqueFileDescriptor result{AdoptTag{}, fcntl(fd.Get(), F_DUPFD_CLOEXEC, 0)};
	if (!result.IsDefined())
		throw MakeErrno("Failed to duplicate eventfd");

	return result;
}

void
ShutdownSignal::Fire() noexcept
{
	static constexpr uint64_t value = 1;
	[[maybe_unused]] ssize_t nbytes =
		fd.Write(std::as_bytes(std::span{&value, 1}));
}

bool
ShutdownSignal::IsFired() const noexcept
{
	return Wait(std::chrono::milliseconds{0});
}

bool
ShutdownSignal::Wait(std::chrono::milliseconds timeout) const noexcept
{
	return fd.WaitReadable(int(timeout.count())) > 0;
}

} // namespace Broker
