// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "FileDescriptor.hxx"

#include <utility>

/**
 * An OO wrapper for a UNIX file descriptor which owns it and closes
 * it automatically.
 */
class UniqueFileDescriptor : protected FileDescriptor {
public:
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	explicit UniqueFileDescriptor(AdoptTag, int _fd) noexcept
		:FileDescriptor(_fd) {}

	explicit UniqueFileDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(other.Release()) {}

	~UniqueFileDescriptor() noexcept {
		Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&other) noexcept {
		using std::swap;
		swap(fd, other.fd);
		return *this;
	}

	/**
	 * Convert this object to its #FileDescriptor base type.
	 */
	const FileDescriptor &ToFileDescriptor() const noexcept {
		return *this;
	}

	/**
	 * Release ownership and return the descriptor as an unmanaged
	 * #FileDescriptor instance.
	 */
	FileDescriptor Release() noexcept {
		return std::exchange(*(FileDescriptor *)this, Undefined());
	}

	using FileDescriptor::IsDefined;
	using FileDescriptor::Get;
	using FileDescriptor::Read;
	using FileDescriptor::Write;
	using FileDescriptor::WaitReadable;
	using FileDescriptor::SetNonBlocking;

	bool Close() noexcept {
		return IsDefined() && FileDescriptor::Close();
	}
};
