// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <dbus/dbus.h>

#include <new>

namespace ODBus {

class AppendMessageIter {
	DBusMessageIter iter;

public:
	explicit AppendMessageIter(DBusMessage &msg) noexcept {
		dbus_message_iter_init_append(&msg, &iter);
	}

	AppendMessageIter(const AppendMessageIter &) = delete;
	AppendMessageIter &operator=(const AppendMessageIter &) = delete;

	/**
	 * Throws std::bad_alloc on error.
	 */
	AppendMessageIter &AppendBasic(int type, const void *value) {
		if (!dbus_message_iter_append_basic(&iter, type, value))
			throw std::bad_alloc{};
		return *this;
	}

	AppendMessageIter &Append(const char *const&value) {
		return AppendBasic(DBUS_TYPE_STRING, &value);
	}

	AppendMessageIter &Append(const dbus_uint32_t &value) {
		return AppendBasic(DBUS_TYPE_UINT32, &value);
	}
};

} /* namespace ODBus */
