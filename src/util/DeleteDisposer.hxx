// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

/**
 * A disposer for boost::intrusive and #IntrusiveList which invokes
 * the "delete" operator on the item.
 */
struct DeleteDisposer {
	template<typename T>
	void operator()(T *t) noexcept {
		delete t;
	}
};
