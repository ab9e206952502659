// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <type_traits>

struct IntrusiveListNode {
	IntrusiveListNode *next, *prev;
};

class IntrusiveListHook {
	template<typename T> friend class IntrusiveList;

protected:
	IntrusiveListNode siblings;

public:
	IntrusiveListHook() noexcept = default;

	IntrusiveListHook(const IntrusiveListHook &) = delete;
	IntrusiveListHook &operator=(const IntrusiveListHook &) = delete;

	void unlink() noexcept {
		siblings.next->prev = siblings.prev;
		siblings.prev->next = siblings.next;
	}
};

/**
 * A variant of #IntrusiveListHook which keeps track of whether it is
 * currently in a list and unlinks itself automatically in the
 * destructor.
 */
class AutoUnlinkIntrusiveListHook : public IntrusiveListHook {
public:
	AutoUnlinkIntrusiveListHook() noexcept {
		siblings.next = nullptr;
	}

	~AutoUnlinkIntrusiveListHook() noexcept {
		if (is_linked())
			unlink();
	}

	void unlink() noexcept {
		IntrusiveListHook::unlink();
		siblings.next = nullptr;
	}

	bool is_linked() const noexcept {
		return siblings.next != nullptr;
	}
};

/**
 * A doubly linked list of objects which embed the list hook
 * (#IntrusiveListHook).  The list does not own its items.
 */
template<typename T>
class IntrusiveList {
	IntrusiveListNode head{&head, &head};

	static constexpr IntrusiveListHook &ToHook(T &t) noexcept {
		static_assert(std::is_base_of_v<IntrusiveListHook, T>);
		return static_cast<IntrusiveListHook &>(t);
	}

	static constexpr T *Cast(IntrusiveListNode *node) noexcept {
		static_assert(std::is_base_of_v<IntrusiveListHook, T>);
		/* the node is the first (and only) member of the
		   hook */
		auto *hook = reinterpret_cast<IntrusiveListHook *>(node);
		return static_cast<T *>(hook);
	}

public:
	IntrusiveList() noexcept = default;

	IntrusiveList(const IntrusiveList &) = delete;
	IntrusiveList &operator=(const IntrusiveList &) = delete;

	~IntrusiveList() noexcept {
		clear();
	}

	constexpr bool empty() const noexcept {
		return head.next == &head;
	}

	[[gnu::pure]]
	std::size_t size() const noexcept {
		std::size_t n = 0;
		for (const auto *i = head.next; i != &head; i = i->next)
			++n;
		return n;
	}

	/**
	 * Forget all items without touching them.  Items with an
	 * #AutoUnlinkIntrusiveListHook must not use this.
	 */
	void clear() noexcept {
		head = {&head, &head};
	}

	template<typename D>
	void clear_and_dispose(D &&disposer) noexcept {
		while (!empty()) {
			auto *item = &front();
			pop_front();
			disposer(item);
		}
	}

	/**
	 * Remove (and dispose) all items matching the given
	 * predicate.  The predicate must not modify the list.
	 *
	 * @return the number of removed items
	 */
	template<typename P, typename D>
	std::size_t remove_and_dispose_if(P &&pred, D &&disposer) noexcept {
		std::size_t n = 0;
		auto *node = head.next;
		while (node != &head) {
			auto *next = node->next;
			auto *item = Cast(node);
			if (pred(static_cast<const T &>(*item))) {
				item->unlink();
				disposer(item);
				++n;
			}

			node = next;
		}

		return n;
	}

	T &front() noexcept {
		return *Cast(head.next);
	}

	void pop_front() noexcept {
		front().unlink();
	}

	void push_front(T &t) noexcept {
		auto &node = ToHook(t).siblings;
		head.next->prev = &node;
		node.next = head.next;
		head.next = &node;
		node.prev = &head;
	}

	void push_back(T &t) noexcept {
		auto &node = ToHook(t).siblings;
		head.prev->next = &node;
		node.prev = head.prev;
		head.prev = &node;
		node.next = &head;
	}
};
