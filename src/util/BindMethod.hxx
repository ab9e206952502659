// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

/**
 * This object stores a function pointer wrapping a method, and a
 * reference to an instance of the method's class.  It can be used to
 * wrap instance methods as callback functions.
 *
 * @param S the plain function signature type
 */
template<typename S=void()>
class BoundMethod;

template<bool NoExcept, typename R, typename... Args>
class BoundMethod<R(Args...) noexcept(NoExcept)> {
	using function_pointer = R(*)(void *, Args...) noexcept(NoExcept);

	void *instance_;
	function_pointer function;

public:
	/**
	 * Non-initializing trivial constructor
	 */
	BoundMethod() = default;

	constexpr
	BoundMethod(void *_instance, function_pointer _function) noexcept
		:instance_(_instance), function(_function) {}

	/**
	 * Construct an "undefined" object.  It must not be called,
	 * and its "bool" operator returns false.
	 */
	constexpr BoundMethod(std::nullptr_t) noexcept
		:instance_(nullptr), function(nullptr) {}

	/**
	 * Was this object initialized with a valid function pointer?
	 */
	constexpr explicit operator bool() const noexcept {
		return function != nullptr;
	}

	R operator()(Args... args) const noexcept(NoExcept) {
		return function(instance_, std::forward<Args>(args)...);
	}
};

namespace BindMethodDetail {

template<typename M>
struct MethodTraits;

template<typename T, bool NoExcept, typename R, typename... Args>
struct MethodTraits<R (T::*)(Args...) noexcept(NoExcept)> {
	using class_type = T;
	using signature = R(Args...) noexcept(NoExcept);

	template<auto method>
	static R Invoke(void *instance, Args... args) noexcept(NoExcept) {
		auto &t = *static_cast<T *>(instance);
		return (t.*method)(std::forward<Args>(args)...);
	}
};

} /* namespace BindMethodDetail */

/**
 * Construct a #BoundMethod instance.
 *
 * @param method the method pointer
 * @param instance the instance of the class the method is bound to
 */
template<auto method>
constexpr auto
BindMethod(typename BindMethodDetail::MethodTraits<decltype(method)>::class_type &instance) noexcept
{
	using Traits = BindMethodDetail::MethodTraits<decltype(method)>;
	return BoundMethod<typename Traits::signature>(&instance,
						       &Traits::template Invoke<method>);
}

/**
 * Shortcut macro which takes an instance and a method pointer and
 * constructs a #BoundMethod instance.
 */
#define BIND_METHOD(instance, method) \
	BindMethod<method>(instance)

/**
 * Shortcut wrapper for BIND_METHOD() which assumes "*this" is the
 * instance to be bound.
 */
#define BIND_THIS_METHOD(method) \
	BIND_METHOD(*this, &std::remove_reference_t<decltype(*this)>::method)
