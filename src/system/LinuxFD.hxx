// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <signal.h>

class UniqueFileDescriptor;

/**
 * Wrapper for eventfd() which sets the flags EFD_NONBLOCK and
 * EFD_CLOEXEC.
 *
 * Throws on error.
 */
UniqueFileDescriptor
CreateEventFD(unsigned initval=0);

/**
 * Wrapper for signalfd() which sets the flags SFD_NONBLOCK and
 * SFD_CLOEXEC.
 *
 * Throws on error.
 */
UniqueFileDescriptor
CreateSignalFD(const sigset_t &mask);
