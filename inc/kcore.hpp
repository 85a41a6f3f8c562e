//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_KERNEL_CORE
#define KCORE_KERNEL_CORE

#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "wait_list.hpp"
#include "coroutine.hpp"
#include "task.hpp"
#include "executor.hpp"
#include "heap.hpp"
#include "allocator.hpp"
#include "containers.hpp"
#include "channel.hpp"
#include "oneshot.hpp"
#include "registry.hpp"
#include "kernel.hpp"

#endif
