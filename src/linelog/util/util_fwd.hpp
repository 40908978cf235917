/* linelog
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "linelog/common.hpp"
#include <boost/thread.hpp>
#include <string_view>

/**
 * linelog module containing miscellaneous general-use facilities that don't fit into any other module.
 *
 * Each symbol therein is used by at least 1 other linelog module; but all public symbols are intended for use by
 * the linelog user as well.
 */
namespace linelog::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class String_ostream;

/**
 * Short-hand for standard thread class.
 * We use boost.thread threads (and other boost.thread facilities) over std.thread counterparts, as
 * boost.thread is std.thread plus more; in particular `boost::thread_specific_ptr` is used by the log buffer pool.
 */
using Thread = boost::thread;

/* (The @namespace and @brief thingies shouldn't be needed, but some Doxygen bug necessitated them.) */

/**
 * @namespace linelog::util::this_thread
 * @brief Short-hand for standard this-thread namespace. Paired with util::Thread.
 */
namespace this_thread = boost::this_thread;

/// Short-hand for non-reentrant, exclusive mutex.  ("Reentrant" = one can lock an already-locked-in-that-thread mutex.)
using Mutex_non_recursive = boost::mutex;

/**
 * Short-hand for advanced-capability RAII lock guard for any mutex, ensuring exclusive ownership of that mutex.
 * Note the advanced API available for the underlying type: it is possible to relinquish ownership without unlocking,
 * gain ownership of a locked mutex; and so on.
 *
 * @tparam Mutex
 *         A non-recursive or recursive mutex type.  Recommend one of:
 *         #Mutex_non_recursive, `boost::recursive_mutex`.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

/**
 * Commonly used `char`-based string view.  We are in C++17 mode, so this is simply `std::string_view`; the alias
 * remains so that call sites do not care.
 */
using String_view = std::string_view;

} // namespace linelog::util
