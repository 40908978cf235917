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
#include "linelog/log/detail/buffer_pool.hpp"
#include <cassert>
#include <utility>

namespace linelog::log::detail
{

// Static initializations.

boost::thread_specific_ptr<Buffer_pool::Free_list> Buffer_pool::s_this_thread_free_list;

// Buffer_pool implementations.

Buffer_pool::Free_list* Buffer_pool::this_thread_free_list() // Static.
{
  /* It's an on-demand singleton -- but per thread, hence thread-safe, unlike a regular on-demand singleton.
   * `delete` of the list (and thus of the pooled buffers) is executed by thread_specific_ptr when the thread exits. */
  Free_list* free_list = s_this_thread_free_list.get();
  if (!free_list)
  {
    // Uncommon code path.
    free_list = new Free_list;
    free_list->m_bufs.reserve(S_MAX_POOLED_PER_THREAD);
    s_this_thread_free_list.reset(free_list);

    assert(free_list == s_this_thread_free_list.get());
  }
  return free_list;
}

std::string Buffer_pool::acquire() // Static.
{
  auto& free_list = *(this_thread_free_list());
  ++free_list.m_n_acquired;

  if (free_list.m_bufs.empty())
  {
    std::string buf;
    buf.reserve(S_INITIAL_CAPACITY);
    return buf;
  }
  // else

  // Moving keeps the capacity (that's the point); release() has already emptied it.
  std::string buf(std::move(free_list.m_bufs.back()));
  free_list.m_bufs.pop_back();
  assert(buf.empty());
  return buf;
}

void Buffer_pool::release(std::string&& buf) // Static.
{
  auto& free_list = *(this_thread_free_list());

  if ((buf.capacity() > S_MAX_POOLED_CAPACITY) || (free_list.m_bufs.size() >= S_MAX_POOLED_PER_THREAD))
  {
    // Let it go: `doomed` takes the memory and frees it right here.
    std::string doomed(std::move(buf));
    return;
  }
  // else

  buf.clear(); // Keeps capacity.
  free_list.m_bufs.push_back(std::move(buf));
}

uint64_t Buffer_pool::this_thread_acquire_count() // Static.
{
  return this_thread_free_list()->m_n_acquired;
}

size_t Buffer_pool::this_thread_pooled_count() // Static.
{
  return this_thread_free_list()->m_bufs.size();
}

// Pooled_buffer implementations.

Pooled_buffer::Pooled_buffer() :
  m_buf(Buffer_pool::acquire())
{
  // Nothing else.
}

Pooled_buffer::~Pooled_buffer()
{
  Buffer_pool::release(std::move(m_buf));
}

std::string* Pooled_buffer::get()
{
  return &m_buf;
}

} // namespace linelog::log::detail
