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

#include "linelog/log/logger.hpp"
#include <chrono>
#include <iostream>

/* This simple program shows persistent attributes: a sub-logger made with Logger::with() adds its attributes to every
 * line it logs, ahead of each call's own.
 *   <executable> */

int main()
{
  namespace log = linelog::log;
  using namespace std::chrono_literals;

  const auto logger = log::make_logger(std::cerr, log::with_level(log::Level::S_DEBUG));

  logger.info("Doing something", "cache", true, "duration", 30s, "number", 42);

  linelog::util::this_thread::sleep_for(boost::chrono::milliseconds(750));

  const auto sub = logger.with("sub", true);
  sub.info("Hello from the sub logger", "subkey", "yes");
  sub.debug("Still the sub logger", "odd", "one", "out");

  logger.info("The original is unchanged");

  return 0;
}
