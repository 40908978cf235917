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
#include "linelog/log/detail/buffer_pool.hpp"
#include "linelog/style/style.hpp"
#include "linelog/test/test_common_util.hpp"
#include "linelog/util/string_ostream.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <regex>
#include <streambuf>
#include <vector>

namespace linelog::log::test
{

namespace
{
using linelog::test::fixed_clock;
using linelog::test::fixed_time;
using linelog::test::counting_clock;
using linelog::test::replace_time_stamp;
using linelog::test::split_lines;
using linelog::test::S_FIXED_TIME_STAMP;
using util::String_ostream;
using std::string;
using std::vector;
using namespace std::chrono_literals;

/**
 * Logs `msg` at `level` through the method of that name.
 *
 * @param logger The logger.
 * @param level One of the four defined levels.
 * @param msg The message.
 */
void log_at(const Logger& logger, Level level, util::String_view msg)
{
  switch (level)
  {
    case Level::S_DEBUG: logger.debug(msg); return;
    case Level::S_INFO: logger.info(msg); return;
    case Level::S_WARN: logger.warn(msg); return;
    case Level::S_ERROR: logger.error(msg); return;
  }
  ADD_FAILURE() << "Undefined level [" << static_cast<int>(level) << "].";
}

/**
 * Splits the attribute part of a line (everything after the message) into `key=value` tokens at spaces that are
 * not inside double quotes.  Backslash escapes inside quotes are skipped over.
 *
 * @param text The attribute part.
 *
 * @return The tokens.
 */
vector<string> split_attrs(const string& text)
{
  vector<string> tokens;
  string token;
  bool in_quotes = false;
  for (size_t idx = 0; idx < text.size(); ++idx)
  {
    const char c = text[idx];
    if (in_quotes && (c == '\\') && ((idx + 1) < text.size()))
    {
      token += c;
      token += text[++idx];
      continue;
    }
    if (c == '"')
    {
      in_quotes = !in_quotes;
    }
    else if ((c == ' ') && (!in_quotes))
    {
      if (!token.empty())
      {
        tokens.push_back(token);
        token.clear();
      }
      continue;
    }
    token += c;
  }
  if (!token.empty())
  {
    tokens.push_back(token);
  }
  return tokens;
}

/// A `streambuf` that refuses every write by throwing, as a broken device would.
class Throwing_streambuf : public std::streambuf
{
protected:
  int_type overflow(int_type) override
  {
    throw std::ios_base::failure("device gone");
  }

  std::streamsize xsputn(const char*, std::streamsize) override
  {
    throw std::ios_base::failure("device gone");
  }
};

} // Anonymous namespace

TEST(Logger, Debug)
{
  style::set_enabled(false);

  struct Test_case
  {
    string m_name;
    vector<Option> m_options;
    Function<void (const Logger&)> m_log_func;
    string m_expected;
  };

  const vector<Test_case> test_cases
    = {
        { "disabled", { with_level(Level::S_INFO) },
          [](const Logger& logger) { logger.debug("You should not see me"); },
          "" },
        { "enabled", { with_level(Level::S_DEBUG) },
          [](const Logger& logger) { logger.debug("Hello debug!"); },
          "[TIME] DEBUG: Hello debug!\n" },
        { "prefix", { with_level(Level::S_DEBUG), prefix("building") },
          [](const Logger& logger) { logger.debug("Hello debug!"); },
          "[TIME] DEBUG building: Hello debug!\n" },
        { "with kv", { with_level(Level::S_DEBUG) },
          [](const Logger& logger) { logger.debug("Hello debug!", "number", 12, "duration", 30s, "enabled", true); },
          "[TIME] DEBUG: Hello debug! number=12 duration=30s enabled=true\n" },
        { "with kv quoted", { with_level(Level::S_DEBUG) },
          [](const Logger& logger)
          {
            logger.debug("Hello debug!", "number", 12, "duration", 30s, "sentence", "this has spaces");
          },
          "[TIME] DEBUG: Hello debug! number=12 duration=30s sentence=\"this has spaces\"\n" },
        { "with kv escape chars", { with_level(Level::S_DEBUG) },
          [](const Logger& logger)
          {
            logger.debug("Hello debug!", "number", 12, "duration", 30s, "sentence", "ooh\t\nstuff");
          },
          R"([TIME] DEBUG: Hello debug! number=12 duration=30s sentence="ooh\t\nstuff")" "\n" },
        { "with kv empty", { with_level(Level::S_DEBUG) },
          [](const Logger& logger) { logger.debug("Hello debug!", "empty", ""); },
          "[TIME] DEBUG: Hello debug! empty=\"\"\n" },
        { "with kv odd number", { with_level(Level::S_DEBUG) },
          [](const Logger& logger) { logger.debug("One is missing", "enabled", true, "file", "./file.txt", "elapsed"); },
          "[TIME] DEBUG: One is missing enabled=true file=./file.txt elapsed=<MISSING>\n" },
        { "custom time format", { with_level(Level::S_DEBUG), time_format(S_TIME_FORMAT_KITCHEN) },
          [](const Logger& logger) { logger.debug("The oven is done"); },
          "1:34PM DEBUG: The oven is done\n" }
      };

  for (const auto& test_case : test_cases)
  {
    SCOPED_TRACE(test_case.m_name);

    String_ostream os;
    Config config;
    for (const auto& option : test_case.m_options)
    {
      option(&config);
    }
    config.m_clock = fixed_clock(); // Deterministic time.
    const Logger logger(os.os(), config);

    test_case.m_log_func(logger);

    EXPECT_EQ(replace_time_stamp(os.str()), test_case.m_expected);
  }
} // TEST(Logger, Debug)

TEST(Logger, All_levels)
{
  style::set_enabled(false);

  String_ostream os;
  const auto logger = make_logger(os.os(), with_level(Level::S_DEBUG), time_func(fixed_clock()));

  logger.debug("Doing some debuggy things");
  logger.info("Logging in");
  logger.warn("Config file missing, falling back to defaults");
  logger.error("File not found", "path", "/etc/app.conf");

  EXPECT_EQ(replace_time_stamp(os.str()),
            "[TIME] DEBUG: Doing some debuggy things\n"
            "[TIME] INFO: Logging in\n"
            "[TIME] WARN: Config file missing, falling back to defaults\n"
            "[TIME] ERROR: File not found path=/etc/app.conf\n");
}

TEST(Logger, With)
{
  style::set_enabled(false);

  String_ostream os;
  const auto logger = make_logger(os.os(), time_func(fixed_clock()));

  logger.info("I'm an info message");

  const auto sub = logger.with("sub", true, "missing");
  sub.info("I'm also an info message");

  EXPECT_EQ(replace_time_stamp(os.str()),
            "[TIME] INFO: I'm an info message\n"
            "[TIME] INFO: I'm also an info message sub=true missing=<MISSING>\n");

  // Persistent attributes come first; each list is padded on its own.
  os.str_clear();
  sub.info("Both", "call", 1, "dangling");
  logger.with("a", 1).with("b", 2).info("Chained", "c", 3);
  logger.info("Receiver unchanged");
  EXPECT_EQ(replace_time_stamp(os.str()),
            "[TIME] INFO: Both sub=true missing=<MISSING> call=1 dangling=<MISSING>\n"
            "[TIME] INFO: Chained a=1 b=2 c=3\n"
            "[TIME] INFO: Receiver unchanged\n");
}

TEST(Logger, Prefixed)
{
  style::set_enabled(false);

  String_ostream os;
  const auto logger = make_logger(os.os(), time_func(fixed_clock()));
  const auto http = logger.prefixed("http");

  http.info("Response from get repos", "status", 200, "duration", 500ms);
  logger.info("No prefix here");
  http.prefixed("").warn("Prefix removed");
  http.prefixed("db").error("Prefix replaced");

  EXPECT_EQ(http.prefix(), "http");
  EXPECT_TRUE(logger.prefix().empty());
  EXPECT_EQ(replace_time_stamp(os.str()),
            "[TIME] INFO http: Response from get repos status=200 duration=500ms\n"
            "[TIME] INFO: No prefix here\n"
            "[TIME] WARN: Prefix removed\n"
            "[TIME] ERROR db: Prefix replaced\n");
}

TEST(Logger, Level_gate)
{
  style::set_enabled(false);

  const Level levels[] = { Level::S_DEBUG, Level::S_INFO, Level::S_WARN, Level::S_ERROR };
  for (const auto configured : levels)
  {
    for (const auto attempted : levels)
    {
      SCOPED_TRACE(::testing::Message() << "configured [" << configured << "], attempted [" << attempted << "]");

      String_ostream os;
      const auto logger = make_logger(os.os(), with_level(configured), time_func(fixed_clock()));
      log_at(logger, attempted, "Gate");

      const bool expected = static_cast<int>(attempted) >= static_cast<int>(configured);
      EXPECT_EQ(should_emit(configured, attempted), expected);
      EXPECT_EQ(logger.enabled(attempted), expected);
      EXPECT_EQ(os.str().empty(), !expected);
    }
  }
}

TEST(Logger, Discard_does_nothing)
{
  style::set_enabled(false);
  using detail::Buffer_pool;

  unsigned int n_clock_calls = 0;
  const auto discarding = make_logger(discard_sink(), with_level(Level::S_DEBUG),
                                      time_func(counting_clock(&n_clock_calls)));
  EXPECT_TRUE(discarding.is_discard());
  EXPECT_FALSE(discarding.enabled(Level::S_ERROR));

  const auto n_acquired_before = Buffer_pool::this_thread_acquire_count();
  for (unsigned int idx = 0; idx != 1000; ++idx)
  {
    discarding.debug("Nothing", "idx", idx, "elapsed", 5ms, "tags", vector<string>{ "a", "b" });
    discarding.error("Still nothing");
  }

  // Derivatives of a discarding Logger discard too.
  discarding.with("k", "v").prefixed("sub").error("Nothing either");

  EXPECT_EQ(n_clock_calls, 0u);
  EXPECT_EQ(Buffer_pool::this_thread_acquire_count(), n_acquired_before);
}

TEST(Logger, Disabled_does_nothing)
{
  style::set_enabled(false);
  using detail::Buffer_pool;

  String_ostream os;
  unsigned int n_clock_calls = 0;
  const auto logger = make_logger(os.os(), with_level(Level::S_WARN), time_func(counting_clock(&n_clock_calls)));
  EXPECT_FALSE(logger.is_discard());

  const auto n_acquired_before = Buffer_pool::this_thread_acquire_count();
  for (unsigned int idx = 0; idx != 1000; ++idx)
  {
    logger.debug("A message!", "idx", idx);
    logger.info("A message!");
  }
  EXPECT_EQ(n_clock_calls, 0u);
  EXPECT_EQ(Buffer_pool::this_thread_acquire_count(), n_acquired_before);
  EXPECT_TRUE(os.str().empty());

  // Enabled: one buffer, one clock reading per line.
  logger.warn("Now you see me");
  EXPECT_EQ(n_clock_calls, 1u);
  EXPECT_EQ(Buffer_pool::this_thread_acquire_count(), n_acquired_before + 1);
  EXPECT_EQ(split_lines(os.str()).size(), 1u);
}

TEST(Logger, Race)
{
  style::set_enabled(false);

  String_ostream os;
  const auto logger = make_logger(os.os(), time_func(fixed_clock()));
  const auto sub = logger.prefixed("sub");

  constexpr unsigned int N_THREADS = 5;
  constexpr unsigned int N_LINES_PER_THREAD = 200;

  vector<util::Thread> threads;
  for (unsigned int thread_idx = 0; thread_idx != N_THREADS; ++thread_idx)
  {
    threads.emplace_back([&logger, thread_idx]()
    {
      for (unsigned int idx = 0; idx != N_LINES_PER_THREAD; ++idx)
      {
        logger.info("Something", "thread", thread_idx, "idx", idx);
      }
    });
    threads.emplace_back([&sub, thread_idx]()
    {
      for (unsigned int idx = 0; idx != N_LINES_PER_THREAD; ++idx)
      {
        sub.info("Other", "thread", thread_idx, "idx", idx);
      }
    });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  // Order doesn't matter, but every line must be whole.
  const auto lines = split_lines(os.str());
  EXPECT_EQ(lines.size(), 2 * N_THREADS * N_LINES_PER_THREAD);

  const std::regex line_regex("^" + S_FIXED_TIME_STAMP
                              + " INFO(: Something| sub: Other) thread=[0-9]+ idx=[0-9]+$");
  for (const auto& line : lines)
  {
    EXPECT_TRUE(std::regex_match(line, line_regex)) << "Mangled line [" << line << "].";
  }
}

TEST(Logger, Deterministic_time_stamp)
{
  style::set_enabled(false);

  String_ostream os1;
  String_ostream os2;
  const auto logger1 = make_logger(os1.os(), time_func(fixed_clock()), time_format(S_TIME_FORMAT_KITCHEN));
  const auto logger2 = make_logger(os2.os(), time_func(fixed_clock()), time_format(S_TIME_FORMAT_KITCHEN));

  logger1.info("Same");
  logger2.info("Same");

  EXPECT_EQ(os1.str(), "1:34PM INFO: Same\n");
  EXPECT_EQ(os1.str(), os2.str());

  // The default format.
  String_ostream os3;
  make_logger(os3.os(), time_func(fixed_clock())).info("Same");
  EXPECT_EQ(os3.str(), S_FIXED_TIME_STAMP + " INFO: Same\n");
}

TEST(Logger, Kitchen_time_stamp)
{
  style::set_enabled(false);

  const auto stamp_at = [](Wall_time_pt when, util::String_view format)
  {
    String_ostream os;
    make_logger(os.os(), time_func([when]() { return when; }), time_format(format)).info("Tick");
    return os.str();
  };

  // No leading zero on the hour; two-digit hours and the 12 o'clock hours are intact.
  EXPECT_EQ(stamp_at(fixed_time(), S_TIME_FORMAT_KITCHEN), "1:34PM INFO: Tick\n");
  EXPECT_EQ(stamp_at(fixed_time() - 4h, S_TIME_FORMAT_KITCHEN), "9:34AM INFO: Tick\n");
  EXPECT_EQ(stamp_at(fixed_time() + 9h, S_TIME_FORMAT_KITCHEN), "10:34PM INFO: Tick\n");
  EXPECT_EQ(stamp_at(fixed_time() - 13h - 30min, S_TIME_FORMAT_KITCHEN), "12:04AM INFO: Tick\n");

  // Only the exact kitchen pattern is special; `%I` elsewhere zero-pads as usual.
  EXPECT_EQ(stamp_at(fixed_time(), "at %I:%M%p"), "at 01:34PM INFO: Tick\n");
}

TEST(Logger, Invalid_time_format)
{
  style::set_enabled(false);

  String_ostream os;
  const auto logger = make_logger(os.os(), time_func(fixed_clock()), time_format("%Y-%Q"));
  EXPECT_NO_THROW(logger.info("Still logged"));
  EXPECT_EQ(os.str(), "%Y-%Q INFO: Still logged\n");
}

TEST(Logger, Line_parses_back)
{
  style::set_enabled(false);

  String_ostream os;
  const auto logger = make_logger(os.os(), time_func(fixed_clock()));
  logger.with("user", "jdoe").info("Response from get repos",
                                   "status", 200, "duration", 1h + 2min + 3500ms,
                                   "sentence", "this has spaces", "empty", "",
                                   "tags", vector<string>{ "a", "b" }, "step", Attr("cook", "rare"));

  const auto lines = split_lines(os.str());
  ASSERT_EQ(lines.size(), 1u);
  const auto& line = lines.front();

  const auto colon_pos = line.find(": ");
  ASSERT_NE(colon_pos, string::npos);
  EXPECT_EQ(line.substr(0, colon_pos), S_FIXED_TIME_STAMP + " INFO");

  const auto rest = line.substr(colon_pos + 2);
  const string msg = "Response from get repos";
  ASSERT_EQ(rest.compare(0, msg.size(), msg), 0);

  const vector<string> expected
    = { "user=jdoe", "status=200", "duration=1h2m3.5s", "sentence=\"this has spaces\"", "empty=\"\"",
        "tags=\"[a b]\"", "step=cook=rare" };
  EXPECT_EQ(split_attrs(rest.substr(msg.size())), expected);
}

TEST(Logger, Styled)
{
  String_ostream plain_os;
  String_ostream styled_os;
  const auto plain = make_logger(plain_os.os(), time_func(fixed_clock()), prefix("cooking"));
  const auto styled = make_logger(styled_os.os(), time_func(fixed_clock()), prefix("cooking"));

  style::set_enabled(false);
  plain.warn("Pizza is burning!", "flavour", "pepperoni");
  style::set_enabled(true);
  styled.warn("Pizza is burning!", "flavour", "pepperoni");
  style::set_enabled(false);

  EXPECT_EQ(plain_os.str().find('\x1b'), string::npos);
  EXPECT_NE(styled_os.str().find("\x1b["), string::npos);

  // Aside from the escapes, the text is the same.
  const std::regex escape_regex("\x1b\\[[0-9;]*m");
  EXPECT_EQ(std::regex_replace(styled_os.str(), escape_regex, ""), plain_os.str());
}

TEST(Logger, Failing_sink_is_ignored)
{
  style::set_enabled(false);

  Throwing_streambuf buf;
  std::ostream os(&buf);
  os.exceptions(std::ios_base::badbit);

  const auto logger = make_logger(os, time_func(fixed_clock()));
  EXPECT_NO_THROW(logger.error("Nobody will read this"));
  EXPECT_TRUE(os.bad()); // Left for the owner of the stream to notice.
}

TEST(Logger, Copies_share_sink)
{
  style::set_enabled(false);

  String_ostream os;
  const auto logger = make_logger(os.os(), time_func(fixed_clock()), with_level(Level::S_WARN));
  Logger copy = logger;
  EXPECT_EQ(copy.level(), Level::S_WARN);

  copy = copy.with("copy", true);
  copy.warn("From the copy");
  logger.warn("From the original");

  EXPECT_EQ(replace_time_stamp(os.str()),
            "[TIME] WARN: From the copy copy=true\n"
            "[TIME] WARN: From the original\n");
}

} // namespace linelog::log::test
