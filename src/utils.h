/*
 * Copyright (c) 2003-2023, John Wiegley.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of New Artisans LLC nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @defgroup util General utilities
 */

/**
 * @file   utils.h
 * @author John Wiegley
 *
 * @ingroup util
 *
 * @brief General utility facilities used by Reckon
 */
#pragma once

#define TIMERS_ON   1

/**
 * @name Forward declarations
 */
/*@{*/

namespace reckon {
  using namespace boost;

  typedef std::string string;
  typedef std::list<string> strings_list;

  typedef posix_time::ptime         ptime;
  typedef ptime::time_duration_type time_duration;
  typedef gregorian::date           date;
  typedef gregorian::date_duration  date_duration;
  typedef posix_time::seconds       seconds;

  typedef boost::filesystem::path             path;
  typedef boost::filesystem::ifstream         ifstream;
  typedef boost::filesystem::ofstream         ofstream;
  typedef boost::filesystem::filesystem_error filesystem_error;

  using std::unique_ptr;
  using std::shared_ptr;
}

/*@}*/

/**
 * @name Assertions
 */
/*@{*/

#ifdef assert
#undef assert
#endif

#if !NO_ASSERTS

namespace reckon {
  void debug_assert(const string& reason, const string& func,
                    const string& file, std::size_t line);
}

#define assert(x)                                               \
  ((x) ? ((void)0) : reckon::debug_assert(#x, BOOST_CURRENT_FUNCTION, \
                                          __FILE__, __LINE__))

#else // !NO_ASSERTS

#define assert(x) ((void)(x))

#endif // !NO_ASSERTS

/*@}*/

/**
 * @name String helpers
 */
/*@{*/

namespace reckon {

extern string empty_string;

strings_list split_arguments(const char * line);

inline string lowered(const string& str) {
  string tmp(str);
  to_lower(tmp);
  return tmp;
}

inline string trimmed(const string& str) {
  string tmp(str);
  trim(tmp);
  return tmp;
}

/**
 * Trim both ends and reduce every run of whitespace to a single space.
 */
string collapse_ws(const string& str);

inline bool contains_icase(const string& haystack, const char * needle) {
  return icontains(haystack, needle);
}

} // namespace reckon

/*@}*/

/**
 * @name Tracing and logging
 */
/*@{*/

#if LOGGING_ON

namespace reckon {

enum log_level_t {
  LOG_OFF = 0,
  LOG_CRIT,
  LOG_FATAL,
  LOG_ASSERT,
  LOG_ERROR,
  LOG_VERIFY,
  LOG_WARN,
  LOG_INFO,
  LOG_EXCEPT,
  LOG_DEBUG,
  LOG_TRACE,
  LOG_ALL
};

extern log_level_t        _log_level;
extern std::ostream *     _log_stream;
extern std::ostringstream _log_buffer;

void logger_func(log_level_t level);

#define LOGGER(cat) \
    static const char * const _this_category = cat

#if TRACING_ON

extern uint8_t _trace_level;

#define SHOW_TRACE(lvl) \
  (reckon::_log_level >= reckon::LOG_TRACE && lvl <= reckon::_trace_level)
#define TRACE(lvl, msg) \
  (SHOW_TRACE(lvl) ? \
   ((reckon::_log_buffer << msg), \
    reckon::logger_func(reckon::LOG_TRACE)) : (void)0)

#else // TRACING_ON

#define SHOW_TRACE(lvl) false
#define TRACE(lvl, msg)

#endif // TRACING_ON

#if DEBUG_ON

extern optional<std::string>  _log_category;
extern optional<boost::regex> _log_category_re;

inline bool category_matches(const char * cat) {
  if (_log_category) {
    if (! _log_category_re) {
      _log_category_re =
        boost::regex(_log_category->c_str(),
                     boost::regex::perl | boost::regex::icase);
    }
    return boost::regex_search(cat, *_log_category_re);
  }
  return false;
}

#define SHOW_DEBUG(cat) \
  (reckon::_log_level >= reckon::LOG_DEBUG && reckon::category_matches(cat))
#define SHOW_DEBUG_() SHOW_DEBUG(_this_category)

#define DEBUG(cat, msg) \
  (SHOW_DEBUG(cat) ? \
   ((reckon::_log_buffer << msg), \
    reckon::logger_func(reckon::LOG_DEBUG)) : (void)0)
#define DEBUG_(msg) DEBUG(_this_category, msg)

#else // DEBUG_ON

#define SHOW_DEBUG(cat) false
#define SHOW_DEBUG_()   false
#define DEBUG(cat, msg)
#define DEBUG_(msg)

#endif // DEBUG_ON

#define LOG_MACRO(level, msg) \
  (reckon::_log_level >= level ? \
   ((reckon::_log_buffer << msg), reckon::logger_func(level)) : (void)0)

#define SHOW_INFO()     (reckon::_log_level >= reckon::LOG_INFO)
#define SHOW_WARN()     (reckon::_log_level >= reckon::LOG_WARN)
#define SHOW_ERROR()    (reckon::_log_level >= reckon::LOG_ERROR)
#define SHOW_FATAL()    (reckon::_log_level >= reckon::LOG_FATAL)
#define SHOW_CRITICAL() (reckon::_log_level >= reckon::LOG_CRIT)

#define INFO(msg)      LOG_MACRO(reckon::LOG_INFO, msg)
#define WARN(msg)      LOG_MACRO(reckon::LOG_WARN, msg)
#define ERROR(msg)     LOG_MACRO(reckon::LOG_ERROR, msg)
#define FATAL(msg)     LOG_MACRO(reckon::LOG_FATAL, msg)
#define CRITICAL(msg)  LOG_MACRO(reckon::LOG_CRIT, msg)
#define EXCEPTION(msg) LOG_MACRO(reckon::LOG_EXCEPT, msg)

} // namespace reckon

#else // ! LOGGING_ON

#define LOGGER(cat)

#define SHOW_TRACE(lvl) false
#define SHOW_DEBUG(cat) false
#define SHOW_DEBUG_()   false
#define SHOW_INFO()     false
#define SHOW_WARN()     false
#define SHOW_ERROR()    false
#define SHOW_FATAL()    false
#define SHOW_CRITICAL() false

#define TRACE(lvl, msg)
#define DEBUG(cat, msg)
#define DEBUG_(msg)
#define INFO(msg)
#define WARN(msg)
#define ERROR(msg)
#define FATAL(msg)
#define CRITICAL(msg)

#endif // LOGGING_ON

#define IF_TRACE(lvl) if (SHOW_TRACE(lvl))
#define IF_DEBUG(cat) if (SHOW_DEBUG(cat))
#define IF_DEBUG_()   if (SHOW_DEBUG_())
#define IF_INFO()     if (SHOW_INFO())
#define IF_WARN()     if (SHOW_WARN())
#define IF_ERROR()    if (SHOW_ERROR())
#define IF_FATAL()    if (SHOW_FATAL())
#define IF_CRITICAL() if (SHOW_CRITICAL())

/*@}*/

/**
 * @name Timers
 * This allows log xacts to specify cumulative time spent.
 */
/*@{*/

#if LOGGING_ON && TIMERS_ON

namespace reckon {

void start_timer(const char * name, log_level_t lvl);
void stop_timer(const char * name);
void finish_timer(const char * name);

#if TRACING_ON
#define TRACE_START(name, lvl, msg) \
  (SHOW_TRACE(lvl) ? \
   ((reckon::_log_buffer << msg), \
    reckon::start_timer(#name, reckon::LOG_TRACE)) : ((void)0))
#define TRACE_STOP(name, lvl) \
  (SHOW_TRACE(lvl) ? reckon::stop_timer(#name) : ((void)0))
#define TRACE_FINISH(name, lvl) \
  (SHOW_TRACE(lvl) ? reckon::finish_timer(#name) : ((void)0))
#else
#define TRACE_START(name, lvl, msg)
#define TRACE_STOP(name, lvl)
#define TRACE_FINISH(name, lvl)
#endif

#if DEBUG_ON
#define DEBUG_START(name, cat, msg) \
  (SHOW_DEBUG(cat) ? \
   ((reckon::_log_buffer << msg), \
    reckon::start_timer(#name, reckon::LOG_DEBUG)) : ((void)0))
#define DEBUG_STOP(name, cat) \
  (SHOW_DEBUG(cat) ? reckon::stop_timer(#name) : ((void)0))
#define DEBUG_FINISH(name, cat) \
  (SHOW_DEBUG(cat) ? reckon::finish_timer(#name) : ((void)0))
#else
#define DEBUG_START(name, cat, msg)
#define DEBUG_STOP(name, cat)
#define DEBUG_FINISH(name, cat)
#endif

#define INFO_START(name, msg) \
  (SHOW_INFO() ? \
   ((reckon::_log_buffer << msg), \
    reckon::start_timer(#name, reckon::LOG_INFO)) : ((void)0))
#define INFO_STOP(name) \
  (SHOW_INFO() ? reckon::stop_timer(#name) : ((void)0))
#define INFO_FINISH(name) \
  (SHOW_INFO() ? reckon::finish_timer(#name) : ((void)0))

} // namespace reckon

#else // ! (LOGGING_ON && TIMERS_ON)

#define TRACE_START(name, lvl, msg)
#define TRACE_STOP(name, lvl)
#define TRACE_FINISH(name, lvl)

#define DEBUG_START(name, cat, msg)
#define DEBUG_STOP(name, cat)
#define DEBUG_FINISH(name, cat)

#define INFO_START(name, msg)
#define INFO_STOP(name)
#define INFO_FINISH(name)

#endif // LOGGING_ON && TIMERS_ON

/*@}*/

/*
 * These files define the other internal facilities.
 */

#include "error.h"

enum caught_signal_t {
  NONE_CAUGHT,
  INTERRUPTED,
  PIPE_CLOSED
};

extern caught_signal_t caught_signal;

void sigint_handler(int sig);
void sigpipe_handler(int sig);

inline void check_for_signal() {
  switch (caught_signal) {
  case NONE_CAUGHT:
    break;
  case INTERRUPTED:
    throw std::runtime_error(_("Interrupted by user"));
  case PIPE_CLOSED:
    throw std::runtime_error(_("Pipe terminated"));
  }
}

/**
 * @name General utility functions
 */
/*@{*/

#define foreach BOOST_FOREACH

namespace reckon {

path resolve_path(const path& pathname);

extern const string version;

} // namespace reckon

/*@}*/
