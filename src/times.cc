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

#include <system.hh>

#include "times.h"

namespace reckon {

optional<datetime_t> epoch;

namespace {
  template <typename T>
  class temporal_io_t : public noncopyable
  {
    string fmt_str;

  public:
    temporal_io_t(const char * _fmt_str) : fmt_str(_fmt_str) {}

    const string& format_string() const {
      return fmt_str;
    }

    T parse(const char *);

    std::string format(const T& when) {
      std::tm data(to_tm(when));
      char buf[128];
      std::strftime(buf, 127, fmt_str.c_str(), &data);
      return buf;
    }
  };

  template <>
  datetime_t temporal_io_t<datetime_t>::parse(const char * str)
  {
    std::tm data;
    std::memset(&data, 0, sizeof(std::tm));
    const char * rest = strptime(str, fmt_str.c_str(), &data);
    if (rest && *rest == '\0')
      return posix_time::ptime_from_tm(data);
    else
      return datetime_t();
  }

  template <>
  date_t temporal_io_t<date_t>::parse(const char * str)
  {
    std::tm data;
    std::memset(&data, 0, sizeof(std::tm));
    data.tm_mday = 1;
    const char * rest = strptime(str, fmt_str.c_str(), &data);
    if (! rest)
      return date_t();
    while (*rest && std::isspace(static_cast<unsigned char>(*rest)))
      rest++;
    if (*rest != '\0')
      return date_t();

    try {
      return gregorian::date_from_tm(data);
    }
    catch (const std::out_of_range&) {
      // "31/02/2024", or a two-digit year read by a four-digit reader
      return date_t();
    }
  }

  typedef temporal_io_t<datetime_t> datetime_io_t;
  typedef temporal_io_t<date_t>     date_io_t;

  shared_ptr<datetime_io_t> written_datetime_io;
  shared_ptr<date_io_t>     written_date_io;
  shared_ptr<datetime_io_t> printed_datetime_io;
  shared_ptr<date_io_t>     printed_date_io;

  std::vector<shared_ptr<date_io_t> > readers;

  date_t parse_date_mask_routine(const char * date_str, date_io_t& io)
  {
    if (std::strlen(date_str) > 127)
      throw_(date_error, _f("Invalid date: %1%") % date_str);

    char buf[128];
    std::strcpy(buf, date_str);

    for (char * p = buf; *p; p++)
      if (*p == '.' || *p == '-')
        *p = '/';

    date_t when = io.parse(buf);

    if (! when.is_not_a_date()) {
      DEBUG("times.parse", "Passed date string:  " << date_str);
      DEBUG("times.parse", "Parsed with format:  " << io.format_string());
      DEBUG("times.parse", "Parsed result is:    " << when);
    }
    return when;
  }

  date_t parse_date_mask(const char * date_str)
  {
    if (readers.empty())
      times_initialize();

    foreach (shared_ptr<date_io_t>& reader, readers) {
      date_t when = parse_date_mask_routine(date_str, *reader.get());
      if (! when.is_not_a_date())
        return when;
    }

    throw_(date_error, _f("Invalid date: %1%") % date_str);
    return date_t();
  }
}

optional<date_time::months_of_year>
string_to_month_of_year(const std::string& text)
{
  string str(lowered(text));

  if (str == _("jan") || str == _("january"))
    return gregorian::Jan;
  else if (str == _("feb") || str == _("february"))
    return gregorian::Feb;
  else if (str == _("mar") || str == _("march"))
    return gregorian::Mar;
  else if (str == _("apr") || str == _("april"))
    return gregorian::Apr;
  else if (str == _("may"))
    return gregorian::May;
  else if (str == _("jun") || str == _("june"))
    return gregorian::Jun;
  else if (str == _("jul") || str == _("july"))
    return gregorian::Jul;
  else if (str == _("aug") || str == _("august"))
    return gregorian::Aug;
  else if (str == _("sep") || str == _("sept") || str == _("september"))
    return gregorian::Sep;
  else if (str == _("oct") || str == _("october"))
    return gregorian::Oct;
  else if (str == _("nov") || str == _("november"))
    return gregorian::Nov;
  else if (str == _("dec") || str == _("december"))
    return gregorian::Dec;
  else
    return none;
}

date_t parse_date(const char * str)
{
  return parse_date_mask(str);
}

optional<date_t> try_parse_date(const std::string& str)
{
  string text(trimmed(str));
  if (text.empty())
    return none;
  try {
    return parse_date(text);
  }
  catch (const date_error&) {
    return none;
  }
}

std::string format_datetime(const datetime_t& when,
                            const format_type_t format_type,
                            const optional<const char *>& format)
{
  if (! printed_datetime_io)
    times_initialize();

  if (format_type == FMT_WRITTEN) {
    return written_datetime_io->format(when);
  }
  else if (format_type == FMT_CUSTOM && format) {
    datetime_io_t custom(*format);
    return custom.format(when);
  }
  else if (format_type == FMT_PRINTED) {
    return printed_datetime_io->format(when);
  }
  else {
    assert(false);
    return empty_string;
  }
}

std::string format_date(const date_t& when,
                        const format_type_t format_type,
                        const optional<const char *>& format)
{
  if (! printed_date_io)
    times_initialize();

  if (format_type == FMT_WRITTEN) {
    return written_date_io->format(when);
  }
  else if (format_type == FMT_CUSTOM && format) {
    date_io_t custom(*format);
    return custom.format(when);
  }
  else if (format_type == FMT_PRINTED) {
    return printed_date_io->format(when);
  }
  else {
    assert(false);
    return empty_string;
  }
}

namespace {
  bool is_initialized = false;
}

void times_initialize()
{
  if (! is_initialized) {
    written_datetime_io.reset(new datetime_io_t("%Y-%m-%d %H:%M:%S"));
    written_date_io.reset(new date_io_t("%Y-%m-%d"));

    printed_datetime_io.reset(new datetime_io_t("%y-%b-%d %H:%M:%S"));
    printed_date_io.reset(new date_io_t("%Y-%m-%d"));

    // Separators have already been folded to slashes when these run.
    readers.push_back(shared_ptr<date_io_t>(new date_io_t("%d/%m/%Y")));
    readers.push_back(shared_ptr<date_io_t>(new date_io_t("%d/%m/%y")));
    readers.push_back(shared_ptr<date_io_t>(new date_io_t("%Y/%m/%d")));
    readers.push_back(shared_ptr<date_io_t>(new date_io_t("%m/%d/%Y")));
    readers.push_back(shared_ptr<date_io_t>(new date_io_t("%d %b %Y")));
    readers.push_back(shared_ptr<date_io_t>(new date_io_t("%d/%b/%Y")));
    readers.push_back(shared_ptr<date_io_t>(new date_io_t("%d %b %y")));

    is_initialized = true;
  }
}

void times_shutdown()
{
  if (is_initialized) {
    written_datetime_io.reset();
    written_date_io.reset();
    printed_datetime_io.reset();
    printed_date_io.reset();

    readers.clear();

    is_initialized = false;
  }
}

} // namespace reckon
