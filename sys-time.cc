/* Copyright © 2007-2022 Jakub Wilk <jwilk@jwilk.net>
 * Copyright © 2026 pdf2extract authors
 *
 * This file is part of pdf2extract.
 *
 * pdf2extract is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * pdf2extract is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 */

#include "sys-time.hh"

#include <cerrno>
#include <climits>
#include <iomanip>
#include <sstream>

#include "system.hh"

#if !HAVE_TIMEGM

time_t timegm(struct tm *tm)
{
  time_t y = tm->tm_year + 1900;
  if (y < 1970) {
    errno = ERANGE;
    return -1;
  }
  time_t n = (
    y * 365 + (y - 1) / 4 - (y - 1) / 100 + (y - 1) / 400 - 719527 +
    tm->tm_yday
  ) * 24 * 60 * 60;
  n += (tm->tm_hour * 60 + tm->tm_min) * 60 + tm->tm_sec;
  return n;
}

#endif


/* class Timestamp
 * ===============
 */

Timestamp::Timestamp()
: dummy(true),
  timestamp{},
  tz_sign(0),
  tz_hour(0),
  tz_minute(0)
{ }

Timestamp::Timestamp(int year, int month, int day, int hour, int minute, int second, char tz_sign, int tz_hour, int tz_minute)
: dummy(false),
  timestamp{},
  tz_sign(tz_sign),
  tz_hour(tz_hour),
  tz_minute(tz_minute)
{
  this->timestamp.tm_isdst = -1;
  this->timestamp.tm_year = year - 1900;
  this->timestamp.tm_mon = month - 1;
  this->timestamp.tm_mday = day;
  this->timestamp.tm_hour = hour;
  this->timestamp.tm_min = minute;
  this->timestamp.tm_sec = second;
}

Timestamp Timestamp::now()
{
  Timestamp result;
  result.dummy = false;
  time_t unix_now = time(nullptr);
  if (unix_now == static_cast<time_t>(-1))
    throw_posix_error("time()");
  struct tm local_tm;
  if (localtime_r(&unix_now, &local_tm) == nullptr)
    throw_posix_error("localtime()");
  struct tm tmp_tm = local_tm;
  time_t unix_now_l = timegm(&tmp_tm);
  if (unix_now_l == static_cast<time_t>(-1))
    throw_posix_error("timegm()");
  time_t tz_offset = unix_now_l - unix_now;
  if (tz_offset >= 0)
    result.tz_sign = '+';
  else
  {
    result.tz_sign = '-';
    tz_offset = -tz_offset;
  }
  tz_offset /= 60;
  result.tz_hour = tz_offset / 60;
  result.tz_minute = tz_offset % 60;
  result.timestamp = local_tm;
  return result;
}

std::string Timestamp::format(char separator) const
{
  /* Format timestamp according to RFC 3339 date format,
   * e.g. "2007-10-27S13:19:59+02:00", where S is the separator.
   */
  if (this->dummy)
    return "";
  std::ostringstream stream;
  char buffer[17 + CHAR_BIT * sizeof this->timestamp.tm_year / 3];
  char format[] = "%Y-%m-%d %H:%M:%S";
  format[8] = separator;
  struct tm tmp_timestamp = this->timestamp;
  if (mktime(&tmp_timestamp) == static_cast<time_t>(-1))
    throw Timestamp::Invalid();
  if (strftime(buffer, sizeof buffer, format, &this->timestamp) != 19)
    throw Timestamp::Invalid();
  stream << buffer;
  if (this->tz_sign)
  {
    if (this->tz_hour < 0 || this->tz_hour >= 24)
      throw Timestamp::Invalid();
    if (this->tz_minute < 0 || this->tz_minute >= 60)
      throw Timestamp::Invalid();
    stream
      << this->tz_sign
      << std::setw(2) << std::setfill('0') << this->tz_hour
      << ":"
      << std::setw(2) << std::setfill('0') << this->tz_minute
    ;
  }
  return stream.str();
}

// vim:ts=2 sts=2 sw=2 et
