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

#ifndef PDF2EXTRACT_SYS_TIME_HH
#define PDF2EXTRACT_SYS_TIME_HH

#include <ctime>
#include <stdexcept>
#include <string>

#include "autoconf.hh"
#include "i18n.hh"

#if !HAVE_TIMEGM
time_t timegm(struct tm *tm);
#endif

/* class Timestamp
 * ===============
 */

class Timestamp
{
protected:
  bool dummy;
  struct tm timestamp;
  char tz_sign;
  int tz_hour;
  int tz_minute;
public:
  Timestamp();
  Timestamp(int year, int month, int day, int hour = 0, int minute = 0, int second = 0, char tz_sign = 0, int tz_hour = 0, int tz_minute = 0);
  std::string format(char separator = 'T') const;
  static Timestamp now();

  class Invalid : public std::runtime_error
  {
  public:
    Invalid()
    : std::runtime_error(_("Invalid date format"))
    { }
  };
};

#endif

// vim:ts=2 sts=2 sw=2 et
