/* Copyright © 2007-2015 Jakub Wilk <jwilk@jwilk.net>
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

#ifndef PDF2EXTRACT_DEBUG_HH
#define PDF2EXTRACT_DEBUG_HH

#include <cstdint>
#include <exception>
#include <ostream>
#include <sstream>
#include <string>

class DebugStream;

template <typename tp>
static inline DebugStream &operator<<(DebugStream &, const tp &);

/* Line-oriented log stream.
 * Every line starts with a "- " bullet indented two spaces per level;
 * `stream++` and `stream--` change the level of subsequent lines.
 */

class DebugStream
{
protected:
  unsigned int level;
  bool started;
  std::ostream &ostream;
  void indent();
public:
  explicit DebugStream(std::ostream &ostream)
  : level(0), started(false), ostream(ostream)
  { }
  void operator ++(int) { this->level++; }
  void operator --(int)
  {
    if (this->level > 0)
      this->level--;
  }
  template <typename tp>
    friend DebugStream &operator<<(DebugStream &, const tp &);
  friend DebugStream &operator<<(DebugStream &stream, std::ostream& (*)(std::ostream&));
};

DebugStream &debug(int n, int threshold);
extern DebugStream error_log;

extern std::ostream &dev_null;

void warning(const std::string &message);

/* Diagnostic of the PDF backend, as "<category> (<position>): <message>".
 * Negative positions are left out.
 */
void backend_message(const char *category, intmax_t position, const char *message);

static inline std::ostream &operator<<(std::ostream &stream, const std::exception &error)
{
  stream << error.what();
  return stream;
}

template <typename tp>
static inline DebugStream &operator<<(DebugStream &stream, const tp &object)
{
  if (!stream.started)
  {
    stream.indent();
    stream.started = true;
  }
  std::ostringstream buffer;
  buffer.copyfmt(stream.ostream);
  buffer << object;
  stream.ostream << buffer.str();
  return stream;
}

#endif

// vim:ts=2 sts=2 sw=2 et
