/* Copyright © 2007-2019 Jakub Wilk <jwilk@jwilk.net>
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

#ifndef PDF2EXTRACT_CONFIG_HH
#define PDF2EXTRACT_CONFIG_HH

#include <stdexcept>
#include <string>

#include "i18n.hh"

class Config
{
public:
  std::string pdf_path;
  std::string output_dir;
  int start_page;
  int end_page;
  bool spread_mode;
  int verbose;

  /* Rasterization oversampling: pages are rendered at 72 * zoom dpi. */
  static const int zoom = 2;

  Config();

  class NeedVersion
  { };

  class Error : public std::runtime_error
  {
  public:
    explicit Error(const std::string &message)
    : std::runtime_error(message)
    { }
    virtual bool is_quiet() const
    {
      return false;
    }
    virtual bool is_already_printed() const
    {
      return false;
    }
  };

  class NeedHelp : public Error
  {
  public:
    NeedHelp()
    : Error("")
    { }
    virtual bool is_quiet() const
    {
      return true;
    }
  };

  class InvalidOption : public Error
  {
  public:
    InvalidOption()
    : Error("")
    { }
    virtual bool is_quiet() const
    {
      return true;
    }
    virtual bool is_already_printed() const
    {
      return true;
    }
  };

  void read_config(int argc, char * const argv[]);
  void usage(const Error &error) const;
  void usage() const;
};

#endif

// vim:ts=2 sts=2 sw=2 et
