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

#include "config.hh"

#include <climits>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <getopt.h>

#include "autoconf.hh"
#include "debug.hh"
#include "i18n.hh"
#include "string-utils.hh"

Config::Config()
{
  this->start_page = 1;
  this->end_page = 0;
  this->spread_mode = false;
  this->verbose = 1;
}

namespace string
{
  template <typename tp>
  tp as(const std::string &);
}

template <typename tp>
tp string::as(const std::string &s)
{
  tp n;
  std::istringstream stream(s);
  stream >> n;
  if (stream.fail() || !stream.eof())
    throw Config::Error(string_printf(
      _("\"%s\" is not a valid number"),
      s.c_str())
    );
  return n;
}

void Config::read_config(int argc, char * const argv[])
{
  enum
  {
    OPT_END_PAGE = 'l',
    OPT_HELP = 'h',
    OPT_OUTPUT_DIR = 'o',
    OPT_QUIET = 'q',
    OPT_START_PAGE = 'f',
    OPT_VERBOSE = 'v',
    OPT_DUMMY = CHAR_MAX,
    OPT_PDF_PATH,
    OPT_SPREAD_MODE,
    OPT_VERSION,
  };
  static struct option options [] =
  {
    { "end-page", 1, nullptr, OPT_END_PAGE },
    { "end_page", 1, nullptr, OPT_END_PAGE },
    { "help", 0, nullptr, OPT_HELP },
    { "output-dir", 1, nullptr, OPT_OUTPUT_DIR },
    { "output_dir", 1, nullptr, OPT_OUTPUT_DIR },
    { "pdf-path", 1, nullptr, OPT_PDF_PATH },
    { "pdf_path", 1, nullptr, OPT_PDF_PATH },
    { "quiet", 0, nullptr, OPT_QUIET },
    { "spread-mode", 0, nullptr, OPT_SPREAD_MODE },
    { "spread_mode", 0, nullptr, OPT_SPREAD_MODE },
    { "start-page", 1, nullptr, OPT_START_PAGE },
    { "start_page", 1, nullptr, OPT_START_PAGE },
    { "verbose", 0, nullptr, OPT_VERBOSE },
    { "version", 0, nullptr, OPT_VERSION },
    { nullptr, 0, nullptr, '\0' }
  };
  /* Zero forces a full rescan, so that the object can be filled more than once. */
  optind = 0;
  while (true)
  {
    int c = getopt_long(argc, argv, "f:l:o:qvh", options, nullptr);
    if (c < 0)
      break;
    if (c == 0)
      throw Config::Error(_("Unable to parse command-line options"));
    switch (c)
    {
    case OPT_PDF_PATH:
      this->pdf_path = optarg;
      break;
    case OPT_OUTPUT_DIR:
      this->output_dir = optarg;
      break;
    case OPT_START_PAGE:
      this->start_page = string::as<int>(optarg);
      break;
    case OPT_END_PAGE:
      this->end_page = string::as<int>(optarg);
      break;
    case OPT_SPREAD_MODE:
      this->spread_mode = true;
      break;
    case OPT_QUIET:
      this->verbose = 0;
      break;
    case OPT_VERBOSE:
      this->verbose++;
      break;
    case OPT_HELP:
      throw NeedHelp();
    case OPT_VERSION:
      throw NeedVersion();
    case '?':
    case ':':
      throw InvalidOption();
    default:
      throw std::logic_error(_("Unknown option"));
    }
  }
  if (optind < argc)
    throw Config::Error(string_printf(
      _("Unexpected argument: %s"),
      argv[optind]
    ));
  if (this->pdf_path.empty())
    throw Config::Error(_("No input file name was specified"));
  if (this->output_dir.empty())
    throw Config::Error(_("No output directory was specified"));
}

template <typename streamtp>
static void print_usage(streamtp &stream)
{
  stream
    << _("Usage: ") << std::endl
    << _("   pdf2extract --pdf_path=<pdf-file> --output_dir=<directory> [options]") << std::endl
    << std::endl << _("Options: ")
    << std::endl << _("     --pdf_path=FILE")
    << std::endl << _(" -o, --output_dir=DIRECTORY")
    << std::endl << _(" -f, --start_page=N")
    << std::endl << _(" -l, --end_page=N")
    << std::endl <<   "     --spread_mode"
    << std::endl <<   " -v, --verbose"
    << std::endl <<   " -q, --quiet"
    << std::endl <<   " -h, --help"
    << std::endl <<   "     --version"
    << std::endl;
}

void Config::usage(const Config::Error &error) const
{
  if (error.is_already_printed())
    error_log << std::endl;
  if (!error.is_quiet())
    error_log << error << std::endl << std::endl;
  print_usage(error_log);
}

void Config::usage() const
{
  print_usage(std::cout);
}

// vim:ts=2 sts=2 sw=2 et
