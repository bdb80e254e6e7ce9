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

#include <clocale>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <Magick++.h>

#include "chart.hh"
#include "config.hh"
#include "debug.hh"
#include "extractor.hh"
#include "i18n.hh"
#include "image-codec.hh"
#include "paths.hh"
#include "pdf-backend.hh"
#include "string-utils.hh"
#include "system.hh"
#include "vector-regions.hh"
#include "version.hh"

static Config config;

static void setup_i18n()
{
#ifdef ENABLE_NLS
  std::setlocale(LC_ALL, "");
  /* Deliberately ignore errors. */
  /* Numbers in the JSON record and in log messages use the C notation. */
  std::setlocale(LC_NUMERIC, "C");
  std::string localedir = absolute_path(paths::localedir, "/");
  bindtextdomain(PACKAGE_NAME, localedir.c_str());
  textdomain(PACKAGE_NAME);
  /* Deliberately ignore errors. */
#else
  std::setlocale(LC_CTYPE, "");
  /* Deliberately ignore errors. */
#endif
}

class PdfNotFound : public std::runtime_error
{
public:
  explicit PdfNotFound(const std::string &path)
  : std::runtime_error(string_printf(_("PDF file not found: %s"), path.c_str()))
  { }
};

static int xmain(int argc, char * const argv[])
{
  std::ios_base::sync_with_stdio(false);

  try
  {
    config.read_config(argc, argv);
  }
  catch (const Config::NeedVersion &)
  {
    std::cout << get_multiline_version();
    exit(0);
  }
  catch (const Config::NeedHelp &)
  {
    config.usage();
    exit(0);
  }
  catch (const Config::Error &ex)
  {
    config.usage(ex);
    exit(1);
  }

  if (!path_exists(config.pdf_path))
    throw PdfNotFound(config.pdf_path);

  pdf::Environment environment;
  codec::initialize();

  chart::AxesChartRenderer chart_renderer;
  drawing::ClusteringDetector detector(Config::zoom);
  Extractor extractor(config, chart_renderer, detector);
  extractor();
  return 0;
}

int main(int argc, char * const argv[])
try
{
  setup_i18n();
  return xmain(argc, argv);
}
catch (const std::ios_base::failure &ex)
{
  error_log << string_printf(_("Input/output error (%s)"), ex.what()) << std::endl;
  exit(1);
}
catch (const Magick::Exception &ex)
{
  error_log << ex << std::endl;
  exit(1);
}
catch (const std::runtime_error &ex)
{
  error_log << ex << std::endl;
  exit(1);
}
catch (const std::exception &ex)
{
  error_log << ex << std::endl;
  exit(1);
}

// vim:ts=2 sts=2 sw=2 et
