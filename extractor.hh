/* Copyright © 2026 pdf2extract authors
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

#ifndef PDF2EXTRACT_EXTRACTOR_HH
#define PDF2EXTRACT_EXTRACTOR_HH

#include <string>

#include "chart.hh"
#include "config.hh"
#include "extract-model.hh"
#include "vector-regions.hh"

/* Runs one extraction:
 * open the document, validate the page range, then for every unit in order
 * render it, collect its text, raster images and vector images,
 * and finally write pdf_extract.json.
 * Nothing is written to the output directory when the range is invalid.
 */

class Extractor
{
protected:
  const Config &config;
  ChartRenderer &chart_renderer;
  drawing::RegionDetector &detector;
public:
  Extractor(const Config &config, ChartRenderer &chart_renderer, drawing::RegionDetector &detector)
  : config(config), chart_renderer(chart_renderer), detector(detector)
  { }

  extract::PdfExtract operator()();

  /* Full path of the record written by the last run. */
  std::string record_path;
};

#endif

// vim:ts=2 sts=2 sw=2 et
