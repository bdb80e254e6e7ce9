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

#ifndef PDF2EXTRACT_VECTOR_IMAGES_HH
#define PDF2EXTRACT_VECTOR_IMAGES_HH

#include <string>
#include <vector>

#include "chart.hh"
#include "config.hh"
#include "extract-model.hh"
#include "output-layout.hh"
#include "pdf-backend.hh"
#include "vector-regions.hh"

class VectorImageExtractor
{
protected:
  const Config &config;
  pdf::Document &document;
  OutputLayout &layout;
  ChartRenderer &chart_renderer;
  drawing::RegionDetector &detector;
public:
  static const double margin_allowance;
  static const double overlap_threshold;

  VectorImageExtractor(const Config &config, pdf::Document &document, OutputLayout &layout,
    ChartRenderer &chart_renderer, drawing::RegionDetector &detector)
  : config(config), document(document), layout(layout),
    chart_renderer(chart_renderer), detector(detector)
  { }

  /* Appends the page's vector images to `images`, numbered from `index`.
   * Returns the next free index.
   * A detector failure is reported and leaves the page without vector images.
   */
  int operator()(int page_index, const std::string &page_id, int index, std::vector<extract::Image> &images);
};

#endif

// vim:ts=2 sts=2 sw=2 et
