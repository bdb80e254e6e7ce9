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

#ifndef PDF2EXTRACT_RASTER_IMAGES_HH
#define PDF2EXTRACT_RASTER_IMAGES_HH

#include <string>
#include <vector>

#include "chart.hh"
#include "config.hh"
#include "extract-model.hh"
#include "output-layout.hh"
#include "pdf-backend.hh"

namespace raster
{

  /* Decoded embedded image: 8-bit RGB, rows top to bottom. */
  class Bitmap
  {
  public:
    int width;
    int height;
    std::string rgb;
  };

  /* Every image XObject drawn on the page, once each, in drawing order. */
  std::vector<Bitmap> collect_images(pdf::Document &document, int page_index);

}

class RasterImageExtractor
{
protected:
  const Config &config;
  pdf::Document &document;
  OutputLayout &layout;
  ChartRenderer &chart_renderer;
public:
  RasterImageExtractor(const Config &config, pdf::Document &document, OutputLayout &layout, ChartRenderer &chart_renderer)
  : config(config), document(document), layout(layout), chart_renderer(chart_renderer)
  { }

  /* Appends the page's images to `images`, numbered from `index`.
   * Returns the next free index.
   */
  int operator()(int page_index, const std::string &page_id, int index, std::vector<extract::Image> &images);
};

#endif

// vim:ts=2 sts=2 sw=2 et
