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

#ifndef PDF2EXTRACT_PAGE_RENDER_HH
#define PDF2EXTRACT_PAGE_RENDER_HH

#include <string>
#include <vector>

#include <Magick++.h>

#include "config.hh"
#include "page-groups.hh"
#include "pdf-backend.hh"

/* Places the images side by side, left to right, on a white canvas as tall as
 * the tallest one; shorter images are centred vertically.
 * A single image is returned unchanged.
 */
Magick::Image compose_spread(const std::vector<Magick::Image> &images);

class SpreadRenderer
{
protected:
  const Config &config;
  pdf::Document &document;
  pdf::splash::Color paper_color;
public:
  SpreadRenderer(const Config &config, pdf::Document &document);

  Magick::Image render_page(int page_index);

  /* PNG image of the whole unit. */
  std::string operator()(const Unit &unit);
};

#endif

// vim:ts=2 sts=2 sw=2 et
