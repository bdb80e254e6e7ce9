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

#include "page-render.hh"

#include <algorithm>
#include <cerrno>
#include <sstream>
#include <stdexcept>

#include "debug.hh"
#include "i18n.hh"
#include "image-codec.hh"
#include "string-utils.hh"
#include "system.hh"

Magick::Image compose_spread(const std::vector<Magick::Image> &images)
{
  if (images.empty())
    throw std::logic_error(_("Nothing to compose"));
  if (images.size() == 1)
    return images[0];
  unsigned int total_width = 0;
  unsigned int max_height = 0;
  for (const Magick::Image &image : images)
  {
    total_width += image.columns();
    max_height = std::max(max_height, static_cast<unsigned int>(image.rows()));
  }
  Magick::Image canvas = codec::blank(total_width, max_height);
  int x = 0;
  for (const Magick::Image &image : images)
  {
    int y = (max_height - image.rows()) / 2;
    canvas.composite(image, x, y, Magick::OverCompositeOp);
    x += image.columns();
  }
  return canvas;
}

SpreadRenderer::SpreadRenderer(const Config &config, pdf::Document &document)
: config(config), document(document)
{
  codec::initialize();
  pdf::set_color(this->paper_color, 0xFF, 0xFF, 0xFF);
}

Magick::Image SpreadRenderer::render_page(int page_index)
{
  pdf::Renderer renderer(this->paper_color);
  renderer.startDoc(&this->document);
  this->document.display_page(&renderer, page_index, 72.0 * Config::zoom);
  pdf::Pixmap pixmap(&renderer);
  int width = pixmap.get_width();
  int height = pixmap.get_height();
  double page_width, page_height;
  this->document.get_page_size(page_index, page_width, page_height);
  if (width == 1 && height == 1 && page_width * Config::zoom > 1.5)
  {
    /* Splash gives a 1x1 bitmap when it cannot allocate the real one. */
    errno = ENOMEM;
    throw_posix_error("SplashBitmap");
  }
  debug(2, this->config.verbose)
    << string_printf(_("Page %d: rendered %dx%d"), page_index + 1, width, height)
    << std::endl;
  std::ostringstream buffer;
  buffer << pixmap;
  return codec::from_rgb(width, height, buffer.str());
}

std::string SpreadRenderer::operator()(const Unit &unit)
{
  std::vector<Magick::Image> images;
  for (int page : unit.get_pages())
    images.push_back(this->render_page(page - 1));
  Magick::Image result = compose_spread(images);
  images.clear();
  return codec::encode_png(result);
}

// vim:ts=2 sts=2 sw=2 et
