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

#include "chart.hh"

#include <list>

#include <Magick++.h>

#include "i18n.hh"
#include "image-codec.hh"
#include "string-utils.hh"

unsigned int chart::nice_step(unsigned int extent)
{
  static const unsigned int multipliers[] = {1, 2, 5};
  unsigned int magnitude = 1;
  while (true)
  {
    for (unsigned int multiplier : multipliers)
    {
      unsigned int step = multiplier * magnitude;
      if (step * 10 >= extent)
        return step;
    }
    magnitude *= 10;
  }
}

chart::AxesChartRenderer::AxesChartRenderer()
: margin(24), tick_length(6)
{
  codec::initialize();
}

std::string chart::AxesChartRenderer::operator()(const std::string &image_data)
{
  try
  {
    Magick::Image source = codec::decode(image_data);
    unsigned int width = source.columns();
    unsigned int height = source.rows();
    unsigned int left = this->margin;
    unsigned int top = this->margin / 2;
    Magick::Image canvas = codec::blank(width + left + this->margin / 2, height + top + this->margin);
    canvas.composite(source, left, top, Magick::OverCompositeOp);

    double x0 = left - 0.5;
    double y0 = top - 0.5;
    double x1 = left + width - 0.5;
    double y1 = top + height - 0.5;
    std::list<Magick::Drawable> drawables;
    drawables.push_back(Magick::DrawableStrokeColor(Magick::Color("black")));
    drawables.push_back(Magick::DrawableFillColor(Magick::Color("none")));
    drawables.push_back(Magick::DrawableStrokeWidth(1));
    drawables.push_back(Magick::DrawableRectangle(x0, y0, x1, y1));
    unsigned int step = chart::nice_step(width);
    for (unsigned int x = 0; x <= width; x += step)
      drawables.push_back(Magick::DrawableLine(x0 + x, y1, x0 + x, y1 + this->tick_length));
    step = chart::nice_step(height);
    for (unsigned int y = 0; y <= height; y += step)
      drawables.push_back(Magick::DrawableLine(x0 - this->tick_length, y1 - y, x0, y1 - y));
    canvas.draw(drawables);
    return codec::encode_png(canvas);
  }
  catch (const Magick::Exception &ex)
  {
    throw chart::Error(string_printf(_("Unable to render chart: %s"), ex.what()));
  }
}

// vim:ts=2 sts=2 sw=2 et
