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

#undef NDEBUG
#include <cassert>
#include <string>

#include <Magick++.h>

#include "chart.hh"
#include "image-codec.hh"

static void test_nice_step()
{
  assert(chart::nice_step(0) == 1);
  assert(chart::nice_step(10) == 1);
  assert(chart::nice_step(11) == 2);
  assert(chart::nice_step(20) == 2);
  assert(chart::nice_step(21) == 5);
  assert(chart::nice_step(50) == 5);
  assert(chart::nice_step(51) == 10);
  assert(chart::nice_step(640) == 100);
  assert(chart::nice_step(1500) == 200);
  for (unsigned int extent = 1; extent < 5000; extent += 37)
  {
    unsigned int step = chart::nice_step(extent);
    assert(step * 10 >= extent);
  }
}

static void test_render()
{
  std::string rgb(40 * 30 * 3, '\0');
  Magick::Image source = codec::from_rgb(40, 30, rgb);
  std::string png = codec::encode_png(source);
  chart::AxesChartRenderer render;
  std::string result = render(png);
  Magick::Image chart = codec::decode(result);
  assert(chart.columns() == 40 + 36);
  assert(chart.rows() == 30 + 36);
  Magick::ColorRGB corner = chart.pixelColor(0, 0);
  assert(corner.red() > 0.98 && corner.green() > 0.98 && corner.blue() > 0.98);
  Magick::ColorRGB inside = chart.pixelColor(24 + 20, 12 + 15);
  assert(inside.red() < 0.02 && inside.green() < 0.02 && inside.blue() < 0.02);
}

static void test_bad_input()
{
  chart::AxesChartRenderer render;
  try
  {
    render("this is not an image");
    assert(false);
  }
  catch (const chart::Error &)
  { }
}

int main()
{
  codec::initialize();
  test_nice_step();
  test_render();
  test_bad_input();
  return 0;
}

// vim:ts=2 sts=2 sw=2 et
