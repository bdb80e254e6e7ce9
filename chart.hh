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

#ifndef PDF2EXTRACT_CHART_HH
#define PDF2EXTRACT_CHART_HH

#include <stdexcept>
#include <string>

/* Produces the secondary "chart" rendering of an extracted image.
 * Input and output are encoded image bytes.
 */

class ChartRenderer
{
public:
  virtual std::string operator()(const std::string &image_data) = 0;
  virtual ~ChartRenderer() throw ()
  { }
};

namespace chart
{

  class Error : public std::runtime_error
  {
  public:
    explicit Error(const std::string &message)
    : std::runtime_error(message)
    { }
  };

  /* Places the image inside a framed plot area with tick marks along the
   * bottom and left axes, one tick every nice_step() pixels.
   */
  class AxesChartRenderer : public ChartRenderer
  {
  protected:
    unsigned int margin;
    unsigned int tick_length;
  public:
    AxesChartRenderer();
    virtual std::string operator()(const std::string &image_data);
  };

  /* Smallest step of the form {1, 2, 5} * 10^n splitting extent into at most 10 intervals. */
  unsigned int nice_step(unsigned int extent);

}

#endif

// vim:ts=2 sts=2 sw=2 et
