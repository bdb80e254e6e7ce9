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

#ifndef PDF2EXTRACT_IMAGE_CODEC_HH
#define PDF2EXTRACT_IMAGE_CODEC_HH

#include <string>

#include <Magick++.h>

namespace codec
{

  /* Must be called before any other GraphicsMagick use; repeated calls are cheap. */
  void initialize();

  Magick::Image from_rgb(unsigned int width, unsigned int height, const std::string &rgb);

  Magick::Image blank(unsigned int width, unsigned int height);

  std::string encode_png(Magick::Image &image);

  Magick::Image decode(const std::string &data);

}

#endif

// vim:ts=2 sts=2 sw=2 et
