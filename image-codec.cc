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

#include "image-codec.hh"

#include <stdexcept>

#include "i18n.hh"

class GraphicsMagickInitializer
{
public:
  GraphicsMagickInitializer()
  {
    Magick::InitializeMagick("");
  }
};

void codec::initialize()
{
  static GraphicsMagickInitializer gm_init;
}

Magick::Image codec::from_rgb(unsigned int width, unsigned int height, const std::string &rgb)
{
  codec::initialize();
  if (rgb.size() < static_cast<size_t>(width) * height * 3)
    throw std::logic_error(_("Pixel buffer is too small"));
  Magick::Image image(width, height, "RGB", Magick::CharPixel, rgb.data());
  image.type(Magick::TrueColorType);
  return image;
}

Magick::Image codec::blank(unsigned int width, unsigned int height)
{
  codec::initialize();
  Magick::Image image(Magick::Geometry(width, height), Magick::Color("white"));
  image.type(Magick::TrueColorType);
  return image;
}

std::string codec::encode_png(Magick::Image &image)
{
  Magick::Blob blob;
  image.depth(8);
  image.magick("PNG");
  image.write(&blob);
  return std::string(static_cast<const char*>(blob.data()), blob.length());
}

Magick::Image codec::decode(const std::string &data)
{
  codec::initialize();
  Magick::Blob blob(data.data(), data.size());
  Magick::Image image(blob);
  return image;
}

// vim:ts=2 sts=2 sw=2 et
