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

#include "raster-images.hh"

#include <set>
#include <utility>

#include <Stream.h>

#include "debug.hh"
#include "i18n.hh"
#include "image-codec.hh"
#include "string-utils.hh"

namespace raster
{

/* class ImageCollector : pdf::OutputDevice
 * ========================================
 */

  class ImageCollector : public pdf::OutputDevice
  {
  protected:
    std::vector<Bitmap> &images;
    std::set<std::pair<int, int>> seen;
    bool is_new_xobject(pdf::Object *object);
    void add_color_image(pdf::Stream *stream, int width, int height, pdf::gfx::ImageColorMap *color_map);
    void add_stencil_mask(pdf::Stream *stream, int width, int height, bool invert);
  public:
    explicit ImageCollector(std::vector<Bitmap> &images)
    : images(images)
    { }
    bool upsideDown() { return true; }
    bool useDrawChar() { return false; }
    bool interpretType3Chars() { return false; }
    bool needNonText() { return true; }

    void drawImageMask(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream, int width, int height,
      bool invert, bool interpolate, bool inline_image)
    {
      if (inline_image || !this->is_new_xobject(object))
      {
        pdf::OutputDevice::drawImageMask(state, object, stream, width, height, invert, interpolate, inline_image);
        return;
      }
      this->add_stencil_mask(stream, width, height, invert);
    }

#if POPPLER_VERSION >= 8200
    void drawImage(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream, int width, int height,
      pdf::gfx::ImageColorMap *color_map, bool interpolate, const int *mask_colors, bool inline_image)
#else
    void drawImage(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream, int width, int height,
      pdf::gfx::ImageColorMap *color_map, bool interpolate, int *mask_colors, bool inline_image)
#endif
    {
      if (inline_image || !this->is_new_xobject(object))
      {
        pdf::OutputDevice::drawImage(state, object, stream, width, height, color_map,
          interpolate, mask_colors, inline_image);
        return;
      }
      this->add_color_image(stream, width, height, color_map);
    }

    void drawMaskedImage(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream, int width, int height,
      pdf::gfx::ImageColorMap *color_map, bool interpolate,
      pdf::Stream *mask_stream, int mask_width, int mask_height, bool mask_invert, bool mask_interpolate)
    {
      if (this->is_new_xobject(object))
        this->add_color_image(stream, width, height, color_map);
    }

    void drawSoftMaskedImage(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream,
      int width, int height, pdf::gfx::ImageColorMap *color_map, bool interpolate,
      pdf::Stream *mask_stream, int mask_width, int mask_height,
      pdf::gfx::ImageColorMap *mask_color_map, bool mask_interpolate)
    {
      if (this->is_new_xobject(object))
        this->add_color_image(stream, width, height, color_map);
    }
  };

  bool ImageCollector::is_new_xobject(pdf::Object *object)
  {
    if (object == nullptr || !object->isRef())
      return false;
    pdf::Ref ref = object->getRef();
    return this->seen.insert(std::make_pair(ref.num, ref.gen)).second;
  }

  void ImageCollector::add_color_image(pdf::Stream *stream, int width, int height, pdf::gfx::ImageColorMap *color_map)
  {
    if (width <= 0 || height <= 0 || color_map == nullptr)
      return;
    Bitmap bitmap;
    bitmap.width = width;
    bitmap.height = height;
    bitmap.rgb.assign(static_cast<size_t>(width) * height * 3, '\xFF');
    int n_comps = color_map->getNumPixelComps();
    ImageStream image_stream(stream, width, n_comps, color_map->getBits());
    image_stream.reset();
    size_t offset = 0;
    for (int y = 0; y < height; y++)
    {
      unsigned char *line = image_stream.getLine();
      if (line == nullptr)
        break;
      for (int x = 0; x < width; x++)
      {
        pdf::gfx::RgbColor rgb;
        color_map->getRGB(line + x * n_comps, &rgb);
        bitmap.rgb[offset++] = pdf::gfx::color_component_as_byte(rgb.r);
        bitmap.rgb[offset++] = pdf::gfx::color_component_as_byte(rgb.g);
        bitmap.rgb[offset++] = pdf::gfx::color_component_as_byte(rgb.b);
      }
    }
    image_stream.close();
    this->images.push_back(std::move(bitmap));
  }

  void ImageCollector::add_stencil_mask(pdf::Stream *stream, int width, int height, bool invert)
  {
    if (width <= 0 || height <= 0)
      return;
    Bitmap bitmap;
    bitmap.width = width;
    bitmap.height = height;
    bitmap.rgb.assign(static_cast<size_t>(width) * height * 3, '\xFF');
    ImageStream image_stream(stream, width, 1, 1);
    image_stream.reset();
    size_t offset = 0;
    for (int y = 0; y < height; y++)
    {
      unsigned char *line = image_stream.getLine();
      if (line == nullptr)
        break;
      for (int x = 0; x < width; x++, offset += 3)
      {
        /* By default, 0 samples are painted. */
        bool painted = (line[x] != 0) == invert;
        if (painted)
          bitmap.rgb[offset] = bitmap.rgb[offset + 1] = bitmap.rgb[offset + 2] = '\0';
      }
    }
    image_stream.close();
    this->images.push_back(std::move(bitmap));
  }

  std::vector<Bitmap> collect_images(pdf::Document &document, int page_index)
  {
    std::vector<Bitmap> images;
    ImageCollector collector(images);
    document.display_page(&collector, page_index, 72);
    return images;
  }

}

/* class RasterImageExtractor
 * ==========================
 */

int RasterImageExtractor::operator()(int page_index, const std::string &page_id, int index, std::vector<extract::Image> &images)
{
  std::vector<raster::Bitmap> bitmaps = raster::collect_images(this->document, page_index);
  for (raster::Bitmap &bitmap : bitmaps)
  {
    std::string png;
    {
      Magick::Image image = codec::from_rgb(bitmap.width, bitmap.height, bitmap.rgb);
      png = codec::encode_png(image);
    }
    bitmap.rgb.clear();
    bitmap.rgb.shrink_to_fit();
    images.push_back(this->layout.save_image(
      page_id, extract::Image::RASTER, index, png,
      bitmap.width, bitmap.height, this->chart_renderer
    ));
    debug(2, this->config.verbose)
      << string_printf(_("Raster image %d: %dx%d, %zu bytes"), index, bitmap.width, bitmap.height, png.size())
      << std::endl;
    index++;
  }
  return index;
}

// vim:ts=2 sts=2 sw=2 et
