/* Copyright © 2007-2022 Jakub Wilk <jwilk@jwilk.net>
 * Copyright © 2009 Mateusz Turcza
 * Copyright © 2026 pdf2extract authors
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

#ifndef PDF2EXTRACT_PDF_BACKEND_HH
#define PDF2EXTRACT_PDF_BACKEND_HH

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "autoconf.hh"

// Poppler:
#include <PDFDoc.h>
#include <GfxState.h>
#include <Object.h>
#include <OutputDev.h>
#include <SplashOutputDev.h>
#include <Stream.h>
#include <goo/GooString.h>
#include <splash/SplashBitmap.h>
#include <splash/SplashTypes.h>

#include "i18n.hh"

namespace pdf
{

/* type definitions — splash output device
 * =======================================
 */

  namespace splash
  {
    typedef ::SplashColor Color;
    typedef ::SplashBitmap Bitmap;
    typedef ::SplashOutputDev OutputDevice;
  }

/* miscellaneous type definitions
 * ==============================
 */

  typedef ::OutputDev OutputDevice;
  typedef ::Stream Stream;
  typedef ::Object Object;
  typedef ::GooString String;
  typedef ::Goffset Offset;
  typedef ::Ref Ref;

/* type definitions — rendering subsystem
 * ======================================
 */

  namespace gfx
  {
    typedef ::GfxSubpath Subpath;
    typedef ::GfxPath Path;
    typedef ::GfxState State;
    typedef ::GfxImageColorMap ImageColorMap;
    typedef ::GfxColorComp ColorComponent;
    typedef ::GfxRGB RgbColor;
  }

/* class pdf::Renderer : pdf::splash::OutputDevice
 * ===============================================
 */

  class Renderer : public pdf::splash::OutputDevice
  {
  public:
    explicit Renderer(pdf::splash::Color &paper_color);
  };


/* class pdf::Pixmap
 * =================
 */

  /* RGB bitmap taken over from a renderer after a page was displayed. */

  class Pixmap
  {
  private:
    Pixmap(const Pixmap&) = delete;
    Pixmap& operator=(const Pixmap&) = delete;
  protected:
    const uint8_t *raw_data;
    pdf::splash::Bitmap *bmp;
    size_t row_size;
    size_t byte_width;
    int width, height;
  public:
    int get_width() const
    {
      return width;
    }
    int get_height() const
    {
      return height;
    }

    explicit Pixmap(Renderer *renderer);

    ~Pixmap()
    {
      delete bmp;
    }

    friend std::ostream &operator<<(std::ostream &, const Pixmap &);
  };


/* class pdf::Environment
 * ======================
 */

  class Environment
  {
  public:
    Environment();
    static bool antialias;
  };


/* class pdf::Document
 * ===================
 */

  /* Holds the document bytes for as long as the parser refers to them. */

  class DocumentBuffer
  {
  protected:
    std::string data;
    explicit DocumentBuffer(std::string &&data)
    : data(std::move(data))
    { }
  };

  /* Page indices are 0-based in this interface. */

  class Document : protected DocumentBuffer, public ::PDFDoc
  {
  public:
    explicit Document(std::string data);
    int get_page_count()
    {
      return this->getNumPages();
    }
    void display_page(pdf::OutputDevice *device, int page_index, double dpi, bool crop = true);
    void get_page_size(int page_index, double &width, double &height);
    class LoadError : public std::runtime_error
    {
    public:
      LoadError()
      : std::runtime_error(_("Unable to load document"))
      { }
    };
  };


/* utility functions
 * =================
 */

  void set_color(pdf::splash::Color &result, uint8_t r, uint8_t g, uint8_t b);

  namespace gfx
  {
    static inline double color_component_as_double(pdf::gfx::ColorComponent c)
    {
      return ::colToDbl(c);
    }

    static inline uint8_t color_component_as_byte(pdf::gfx::ColorComponent c)
    {
      return ::colToByte(c);
    }
  }

}

#endif

// vim:ts=2 sts=2 sw=2 et
