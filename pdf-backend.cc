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

#include "pdf-backend.hh"

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include <Error.h>
#include <GlobalParams.h>
#include <PDFDoc.h>
#include <Stream.h>

#include "debug.hh"
#include "i18n.hh"


/* class pdf::Environment
 * ======================
 */

#if POPPLER_VERSION >= 8500
static void poppler_error_handler(ErrorCategory category, pdf::Offset pos, const char *message)
#else
static void poppler_error_handler(void *data, ErrorCategory category, pdf::Offset pos, const char *message)
#endif
{
  const char *category_name = _("PDF error");
  switch (category)
  {
    case errSyntaxWarning:
      category_name = _("PDF syntax warning");
      break;
    case errSyntaxError:
      category_name = _("PDF syntax error");
      break;
    case errConfig:
      category_name = _("Poppler configuration error");
      break;
    case errCommandLine:
      break; /* should not happen */
    case errIO:
      category_name = _("Input/output error");
      break;
    case errNotAllowed:
      category_name = _("Permission denied");
      break;
    case errUnimplemented:
      category_name = _("PDF feature not implemented");
      break;
    case errInternal:
      category_name = _("Internal Poppler error");
      break;
  }

  backend_message(category_name, static_cast<intmax_t>(pos), message);
}

pdf::Environment::Environment()
{
#if POPPLER_VERSION >= 8300
  globalParams = std::unique_ptr<GlobalParams>(new GlobalParams);
#else
  globalParams = new GlobalParams;
#endif
#if POPPLER_VERSION >= 8500
  setErrorCallback(poppler_error_handler);
#else
  setErrorCallback(poppler_error_handler, nullptr);
#endif
}

bool pdf::Environment::antialias = true;


/* class pdf::Document
 * ===================
 */

pdf::Document::Document(std::string data)
: DocumentBuffer(std::move(data)),
  ::PDFDoc(new MemStream(
    this->DocumentBuffer::data.data(), 0,
    static_cast<pdf::Offset>(this->DocumentBuffer::data.size()),
    pdf::Object(objNull)
  ))
{
  if (!this->isOk())
    throw LoadError();
}

void pdf::Document::display_page(pdf::OutputDevice *device, int page_index, double dpi, bool crop)
{
  this->displayPage(device, page_index + 1, dpi, dpi, 0, !crop, crop, false);
}

void pdf::Document::get_page_size(int page_index, double &width, double &height)
{
  int n = page_index + 1;
  width = this->getPageCropWidth(n);
  height = this->getPageCropHeight(n);
  if ((this->getPageRotate(n) / 90) & 1)
    std::swap(width, height);
}


/* utility functions
 * =================
 */

void pdf::set_color(splash::Color &result, uint8_t r, uint8_t g, uint8_t b)
{
  result[0] = r;
  result[1] = g;
  result[2] = b;
}


/* class pdf::Renderer : pdf::splash::OutputDevice
 * ===============================================
 */

pdf::Renderer::Renderer(pdf::splash::Color &paper_color)
: pdf::splash::OutputDevice(splashModeRGB8, 4, false, paper_color)
{
  this->setFontAntialias(pdf::Environment::antialias);
  this->setVectorAntialias(pdf::Environment::antialias);
}


/* class pdf::Pixmap
 * =================
 */

pdf::Pixmap::Pixmap(Renderer *renderer)
{
  bmp = renderer->takeBitmap();
  raw_data = const_cast<const uint8_t*>(bmp->getDataPtr());
  width = bmp->getWidth();
  height = bmp->getHeight();
  row_size = bmp->getRowSize();
  if (bmp->getMode() != splashModeRGB8)
  {
    delete bmp;
    throw std::logic_error(_("Unexpected bitmap color mode"));
  }
  this->byte_width = width * 3;
}

namespace pdf
{
  std::ostream &operator<<(std::ostream &stream, const pdf::Pixmap &pixmap)
  {
    const uint8_t *row_ptr = pixmap.raw_data;
    for (int y = 0; y < pixmap.height; y++)
    {
      stream.write(reinterpret_cast<const char*>(row_ptr), pixmap.byte_width);
      row_ptr += pixmap.row_size;
    }
    return stream;
  }
}

// vim:ts=2 sts=2 sw=2 et
