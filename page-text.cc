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

#include "page-text.hh"

#include <vector>

#include <TextOutputDev.h>

#include "string-utils.hh"

static void append_text(void *stream, const char *text, int length)
{
  static_cast<std::string*>(stream)->append(text, length);
}

std::string get_page_text(pdf::Document &document, int page_index)
{
  std::string text;
  {
    TextOutputDev device(append_text, &text, false, 0, false);
    document.display_page(&device, page_index, 72);
  }
  /* Poppler terminates every page with a form feed. */
  string::rstrip(text, "\f");
  return text;
}

std::string get_unit_text(pdf::Document &document, const Unit &unit)
{
  std::vector<std::string> texts;
  for (int page : unit.get_pages())
    texts.push_back(get_page_text(document, page - 1));
  return string::join(texts, "\n\n");
}

// vim:ts=2 sts=2 sw=2 et
