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

#ifndef PDF2EXTRACT_PAGE_TEXT_HH
#define PDF2EXTRACT_PAGE_TEXT_HH

#include <string>

#include "page-groups.hh"
#include "pdf-backend.hh"

/* UTF-8 text layer of a page, in reading order. */
std::string get_page_text(pdf::Document &document, int page_index);

/* Text of every page of the unit, separated by a blank line. */
std::string get_unit_text(pdf::Document &document, const Unit &unit);

#endif

// vim:ts=2 sts=2 sw=2 et
