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

#include "page-groups.hh"

#include <sstream>

#include "i18n.hh"
#include "string-utils.hh"

/* class PageRange
 * ===============
 */

PageRange PageRange::resolve(int start, int end, int total_pages)
{
  PageRange range;
  range.end = (end > 0 && end < total_pages) ? end : total_pages;
  range.start = (start == 0) ? 1 : start;
  if (range.start < 1 || range.start > total_pages)
    throw Invalid(string_printf(
      _("Start page %d is out of range (1-%d)"),
      range.start, total_pages
    ));
  if (range.end < range.start)
    throw Invalid(string_printf(
      _("End page %d cannot be less than start page %d"),
      range.end, range.start
    ));
  return range;
}


/* class Unit
 * ==========
 */

Unit Unit::single(int page)
{
  return Unit(SINGLE, page, page);
}

Unit Unit::spread(int left, int right)
{
  if (right != left + 1)
    throw std::logic_error(_("A spread must consist of two consecutive pages"));
  return Unit(SPREAD, left, right);
}

std::vector<int> Unit::get_pages() const
{
  switch (this->kind)
  {
  case SINGLE:
    return std::vector<int>{this->left};
  case SPREAD:
    return std::vector<int>{this->left, this->right};
  }
  throw std::logic_error(_("Unknown unit kind"));
}

std::string Unit::get_id() const
{
  std::ostringstream stream;
  switch (this->kind)
  {
  case SINGLE:
    stream << "p" << this->left;
    return stream.str();
  case SPREAD:
    stream << "p" << this->left << "_" << this->right;
    return stream.str();
  }
  throw std::logic_error(_("Unknown unit kind"));
}

std::string Unit::get_file_name() const
{
  std::ostringstream stream;
  switch (this->kind)
  {
  case SINGLE:
    stream << "page_" << this->left << ".png";
    return stream.str();
  case SPREAD:
    stream << "page_" << this->left << "_" << this->right << ".png";
    return stream.str();
  }
  throw std::logic_error(_("Unknown unit kind"));
}


/* planner
 * =======
 */

std::vector<Unit> plan_units(int start_page, int end_page, bool spread_mode)
{
  std::vector<Unit> units;
  int page = start_page;
  while (page <= end_page)
  {
    /* Pairing follows the global page parity: the cover stays alone,
     * then 2-3, 4-5, ... are spreads when both halves are in range.
     */
    if (spread_mode && page != 1 && page % 2 == 0 && page + 1 <= end_page)
    {
      units.push_back(Unit::spread(page, page + 1));
      page += 2;
    }
    else
    {
      units.push_back(Unit::single(page));
      page++;
    }
  }
  return units;
}

// vim:ts=2 sts=2 sw=2 et
