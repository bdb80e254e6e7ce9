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

#include "vector-images.hh"

#include "debug.hh"
#include "drawing.hh"
#include "i18n.hh"
#include "string-utils.hh"

const double VectorImageExtractor::margin_allowance = 0.0;
const double VectorImageExtractor::overlap_threshold = 0.75;

int VectorImageExtractor::operator()(int page_index, const std::string &page_id, int index, std::vector<extract::Image> &images)
{
  int page_number = page_index + 1;
  DebugStream &log = debug(1, this->config.verbose);
  std::vector<drawing::Drawing> drawings = drawing::collect_drawings(this->document, page_index);
  log << string_printf(_("Page %d: found %zu drawings"), page_number, drawings.size()) << std::endl;
  log << string_printf(_("Page %d: drawable items: %zu"), page_number, drawing::count_drawable(drawings)) << std::endl;
  if (this->config.verbose >= 2)
  {
    DebugStream &detail = debug(2, this->config.verbose);
    detail++;
    for (const drawing::Drawing &item : drawings)
      detail << string_printf("%s (%.1f, %.1f)-(%.1f, %.1f)",
        drawing::Drawing::type_name(item.type),
        item.rect.x0, item.rect.y0, item.rect.x1, item.rect.y1
      ) << std::endl;
    detail--;
  }
  double width, height;
  this->document.get_page_size(page_index, width, height);
  std::vector<drawing::Region> regions;
  try
  {
    regions = this->detector(drawings, width, height, margin_allowance, overlap_threshold);
  }
  catch (const std::runtime_error &ex)
  {
    warning(string_printf(_("Unable to render vector images on page %d: %s"), page_number, ex.what()));
    return index;
  }
  drawings.clear();
  log << string_printf(_("Page %d: rendered %zu vector images"), page_number, regions.size()) << std::endl;
  log++;
  for (drawing::Region &region : regions)
  {
    log << string_printf(_("Vector image %d: %dx%d, %zu bytes"), index, region.width, region.height, region.png.size()) << std::endl;
    images.push_back(this->layout.save_image(
      page_id, extract::Image::VECTOR, index, region.png,
      region.width, region.height, this->chart_renderer
    ));
    region.png.clear();
    index++;
  }
  log--;
  return index;
}

// vim:ts=2 sts=2 sw=2 et
