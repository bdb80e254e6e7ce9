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

#include "extractor.hh"

#include <memory>
#include <utility>
#include <vector>

#include "debug.hh"
#include "i18n.hh"
#include "output-layout.hh"
#include "page-groups.hh"
#include "page-render.hh"
#include "page-text.hh"
#include "pdf-backend.hh"
#include "raster-images.hh"
#include "string-utils.hh"
#include "sys-time.hh"
#include "system.hh"
#include "vector-images.hh"

extract::PdfExtract Extractor::operator()()
{
  DebugStream &log = debug(1, this->config.verbose);
  extract::PdfExtract result;
  extract::Metadata &metadata = result.metadata;

  std::string directory_name;
  split_path(this->config.pdf_path, directory_name, metadata.filename);
  std::unique_ptr<pdf::Document> document(new pdf::Document(read_file(this->config.pdf_path)));
  metadata.total_pages = document->get_page_count();
  PageRange range = PageRange::resolve(this->config.start_page, this->config.end_page, metadata.total_pages);
  metadata.start_page = range.start;
  metadata.end_page = range.end;
  metadata.spread_mode = this->config.spread_mode;
  metadata.extraction_timestamp = Timestamp::now().format('T');

  log << string_printf(_("Extracting %s"), this->config.pdf_path.c_str()) << std::endl;
  log++;
  if (this->config.end_page > 0)
    log << string_printf(_("pages: %d to %d"), this->config.start_page, this->config.end_page) << std::endl;
  else
    log << string_printf(_("pages: %d to end"), this->config.start_page) << std::endl;
  log << (this->config.spread_mode ? _("spread mode: enabled") : _("spread mode: disabled")) << std::endl;
  log << string_printf(_("output directory: %s"), this->config.output_dir.c_str()) << std::endl;
  log--;

  OutputLayout layout(this->config.output_dir);
  SpreadRenderer renderer(this->config, *document);
  RasterImageExtractor extract_raster(this->config, *document, layout, this->chart_renderer);
  VectorImageExtractor extract_vector(this->config, *document, layout, this->chart_renderer, this->detector);

  for (const Unit &unit : plan_units(range.start, range.end, this->config.spread_mode))
  {
    extract::Page page;
    page.page_id = unit.get_id();
    page.page_number = unit.get_first_page();
    log << string_printf(_("page %s"), page.page_id.c_str()) << std::endl;
    log++;
    page.page_image_path = layout.save_page(unit, renderer(unit));
    page.text = get_unit_text(*document, unit);
    int index = 0;
    for (int page_number : unit.get_pages())
    {
      index = extract_raster(page_number - 1, page.page_id, index, page.images);
      index = extract_vector(page_number - 1, page.page_id, index, page.images);
      metadata.extracted_pages.push_back(page_number);
    }
    log--;
    result.pages.push_back(std::move(page));
  }
  document.reset();

  this->record_path = layout.save_record(result);
  size_t n_images = 0;
  for (const extract::Page &page : result.pages)
    n_images += page.images.size();
  log << _("Extraction complete") << std::endl;
  log++;
  log << string_printf(_("Extracted %zu page units"), result.pages.size()) << std::endl;
  log << string_printf(_("Found %zu images"), n_images) << std::endl;
  log << string_printf(_("Results saved to %s"), this->record_path.c_str()) << std::endl;
  log--;
  return result;
}

// vim:ts=2 sts=2 sw=2 et
