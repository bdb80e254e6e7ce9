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

#ifndef PDF2EXTRACT_OUTPUT_LAYOUT_HH
#define PDF2EXTRACT_OUTPUT_LAYOUT_HH

#include <string>

#include "chart.hh"
#include "extract-model.hh"
#include "page-groups.hh"
#include "system.hh"

/* On-disk layout of one extraction:
 *
 *   <output_dir>/pdf_extract.json
 *   <output_dir>/pages/page_<N|N_M>.png
 *   <output_dir>/images/<image-id>.png
 *   <output_dir>/images/<image-id>_chart.png
 *
 * Constructing the layout creates the directories.
 */

class OutputLayout
{
protected:
  OutputDirectory root;
  OutputDirectory pages_dir;
  OutputDirectory images_dir;
  void store(const std::string &relative_path, const std::string &data);
public:
  static const char pages_dir_name[];
  static const char images_dir_name[];
  static const char record_file_name[];

  explicit OutputLayout(const std::string &output_dir);

  /* Returns the path relative to the output directory. */
  std::string save_page(const Unit &unit, const std::string &png);

  /* Stores the image and its chart rendering, and describes both. */
  extract::Image save_image(const std::string &page_id, extract::Image::type_t type, int index,
    const std::string &png, int width, int height, ChartRenderer &chart_renderer);

  /* Returns the full path of the written file. */
  std::string save_record(const extract::PdfExtract &record);
};

#endif

// vim:ts=2 sts=2 sw=2 et
