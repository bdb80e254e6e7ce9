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

#ifndef PDF2EXTRACT_EXTRACT_MODEL_HH
#define PDF2EXTRACT_EXTRACT_MODEL_HH

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

/* The extraction record, as written to pdf_extract.json.
 * Paths are relative to the output directory.
 */

namespace extract
{

  class Image
  {
  public:
    enum type_t
    {
      RASTER,
      VECTOR,
    };
    std::string image_id;
    std::string page_id;
    int index;
    std::string image_path;
    std::string chart_path;
    int width;
    int height;
    type_t image_type;

    /* "img_p4_5_r0", "img_p3_v2" */
    static std::string make_id(const std::string &page_id, type_t type, int index);
    static const char *type_name(type_t type);
  };

  class Page
  {
  public:
    std::string page_id;
    int page_number;
    std::string page_image_path;
    std::string text;
    std::vector<Image> images;
  };

  class Metadata
  {
  public:
    std::string filename;
    int total_pages;
    std::vector<int> extracted_pages;
    std::string extraction_timestamp;
    int start_page;
    int end_page;
    bool spread_mode;
  };

  class PdfExtract
  {
  public:
    Metadata metadata;
    std::vector<Page> pages;
  };

  typedef nlohmann::ordered_json Json;

  Json to_json(const Image &image);
  Json to_json(const Page &page);
  Json to_json(const Metadata &metadata);
  Json to_json(const PdfExtract &extract);

}

#endif

// vim:ts=2 sts=2 sw=2 et
