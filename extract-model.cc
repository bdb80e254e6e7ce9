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

#include "extract-model.hh"

#include <sstream>
#include <stdexcept>

#include "i18n.hh"

namespace extract
{

  std::string Image::make_id(const std::string &page_id, type_t type, int index)
  {
    std::ostringstream stream;
    stream << "img_" << page_id << "_";
    switch (type)
    {
    case RASTER:
      stream << "r";
      break;
    case VECTOR:
      stream << "v";
      break;
    }
    stream << index;
    return stream.str();
  }

  const char *Image::type_name(type_t type)
  {
    switch (type)
    {
    case RASTER:
      return "raster";
    case VECTOR:
      return "vector";
    }
    throw std::logic_error(_("Unknown image type"));
  }

  Json to_json(const Image &image)
  {
    Json json;
    json["image_id"] = image.image_id;
    json["page_id"] = image.page_id;
    json["index"] = image.index;
    json["image_path"] = image.image_path;
    json["chart_path"] = image.chart_path;
    json["width"] = image.width;
    json["height"] = image.height;
    json["image_type"] = Image::type_name(image.image_type);
    return json;
  }

  Json to_json(const Page &page)
  {
    Json json;
    json["page_id"] = page.page_id;
    json["page_number"] = page.page_number;
    json["page_image_path"] = page.page_image_path;
    json["text"] = page.text;
    json["images"] = Json::array();
    for (const Image &image : page.images)
      json["images"].push_back(to_json(image));
    return json;
  }

  Json to_json(const Metadata &metadata)
  {
    Json json;
    json["filename"] = metadata.filename;
    json["total_pages"] = metadata.total_pages;
    json["extracted_pages"] = metadata.extracted_pages;
    json["extraction_timestamp"] = metadata.extraction_timestamp;
    json["start_page"] = metadata.start_page;
    json["end_page"] = metadata.end_page;
    json["spread_mode"] = metadata.spread_mode;
    return json;
  }

  Json to_json(const PdfExtract &extract)
  {
    Json json;
    json["metadata"] = to_json(extract.metadata);
    json["pages"] = Json::array();
    for (const Page &page : extract.pages)
      json["pages"].push_back(to_json(page));
    return json;
  }

}

// vim:ts=2 sts=2 sw=2 et
