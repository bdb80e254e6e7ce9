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

#include "output-layout.hh"

const char OutputLayout::pages_dir_name[] = "pages";
const char OutputLayout::images_dir_name[] = "images";
const char OutputLayout::record_file_name[] = "pdf_extract.json";

OutputLayout::OutputLayout(const std::string &output_dir)
: root(output_dir),
  pages_dir(join_path(output_dir, pages_dir_name)),
  images_dir(join_path(output_dir, images_dir_name))
{ }

void OutputLayout::store(const std::string &relative_path, const std::string &data)
{
  write_file(this->root / relative_path, data);
}

std::string OutputLayout::save_page(const Unit &unit, const std::string &png)
{
  std::string path = join_path(pages_dir_name, unit.get_file_name());
  this->store(path, png);
  return path;
}

extract::Image OutputLayout::save_image(const std::string &page_id, extract::Image::type_t type, int index,
  const std::string &png, int width, int height, ChartRenderer &chart_renderer)
{
  extract::Image image;
  image.image_id = extract::Image::make_id(page_id, type, index);
  image.page_id = page_id;
  image.index = index;
  image.image_path = join_path(images_dir_name, image.image_id + ".png");
  image.chart_path = join_path(images_dir_name, image.image_id + "_chart.png");
  image.width = width;
  image.height = height;
  image.image_type = type;
  this->store(image.image_path, png);
  this->store(image.chart_path, chart_renderer(png));
  return image;
}

std::string OutputLayout::save_record(const extract::PdfExtract &record)
{
  std::string path = this->root / record_file_name;
  std::string json = extract::to_json(record).dump(2, ' ', false, extract::Json::error_handler_t::replace);
  write_file(path, json + "\n");
  return path;
}

// vim:ts=2 sts=2 sw=2 et
