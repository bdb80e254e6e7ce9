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

#undef NDEBUG
#include <cassert>
#include <set>
#include <string>
#include <vector>

#include <Magick++.h>
#include <nlohmann/json.hpp>

#include "chart.hh"
#include "config.hh"
#include "extract-model.hh"
#include "extractor.hh"
#include "image-codec.hh"
#include "page-groups.hh"
#include "pdf-backend.hh"
#include "sys-time.hh"
#include "system.hh"
#include "vector-regions.hh"

#include "pdf-fixture.hh"

class EchoChartRenderer : public ChartRenderer
{
public:
  int calls;
  EchoChartRenderer()
  : calls(0)
  { }
  virtual std::string operator()(const std::string &image_data)
  {
    this->calls++;
    return image_data;
  }
};

/* One region per page with anything drawable; the n-th call fails. */
class FakeDetector : public drawing::RegionDetector
{
public:
  int calls;
  int failing_call;
  explicit FakeDetector(int failing_call = 0)
  : calls(0), failing_call(failing_call)
  { }
  virtual std::vector<drawing::Region> operator()(const std::vector<drawing::Drawing> &drawings,
    double page_width, double page_height, double margin, double overlap_threshold)
  {
    this->calls++;
    assert(page_width == 200 && page_height == 300);
    assert(margin == 0.0);
    assert(overlap_threshold == 0.75);
    if (this->calls == this->failing_call)
      throw drawing::DetectionError("simulated failure");
    std::vector<drawing::Region> regions;
    if (drawing::count_drawable(drawings) == 0)
      return regions;
    drawing::Region region;
    Magick::Image image = codec::blank(10, 6);
    region.png = codec::encode_png(image);
    region.width = 10;
    region.height = 6;
    regions.push_back(region);
    return regions;
  }
};

static std::string make_book()
{
  std::vector<fixture::Page> pages{
    fixture::Page(fixture::text("Page 1")),
    fixture::Page(
      fixture::text("Page 2") +
      "q 40 0 0 40 20 20 cm /Im1 Do Q\n"
      "q 40 0 0 40 100 20 cm /Im1 Do Q\n"
      "0 0 1 rg 20 150 60 40 re f\n",
      true
    ),
    fixture::Page(fixture::text("Page 3") + "1 0 0 RG 4 w 20 100 m 180 100 l S\n"),
    fixture::Page(fixture::text("Page 4") + "0 1 0 rg 50 50 100 100 re f\n"),
    fixture::Page(fixture::text("Page 5") + "0.5 g 10 10 30 30 re f\n"),
  };
  return fixture::make_document(pages);
}

static std::vector<std::string> image_ids(const extract::Page &page)
{
  std::vector<std::string> result;
  for (const extract::Image &image : page.images)
    result.push_back(image.image_id);
  return result;
}

static Magick::Image load_image(const std::string &path)
{
  return codec::decode(read_file(path));
}

static void test_spread_run()
{
  TemporaryDirectory tmpdir;
  std::string pdf_path = tmpdir / "book.pdf";
  write_file(pdf_path, make_book());
  Config config;
  config.pdf_path = pdf_path;
  config.output_dir = tmpdir / "out";
  config.spread_mode = true;
  config.verbose = 0;
  EchoChartRenderer chart_renderer;
  FakeDetector detector(4);
  Extractor extractor(config, chart_renderer, detector);
  extract::PdfExtract record = extractor();

  assert(detector.calls == 5);
  assert(record.metadata.filename == "book.pdf");
  assert(record.metadata.total_pages == 5);
  assert((record.metadata.extracted_pages == std::vector<int>{1, 2, 3, 4, 5}));
  assert(record.metadata.start_page == 1);
  assert(record.metadata.end_page == 5);
  assert(record.metadata.spread_mode);
  assert(record.metadata.extraction_timestamp.size() == 25);
  assert(record.metadata.extraction_timestamp[10] == 'T');

  assert(record.pages.size() == 3);
  assert(record.pages[0].page_id == "p1");
  assert(record.pages[0].page_number == 1);
  assert(record.pages[0].page_image_path == "pages/page_1.png");
  assert(record.pages[0].images.empty());
  assert(record.pages[0].text.find("Page 1") != std::string::npos);

  const extract::Page &spread = record.pages[1];
  assert(spread.page_id == "p2_3");
  assert(spread.page_number == 2);
  assert(spread.page_image_path == "pages/page_2_3.png");
  size_t left = spread.text.find("Page 2");
  size_t separator = spread.text.find("\n\n");
  size_t right = spread.text.find("Page 3");
  assert(left != std::string::npos && right != std::string::npos);
  assert(left < separator && separator < right);
  assert((image_ids(spread) == std::vector<std::string>{"img_p2_3_r0", "img_p2_3_v1", "img_p2_3_v2"}));
  assert(spread.images[0].image_type == extract::Image::RASTER);
  assert(spread.images[0].width == 2 && spread.images[0].height == 2);
  assert(spread.images[0].image_path == "images/img_p2_3_r0.png");
  assert(spread.images[0].chart_path == "images/img_p2_3_r0_chart.png");
  assert(spread.images[1].image_type == extract::Image::VECTOR);
  for (size_t i = 0; i < spread.images.size(); i++)
  {
    assert(spread.images[i].index == static_cast<int>(i));
    assert(spread.images[i].page_id == "p2_3");
  }

  /* The detector failed on page 4; page 5 still numbers from zero. */
  const extract::Page &last = record.pages[2];
  assert(last.page_id == "p4_5");
  assert((image_ids(last) == std::vector<std::string>{"img_p4_5_v0"}));

  std::set<std::string> ids;
  for (const extract::Page &page : record.pages)
    for (const extract::Image &image : page.images)
      assert(ids.insert(image.image_id).second);
  assert(chart_renderer.calls == 4);

  const std::string output_dir = config.output_dir;
  Magick::Image page_image = load_image(output_dir + "/pages/page_1.png");
  assert(page_image.columns() == 400 && page_image.rows() == 600);
  page_image = load_image(output_dir + "/pages/page_2_3.png");
  assert(page_image.columns() == 800 && page_image.rows() == 600);
  assert(path_exists(output_dir + "/pages/page_4_5.png"));
  Magick::Image raster = load_image(output_dir + "/images/img_p2_3_r0.png");
  assert(raster.columns() == 2 && raster.rows() == 2);
  Magick::ColorRGB color = raster.pixelColor(0, 0);
  assert(color.red() > 0.98 && color.green() < 0.02 && color.blue() < 0.02);
  for (const extract::Page &page : record.pages)
    for (const extract::Image &image : page.images)
    {
      assert(path_exists(output_dir + "/" + image.image_path));
      assert(read_file(output_dir + "/" + image.chart_path) == read_file(output_dir + "/" + image.image_path));
    }

  assert(extractor.record_path == output_dir + "/pdf_extract.json");
  nlohmann::json json = nlohmann::json::parse(read_file(extractor.record_path));
  assert(json["metadata"]["filename"] == "book.pdf");
  assert(json["metadata"]["extracted_pages"].size() == 5);
  assert(json["pages"].size() == 3);
  assert(json["pages"][1]["images"][0]["image_id"] == "img_p2_3_r0");
  assert(json["pages"][1]["images"][0]["image_type"] == "raster");
}

static void test_single_pages()
{
  TemporaryDirectory tmpdir;
  std::string pdf_path = tmpdir / "book.pdf";
  write_file(pdf_path, make_book());
  Config config;
  config.pdf_path = pdf_path;
  config.output_dir = tmpdir / "nested/out";
  config.start_page = 3;
  config.end_page = 99;
  config.verbose = 0;
  EchoChartRenderer chart_renderer;
  FakeDetector detector;
  Extractor extractor(config, chart_renderer, detector);
  extract::PdfExtract record = extractor();
  assert(record.metadata.start_page == 3);
  assert(record.metadata.end_page == 5);
  assert(!record.metadata.spread_mode);
  assert((record.metadata.extracted_pages == std::vector<int>{3, 4, 5}));
  assert(record.pages.size() == 3);
  assert(record.pages[0].page_id == "p3");
  assert((image_ids(record.pages[0]) == std::vector<std::string>{"img_p3_v0"}));
  assert((image_ids(record.pages[1]) == std::vector<std::string>{"img_p4_v0"}));
  Magick::Image page_image = load_image(config.output_dir + "/pages/page_3.png");
  assert(page_image.columns() == 400 && page_image.rows() == 600);
}

static void test_invalid_range_writes_nothing()
{
  TemporaryDirectory tmpdir;
  std::string pdf_path = tmpdir / "book.pdf";
  write_file(pdf_path, make_book());
  Config config;
  config.pdf_path = pdf_path;
  config.output_dir = tmpdir / "out";
  config.start_page = 7;
  config.verbose = 0;
  EchoChartRenderer chart_renderer;
  FakeDetector detector;
  Extractor extractor(config, chart_renderer, detector);
  try
  {
    extractor();
    assert(false);
  }
  catch (const PageRange::Invalid &)
  { }
  assert(!path_exists(config.output_dir));
  config.start_page = 4;
  config.end_page = 2;
  try
  {
    extractor();
    assert(false);
  }
  catch (const PageRange::Invalid &)
  { }
  assert(!path_exists(config.output_dir));
  assert(detector.calls == 0);
}

static void test_bad_documents()
{
  TemporaryDirectory tmpdir;
  Config config;
  config.output_dir = tmpdir / "out";
  config.verbose = 0;
  EchoChartRenderer chart_renderer;
  FakeDetector detector;
  Extractor extractor(config, chart_renderer, detector);
  config.pdf_path = tmpdir / "missing.pdf";
  try
  {
    extractor();
    assert(false);
  }
  catch (const NoSuchFileOrDirectory &)
  { }
  config.pdf_path = tmpdir / "garbage.pdf";
  write_file(config.pdf_path, "this is not a PDF document");
  try
  {
    extractor();
    assert(false);
  }
  catch (const pdf::Document::LoadError &)
  { }
  assert(!path_exists(config.output_dir));
}

static void test_timestamp_format()
{
  assert(Timestamp(2026, 10, 19, 14, 3, 11, '+', 2, 0).format() == "2026-10-19T14:03:11+02:00");
  assert(Timestamp(2026, 1, 2, 3, 4, 5, '-', 5, 30).format() == "2026-01-02T03:04:05-05:30");
  assert(Timestamp().format().empty());
}

int main()
{
  pdf::Environment environment;
  codec::initialize();
  test_timestamp_format();
  test_spread_run();
  test_single_pages();
  test_invalid_range_writes_nothing();
  test_bad_documents();
  return 0;
}

// vim:ts=2 sts=2 sw=2 et
