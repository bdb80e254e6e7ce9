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
#include <string>
#include <vector>

#include <Magick++.h>

#include "drawing.hh"
#include "image-codec.hh"
#include "vector-regions.hh"

using drawing::Cluster;
using drawing::Drawing;
using drawing::PathOp;
using drawing::Point;
using drawing::Rect;
using drawing::Region;

static PathOp make_op(PathOp::op_t op, double x, double y)
{
  PathOp result;
  result.op = op;
  result.points[0] = Point(x, y);
  return result;
}

static Drawing make_box(double x0, double y0, double x1, double y1, Drawing::type_t type = Drawing::FILL)
{
  Drawing item;
  item.type = type;
  item.path.push_back(make_op(PathOp::MOVE, x0, y0));
  item.path.push_back(make_op(PathOp::LINE, x1, y0));
  item.path.push_back(make_op(PathOp::LINE, x1, y1));
  item.path.push_back(make_op(PathOp::LINE, x0, y1));
  item.path.push_back(make_op(PathOp::CLOSE, 0, 0));
  item.rect = Rect(x0, y0, x1, y1);
  item.fill_color[0] = 1.0;
  return item;
}

static const double page_width = 200;
static const double page_height = 300;

static std::vector<Cluster> cluster(const std::vector<Drawing> &drawings, double margin = 0, double threshold = 0.75)
{
  drawing::ClusteringDetector detector(2);
  return detector.cluster(drawings, page_width, page_height, margin, threshold);
}

static void test_touching_boxes_merge()
{
  std::vector<Drawing> drawings{
    make_box(10, 10, 20, 20),
    make_box(20, 10, 30, 20),
    make_box(30, 15, 40, 40),
  };
  std::vector<Cluster> clusters = cluster(drawings);
  assert(clusters.size() == 1);
  assert((clusters[0].members == std::vector<size_t>{0, 1, 2}));
  assert(clusters[0].rect.x0 == 10 && clusters[0].rect.y0 == 10);
  assert(clusters[0].rect.x1 == 40 && clusters[0].rect.y1 == 40);
}

static void test_separate_boxes_sorted()
{
  std::vector<Drawing> drawings{
    make_box(100, 200, 150, 250),
    make_box(120, 20, 180, 60),
    make_box(10, 20, 50, 60),
  };
  std::vector<Cluster> clusters = cluster(drawings);
  assert(clusters.size() == 3);
  assert((clusters[0].members == std::vector<size_t>{2}));
  assert((clusters[1].members == std::vector<size_t>{1}));
  assert((clusters[2].members == std::vector<size_t>{0}));
}

static void test_margin_joins_neighbours()
{
  std::vector<Drawing> drawings{
    make_box(10, 10, 20, 20),
    make_box(24, 10, 34, 20),
  };
  assert(cluster(drawings, 0).size() == 2);
  assert(cluster(drawings, 2).size() == 1);
}

static void test_overlapping_clusters_merge()
{
  /* The inner square touches nothing, but lies within the frame's bounding box. */
  std::vector<Drawing> drawings{
    make_box(10, 10, 100, 12),
    make_box(10, 98, 100, 100),
    make_box(10, 12, 12, 98),
    make_box(40, 40, 60, 60),
  };
  std::vector<Cluster> clusters = cluster(drawings);
  assert(clusters.size() == 1);
  assert((clusters[0].members == std::vector<size_t>{0, 1, 2, 3}));
  assert(cluster(drawings, 0, 1.01).size() == 2);
}

static void test_small_and_clip_ignored()
{
  std::vector<Drawing> drawings{
    make_box(0, 0, 200, 300, Drawing::CLIP),
    make_box(10, 10, 12, 50),
    make_box(50, 50, 80, 80),
    make_box(300, 300, 400, 400),
  };
  std::vector<Cluster> clusters = cluster(drawings);
  assert(clusters.size() == 1);
  assert((clusters[0].members == std::vector<size_t>{2}));
}

static void test_stroke_width_grows_box()
{
  Drawing line = make_box(50, 50, 50, 90, Drawing::STROKE);
  line.line_width = 6;
  std::vector<Cluster> clusters = cluster(std::vector<Drawing>{line});
  assert(clusters.size() == 1);
  assert(clusters[0].rect.x0 == 47 && clusters[0].rect.x1 == 53);
  assert(clusters[0].rect.y0 == 47 && clusters[0].rect.y1 == 93);
}

static void test_regions_rasterized()
{
  std::vector<Drawing> drawings{
    make_box(10, 10, 30.25, 20),
    make_box(100, 100, 110, 140),
  };
  drawing::ClusteringDetector detector(2);
  std::vector<Region> regions = detector(drawings, page_width, page_height, 0, 0.75);
  assert(regions.size() == 2);
  assert(regions[0].width == 41);
  assert(regions[0].height == 20);
  assert(regions[1].width == 20);
  assert(regions[1].height == 80);
  Magick::Image image = codec::decode(regions[1].png);
  assert(image.columns() == 20);
  assert(image.rows() == 80);
  Magick::ColorRGB color = image.pixelColor(10, 40);
  assert(color.red() > 0.9);
  assert(color.green() < 0.1);
  assert(color.blue() < 0.1);
}

static void test_no_drawables()
{
  drawing::ClusteringDetector detector(2);
  std::vector<Drawing> drawings{make_box(0, 0, 200, 300, Drawing::CLIP)};
  assert(detector(drawings, page_width, page_height, 0, 0.75).empty());
  assert(drawing::count_drawable(drawings) == 0);
}

int main()
{
  codec::initialize();
  test_touching_boxes_merge();
  test_separate_boxes_sorted();
  test_margin_joins_neighbours();
  test_overlapping_clusters_merge();
  test_small_and_clip_ignored();
  test_stroke_width_grows_box();
  test_regions_rasterized();
  test_no_drawables();
  return 0;
}

// vim:ts=2 sts=2 sw=2 et
