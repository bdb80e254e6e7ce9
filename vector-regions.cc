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

#include "vector-regions.hh"

#include <algorithm>
#include <cmath>
#include <list>
#include <numeric>

#include <Magick++.h>

#include "i18n.hh"
#include "image-codec.hh"
#include "string-utils.hh"

namespace drawing
{

/* class DisjointSets
 * ==================
 */

  class DisjointSets
  {
  protected:
    std::vector<size_t> parent;
  public:
    explicit DisjointSets(size_t n)
    : parent(n)
    {
      std::iota(this->parent.begin(), this->parent.end(), 0);
    }
    size_t find(size_t i)
    {
      while (this->parent[i] != i)
      {
        this->parent[i] = this->parent[this->parent[i]];
        i = this->parent[i];
      }
      return i;
    }
    void join(size_t i, size_t j)
    {
      i = this->find(i);
      j = this->find(j);
      if (i == j)
        return;
      if (j < i)
        std::swap(i, j);
      this->parent[j] = i;
    }
  };

  static bool cluster_precedes(const Cluster &a, const Cluster &b)
  {
    if (a.rect.y0 != b.rect.y0)
      return a.rect.y0 < b.rect.y0;
    return a.rect.x0 < b.rect.x0;
  }


/* class drawing::ClusteringDetector : drawing::RegionDetector
 * ===========================================================
 */

  ClusteringDetector::ClusteringDetector(int zoom, double min_side)
  : zoom(zoom), min_side(min_side)
  {
    codec::initialize();
  }

  std::vector<Cluster> ClusteringDetector::cluster(const std::vector<Drawing> &drawings,
    double page_width, double page_height, double margin, double overlap_threshold) const
  {
    const Rect page(0, 0, page_width, page_height);
    std::vector<size_t> items;
    std::vector<Rect> boxes;
    for (size_t i = 0; i < drawings.size(); i++)
    {
      if (!drawings[i].is_drawable())
        continue;
      Rect box = drawings[i].paint_rect().grown(margin).intersection(page);
      if (box.is_empty())
        continue;
      items.push_back(i);
      boxes.push_back(box);
    }

    DisjointSets sets(items.size());
    for (size_t a = 0; a < items.size(); a++)
      for (size_t b = a + 1; b < items.size(); b++)
        if (boxes[a].touches(boxes[b]))
          sets.join(a, b);

    std::vector<Cluster> clusters;
    std::vector<size_t> cluster_of_root(items.size(), items.size());
    for (size_t a = 0; a < items.size(); a++)
    {
      size_t root = sets.find(a);
      if (cluster_of_root[root] == items.size())
      {
        cluster_of_root[root] = clusters.size();
        Cluster cluster;
        cluster.rect = boxes[a];
        clusters.push_back(cluster);
      }
      Cluster &cluster = clusters[cluster_of_root[root]];
      cluster.members.push_back(items[a]);
      cluster.rect = cluster.rect.united(boxes[a]);
    }

    bool merged = true;
    while (merged)
    {
      merged = false;
      for (size_t i = 0; i < clusters.size() && !merged; i++)
        for (size_t j = i + 1; j < clusters.size() && !merged; j++)
        {
          double smaller = std::min(clusters[i].rect.area(), clusters[j].rect.area());
          if (smaller <= 0)
            continue;
          double overlap = clusters[i].rect.intersection(clusters[j].rect).area();
          if (overlap / smaller < overlap_threshold)
            continue;
          Cluster &target = clusters[i];
          target.members.insert(target.members.end(), clusters[j].members.begin(), clusters[j].members.end());
          std::sort(target.members.begin(), target.members.end());
          target.rect = target.rect.united(clusters[j].rect);
          clusters.erase(clusters.begin() + j);
          merged = true;
        }
    }

    std::vector<Cluster> result;
    for (const Cluster &cluster : clusters)
      if (cluster.rect.width() >= this->min_side && cluster.rect.height() >= this->min_side)
        result.push_back(cluster);
    std::stable_sort(result.begin(), result.end(), cluster_precedes);
    return result;
  }

  static Magick::Color as_color(const double rgb[3])
  {
    return Magick::ColorRGB(rgb[0], rgb[1], rgb[2]);
  }

  Region ClusteringDetector::rasterize(const std::vector<Drawing> &drawings, const Cluster &cluster) const
  {
    const double zoom = this->zoom;
    const Rect &rect = cluster.rect;
    Region region;
    region.rect = rect;
    region.width = std::max(1, static_cast<int>(std::ceil(rect.width() * zoom)));
    region.height = std::max(1, static_cast<int>(std::ceil(rect.height() * zoom)));
    Magick::Image canvas = codec::blank(region.width, region.height);
    std::list<Magick::Drawable> drawables;
    for (size_t i : cluster.members)
    {
      const Drawing &item = drawings[i];
      Magick::VPathList path;
      for (const PathOp &op : item.path)
      {
        double x[3], y[3];
        for (int k = 0; k < 3; k++)
        {
          x[k] = (op.points[k].x - rect.x0) * zoom;
          y[k] = (op.points[k].y - rect.y0) * zoom;
        }
        switch (op.op)
        {
        case PathOp::MOVE:
          path.push_back(Magick::PathMovetoAbs(Magick::Coordinate(x[0], y[0])));
          break;
        case PathOp::LINE:
          path.push_back(Magick::PathLinetoAbs(Magick::Coordinate(x[0], y[0])));
          break;
        case PathOp::CURVE:
          path.push_back(Magick::PathCurvetoAbs(Magick::PathCurvetoArgs(x[0], y[0], x[1], y[1], x[2], y[2])));
          break;
        case PathOp::CLOSE:
          path.push_back(Magick::PathClosePath());
          break;
        }
      }
      if (item.has_fill())
      {
        drawables.push_back(Magick::DrawableFillColor(as_color(item.fill_color)));
        drawables.push_back(Magick::DrawableFillOpacity(item.fill_opacity));
        drawables.push_back(Magick::DrawableFillRule(item.even_odd ? Magick::EvenOddRule : Magick::NonZeroRule));
      }
      else
        drawables.push_back(Magick::DrawableFillColor(Magick::Color("none")));
      if (item.has_stroke())
      {
        drawables.push_back(Magick::DrawableStrokeColor(as_color(item.stroke_color)));
        drawables.push_back(Magick::DrawableStrokeOpacity(item.stroke_opacity));
        drawables.push_back(Magick::DrawableStrokeWidth(std::max(item.line_width * zoom, 1.0)));
      }
      else
        drawables.push_back(Magick::DrawableStrokeColor(Magick::Color("none")));
      drawables.push_back(Magick::DrawablePath(path));
    }
    canvas.draw(drawables);
    region.png = codec::encode_png(canvas);
    return region;
  }

  std::vector<Region> ClusteringDetector::operator()(const std::vector<Drawing> &drawings,
    double page_width, double page_height, double margin, double overlap_threshold)
  {
    std::vector<Region> regions;
    try
    {
      for (const Cluster &cluster : this->cluster(drawings, page_width, page_height, margin, overlap_threshold))
        regions.push_back(this->rasterize(drawings, cluster));
    }
    catch (const Magick::Exception &ex)
    {
      throw DetectionError(string_printf(_("Unable to rasterize vector drawings: %s"), ex.what()));
    }
    return regions;
  }

}

// vim:ts=2 sts=2 sw=2 et
