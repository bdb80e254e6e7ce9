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

#ifndef PDF2EXTRACT_VECTOR_REGIONS_HH
#define PDF2EXTRACT_VECTOR_REGIONS_HH

#include <stdexcept>
#include <string>
#include <vector>

#include "drawing.hh"

namespace drawing
{

  /* A rasterized group of drawings. */
  class Region
  {
  public:
    std::string png;
    int width;
    int height;
    Rect rect;
  };

  /* Drawings painted together, as indices into the page's drawing list. */
  class Cluster
  {
  public:
    std::vector<size_t> members;
    Rect rect;
  };

  class DetectionError : public std::runtime_error
  {
  public:
    explicit DetectionError(const std::string &message)
    : std::runtime_error(message)
    { }
  };

  /* Groups a page's drawings into regions and rasterizes each of them.
   * Boxes grown by `margin` that overlap by at least `overlap_threshold`
   * (fraction of the smaller box) end up in the same region.
   */
  class RegionDetector
  {
  public:
    virtual std::vector<Region> operator()(const std::vector<Drawing> &drawings,
      double page_width, double page_height, double margin, double overlap_threshold) = 0;
    virtual ~RegionDetector() throw ()
    { }
  };

  class ClusteringDetector : public RegionDetector
  {
  protected:
    int zoom;
    double min_side;
  public:
    explicit ClusteringDetector(int zoom, double min_side = 4.0);
    virtual std::vector<Region> operator()(const std::vector<Drawing> &drawings,
      double page_width, double page_height, double margin, double overlap_threshold);

    std::vector<Cluster> cluster(const std::vector<Drawing> &drawings,
      double page_width, double page_height, double margin, double overlap_threshold) const;

    Region rasterize(const std::vector<Drawing> &drawings, const Cluster &cluster) const;
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
