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

#ifndef PDF2EXTRACT_DRAWING_HH
#define PDF2EXTRACT_DRAWING_HH

#include <string>
#include <vector>

namespace pdf
{
  class Document;
}

/* Vector drawing commands of a page, in device space:
 * 1 unit = 1 point, origin at the top-left corner of the crop box.
 */

namespace drawing
{

  class Point
  {
  public:
    double x, y;
    Point()
    : x(0), y(0)
    { }
    Point(double x, double y)
    : x(x), y(y)
    { }
  };

  class Rect
  {
  public:
    double x0, y0, x1, y1;
    Rect()
    : x0(0), y0(0), x1(0), y1(0)
    { }
    Rect(double x0, double y0, double x1, double y1)
    : x0(x0), y0(y0), x1(x1), y1(y1)
    { }
    double width() const
    {
      return this->x1 - this->x0;
    }
    double height() const
    {
      return this->y1 - this->y0;
    }
    bool is_empty() const
    {
      return !(this->x1 > this->x0 && this->y1 > this->y0);
    }
    double area() const
    {
      return this->is_empty() ? 0.0 : this->width() * this->height();
    }
    Rect grown(double amount) const
    {
      return Rect(this->x0 - amount, this->y0 - amount, this->x1 + amount, this->y1 + amount);
    }
    Rect intersection(const Rect &other) const;
    Rect united(const Rect &other) const;
    /* True also for rectangles that merely share an edge. */
    bool touches(const Rect &other) const;
  };

  class PathOp
  {
  public:
    enum op_t
    {
      MOVE,
      LINE,
      CURVE,
      CLOSE,
    };
    op_t op;
    /* MOVE and LINE use points[0]; CURVE uses all three. */
    Point points[3];
    bool operator==(const PathOp &other) const;
  };

  class Drawing
  {
  public:
    enum type_t
    {
      FILL,
      STROKE,
      FILL_STROKE,
      CLIP,
    };
    type_t type;
    std::vector<PathOp> path;
    Rect rect;
    double fill_color[3];
    double stroke_color[3];
    double fill_opacity;
    double stroke_opacity;
    double line_width;
    bool even_odd;

    Drawing();
    bool is_drawable() const
    {
      return this->type != CLIP;
    }
    bool has_fill() const
    {
      return this->type == FILL || this->type == FILL_STROKE;
    }
    bool has_stroke() const
    {
      return this->type == STROKE || this->type == FILL_STROKE;
    }
    /* Area covered when painted: strokes extend half the line width past the path. */
    Rect paint_rect() const;
    static const char *type_name(type_t type);
  };

  /* Plays the page through a recording output device. */
  std::vector<Drawing> collect_drawings(pdf::Document &document, int page_index);

  size_t count_drawable(const std::vector<Drawing> &drawings);

}

#endif

// vim:ts=2 sts=2 sw=2 et
