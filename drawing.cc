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

#include "drawing.hh"

#include <algorithm>
#include <stdexcept>

#include "i18n.hh"
#include "pdf-backend.hh"

namespace drawing
{

/* class drawing::Rect
 * ===================
 */

  Rect Rect::intersection(const Rect &other) const
  {
    return Rect(
      std::max(this->x0, other.x0), std::max(this->y0, other.y0),
      std::min(this->x1, other.x1), std::min(this->y1, other.y1)
    );
  }

  Rect Rect::united(const Rect &other) const
  {
    return Rect(
      std::min(this->x0, other.x0), std::min(this->y0, other.y0),
      std::max(this->x1, other.x1), std::max(this->y1, other.y1)
    );
  }

  bool Rect::touches(const Rect &other) const
  {
    return
      this->x0 <= other.x1 && other.x0 <= this->x1 &&
      this->y0 <= other.y1 && other.y0 <= this->y1;
  }


/* class drawing::PathOp
 * =====================
 */

  bool PathOp::operator==(const PathOp &other) const
  {
    if (this->op != other.op)
      return false;
    int n_points = 0;
    switch (this->op)
    {
    case MOVE:
    case LINE:
      n_points = 1;
      break;
    case CURVE:
      n_points = 3;
      break;
    case CLOSE:
      break;
    }
    for (int i = 0; i < n_points; i++)
      if (this->points[i].x != other.points[i].x || this->points[i].y != other.points[i].y)
        return false;
    return true;
  }


/* class drawing::Drawing
 * ======================
 */

  Drawing::Drawing()
  : type(FILL),
    fill_color{0, 0, 0},
    stroke_color{0, 0, 0},
    fill_opacity(1.0),
    stroke_opacity(1.0),
    line_width(0.0),
    even_odd(false)
  { }

  Rect Drawing::paint_rect() const
  {
    if (this->has_stroke())
      return this->rect.grown(this->line_width / 2);
    return this->rect;
  }

  const char *Drawing::type_name(type_t type)
  {
    switch (type)
    {
    case FILL:
      return "f";
    case STROKE:
      return "s";
    case FILL_STROKE:
      return "fs";
    case CLIP:
      return "clip";
    }
    throw std::logic_error(_("Unknown drawing type"));
  }

  size_t count_drawable(const std::vector<Drawing> &drawings)
  {
    size_t n = 0;
    for (const Drawing &item : drawings)
      if (item.is_drawable())
        n++;
    return n;
  }


/* class DrawingCollector : pdf::OutputDevice
 * ==========================================
 */

  class DrawingCollector : public pdf::OutputDevice
  {
  protected:
    std::vector<Drawing> &drawings;
    static bool convert_path(pdf::gfx::State *state, std::vector<PathOp> &ops, Rect &rect);
    void record(pdf::gfx::State *state, Drawing::type_t type, bool even_odd);
  public:
    explicit DrawingCollector(std::vector<Drawing> &drawings)
    : drawings(drawings)
    { }
    bool upsideDown() { return true; }
    bool useDrawChar() { return false; }
    bool interpretType3Chars() { return false; }
    bool needNonText() { return true; }
    void stroke(pdf::gfx::State *state);
    void fill(pdf::gfx::State *state)
    {
      this->record(state, Drawing::FILL, false);
    }
    void eoFill(pdf::gfx::State *state)
    {
      this->record(state, Drawing::FILL, true);
    }
    void clip(pdf::gfx::State *state)
    {
      this->record(state, Drawing::CLIP, false);
    }
    void eoClip(pdf::gfx::State *state)
    {
      this->record(state, Drawing::CLIP, true);
    }
  };

  bool DrawingCollector::convert_path(pdf::gfx::State *state, std::vector<PathOp> &ops, Rect &rect)
  {
    bool have_points = false;
    auto add_point = [&](PathOp &op, int n, double x, double y)
    {
      double tx, ty;
      state->transform(x, y, &tx, &ty);
      op.points[n] = Point(tx, ty);
      if (!have_points)
      {
        rect = Rect(tx, ty, tx, ty);
        have_points = true;
      }
      else
        rect = rect.united(Rect(tx, ty, tx, ty));
    };
    auto path = state->getPath();
    int n_subpaths = path->getNumSubpaths();
    for (int i = 0; i < n_subpaths; i++)
    {
      auto subpath = path->getSubpath(i);
      int n_points = subpath->getNumPoints();
      if (n_points == 0)
        continue;
      PathOp move;
      move.op = PathOp::MOVE;
      add_point(move, 0, subpath->getX(0), subpath->getY(0));
      ops.push_back(move);
      int j = 1;
      while (j < n_points)
      {
        PathOp op;
        if (subpath->getCurve(j) && j + 2 < n_points)
        {
          op.op = PathOp::CURVE;
          for (int k = 0; k < 3; k++)
            add_point(op, k, subpath->getX(j + k), subpath->getY(j + k));
          j += 3;
        }
        else
        {
          op.op = PathOp::LINE;
          add_point(op, 0, subpath->getX(j), subpath->getY(j));
          j++;
        }
        ops.push_back(op);
      }
      if (subpath->isClosed())
      {
        PathOp close;
        close.op = PathOp::CLOSE;
        ops.push_back(close);
      }
    }
    return have_points;
  }

  void DrawingCollector::record(pdf::gfx::State *state, Drawing::type_t type, bool even_odd)
  {
    Drawing item;
    if (!convert_path(state, item.path, item.rect))
      return;
    item.type = type;
    item.even_odd = even_odd;
    pdf::gfx::RgbColor rgb;
    state->getFillRGB(&rgb);
    item.fill_color[0] = pdf::gfx::color_component_as_double(rgb.r);
    item.fill_color[1] = pdf::gfx::color_component_as_double(rgb.g);
    item.fill_color[2] = pdf::gfx::color_component_as_double(rgb.b);
    state->getStrokeRGB(&rgb);
    item.stroke_color[0] = pdf::gfx::color_component_as_double(rgb.r);
    item.stroke_color[1] = pdf::gfx::color_component_as_double(rgb.g);
    item.stroke_color[2] = pdf::gfx::color_component_as_double(rgb.b);
    item.fill_opacity = state->getFillOpacity();
    item.stroke_opacity = state->getStrokeOpacity();
    item.line_width = state->getTransformedLineWidth();
    this->drawings.push_back(item);
  }

  void DrawingCollector::stroke(pdf::gfx::State *state)
  {
    size_t n = this->drawings.size();
    this->record(state, Drawing::STROKE, false);
    if (this->drawings.size() != n + 1 || n == 0)
      return;
    /* "B" and "b" paint the same path twice: merge the pair. */
    Drawing &previous = this->drawings[n - 1];
    Drawing &current = this->drawings[n];
    if (previous.type != Drawing::FILL || previous.path.size() != current.path.size())
      return;
    if (!std::equal(previous.path.begin(), previous.path.end(), current.path.begin()))
      return;
    previous.type = Drawing::FILL_STROKE;
    std::copy(current.stroke_color, current.stroke_color + 3, previous.stroke_color);
    previous.stroke_opacity = current.stroke_opacity;
    previous.line_width = current.line_width;
    this->drawings.pop_back();
  }

  std::vector<Drawing> collect_drawings(pdf::Document &document, int page_index)
  {
    std::vector<Drawing> drawings;
    DrawingCollector collector(drawings);
    document.display_page(&collector, page_index, 72);
    return drawings;
  }

}

// vim:ts=2 sts=2 sw=2 et
