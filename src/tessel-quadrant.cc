/*
 * Copyright (C) 2026 The Tessel authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "config.h"

#include "tessel-quadrant.hh"
#include "tessel-debug.hh"

typedef struct {
  long x;
  long y;
} Point;

static gboolean
point_in_triangle (Point p,
                   Point p0,
                   Point p1,
                   Point p2)
{
  auto s = p0.y * p2.x - p0.x * p2.y + (p2.y - p0.y) * p.x + (p0.x - p2.x) * p.y;
  auto t = p0.x * p1.y - p0.y * p1.x + (p0.y - p1.y) * p.x + (p1.x - p0.x) * p.y;

  if ((s < 0) != (t < 0))
    return FALSE;

  auto area = -p1.y * p2.x + p0.y * (p2.x - p1.x) + p0.x * (p1.y - p2.y) + p1.x * p2.y;
  if (area < 0) {
    s = -s;
    t = -t;
    area = -area;
  }

  return s > 0 && t > 0 && (s + t) <= area;
}

/**
 * tessel_drag_quadrant_resolve:
 * @x: pointer position, relative to the widget
 * @y: pointer position, relative to the widget
 * @width: widget width
 * @height: widget height
 *
 * Splits the widget rectangle into four triangles meeting at its
 * center and returns the one containing the pointer. The triangles
 * are tested in the order left, top, right, bottom; points on a
 * triangle boundary that match none of them resolve to left.
 *
 * Returns: the #TesselDragQuadrant under the pointer
 */
TesselDragQuadrant
tessel_drag_quadrant_resolve (int x,
                              int y,
                              int width,
                              int height)
{
  Point const p = { x, y };
  Point const top_left = { 0, 0 };
  Point const top_right = { width, 0 };
  Point const bottom_left = { 0, height };
  Point const bottom_right = { width, height };
  Point const center = { width / 2, height / 2 };

  static const TesselDragQuadrant order[] = {
    TESSEL_DRAG_QUADRANT_LEFT,
    TESSEL_DRAG_QUADRANT_TOP,
    TESSEL_DRAG_QUADRANT_RIGHT,
    TESSEL_DRAG_QUADRANT_BOTTOM,
  };

  for (guint i = 0; i < G_N_ELEMENTS (order); ++i) {
    gboolean inside = FALSE;

    switch (order[i]) {
    case TESSEL_DRAG_QUADRANT_LEFT:
      inside = point_in_triangle (p, top_left, bottom_left, center);
      break;
    case TESSEL_DRAG_QUADRANT_TOP:
      inside = point_in_triangle (p, top_left, top_right, center);
      break;
    case TESSEL_DRAG_QUADRANT_RIGHT:
      inside = point_in_triangle (p, top_right, bottom_right, center);
      break;
    case TESSEL_DRAG_QUADRANT_BOTTOM:
      inside = point_in_triangle (p, bottom_left, bottom_right, center);
      break;
    }

    if (inside)
      return order[i];
  }

  _tessel_debug_print (TESSEL_DEBUG_DND,
                       "No drag quadrant for %d,%d in %dx%d, defaulting to left\n",
                       x, y, width, height);

  return TESSEL_DRAG_QUADRANT_LEFT;
}

TesselRect
tessel_drag_quadrant_get_highlight_rect (TesselDragQuadrant quadrant,
                                         int width,
                                         int height)
{
  switch (quadrant) {
  case TESSEL_DRAG_QUADRANT_TOP:
    return TesselRect{ 0, 0, width, height / 2 };
  case TESSEL_DRAG_QUADRANT_RIGHT:
    return TesselRect{ width / 2, 0, width - width / 2, height };
  case TESSEL_DRAG_QUADRANT_BOTTOM:
    return TesselRect{ 0, height / 2, width, height - height / 2 };
  case TESSEL_DRAG_QUADRANT_LEFT:
  default:
    return TesselRect{ 0, 0, width / 2, height };
  }
}

/* Dropping on the left or right edge places the panes side by side */
gboolean
tessel_drag_quadrant_is_horizontal (TesselDragQuadrant quadrant)
{
  return quadrant == TESSEL_DRAG_QUADRANT_LEFT ||
         quadrant == TESSEL_DRAG_QUADRANT_RIGHT;
}

gboolean
tessel_drag_quadrant_is_after (TesselDragQuadrant quadrant)
{
  return quadrant == TESSEL_DRAG_QUADRANT_RIGHT ||
         quadrant == TESSEL_DRAG_QUADRANT_BOTTOM;
}

const char *
tessel_drag_quadrant_to_string (TesselDragQuadrant quadrant)
{
  switch (quadrant) {
  case TESSEL_DRAG_QUADRANT_LEFT:   return "left";
  case TESSEL_DRAG_QUADRANT_TOP:    return "top";
  case TESSEL_DRAG_QUADRANT_RIGHT:  return "right";
  case TESSEL_DRAG_QUADRANT_BOTTOM: return "bottom";
  default:                          return "invalid";
  }
}
