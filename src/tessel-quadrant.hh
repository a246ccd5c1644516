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

#pragma once

#include <glib.h>

#include "tessel-enums.hh"

G_BEGIN_DECLS

typedef struct {
  int x;
  int y;
  int width;
  int height;
} TesselRect;

TesselDragQuadrant tessel_drag_quadrant_resolve (int x,
                                                 int y,
                                                 int width,
                                                 int height);

TesselRect tessel_drag_quadrant_get_highlight_rect (TesselDragQuadrant quadrant,
                                                    int width,
                                                    int height);

gboolean tessel_drag_quadrant_is_horizontal (TesselDragQuadrant quadrant);

gboolean tessel_drag_quadrant_is_after (TesselDragQuadrant quadrant);

const char *tessel_drag_quadrant_to_string (TesselDragQuadrant quadrant);

G_END_DECLS
