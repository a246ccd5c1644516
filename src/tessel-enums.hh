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

#ifndef TESSEL_ENUMS_H
#define TESSEL_ENUMS_H

#include <glib.h>

G_BEGIN_DECLS

/* Values of the enumerated profile keys; they match the
 * corresponding VTE enumerations so they can be passed through. */

typedef enum
{
  TESSEL_EXIT_CLOSE,
  TESSEL_EXIT_RESTART,
  TESSEL_EXIT_HOLD,
  TESSEL_EXIT_NONE
} TesselExitAction;

typedef enum {
  TESSEL_CURSOR_SHAPE_BLOCK,
  TESSEL_CURSOR_SHAPE_IBEAM,
  TESSEL_CURSOR_SHAPE_UNDERLINE
} TesselCursorShape;

typedef enum {
  TESSEL_CURSOR_BLINK_SYSTEM,
  TESSEL_CURSOR_BLINK_ON,
  TESSEL_CURSOR_BLINK_OFF
} TesselCursorBlinkMode;

typedef enum {
  TESSEL_ERASE_AUTO,
  TESSEL_ERASE_ASCII_BACKSPACE,
  TESSEL_ERASE_ASCII_DELETE,
  TESSEL_ERASE_DELETE_SEQUENCE,
  TESSEL_ERASE_TTY
} TesselEraseBinding;

typedef enum {
  TESSEL_CJK_WIDTH_NARROW = 1,
  TESSEL_CJK_WIDTH_WIDE   = 2
} TesselCJKWidth;

typedef enum {
  TESSEL_DRAG_QUADRANT_LEFT,
  TESSEL_DRAG_QUADRANT_TOP,
  TESSEL_DRAG_QUADRANT_RIGHT,
  TESSEL_DRAG_QUADRANT_BOTTOM
} TesselDragQuadrant;

typedef enum {
  TESSEL_ORIENTATION_HORIZONTAL,
  TESSEL_ORIENTATION_VERTICAL
} TesselOrientation;

typedef enum {
  TESSEL_PASTE_ACTION_PASTE,
  TESSEL_PASTE_ACTION_PROMPT
} TesselPasteAction;

typedef enum {
  TESSEL_URL_FLAVOR_AS_IS,
  TESSEL_URL_FLAVOR_DEFAULT_TO_HTTP,
  TESSEL_URL_FLAVOR_EMAIL
} TesselURLFlavor;

G_END_DECLS

#endif /* TESSEL_ENUMS_H */
