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

G_BEGIN_DECLS

/* Pane-level effects of the profile keys. Several keys may map to
 * the same preference; keys without a pane effect have none. */
typedef enum {
  TESSEL_PREFERENCE_AUDIBLE_BELL,
  TESSEL_PREFERENCE_BOLD_IS_BRIGHT,
  TESSEL_PREFERENCE_REWRAP_ON_RESIZE,
  TESSEL_PREFERENCE_CURSOR_SHAPE,
  TESSEL_PREFERENCE_COLORS,
  TESSEL_PREFERENCE_SHOW_SCROLLBAR,
  TESSEL_PREFERENCE_SCROLL_ON_OUTPUT,
  TESSEL_PREFERENCE_SCROLL_ON_KEYSTROKE,
  TESSEL_PREFERENCE_SCROLLBACK,
  TESSEL_PREFERENCE_BACKSPACE_BINDING,
  TESSEL_PREFERENCE_DELETE_BINDING,
  TESSEL_PREFERENCE_ENCODING,
  TESSEL_PREFERENCE_CJK_WIDTH,
  TESSEL_PREFERENCE_CURSOR_BLINK_MODE,
  TESSEL_PREFERENCE_TITLE,
  TESSEL_PREFERENCE_FONT,

  TESSEL_PREFERENCE_LAST
} TesselPreference;

gboolean tessel_preference_from_key (const char *key,
                                     TesselPreference *preference);

const char *tessel_preference_to_string (TesselPreference preference);

const TesselPreference *tessel_preference_get_apply_order (gsize *n_preferences);

G_END_DECLS
