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

#include <string.h>

#include "tessel-preferences.hh"
#include "tessel-schemas.hh"

typedef struct {
  const char *key;
  TesselPreference preference;
} PreferenceKeyEntry;

static const PreferenceKeyEntry preference_keys[] = {
  { TESSEL_PROFILE_AUDIBLE_BELL_KEY,             TESSEL_PREFERENCE_AUDIBLE_BELL        },
  { TESSEL_PROFILE_BOLD_IS_BRIGHT_KEY,           TESSEL_PREFERENCE_BOLD_IS_BRIGHT      },
  { TESSEL_PROFILE_REWRAP_ON_RESIZE_KEY,         TESSEL_PREFERENCE_REWRAP_ON_RESIZE    },
  { TESSEL_PROFILE_CURSOR_SHAPE_KEY,             TESSEL_PREFERENCE_CURSOR_SHAPE        },
  { TESSEL_PROFILE_FOREGROUND_COLOR_KEY,         TESSEL_PREFERENCE_COLORS              },
  { TESSEL_PROFILE_BACKGROUND_COLOR_KEY,         TESSEL_PREFERENCE_COLORS              },
  { TESSEL_PROFILE_PALETTE_KEY,                  TESSEL_PREFERENCE_COLORS              },
  { TESSEL_PROFILE_USE_THEME_COLORS_KEY,         TESSEL_PREFERENCE_COLORS              },
  { TESSEL_PROFILE_BACKGROUND_TRANSPARENCY_KEY,  TESSEL_PREFERENCE_COLORS              },
  { TESSEL_PROFILE_SHOW_SCROLLBAR_KEY,           TESSEL_PREFERENCE_SHOW_SCROLLBAR      },
  { TESSEL_PROFILE_SCROLL_ON_OUTPUT_KEY,         TESSEL_PREFERENCE_SCROLL_ON_OUTPUT    },
  { TESSEL_PROFILE_SCROLL_ON_KEYSTROKE_KEY,      TESSEL_PREFERENCE_SCROLL_ON_KEYSTROKE },
  { TESSEL_PROFILE_SCROLLBACK_UNLIMITED_KEY,     TESSEL_PREFERENCE_SCROLLBACK          },
  { TESSEL_PROFILE_SCROLLBACK_LINES_KEY,         TESSEL_PREFERENCE_SCROLLBACK          },
  { TESSEL_PROFILE_BACKSPACE_BINDING_KEY,        TESSEL_PREFERENCE_BACKSPACE_BINDING   },
  { TESSEL_PROFILE_DELETE_BINDING_KEY,           TESSEL_PREFERENCE_DELETE_BINDING      },
  { TESSEL_PROFILE_ENCODING_KEY,                 TESSEL_PREFERENCE_ENCODING            },
  { TESSEL_PROFILE_CJK_UTF8_AMBIGUOUS_WIDTH_KEY, TESSEL_PREFERENCE_CJK_WIDTH           },
  { TESSEL_PROFILE_CURSOR_BLINK_MODE_KEY,        TESSEL_PREFERENCE_CURSOR_BLINK_MODE   },
  { TESSEL_PROFILE_TERMINAL_TITLE_KEY,           TESSEL_PREFERENCE_TITLE               },
  { TESSEL_PROFILE_USE_SYSTEM_FONT_KEY,          TESSEL_PREFERENCE_FONT                },
  { TESSEL_PROFILE_FONT_KEY,                     TESSEL_PREFERENCE_FONT                },
};

/* The title is refreshed separately, after everything else */
static const TesselPreference apply_order[] = {
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
  TESSEL_PREFERENCE_CJK_WIDTH,
  TESSEL_PREFERENCE_ENCODING,
  TESSEL_PREFERENCE_CURSOR_BLINK_MODE,
  TESSEL_PREFERENCE_FONT,
};

static const char *preference_names[] = {
  "audible-bell",
  "bold-is-bright",
  "rewrap-on-resize",
  "cursor-shape",
  "colors",
  "show-scrollbar",
  "scroll-on-output",
  "scroll-on-keystroke",
  "scrollback",
  "backspace-binding",
  "delete-binding",
  "encoding",
  "cjk-width",
  "cursor-blink-mode",
  "title",
  "font",
};

G_STATIC_ASSERT (G_N_ELEMENTS (preference_names) == TESSEL_PREFERENCE_LAST);

/**
 * tessel_preference_from_key:
 * @key: a profile key name
 * @preference: (out): location to store the preference
 *
 * Returns: %TRUE if @key has an effect on a pane
 */
gboolean
tessel_preference_from_key (const char *key,
                            TesselPreference *preference)
{
  g_return_val_if_fail (preference != nullptr, FALSE);

  if (key == nullptr)
    return FALSE;

  for (guint i = 0; i < G_N_ELEMENTS (preference_keys); ++i) {
    if (strcmp (preference_keys[i].key, key) == 0) {
      *preference = preference_keys[i].preference;
      return TRUE;
    }
  }

  return FALSE;
}

const char *
tessel_preference_to_string (TesselPreference preference)
{
  g_return_val_if_fail (preference < TESSEL_PREFERENCE_LAST, nullptr);

  return preference_names[preference];
}

const TesselPreference *
tessel_preference_get_apply_order (gsize *n_preferences)
{
  g_return_val_if_fail (n_preferences != nullptr, nullptr);

  *n_preferences = G_N_ELEMENTS (apply_order);
  return apply_order;
}
