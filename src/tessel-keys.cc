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

#include "tessel-keys.hh"

#include <string.h>

typedef struct {
  guint keyval;
  const char *sequence;
} KeySequence;

/* Sequences for the keys that have no character, in the
 * cursor-key normal mode a freshly reset terminal is in. */
static const KeySequence key_sequences[] = {
  { GDK_KEY_Return,    "\r"      },
  { GDK_KEY_KP_Enter,  "\r"      },
  { GDK_KEY_BackSpace, "\x7f"    },
  { GDK_KEY_Tab,       "\t"      },
  { GDK_KEY_KP_Tab,    "\t"      },
  { GDK_KEY_Escape,    "\x1b"    },
  { GDK_KEY_Up,        "\x1b[A"  },
  { GDK_KEY_Down,      "\x1b[B"  },
  { GDK_KEY_Right,     "\x1b[C"  },
  { GDK_KEY_Left,      "\x1b[D"  },
  { GDK_KEY_Home,      "\x1b[H"  },
  { GDK_KEY_End,       "\x1b[F"  },
  { GDK_KEY_Insert,    "\x1b[2~" },
  { GDK_KEY_Delete,    "\x1b[3~" },
  { GDK_KEY_Page_Up,   "\x1b[5~" },
  { GDK_KEY_Page_Down, "\x1b[6~" },
};

/**
 * tessel_key_to_sequence:
 * @keyval: a key value
 * @state: the modifier state of the key press
 * @length: (out): return location for the length of the sequence
 *
 * Translates a key press into the bytes a terminal sends to its child.
 * The sequence may contain a NUL byte (Ctrl+Space, Ctrl+@), so use
 * @length rather than strlen().
 *
 * Returns: (transfer full) (nullable): the byte sequence, or %nullptr if
 *   the key produces no input
 */
char *
tessel_key_to_sequence (guint keyval,
                        GdkModifierType state,
                        gsize *length)
{
  g_return_val_if_fail (length != nullptr, nullptr);

  *length = 0;

  for (guint i = 0; i < G_N_ELEMENTS (key_sequences); ++i) {
    if (key_sequences[i].keyval == keyval) {
      *length = strlen (key_sequences[i].sequence);
      return g_strdup (key_sequences[i].sequence);
    }
  }

  gunichar c = gdk_keyval_to_unicode (keyval);
  if (c == 0)
    return nullptr;

  if (state & GDK_CONTROL_MASK) {
    /* Control characters: Ctrl+@ .. Ctrl+_, and Ctrl+Space for NUL */
    gunichar upper = c == ' ' ? '@' : g_unichar_toupper (c);
    if (upper >= '@' && upper <= '_') {
      auto const control = static_cast<char *>(g_malloc0 (2));
      control[0] = char (upper & 0x1f);
      *length = 1;
      return control;
    }
  }

  char utf8[7];
  int len = g_unichar_to_utf8 (c, utf8);
  GString *seq = g_string_new (nullptr);

  if (state & GDK_ALT_MASK)
    g_string_append_c (seq, '\x1b');
  g_string_append_len (seq, utf8, len);

  *length = seq->len;
  return g_string_free (seq, FALSE);
}
