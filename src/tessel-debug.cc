/*
 * Copyright (C) 2002,2003 Red Hat, Inc.
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

#include <config.h>

#include <glib.h>

#include "tessel-debug.hh"

TesselDebugFlags _tessel_debug_flags;

void
_tessel_debug_init(void)
{
#ifdef ENABLE_DEBUG
  const GDebugKey keys[] = {
    { "pane",      TESSEL_DEBUG_PANE      },
    { "dnd",       TESSEL_DEBUG_DND       },
    { "processes", TESSEL_DEBUG_PROCESSES },
    { "profile",   TESSEL_DEBUG_PROFILE   },
    { "clipboard", TESSEL_DEBUG_CLIPBOARD },
    { "encodings", TESSEL_DEBUG_ENCODINGS },
    { "session",   TESSEL_DEBUG_SESSION   },
    { "settings",  TESSEL_DEBUG_SETTINGS  },
  };

  _tessel_debug_flags = TesselDebugFlags(g_parse_debug_string (g_getenv ("TESSEL_DEBUG"),
                                                               keys, G_N_ELEMENTS (keys)));

#endif /* ENABLE_DEBUG */
}
