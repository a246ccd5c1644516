/*
 * Copyright (C) 2002 Red Hat, Inc.
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

/* The interfaces in this file are subject to change at any time. */

#ifndef TESSEL_DEBUG_H
#define TESSEL_DEBUG_H

#include <glib.h>

G_BEGIN_DECLS

typedef enum {
  TESSEL_DEBUG_PANE       = 1 << 0,
  TESSEL_DEBUG_DND        = 1 << 1,
  TESSEL_DEBUG_PROCESSES  = 1 << 2,
  TESSEL_DEBUG_PROFILE    = 1 << 3,
  TESSEL_DEBUG_CLIPBOARD  = 1 << 4,
  TESSEL_DEBUG_ENCODINGS  = 1 << 5,
  TESSEL_DEBUG_SESSION    = 1 << 6,
  TESSEL_DEBUG_SETTINGS   = 1 << 7,
} TesselDebugFlags;

void _tessel_debug_init(void);

extern TesselDebugFlags _tessel_debug_flags;
static inline gboolean _tessel_debug_on (TesselDebugFlags flags) G_GNUC_UNUSED;

static inline gboolean
_tessel_debug_on (TesselDebugFlags flags)
{
  return (_tessel_debug_flags & flags) == flags;
}

#ifdef ENABLE_DEBUG
#define _TESSEL_DEBUG_IF(flags) if (G_UNLIKELY (_tessel_debug_on (flags)))
#else
#define _TESSEL_DEBUG_IF(flags) if (0)
#endif

#if defined(__GNUC__) && G_HAVE_GNUC_VARARGS
#define _tessel_debug_print(flags, fmt, ...) \
  G_STMT_START { _TESSEL_DEBUG_IF(flags) g_printerr(fmt, ##__VA_ARGS__); } G_STMT_END
#else
#include <stdarg.h>
#include <glib/gstdio.h>
static void _tessel_debug_print (guint flags, const char *fmt, ...)
{
  if (_tessel_debug_on (TesselDebugFlags(flags))) {
    va_list  ap;
    va_start (ap, fmt);
    g_vfprintf (stderr, fmt, ap);
    va_end (ap);
  }
}
#endif

G_END_DECLS

#endif /* !TESSEL_DEBUG_H */
