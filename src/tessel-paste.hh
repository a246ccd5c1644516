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

gboolean tessel_paste_is_unsafe (const char *text);

TesselPasteAction tessel_paste_guard_decide (const char *text,
                                             gboolean warning_ignored,
                                             gboolean alert_enabled);

const char *tessel_paste_strip_comment_char (const char *text,
                                             gboolean strip);

G_END_DECLS
