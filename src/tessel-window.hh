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

#ifndef TESSEL_WINDOW_H
#define TESSEL_WINDOW_H

#include <adwaita.h>

#include "tessel-context.hh"
#include "tessel-session.hh"

G_BEGIN_DECLS

#define TESSEL_TYPE_WINDOW (tessel_window_get_type ())

G_DECLARE_FINAL_TYPE (TesselWindow, tessel_window, TESSEL, WINDOW, AdwApplicationWindow)

TesselWindow *tessel_window_new (GtkApplication *app,
                                 TesselContext *context);

TesselSession *tessel_window_get_session (TesselWindow *window);

G_END_DECLS

#endif /* !TESSEL_WINDOW_H */
