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

#ifndef TESSEL_APP_H
#define TESSEL_APP_H

#include <adwaita.h>

#include "tessel-context.hh"

G_BEGIN_DECLS

#define TESSEL_TYPE_APP (tessel_app_get_type ())

G_DECLARE_FINAL_TYPE (TesselApp, tessel_app, TESSEL, APP, AdwApplication)

TesselApp *tessel_app_new (void);

TesselContext *tessel_app_get_context (TesselApp *app);

G_END_DECLS

#endif /* !TESSEL_APP_H */
