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

#ifndef TESSEL_PANE_VIEW_H
#define TESSEL_PANE_VIEW_H

#include <gtk/gtk.h>

#include "tessel-context.hh"
#include "tessel-pane.hh"
#include "tessel-vte.hh"

G_BEGIN_DECLS

#define TESSEL_TYPE_PANE_VIEW (tessel_pane_view_get_type ())

G_DECLARE_FINAL_TYPE (TesselPaneView, tessel_pane_view, TESSEL, PANE_VIEW, GtkWidget)

GtkWidget *tessel_pane_view_new (TesselContext *context,
                                 const char *profile_uuid);

TesselPane *tessel_pane_view_get_pane (TesselPaneView *view);

TesselVte *tessel_pane_view_get_vte (TesselPaneView *view);

TesselPaneView *tessel_pane_view_get_from_pane (TesselPane *pane);

void tessel_pane_view_close (TesselPaneView *view);

G_END_DECLS

#endif /* !TESSEL_PANE_VIEW_H */
