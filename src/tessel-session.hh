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

#ifndef TESSEL_SESSION_H
#define TESSEL_SESSION_H

#include <gtk/gtk.h>

#include "tessel-context.hh"
#include "tessel-pane-view.hh"

G_BEGIN_DECLS

#define TESSEL_TYPE_SESSION (tessel_session_get_type ())

G_DECLARE_FINAL_TYPE (TesselSession, tessel_session, TESSEL, SESSION, GtkWidget)

GtkWidget *tessel_session_new (TesselContext *context);

TesselContext *tessel_session_get_context (TesselSession *session);

TesselPaneView *tessel_session_start (TesselSession *session,
                                      const char *profile_uuid,
                                      const char *working_directory);

void tessel_session_add_view (TesselSession *session,
                              TesselPaneView *view);

TesselPaneView *tessel_session_take_view (TesselSession *session,
                                          TesselPaneView *view);

TesselPaneView *tessel_session_split (TesselSession *session,
                                      TesselPaneView *view,
                                      TesselOrientation orientation);

TesselPaneView *tessel_session_get_active_view (TesselSession *session);

GList *tessel_session_list_views (TesselSession *session);

guint tessel_session_get_n_views (TesselSession *session);

gboolean tessel_session_has_running_processes (TesselSession *session);

G_END_DECLS

#endif /* !TESSEL_SESSION_H */
