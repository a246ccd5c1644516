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

#ifndef TESSEL_INFO_BAR_H
#define TESSEL_INFO_BAR_H

#include <gtk/gtk.h>

G_BEGIN_DECLS

#define TESSEL_TYPE_INFO_BAR (tessel_info_bar_get_type ())

G_DECLARE_FINAL_TYPE (TesselInfoBar, tessel_info_bar, TESSEL, INFO_BAR, GtkWidget)

GtkWidget *tessel_info_bar_new (GtkMessageType type,
                                const char *first_button_text,
                                ...) G_GNUC_NULL_TERMINATED;

void tessel_info_bar_format_text (TesselInfoBar *bar,
                                  const char *format,
                                  ...) G_GNUC_PRINTF (2, 3);

G_END_DECLS

#endif /* !TESSEL_INFO_BAR_H */
