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

G_BEGIN_DECLS

typedef enum {
  TESSEL_EXIT_STATUS_EXITED,
  TESSEL_EXIT_STATUS_SIGNALED,
  TESSEL_EXIT_STATUS_ABORTED
} TesselExitStatusKind;

TesselExitStatusKind tessel_exit_status_decode (int status,
                                                int *value);

char *tessel_exit_status_describe (int status) G_GNUC_MALLOC;

G_END_DECLS
