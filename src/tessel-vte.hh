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

#ifndef TESSEL_VTE_H
#define TESSEL_VTE_H

#include <vte/vte.h>

#include "tessel-emulator.hh"

G_BEGIN_DECLS

#define TESSEL_TYPE_VTE (tessel_vte_get_type ())

G_DECLARE_FINAL_TYPE (TesselVte, tessel_vte, TESSEL, VTE, VteTerminal)

TesselVte *tessel_vte_new (void);

char *tessel_vte_check_match (TesselVte *vte,
                              double x,
                              double y);

void tessel_vte_open_url (TesselVte *vte,
                          const char *url);

G_END_DECLS

#endif /* !TESSEL_VTE_H */
