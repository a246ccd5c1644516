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

#ifndef TESSEL_DEFINES_H
#define TESSEL_DEFINES_H

G_BEGIN_DECLS

#define TESSEL_APPLICATION_ID                   "com.github.Tessel"

#define TESSEL_RESOURCE_PATH                    "/com/github/tessel"

/* Environment variable set in every spawned child */
#define TESSEL_ENV_TERMINAL_ID                  "TERMINAL_ID"

/* Application-private drag-and-drop format carrying a pane UUID */
#define TESSEL_DND_PANE_MIME_TYPE               "application/x-tessel-pane"

#define TESSEL_DEFAULT_TITLE                    "Terminal"

#define TESSEL_DEFAULT_FONT_SIZE                (10)

enum {
  _EXIT_FAILURE_NO_UTF8 = 8,
  _EXIT_FAILURE_UNSUPPORTED_LOCALE = 9,
  _EXIT_FAILURE_NO_SCHEMAS = 11
};

G_END_DECLS

#endif /* !TESSEL_DEFINES_H */
