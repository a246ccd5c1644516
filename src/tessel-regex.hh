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

#ifndef TESSEL_REGEX_H
#define TESSEL_REGEX_H

#include <glib.h>

#include "tessel-enums.hh"

G_BEGIN_DECLS

typedef struct {
  const char *pattern;
  TesselURLFlavor flavor;
} TesselRegexPattern;

/* Building blocks */

#define SCHEME          "(?ix: news | telnet | nntp | https? | ftps? | sftp | webcal | file )"
#define USERCHARS       "-+.[:alnum:]"
#define USERCHARS_CLASS "[" USERCHARS "]"
#define PASSCHARS_CLASS "[-[:alnum:]\\Q,?;.:/!%$^*&~\"#'\\E]"
#define HOSTCHARS_CLASS "[-[:alnum:]]"
#define HOST            HOSTCHARS_CLASS "+(?:\\." HOSTCHARS_CLASS "+)*"
#define PORT            "(?:\\:[[:digit:]]{1,5})?"
#define USERPASS        USERCHARS_CLASS "+(?:\\:" PASSCHARS_CLASS "+)?"
#define URLPATH         "(?:/[[:alnum:]\\Q-_.!~*'();/?:@&=+$,#%\\E]*(?<![\\Q.,;:!?'\\E]))?"

#define REGEX_URL_AS_IS  "\\b" SCHEME "://(?:" USERPASS "@)?" HOST PORT URLPATH
#define REGEX_URL_FILE   "(?ix: file:/ )" URLPATH
#define REGEX_URL_HTTP   "\\b(?:www|ftp)" HOSTCHARS_CLASS "*\\." HOST PORT URLPATH
#define REGEX_EMAIL      "\\b(?i:mailto:)?" USERCHARS_CLASS "+@" HOST

static const TesselRegexPattern url_regex_patterns[] = {
  { REGEX_URL_AS_IS, TESSEL_URL_FLAVOR_AS_IS },
  { REGEX_URL_FILE,  TESSEL_URL_FLAVOR_AS_IS },
  { REGEX_URL_HTTP,  TESSEL_URL_FLAVOR_DEFAULT_TO_HTTP },
  { REGEX_EMAIL,     TESSEL_URL_FLAVOR_EMAIL },
};

G_END_DECLS

#endif /* !TESSEL_REGEX_H */
