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

#include "config.h"

#include "tessel-encoding.hh"
#include "tessel-debug.hh"

#include <glib/gi18n.h>

typedef struct {
  const char *charset;
  const char *name;
} TesselEncodingEntry;

static const TesselEncodingEntry encodings[] = {
  { "UTF-8",          N_("Unicode") },
  { "ISO-8859-1",     N_("Western") },
  { "ISO-8859-2",     N_("Central European") },
  { "ISO-8859-3",     N_("South European") },
  { "ISO-8859-4",     N_("Baltic") },
  { "ISO-8859-5",     N_("Cyrillic") },
  { "ISO-8859-6",     N_("Arabic") },
  { "ISO-8859-7",     N_("Greek") },
  { "ISO-8859-8",     N_("Hebrew Visual") },
  { "ISO-8859-8-I",   N_("Hebrew") },
  { "ISO-8859-9",     N_("Turkish") },
  { "ISO-8859-10",    N_("Nordic") },
  { "ISO-8859-13",    N_("Baltic") },
  { "ISO-8859-14",    N_("Celtic") },
  { "ISO-8859-15",    N_("Western") },
  { "ISO-8859-16",    N_("Romanian") },
  { "ARMSCII-8",      N_("Armenian") },
  { "BIG5",           N_("Chinese Traditional") },
  { "BIG5-HKSCS",     N_("Chinese Traditional") },
  { "CP866",          N_("Cyrillic/Russian") },
  { "EUC-JP",         N_("Japanese") },
  { "EUC-KR",         N_("Korean") },
  { "EUC-TW",         N_("Chinese Traditional") },
  { "GB18030",        N_("Chinese Simplified") },
  { "GB2312",         N_("Chinese Simplified") },
  { "GBK",            N_("Chinese Simplified") },
  { "GEORGIAN-PS",    N_("Georgian") },
  { "IBM850",         N_("Western") },
  { "IBM852",         N_("Central European") },
  { "IBM855",         N_("Cyrillic") },
  { "IBM857",         N_("Turkish") },
  { "IBM862",         N_("Hebrew") },
  { "IBM864",         N_("Arabic") },
  { "ISO-2022-JP",    N_("Japanese") },
  { "ISO-2022-KR",    N_("Korean") },
  { "ISO-IR-111",     N_("Cyrillic") },
  { "KOI8-R",         N_("Cyrillic") },
  { "KOI8-U",         N_("Cyrillic/Ukrainian") },
  { "SHIFT_JIS",      N_("Japanese") },
  { "TCVN",           N_("Vietnamese") },
  { "TIS-620",        N_("Thai") },
  { "UHC",            N_("Korean") },
  { "VISCII",         N_("Vietnamese") },
  { "WINDOWS-1250",   N_("Central European") },
  { "WINDOWS-1251",   N_("Cyrillic") },
  { "WINDOWS-1252",   N_("Western") },
  { "WINDOWS-1253",   N_("Greek") },
  { "WINDOWS-1254",   N_("Turkish") },
  { "WINDOWS-1255",   N_("Hebrew") },
  { "WINDOWS-1256",   N_("Arabic") },
  { "WINDOWS-1257",   N_("Baltic") },
  { "WINDOWS-1258",   N_("Vietnamese") },
};

static const TesselEncodingEntry *
lookup_encoding (const char *charset)
{
  if (charset == nullptr)
    return nullptr;

  for (guint i = 0; i < G_N_ELEMENTS (encodings); ++i) {
    if (g_ascii_strcasecmp (encodings[i].charset, charset) == 0)
      return &encodings[i];
  }

  return nullptr;
}

gboolean
tessel_encodings_is_known_charset (const char *charset)
{
  return lookup_encoding (charset) != nullptr;
}

const char *
tessel_encodings_get_name (const char *charset)
{
  auto const entry = lookup_encoding (charset);
  if (entry == nullptr)
    return nullptr;

  return _(entry->name);
}

/**
 * tessel_encodings_append_menu:
 * @menu: a #GMenu
 * @charsets: the charsets to offer, in order
 * @detailed_action: the action taking the charset as its string target
 *
 * Appends an item for each charset in @charsets that is in the
 * table of known encodings; unknown charsets are skipped.
 */
void
tessel_encodings_append_menu (GMenu *menu,
                              char **charsets,
                              const char *detailed_action)
{
  g_return_if_fail (G_IS_MENU (menu));
  g_return_if_fail (detailed_action != nullptr);

  if (charsets == nullptr)
    return;

  for (guint i = 0; charsets[i]; ++i) {
    auto const entry = lookup_encoding (charsets[i]);
    if (entry == nullptr) {
      _tessel_debug_print (TESSEL_DEBUG_ENCODINGS,
                           "Skipping unknown encoding \"%s\"\n", charsets[i]);
      continue;
    }

    g_autofree char *label = g_strdup_printf ("%s (%s)", _(entry->name), entry->charset);
    g_autoptr(GMenuItem) item = g_menu_item_new (label, nullptr);
    g_menu_item_set_action_and_target_value (item, detailed_action,
                                             g_variant_new_string (entry->charset));
    g_menu_append_item (menu, item);
  }
}
