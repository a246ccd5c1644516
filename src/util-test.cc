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

#include <string.h>

#include <glib.h>
#include <gio/gsettingsbackend.h>

#include "tessel-pcre2.hh"
#include "tessel-regex.hh"
#include "tessel-util.hh"

static void
test_url_for_flavor (void)
{
  g_autofree char *as_is = tessel_util_url_for_flavor ("https://gnome.org/", TESSEL_URL_FLAVOR_AS_IS);
  g_assert_cmpstr (as_is, ==, "https://gnome.org/");

  g_autofree char *http = tessel_util_url_for_flavor ("www.gnome.org", TESSEL_URL_FLAVOR_DEFAULT_TO_HTTP);
  g_assert_cmpstr (http, ==, "http://www.gnome.org");

  g_autofree char *email = tessel_util_url_for_flavor ("me@example.org", TESSEL_URL_FLAVOR_EMAIL);
  g_assert_cmpstr (email, ==, "mailto:me@example.org");

  g_autofree char *mailto = tessel_util_url_for_flavor ("MAILTO:me@example.org", TESSEL_URL_FLAVOR_EMAIL);
  g_assert_cmpstr (mailto, ==, "MAILTO:me@example.org");
}

static void
test_quote_uri_list (void)
{
  char *uris[] = {
    (char *) "file:///tmp/a%20b",
    (char *) "file:///etc/hosts",
    nullptr
  };

  g_autofree char *quoted = tessel_util_quote_uri_list (uris);
  g_assert_cmpstr (quoted, ==, "'/tmp/a b' '/etc/hosts' ");

  g_autofree char *empty = tessel_util_quote_uri_list (nullptr);
  g_assert_cmpstr (empty, ==, "");
}

static void
test_settings_rgba (void)
{
  g_autoptr(GSettingsBackend) backend = g_memory_settings_backend_new ();
  g_autoptr(GError) error = nullptr;
  g_autoptr(GSettingsSchemaSource) source =
    g_settings_schema_source_new_from_directory (TESSEL_TEST_SCHEMA_DIR, nullptr, FALSE, &error);
  g_assert_no_error (error);

  g_autoptr(GSettingsSchema) schema =
    g_settings_schema_source_lookup (source, "com.github.Tessel.Profile", FALSE);
  g_assert_nonnull (schema);

  g_autoptr(GSettings) settings =
    g_settings_new_full (schema, backend, "/com/github/tessel/profiles/:test/");

  g_settings_set_string (settings, "foreground-color", "#ff0000");
  GdkRGBA color;
  g_assert_true (tessel_g_settings_get_rgba (settings, "foreground-color", &color));
  g_assert_cmpfloat (color.red, ==, 1.);
  g_assert_cmpfloat (color.green, ==, 0.);

  g_settings_set_string (settings, "foreground-color", "not a color");
  g_test_expect_message (G_LOG_DOMAIN, G_LOG_LEVEL_WARNING, "Failed to parse color*");
  g_assert_false (tessel_g_settings_get_rgba (settings, "foreground-color", &color));
  g_test_assert_expected_messages ();
  g_assert_cmpfloat (color.red, ==, 1.);
}

static char *
match_url (const char *pattern,
           const char *subject)
{
  int errcode;
  PCRE2_SIZE erroffset;
  pcre2_code_8 *code = pcre2_compile_8 ((PCRE2_SPTR8) pattern, PCRE2_ZERO_TERMINATED,
                                        PCRE2_UTF | PCRE2_UCP | PCRE2_MULTILINE,
                                        &errcode, &erroffset, nullptr);
  g_assert_nonnull (code);

  pcre2_match_data_8 *match_data = pcre2_match_data_create_from_pattern_8 (code, nullptr);
  char *match = nullptr;
  if (pcre2_match_8 (code, (PCRE2_SPTR8) subject, strlen (subject), 0, 0, match_data, nullptr) >= 0) {
    PCRE2_SIZE *ovector = pcre2_get_ovector_pointer_8 (match_data);
    match = g_strndup (subject + ovector[0], ovector[1] - ovector[0]);
  }

  pcre2_match_data_free_8 (match_data);
  pcre2_code_free_8 (code);
  return match;
}

static void
assert_match (const char *pattern,
              const char *subject,
              const char *expected)
{
  g_autofree char *match = match_url (pattern, subject);
  g_assert_cmpstr (match, ==, expected);
}

static void
test_url_regexes (void)
{
  assert_match (REGEX_URL_AS_IS, "see https://gnome.org/path.", "https://gnome.org/path");
  assert_match (REGEX_URL_AS_IS, "ftp://user:pw@host.example:21/x", "ftp://user:pw@host.example:21/x");
  assert_match (REGEX_URL_AS_IS, "no url here", nullptr);
  assert_match (REGEX_URL_FILE, "open file:///etc/hosts now", "file:///etc/hosts");
  assert_match (REGEX_URL_HTTP, "visit www.gnome.org, then", "www.gnome.org");
  assert_match (REGEX_EMAIL, "mail me@example.org today", "me@example.org");
}

int
main (int argc,
      char *argv[])
{
  g_test_init (&argc, &argv, nullptr);

  g_test_add_func ("/tessel/util/url-for-flavor", test_url_for_flavor);
  g_test_add_func ("/tessel/util/quote-uri-list", test_quote_uri_list);
  g_test_add_func ("/tessel/util/settings-rgba", test_settings_rgba);
  g_test_add_func ("/tessel/regex/urls", test_url_regexes);

  return g_test_run ();
}
