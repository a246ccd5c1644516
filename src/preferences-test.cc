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

#include <glib.h>

#include "tessel-pane.hh"
#include "tessel-preferences.hh"
#include "tessel-schemas.hh"
#include "tessel-test-emulator.hh"

typedef struct {
  TesselContext *context;
  TesselTestEmulator *emulator;
  TesselPane *pane;
  GSettings *profile;
} Fixture;

static void
flush (void)
{
  while (g_main_context_iteration (nullptr, FALSE));
}

static void
count_cb (gpointer object,
          GParamSpec *pspec,
          guint *n)
{
  (*n)++;
}

static void
fixture_setup (Fixture *fixture,
               gconstpointer user_data)
{
  fixture->context = tessel_test_context_new (nullptr);
  fixture->emulator = tessel_test_emulator_new ();
  fixture->pane = tessel_pane_new (fixture->context, TESSEL_EMULATOR (fixture->emulator), nullptr);
  fixture->profile = tessel_pane_get_profile (fixture->pane);
  g_assert_nonnull (fixture->profile);

  tessel_test_emulator_clear_calls (fixture->emulator);
}

static void
fixture_teardown (Fixture *fixture,
                  gconstpointer user_data)
{
  g_clear_object (&fixture->pane);
  g_clear_object (&fixture->emulator);
  g_clear_object (&fixture->context);
}

static void
test_preference_from_key (void)
{
  TesselPreference preference;

  g_assert_true (tessel_preference_from_key (TESSEL_PROFILE_PALETTE_KEY, &preference));
  g_assert_cmpint (preference, ==, TESSEL_PREFERENCE_COLORS);
  g_assert_true (tessel_preference_from_key (TESSEL_PROFILE_BACKGROUND_TRANSPARENCY_KEY, &preference));
  g_assert_cmpint (preference, ==, TESSEL_PREFERENCE_COLORS);
  g_assert_true (tessel_preference_from_key (TESSEL_PROFILE_SCROLLBACK_UNLIMITED_KEY, &preference));
  g_assert_cmpint (preference, ==, TESSEL_PREFERENCE_SCROLLBACK);
  g_assert_true (tessel_preference_from_key (TESSEL_PROFILE_USE_SYSTEM_FONT_KEY, &preference));
  g_assert_cmpint (preference, ==, TESSEL_PREFERENCE_FONT);
  g_assert_true (tessel_preference_from_key (TESSEL_PROFILE_TERMINAL_TITLE_KEY, &preference));
  g_assert_cmpint (preference, ==, TESSEL_PREFERENCE_TITLE);

  g_assert_false (tessel_preference_from_key (TESSEL_PROFILE_VISIBLE_NAME_KEY, &preference));
  g_assert_false (tessel_preference_from_key (TESSEL_PROFILE_EXIT_ACTION_KEY, &preference));
  g_assert_false (tessel_preference_from_key ("no-such-key", &preference));
  g_assert_false (tessel_preference_from_key (nullptr, &preference));

  g_assert_cmpstr (tessel_preference_to_string (TESSEL_PREFERENCE_CJK_WIDTH), ==, "cjk-width");
}

static void
test_preference_unknown_key (Fixture *fixture,
                             gconstpointer user_data)
{
  tessel_pane_apply_preference (fixture->pane, "no-such-key");
  tessel_pane_apply_preference (fixture->pane, TESSEL_PROFILE_VISIBLE_NAME_KEY);
  tessel_pane_apply_preference (fixture->pane, TESSEL_PROFILE_LOGIN_SHELL_KEY);

  g_assert_cmpuint (fixture->emulator->calls->len, ==, 0);
}

static void
test_preference_apply_all_order (Fixture *fixture,
                                 gconstpointer user_data)
{
  static const char *expected[] = {
    "set_audible_bell",
    "set_bold_is_bright",
    "set_rewrap_on_resize",
    "set_cursor_shape",
    "set_colors",
    "set_scroll_on_output",
    "set_scroll_on_keystroke",
    "set_scrollback_lines",
    "set_backspace_binding",
    "set_delete_binding",
    "set_cjk_ambiguous_width",
    "set_encoding",
    "set_cursor_blink_mode",
    "set_font",
  };

  tessel_pane_apply_preferences_all (fixture->pane);

  GPtrArray *calls = fixture->emulator->calls;
  g_assert_cmpuint (calls->len, ==, G_N_ELEMENTS (expected));
  for (guint i = 0; i < calls->len; ++i)
    g_assert_cmpstr ((const char *) g_ptr_array_index (calls, i), ==, expected[i]);

  TesselTestEmulator *emulator = fixture->emulator;
  g_assert_cmpint (emulator->scrollback_lines, ==, 8192);
  g_assert_true (emulator->audible_bell);
  g_assert_false (emulator->bold_is_bright);
  g_assert_cmpstr (emulator->encoding, ==, "UTF-8");
  g_assert_cmpint (emulator->cjk_ambiguous_width, ==, 1);
}

static void
test_preference_single_key (Fixture *fixture,
                            gconstpointer user_data)
{
  g_settings_set_boolean (fixture->profile, TESSEL_PROFILE_AUDIBLE_BELL_KEY, FALSE);
  flush ();

  g_assert_false (fixture->emulator->audible_bell);
  g_assert_cmpuint (tessel_test_emulator_count_calls (fixture->emulator, "set_audible_bell"), ==, 1);
  g_assert_cmpuint (fixture->emulator->calls->len, ==, 1);

  g_settings_set_enum (fixture->profile, TESSEL_PROFILE_CJK_UTF8_AMBIGUOUS_WIDTH_KEY, 2);
  flush ();
  g_assert_cmpint (fixture->emulator->cjk_ambiguous_width, ==, 2);

  g_settings_set_enum (fixture->profile, TESSEL_PROFILE_CURSOR_SHAPE_KEY, TESSEL_CURSOR_SHAPE_UNDERLINE);
  flush ();
  g_assert_cmpint (fixture->emulator->cursor_shape, ==, TESSEL_CURSOR_SHAPE_UNDERLINE);
}

static void
test_preference_scrollback (Fixture *fixture,
                            gconstpointer user_data)
{
  g_settings_set_int (fixture->profile, TESSEL_PROFILE_SCROLLBACK_LINES_KEY, 100);
  flush ();
  g_assert_cmpint (fixture->emulator->scrollback_lines, ==, 100);

  g_settings_set_boolean (fixture->profile, TESSEL_PROFILE_SCROLLBACK_UNLIMITED_KEY, TRUE);
  flush ();
  g_assert_cmpint (fixture->emulator->scrollback_lines, ==, -1);

  /* Lines are kept, but unlimited wins */
  g_settings_set_int (fixture->profile, TESSEL_PROFILE_SCROLLBACK_LINES_KEY, 200);
  flush ();
  g_assert_cmpint (fixture->emulator->scrollback_lines, ==, -1);
}

static void
test_preference_colors (Fixture *fixture,
                        gconstpointer user_data)
{
  TesselTestEmulator *emulator = fixture->emulator;

  g_settings_set_int (fixture->profile, TESSEL_PROFILE_BACKGROUND_TRANSPARENCY_KEY, 25);
  flush ();

  g_assert_false (emulator->colors_use_theme);
  g_assert_cmpuint (emulator->palette_size, ==, 16);
  g_assert_cmpfloat_with_epsilon (emulator->background.alpha, 0.75, 0.001);
  g_assert_cmpfloat_with_epsilon (emulator->foreground.alpha, 1.0, 0.001);

  g_settings_set_boolean (fixture->profile, TESSEL_PROFILE_USE_THEME_COLORS_KEY, TRUE);
  flush ();
  g_assert_true (emulator->colors_use_theme);
}

static void
test_preference_invalid_palette (Fixture *fixture,
                                 gconstpointer user_data)
{
  const char *palette[] = {
    "#000000", "#111111", "#222222", "#GGGGGG",
    "#444444", "#555555", "#666666", "#777777",
    "#888888", "#999999", "#AAAAAA", "#BBBBBB",
    "#CCCCCC", "#DDDDDD", "#EEEEEE", "#FFFFFF",
    nullptr
  };

  g_test_expect_message (G_LOG_DOMAIN, G_LOG_LEVEL_WARNING, "Failed to parse palette color*");
  g_settings_set_strv (fixture->profile, TESSEL_PROFILE_PALETTE_KEY, palette);
  flush ();
  g_test_assert_expected_messages ();

  GdkRGBA colors[16];
  tessel_pane_get_colors (fixture->pane, nullptr, nullptr, colors, G_N_ELEMENTS (colors));

  /* The bad entry keeps the previous color */
  GdkRGBA tango;
  g_assert_true (gdk_rgba_parse (&tango, "#C4A000"));
  g_assert_true (gdk_rgba_equal (&colors[3], &tango));
  g_assert_true (gdk_rgba_equal (&fixture->emulator->palette[3], &tango));

  GdkRGBA white;
  g_assert_true (gdk_rgba_parse (&white, "#FFFFFF"));
  g_assert_true (gdk_rgba_equal (&colors[15], &white));
}

static void
test_preference_invalid_foreground (Fixture *fixture,
                                    gconstpointer user_data)
{
  GdkRGBA before, after;

  tessel_pane_get_colors (fixture->pane, &before, nullptr, nullptr, 0);

  g_test_expect_message (G_LOG_DOMAIN, G_LOG_LEVEL_WARNING, "Failed to parse color*");
  g_settings_set_string (fixture->profile, TESSEL_PROFILE_FOREGROUND_COLOR_KEY, "not a color");
  flush ();
  g_test_assert_expected_messages ();

  tessel_pane_get_colors (fixture->pane, &after, nullptr, nullptr, 0);
  g_assert_true (gdk_rgba_equal (&before, &after));
}

static void
test_preference_font (Fixture *fixture,
                      gconstpointer user_data)
{
  g_settings_set_boolean (fixture->profile, TESSEL_PROFILE_USE_SYSTEM_FONT_KEY, FALSE);
  g_settings_set_string (fixture->profile, TESSEL_PROFILE_FONT_KEY, "Monospace 14");
  flush ();
  g_assert_cmpstr (fixture->emulator->font, ==, "Monospace 14");

  /* No size falls back to the default size */
  g_settings_set_string (fixture->profile, TESSEL_PROFILE_FONT_KEY, "Monospace");
  flush ();
  g_assert_cmpstr (fixture->emulator->font, ==, "Monospace 10");
}

static void
test_preference_scrollbar (Fixture *fixture,
                           gconstpointer user_data)
{
  guint n_notify = 0;

  g_signal_connect (fixture->pane, "notify::scrollbar-visible",
                    G_CALLBACK (count_cb), &n_notify);

  g_assert_true (tessel_pane_get_scrollbar_visible (fixture->pane));

  g_settings_set_boolean (fixture->profile, TESSEL_PROFILE_SHOW_SCROLLBAR_KEY, FALSE);
  flush ();

  g_assert_false (tessel_pane_get_scrollbar_visible (fixture->pane));
  g_assert_cmpuint (n_notify, ==, 1);
  g_assert_cmpuint (fixture->emulator->calls->len, ==, 0);
}

static void
test_preference_encoding (Fixture *fixture,
                          gconstpointer user_data)
{
  tessel_pane_select_encoding (fixture->pane, "ISO-8859-15");
  flush ();
  g_assert_cmpstr (fixture->emulator->encoding, ==, "ISO-8859-15");

  g_autofree char *stored = g_settings_get_string (fixture->profile, TESSEL_PROFILE_ENCODING_KEY);
  g_assert_cmpstr (stored, ==, "ISO-8859-15");

  g_test_expect_message (G_LOG_DOMAIN, G_LOG_LEVEL_WARNING, "Unknown encoding*");
  tessel_pane_select_encoding (fixture->pane, "X-NOT-A-CHARSET");
  g_test_assert_expected_messages ();

  flush ();
  g_assert_cmpstr (fixture->emulator->encoding, ==, "ISO-8859-15");
}

int
main (int argc,
      char *argv[])
{
  g_test_init (&argc, &argv, nullptr);

  g_test_add_func ("/tessel/preferences/from-key", test_preference_from_key);

#define ADD_TEST(path, func) \
  g_test_add ("/tessel/preferences/" path, Fixture, nullptr, fixture_setup, func, fixture_teardown)

  ADD_TEST ("unknown-key", test_preference_unknown_key);
  ADD_TEST ("apply-all-order", test_preference_apply_all_order);
  ADD_TEST ("single-key", test_preference_single_key);
  ADD_TEST ("scrollback", test_preference_scrollback);
  ADD_TEST ("colors", test_preference_colors);
  ADD_TEST ("invalid-palette", test_preference_invalid_palette);
  ADD_TEST ("invalid-foreground", test_preference_invalid_foreground);
  ADD_TEST ("font", test_preference_font);
  ADD_TEST ("scrollbar", test_preference_scrollbar);
  ADD_TEST ("encoding", test_preference_encoding);

#undef ADD_TEST

  return g_test_run ();
}
