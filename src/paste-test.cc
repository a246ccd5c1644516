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

#include "tessel-paste.hh"

static void
test_paste_unsafe (void)
{
  g_assert_true (tessel_paste_is_unsafe ("sudo rm -rf /"));
  g_assert_true (tessel_paste_is_unsafe ("ls; sudo reboot"));
  g_assert_false (tessel_paste_is_unsafe ("ls -l"));
  g_assert_false (tessel_paste_is_unsafe ("\nsudo reboot"));
  g_assert_false (tessel_paste_is_unsafe (""));
  g_assert_false (tessel_paste_is_unsafe (nullptr));
}

static void
test_paste_decision_table (void)
{
  const struct {
    gboolean ignored;
    gboolean alert;
    TesselPasteAction expected;
  } rows[] = {
    { FALSE, TRUE,  TESSEL_PASTE_ACTION_PROMPT },
    { TRUE,  TRUE,  TESSEL_PASTE_ACTION_PASTE  },
    { FALSE, FALSE, TESSEL_PASTE_ACTION_PASTE  },
    { TRUE,  FALSE, TESSEL_PASTE_ACTION_PASTE  },
  };

  for (guint i = 0; i < G_N_ELEMENTS (rows); ++i) {
    g_assert_cmpint (tessel_paste_guard_decide ("sudo make install", rows[i].ignored, rows[i].alert),
                     ==, rows[i].expected);
    g_assert_cmpint (tessel_paste_guard_decide ("make install", rows[i].ignored, rows[i].alert),
                     ==, TESSEL_PASTE_ACTION_PASTE);
  }

  g_assert_cmpint (tessel_paste_guard_decide ("\nsudo make install", FALSE, TRUE),
                   ==, TESSEL_PASTE_ACTION_PASTE);
}

static void
test_paste_strip (void)
{
  g_assert_cmpstr (tessel_paste_strip_comment_char ("$ ls", TRUE), ==, " ls");
  g_assert_cmpstr (tessel_paste_strip_comment_char ("# ls", TRUE), ==, " ls");
  g_assert_cmpstr (tessel_paste_strip_comment_char ("## ls", TRUE), ==, "# ls");
  g_assert_cmpstr (tessel_paste_strip_comment_char ("$$", TRUE), ==, "$");
  g_assert_cmpstr (tessel_paste_strip_comment_char ("ls #", TRUE), ==, "ls #");
  g_assert_cmpstr (tessel_paste_strip_comment_char ("$ ls", FALSE), ==, "$ ls");
  g_assert_cmpstr (tessel_paste_strip_comment_char ("", TRUE), ==, "");
}

int
main (int argc,
      char *argv[])
{
  g_test_init (&argc, &argv, nullptr);

  g_test_add_func ("/tessel/paste/unsafe", test_paste_unsafe);
  g_test_add_func ("/tessel/paste/decision-table", test_paste_decision_table);
  g_test_add_func ("/tessel/paste/strip", test_paste_strip);

  return g_test_run ();
}
