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

#include "tessel-title.hh"

static void
assert_title (const char *title_template,
              const TesselTitleInfo *info,
              const char *expected)
{
  g_autofree char *title = tessel_title_format (title_template, info);
  g_assert_cmpstr (title, ==, expected);
}

static void
test_title_basic (void)
{
  TesselTitleInfo info = { "vim", nullptr, 3, nullptr };

  assert_title ("${id}: ${title}", &info, "3: vim");
  assert_title ("${title}", &info, "vim");
  assert_title ("plain text", &info, "plain text");
  assert_title ("", &info, "");
}

static void
test_title_repeated (void)
{
  TesselTitleInfo info = { "top", "icon", 12, "/tmp" };

  assert_title ("${title} ${title} ${id}${id}", &info, "top top 1212");
  assert_title ("${directory}:${iconTitle}:${directory}", &info, "/tmp:icon:/tmp");
}

static void
test_title_escaping (void)
{
  TesselTitleInfo info = { "<b>&", nullptr, 1, "/home/a&b" };

  assert_title ("${title}", &info, "&lt;b&gt;&amp;");
  assert_title ("<i>${directory}</i>", &info, "<i>/home/a&amp;b</i>");
}

static void
test_title_unset (void)
{
  TesselTitleInfo info = { nullptr, "", 7, nullptr };

  assert_title ("${title}", &info, "");
  assert_title ("[${iconTitle}] ${directory}|${id}", &info, "[] |7");
  assert_title (nullptr, &info, "");
}

static void
test_title_unknown_placeholder (void)
{
  TesselTitleInfo info = { "bash", nullptr, 1, nullptr };

  assert_title ("${foo} ${title}", &info, "${foo} bash");
  assert_title ("$title ${title", &info, "$title ${title");
}

static void
test_title_idempotent (void)
{
  TesselTitleInfo info = { "ssh host", "host", 4, "/srv" };

  g_autofree char *first = tessel_title_format ("${id} ${title} (${directory})", &info);
  g_autofree char *second = tessel_title_format ("${id} ${title} (${directory})", &info);
  g_assert_cmpstr (first, ==, "4 ssh host (/srv)");
  g_assert_cmpstr (first, ==, second);
}

int
main (int argc,
      char *argv[])
{
  g_test_init (&argc, &argv, nullptr);

  g_test_add_func ("/tessel/title/basic", test_title_basic);
  g_test_add_func ("/tessel/title/repeated", test_title_repeated);
  g_test_add_func ("/tessel/title/escaping", test_title_escaping);
  g_test_add_func ("/tessel/title/unset", test_title_unset);
  g_test_add_func ("/tessel/title/unknown-placeholder", test_title_unknown_placeholder);
  g_test_add_func ("/tessel/title/idempotent", test_title_idempotent);

  return g_test_run ();
}
