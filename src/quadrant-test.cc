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

#include "tessel-quadrant.hh"

static gboolean
expected_quadrant (int x,
                   int y,
                   int width,
                   int height,
                   TesselDragQuadrant *quadrant)
{
  /* Distances to the four edges, scaled so that the corner
   * diagonals are where two of them are equal. */
  const long d[4] = {
    long (x) * height,            /* left */
    long (y) * width,             /* top */
    long (width - x) * height,    /* right */
    long (height - y) * width,    /* bottom */
  };

  int best = 0;
  for (int i = 1; i < 4; ++i)
    if (d[i] < d[best])
      best = i;

  for (int i = 0; i < 4; ++i)
    if (i != best && d[i] == d[best])
      return FALSE; /* on a diagonal */

  *quadrant = TesselDragQuadrant (best);
  return TRUE;
}

static void
check_partition (int width,
                 int height)
{
  guint counts[4] = { 0, 0, 0, 0 };

  for (int y = 1; y < height; ++y) {
    for (int x = 1; x < width; ++x) {
      TesselDragQuadrant expected;
      if (!expected_quadrant (x, y, width, height, &expected))
        continue;

      TesselDragQuadrant quadrant = tessel_drag_quadrant_resolve (x, y, width, height);
      if (quadrant != expected)
        g_error ("%d,%d in %dx%d resolved to %s, expected %s",
                 x, y, width, height,
                 tessel_drag_quadrant_to_string (quadrant),
                 tessel_drag_quadrant_to_string (expected));

      counts[quadrant]++;
    }
  }

  for (int i = 0; i < 4; ++i)
    g_assert_cmpuint (counts[i], >, 0);
}

static void
test_quadrant_partition_square (void)
{
  check_partition (100, 100);
}

static void
test_quadrant_partition_wide (void)
{
  check_partition (200, 100);
}

static void
test_quadrant_partition_tall (void)
{
  check_partition (60, 180);
}

static void
test_quadrant_edges (void)
{
  g_assert_cmpint (tessel_drag_quadrant_resolve (10, 50, 100, 100), ==, TESSEL_DRAG_QUADRANT_LEFT);
  g_assert_cmpint (tessel_drag_quadrant_resolve (50, 10, 100, 100), ==, TESSEL_DRAG_QUADRANT_TOP);
  g_assert_cmpint (tessel_drag_quadrant_resolve (90, 50, 100, 100), ==, TESSEL_DRAG_QUADRANT_RIGHT);
  g_assert_cmpint (tessel_drag_quadrant_resolve (50, 90, 100, 100), ==, TESSEL_DRAG_QUADRANT_BOTTOM);
}

static void
test_quadrant_fallback (void)
{
  /* The center and the corners belong to no triangle */
  g_assert_cmpint (tessel_drag_quadrant_resolve (50, 50, 100, 100), ==, TESSEL_DRAG_QUADRANT_LEFT);
  g_assert_cmpint (tessel_drag_quadrant_resolve (100, 0, 100, 100), ==, TESSEL_DRAG_QUADRANT_LEFT);

  /* Degenerate area */
  g_assert_cmpint (tessel_drag_quadrant_resolve (0, 0, 0, 0), ==, TESSEL_DRAG_QUADRANT_LEFT);
}

static void
test_quadrant_idempotent (void)
{
  for (int i = 0; i < 200; ++i) {
    int x = g_test_rand_int_range (0, 320);
    int y = g_test_rand_int_range (0, 240);

    TesselDragQuadrant first = tessel_drag_quadrant_resolve (x, y, 320, 240);
    g_assert_cmpint (tessel_drag_quadrant_resolve (x, y, 320, 240), ==, first);
  }
}

static void
test_quadrant_highlight_rect (void)
{
  TesselRect rect;

  rect = tessel_drag_quadrant_get_highlight_rect (TESSEL_DRAG_QUADRANT_LEFT, 101, 50);
  g_assert_cmpint (rect.x, ==, 0);
  g_assert_cmpint (rect.y, ==, 0);
  g_assert_cmpint (rect.width, ==, 50);
  g_assert_cmpint (rect.height, ==, 50);

  rect = tessel_drag_quadrant_get_highlight_rect (TESSEL_DRAG_QUADRANT_RIGHT, 101, 50);
  g_assert_cmpint (rect.x, ==, 50);
  g_assert_cmpint (rect.width, ==, 51);

  rect = tessel_drag_quadrant_get_highlight_rect (TESSEL_DRAG_QUADRANT_TOP, 100, 51);
  g_assert_cmpint (rect.y, ==, 0);
  g_assert_cmpint (rect.width, ==, 100);
  g_assert_cmpint (rect.height, ==, 25);

  rect = tessel_drag_quadrant_get_highlight_rect (TESSEL_DRAG_QUADRANT_BOTTOM, 100, 51);
  g_assert_cmpint (rect.y, ==, 25);
  g_assert_cmpint (rect.height, ==, 26);
}

static void
test_quadrant_placement (void)
{
  g_assert_true (tessel_drag_quadrant_is_horizontal (TESSEL_DRAG_QUADRANT_LEFT));
  g_assert_true (tessel_drag_quadrant_is_horizontal (TESSEL_DRAG_QUADRANT_RIGHT));
  g_assert_false (tessel_drag_quadrant_is_horizontal (TESSEL_DRAG_QUADRANT_TOP));
  g_assert_false (tessel_drag_quadrant_is_horizontal (TESSEL_DRAG_QUADRANT_BOTTOM));

  g_assert_false (tessel_drag_quadrant_is_after (TESSEL_DRAG_QUADRANT_LEFT));
  g_assert_false (tessel_drag_quadrant_is_after (TESSEL_DRAG_QUADRANT_TOP));
  g_assert_true (tessel_drag_quadrant_is_after (TESSEL_DRAG_QUADRANT_RIGHT));
  g_assert_true (tessel_drag_quadrant_is_after (TESSEL_DRAG_QUADRANT_BOTTOM));
}

int
main (int argc,
      char *argv[])
{
  g_test_init (&argc, &argv, nullptr);

  g_test_add_func ("/tessel/quadrant/partition/square", test_quadrant_partition_square);
  g_test_add_func ("/tessel/quadrant/partition/wide", test_quadrant_partition_wide);
  g_test_add_func ("/tessel/quadrant/partition/tall", test_quadrant_partition_tall);
  g_test_add_func ("/tessel/quadrant/edges", test_quadrant_edges);
  g_test_add_func ("/tessel/quadrant/fallback", test_quadrant_fallback);
  g_test_add_func ("/tessel/quadrant/idempotent", test_quadrant_idempotent);
  g_test_add_func ("/tessel/quadrant/highlight-rect", test_quadrant_highlight_rect);
  g_test_add_func ("/tessel/quadrant/placement", test_quadrant_placement);

  return g_test_run ();
}
