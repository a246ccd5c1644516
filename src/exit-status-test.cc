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

#include <signal.h>

#include <glib.h>

#include "tessel-exit-status.hh"

static void
test_exit_status_exited (void)
{
  int value = -1;

  g_assert_cmpint (tessel_exit_status_decode (7 << 8, &value), ==, TESSEL_EXIT_STATUS_EXITED);
  g_assert_cmpint (value, ==, 7);

  g_assert_cmpint (tessel_exit_status_decode (0, &value), ==, TESSEL_EXIT_STATUS_EXITED);
  g_assert_cmpint (value, ==, 0);

  g_autofree char *message = tessel_exit_status_describe (7 << 8);
  g_assert_cmpstr (message, ==, "The child process exited normally with status 7.");
}

static void
test_exit_status_signaled (void)
{
  int value = -1;

  g_assert_cmpint (tessel_exit_status_decode (SIGKILL, &value), ==, TESSEL_EXIT_STATUS_SIGNALED);
  g_assert_cmpint (value, ==, SIGKILL);

  g_autofree char *message = tessel_exit_status_describe (SIGKILL);
  g_autofree char *expected = g_strdup_printf ("The child process was aborted by signal %d.", SIGKILL);
  g_assert_cmpstr (message, ==, expected);
}

static void
test_exit_status_aborted (void)
{
  /* A stopped child is neither exited nor signaled */
  auto const status = (SIGSTOP << 8) | 0x7f;

  g_assert_cmpint (tessel_exit_status_decode (status, nullptr), ==, TESSEL_EXIT_STATUS_ABORTED);

  g_autofree char *message = tessel_exit_status_describe (status);
  g_assert_cmpstr (message, ==, "The child process was aborted.");
}

int
main (int argc,
      char *argv[])
{
  g_test_init (&argc, &argv, nullptr);

  g_test_add_func ("/tessel/exit-status/exited", test_exit_status_exited);
  g_test_add_func ("/tessel/exit-status/signaled", test_exit_status_signaled);
  g_test_add_func ("/tessel/exit-status/aborted", test_exit_status_aborted);

  return g_test_run ();
}
