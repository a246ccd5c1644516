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

#include "tessel-exit-status.hh"

#include <sys/wait.h>

#include <glib/gi18n.h>

/**
 * tessel_exit_status_decode:
 * @status: a wait status, as passed to VteTerminal::child-exited
 * @value: (out) (optional): the exit code or signal number
 *
 * Returns: how the child terminated
 */
TesselExitStatusKind
tessel_exit_status_decode (int status,
                           int *value)
{
  if (WIFEXITED (status)) {
    if (value)
      *value = WEXITSTATUS (status);
    return TESSEL_EXIT_STATUS_EXITED;
  }

  if (WIFSIGNALED (status)) {
    if (value)
      *value = WTERMSIG (status);
    return TESSEL_EXIT_STATUS_SIGNALED;
  }

  if (value)
    *value = 0;
  return TESSEL_EXIT_STATUS_ABORTED;
}

char *
tessel_exit_status_describe (int status)
{
  int value;

  switch (tessel_exit_status_decode (status, &value)) {
  case TESSEL_EXIT_STATUS_EXITED:
    return g_strdup_printf (_("The child process exited normally with status %d."), value);
  case TESSEL_EXIT_STATUS_SIGNALED:
    return g_strdup_printf (_("The child process was aborted by signal %d."), value);
  case TESSEL_EXIT_STATUS_ABORTED:
  default:
    return g_strdup (_("The child process was aborted."));
  }
}
