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

#include "tessel-paste.hh"

#include <string.h>

/**
 * tessel_paste_is_unsafe:
 * @text: the text about to be pasted
 *
 * Pasted text is considered unsafe when it runs a command with
 * administrative privileges. Text that begins with a newline is
 * never flagged.
 *
 * Returns: %TRUE if pasting @text should be confirmed
 */
gboolean
tessel_paste_is_unsafe (const char *text)
{
  if (text == nullptr || text[0] == '\n')
    return FALSE;

  return strstr (text, "sudo") != nullptr;
}

TesselPasteAction
tessel_paste_guard_decide (const char *text,
                           gboolean warning_ignored,
                           gboolean alert_enabled)
{
  if (!tessel_paste_is_unsafe (text))
    return TESSEL_PASTE_ACTION_PASTE;

  if (warning_ignored || !alert_enabled)
    return TESSEL_PASTE_ACTION_PASTE;

  return TESSEL_PASTE_ACTION_PROMPT;
}

/**
 * tessel_paste_strip_comment_char:
 * @text: the text about to be pasted
 * @strip: whether stripping is enabled
 *
 * Returns: (transfer none): @text without a single leading '#' or '$'
 *   if @strip is set, @text otherwise
 */
const char *
tessel_paste_strip_comment_char (const char *text,
                                 gboolean strip)
{
  g_return_val_if_fail (text != nullptr, nullptr);

  if (strip && (text[0] == '#' || text[0] == '$'))
    return text + 1;

  return text;
}
