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

#ifndef TESSEL_SCHEMAS_H
#define TESSEL_SCHEMAS_H

#include <glib.h>

G_BEGIN_DECLS

#define TESSEL_PROFILE_SCHEMA           "com.github.Tessel.Profile"
#define TESSEL_SETTING_SCHEMA           "com.github.Tessel.Settings"
#define TESSEL_PROFILES_LIST_SCHEMA     "com.github.Tessel.ProfilesList"

#define TESSEL_PROFILES_PATH_PREFIX     "/com/github/tessel/profiles/"

#define TESSEL_PROFILE_AUDIBLE_BELL_KEY               "audible-bell"
#define TESSEL_PROFILE_BACKGROUND_COLOR_KEY           "background-color"
#define TESSEL_PROFILE_BACKGROUND_TRANSPARENCY_KEY    "background-transparency-percent"
#define TESSEL_PROFILE_BACKSPACE_BINDING_KEY          "backspace-binding"
#define TESSEL_PROFILE_BOLD_IS_BRIGHT_KEY             "bold-is-bright"
#define TESSEL_PROFILE_CJK_UTF8_AMBIGUOUS_WIDTH_KEY   "cjk-utf8-ambiguous-width"
#define TESSEL_PROFILE_CURSOR_BLINK_MODE_KEY          "cursor-blink-mode"
#define TESSEL_PROFILE_CURSOR_SHAPE_KEY               "cursor-shape"
#define TESSEL_PROFILE_CUSTOM_COMMAND_KEY             "custom-command"
#define TESSEL_PROFILE_DEFAULT_SIZE_COLUMNS_KEY       "default-size-columns"
#define TESSEL_PROFILE_DEFAULT_SIZE_ROWS_KEY          "default-size-rows"
#define TESSEL_PROFILE_DELETE_BINDING_KEY             "delete-binding"
#define TESSEL_PROFILE_ENCODING_KEY                   "encoding"
#define TESSEL_PROFILE_EXIT_ACTION_KEY                "exit-action"
#define TESSEL_PROFILE_FONT_KEY                       "font"
#define TESSEL_PROFILE_FOREGROUND_COLOR_KEY           "foreground-color"
#define TESSEL_PROFILE_LOGIN_SHELL_KEY                "login-shell"
#define TESSEL_PROFILE_PALETTE_KEY                    "palette"
#define TESSEL_PROFILE_REWRAP_ON_RESIZE_KEY           "rewrap-on-resize"
#define TESSEL_PROFILE_SCROLLBACK_LINES_KEY           "scrollback-lines"
#define TESSEL_PROFILE_SCROLLBACK_UNLIMITED_KEY       "scrollback-unlimited"
#define TESSEL_PROFILE_SCROLL_ON_KEYSTROKE_KEY        "scroll-on-keystroke"
#define TESSEL_PROFILE_SCROLL_ON_OUTPUT_KEY           "scroll-on-output"
#define TESSEL_PROFILE_SHOW_SCROLLBAR_KEY             "show-scrollbar"
#define TESSEL_PROFILE_TERMINAL_TITLE_KEY             "terminal-title"
#define TESSEL_PROFILE_USE_CUSTOM_COMMAND_KEY         "use-custom-command"
#define TESSEL_PROFILE_USE_SYSTEM_FONT_KEY            "use-system-font"
#define TESSEL_PROFILE_USE_THEME_COLORS_KEY           "use-theme-colors"
#define TESSEL_PROFILE_VISIBLE_NAME_KEY               "visible-name"

#define TESSEL_SETTING_CONFIRM_CLOSE_KEY              "confirm-close"
#define TESSEL_SETTING_ENCODINGS_KEY                  "encodings"
#define TESSEL_SETTING_FOCUS_FOLLOWS_MOUSE_KEY        "focus-follows-mouse"
#define TESSEL_SETTING_STRIP_FIRST_COMMENT_CHAR_KEY   "strip-first-comment-char"
#define TESSEL_SETTING_UNSAFE_PASTE_ALERT_KEY         "unsafe-paste-alert"

#define TESSEL_PROFILES_LIST_DEFAULT_KEY              "default"
#define TESSEL_PROFILES_LIST_LIST_KEY                 "list"

#define DESKTOP_INTERFACE_SETTINGS_SCHEMA             "org.gnome.desktop.interface"
#define MONOSPACE_FONT_KEY_NAME                       "monospace-font-name"

G_END_DECLS

#endif /* TESSEL_SCHEMAS_H */
