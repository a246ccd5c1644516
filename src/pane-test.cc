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

#include "tessel-defines.hh"
#include "tessel-pane.hh"
#include "tessel-schemas.hh"
#include "tessel-test-emulator.hh"

typedef struct {
  TesselContext *context;
  TesselTestEmulator *emulator;
  TesselPane *pane;
  GSettings *profile;
  GString *log;
} Fixture;

static void
flush (void)
{
  while (g_main_context_iteration (nullptr, FALSE));
}

static void
fixture_setup (Fixture *fixture,
               gconstpointer user_data)
{
  fixture->context = tessel_test_context_new (nullptr);
  fixture->emulator = tessel_test_emulator_new ();
  fixture->pane = tessel_pane_new (fixture->context, TESSEL_EMULATOR (fixture->emulator), nullptr);
  fixture->profile = tessel_pane_get_profile (fixture->pane);
  fixture->log = g_string_new (nullptr);

  tessel_test_emulator_clear_calls (fixture->emulator);
}

static void
fixture_teardown (Fixture *fixture,
                  gconstpointer user_data)
{
  g_clear_object (&fixture->pane);
  g_clear_object (&fixture->emulator);
  g_clear_object (&fixture->context);
  g_string_free (fixture->log, TRUE);
}

static void
log_close_request_cb (TesselPane *pane,
                      Fixture *fixture)
{
  g_string_append (fixture->log, "close;");
}

static void
log_exit_held_cb (TesselPane *pane,
                  const char *message,
                  Fixture *fixture)
{
  g_string_append_printf (fixture->log, "held:%s;", message);
}

static void
log_unsafe_paste_cb (TesselPane *pane,
                     const char *text,
                     Fixture *fixture)
{
  g_string_append_printf (fixture->log, "unsafe:%s;", text);
}

static void
log_notification_cb (TesselPane *pane,
                     const char *summary,
                     const char *body,
                     Fixture *fixture)
{
  g_string_append_printf (fixture->log, "notify:%s:%s;", summary, body);
}

static void
log_detach_request_cb (TesselPane *pane,
                       double x,
                       double y,
                       Fixture *fixture)
{
  g_string_append_printf (fixture->log, "detach:%.0f,%.0f;", x, y);
}

static gboolean
veto_detach_cb (TesselPane *pane,
                Fixture *fixture)
{
  g_string_append (fixture->log, "veto;");
  return TRUE;
}

static void
log_move_request_cb (TesselPane *pane,
                     const char *source_uuid,
                     int quadrant,
                     Fixture *fixture)
{
  g_string_append_printf (fixture->log, "move:%s:%d;", source_uuid, quadrant);
}

static void
log_key_press_sync_cb (TesselPane *pane,
                       guint keyval,
                       guint state,
                       Fixture *fixture)
{
  g_string_append_printf (fixture->log, "key:%u:%u;", keyval, state);
}

static void
log_split_request_cb (TesselPane *pane,
                      int orientation,
                      Fixture *fixture)
{
  g_string_append_printf (fixture->log, "split:%d;", orientation);
}

static void
count_notify_cb (GObject *object,
                 GParamSpec *pspec,
                 guint *n)
{
  (*n)++;
}

/* Title */

static void
test_pane_title (Fixture *fixture,
                 gconstpointer user_data)
{
  TesselPane *pane = fixture->pane;
  guint n_notify = 0;

  g_signal_connect (pane, "notify::title", G_CALLBACK (count_notify_cb), &n_notify);

  /* No title from the terminal yet */
  g_assert_cmpstr (tessel_pane_get_title (pane), ==, "Terminal");
  g_assert_false (tessel_pane_get_initialized (pane));

  tessel_test_emulator_set_window_title (fixture->emulator, "vim");
  g_assert_true (tessel_pane_get_initialized (pane));
  g_assert_cmpstr (tessel_pane_get_title (pane), ==, "vim");
  g_assert_cmpuint (n_notify, ==, 1);

  g_settings_set_string (fixture->profile, TESSEL_PROFILE_TERMINAL_TITLE_KEY, "${id}: ${title}");
  flush ();
  g_assert_cmpstr (tessel_pane_get_title (pane), ==, "0: vim");
  g_assert_cmpuint (n_notify, ==, 2);

  tessel_pane_set_id (pane, 3);
  g_assert_cmpstr (tessel_pane_get_title (pane), ==, "3: vim");
  g_assert_cmpuint (n_notify, ==, 3);

  /* Same id, no change */
  tessel_pane_set_id (pane, 3);
  g_assert_cmpuint (n_notify, ==, 3);

  tessel_pane_set_override_title (pane, "[${title}]");
  g_assert_cmpstr (tessel_pane_get_title (pane), ==, "[vim]");

  tessel_pane_set_override_title (pane, "");
  g_assert_null (tessel_pane_get_override_title (pane));
  g_assert_cmpstr (tessel_pane_get_title (pane), ==, "3: vim");

  tessel_test_emulator_set_window_title (fixture->emulator, "");
  g_assert_cmpstr (tessel_pane_get_title (pane), ==, "3: Terminal");
}

static void
test_pane_title_directory (Fixture *fixture,
                           gconstpointer user_data)
{
  TesselPane *pane = fixture->pane;

  g_settings_set_string (fixture->profile, TESSEL_PROFILE_TERMINAL_TITLE_KEY, "${directory}");
  flush ();

  /* Not spawned yet */
  tessel_test_emulator_set_current_directory_uri (fixture->emulator, "file:///tmp");
  g_assert_cmpstr (tessel_pane_get_title (pane), ==, "");

  tessel_pane_spawn (pane, "/tmp");
  tessel_test_emulator_set_current_directory_uri (fixture->emulator, "file:///var/tmp");
  g_assert_cmpstr (tessel_pane_get_title (pane), ==, "/var/tmp");

  g_autofree char *directory = tessel_pane_dup_current_directory (pane);
  g_assert_cmpstr (directory, ==, "/var/tmp");
}

/* Process lifecycle */

static void
test_pane_spawn (Fixture *fixture,
                 gconstpointer user_data)
{
  TesselTestEmulator *emulator = fixture->emulator;

  g_setenv ("COLUMNS", "132", TRUE);

  tessel_pane_spawn (fixture->pane, "/tmp");

  g_assert_cmpuint (emulator->n_spawns, ==, 1);
  g_assert_cmpstr (emulator->spawn_working_directory, ==, "/tmp");
  g_assert_cmpint (tessel_pane_get_child_pid (fixture->pane), ==, 1000);
  g_assert_cmpuint (emulator->n_grab_focus, ==, 1);

  /* Default size is applied on the first spawn */
  g_assert_cmpint (emulator->columns, ==, 80);
  g_assert_cmpint (emulator->rows, ==, 24);

  g_assert_cmpstr (g_environ_getenv (emulator->spawn_envv, TESSEL_ENV_TERMINAL_ID),
                   ==, tessel_pane_get_uuid (fixture->pane));
  g_assert_null (g_environ_getenv (emulator->spawn_envv, "COLUMNS"));

  /* The shell, with argv0 set to its name */
  g_assert_true (emulator->spawn_flags & G_SPAWN_FILE_AND_ARGV_ZERO);
  g_assert_cmpuint (g_strv_length (emulator->spawn_argv), ==, 2);
  g_autofree char *basename = g_path_get_basename (emulator->spawn_argv[0]);
  g_assert_cmpstr (emulator->spawn_argv[1], ==, basename);

  g_unsetenv ("COLUMNS");
}

static void
test_pane_spawn_superseded (Fixture *fixture,
                            gconstpointer user_data)
{
  TesselTestEmulator *emulator = fixture->emulator;

  emulator->defer_spawns = TRUE;

  tessel_pane_spawn (fixture->pane, "/tmp");
  tessel_pane_relaunch (fixture->pane);
  g_assert_cmpuint (emulator->pending_spawns->len, ==, 2);

  /* The first spawn finishes although the relaunch cancelled it */
  tessel_test_emulator_complete_spawn (emulator, 0);
  g_assert_cmpint (tessel_pane_get_child_pid (fixture->pane), ==, -1);
  g_assert_cmpuint (emulator->n_grab_focus, ==, 0);

  GPid pid = tessel_test_emulator_complete_spawn (emulator, 1);
  g_assert_cmpint (tessel_pane_get_child_pid (fixture->pane), ==, pid);
  g_assert_cmpuint (emulator->n_grab_focus, ==, 1);
}

static void
test_pane_spawn_login_shell (Fixture *fixture,
                             gconstpointer user_data)
{
  TesselTestEmulator *emulator = fixture->emulator;

  g_settings_set_boolean (fixture->profile, TESSEL_PROFILE_LOGIN_SHELL_KEY, TRUE);
  tessel_pane_spawn (fixture->pane, nullptr);

  g_autofree char *basename = g_path_get_basename (emulator->spawn_argv[0]);
  g_autofree char *login_name = g_strconcat ("-", basename, nullptr);
  g_assert_cmpstr (emulator->spawn_argv[1], ==, login_name);
}

static void
test_pane_spawn_custom_command (Fixture *fixture,
                                gconstpointer user_data)
{
  TesselTestEmulator *emulator = fixture->emulator;
  const char *expected[] = { "htop", "-d", "10", nullptr };

  g_settings_set_boolean (fixture->profile, TESSEL_PROFILE_USE_CUSTOM_COMMAND_KEY, TRUE);
  g_settings_set_string (fixture->profile, TESSEL_PROFILE_CUSTOM_COMMAND_KEY, "htop -d '10'");
  tessel_pane_spawn (fixture->pane, "/tmp");

  g_assert_cmpstrv (emulator->spawn_argv, expected);
  g_assert_true (emulator->spawn_flags & G_SPAWN_SEARCH_PATH);
  g_assert_false (emulator->spawn_flags & G_SPAWN_FILE_AND_ARGV_ZERO);
}

static void
test_pane_spawn_bad_command (Fixture *fixture,
                             gconstpointer user_data)
{
  g_settings_set_boolean (fixture->profile, TESSEL_PROFILE_USE_CUSTOM_COMMAND_KEY, TRUE);
  g_settings_set_string (fixture->profile, TESSEL_PROFILE_CUSTOM_COMMAND_KEY, "echo 'unterminated");

  g_test_expect_message (G_LOG_DOMAIN, G_LOG_LEVEL_WARNING, "Unexpected error occurred*");
  tessel_pane_spawn (fixture->pane, nullptr);
  g_test_assert_expected_messages ();

  g_assert_cmpuint (fixture->emulator->n_spawns, ==, 0);
  g_assert_true (g_str_has_prefix (fixture->emulator->fed->str, "Unexpected error occurred"));
}

static void
test_pane_spawn_failure (Fixture *fixture,
                         gconstpointer user_data)
{
  fixture->emulator->spawn_error = g_error_new_literal (G_IO_ERROR, G_IO_ERROR_NOT_FOUND,
                                                        "No such file");

  g_test_expect_message (G_LOG_DOMAIN, G_LOG_LEVEL_WARNING, "Unexpected error occurred: No such file");
  tessel_pane_spawn (fixture->pane, nullptr);
  g_test_assert_expected_messages ();

  g_assert_cmpstr (fixture->emulator->fed->str, ==, "Unexpected error occurred: No such file");
  g_assert_cmpint (tessel_pane_get_child_pid (fixture->pane), ==, -1);
  g_assert_cmpuint (fixture->emulator->n_grab_focus, ==, 0);
}

static void
test_pane_exit_restart (Fixture *fixture,
                        gconstpointer user_data)
{
  TesselTestEmulator *emulator = fixture->emulator;

  g_signal_connect (fixture->pane, "close-request", G_CALLBACK (log_close_request_cb), fixture);
  g_signal_connect (fixture->pane, "exit-held", G_CALLBACK (log_exit_held_cb), fixture);

  g_settings_set_enum (fixture->profile, TESSEL_PROFILE_EXIT_ACTION_KEY, TESSEL_EXIT_RESTART);
  tessel_pane_spawn (fixture->pane, "/srv");

  tessel_test_emulator_child_exited (emulator, 0);

  g_assert_cmpuint (emulator->n_spawns, ==, 2);
  g_assert_cmpstr (emulator->spawn_working_directory, ==, "/srv");
  g_assert_cmpint (tessel_pane_get_child_pid (fixture->pane), ==, 1001);
  g_assert_cmpuint (tessel_test_emulator_count_calls (emulator, "set_size"), ==, 1);
  g_assert_cmpstr (fixture->log->str, ==, "");
}

static void
test_pane_exit_close (Fixture *fixture,
                      gconstpointer user_data)
{
  g_signal_connect (fixture->pane, "close-request", G_CALLBACK (log_close_request_cb), fixture);
  g_signal_connect (fixture->pane, "exit-held", G_CALLBACK (log_exit_held_cb), fixture);

  /* No child yet */
  tessel_test_emulator_child_exited (fixture->emulator, 0);
  g_assert_cmpstr (fixture->log->str, ==, "");

  tessel_pane_spawn (fixture->pane, nullptr);
  tessel_test_emulator_child_exited (fixture->emulator, 0);
  g_assert_cmpstr (fixture->log->str, ==, "close;");
  g_assert_cmpint (tessel_pane_get_child_pid (fixture->pane), ==, -1);

  /* Only once */
  tessel_test_emulator_child_exited (fixture->emulator, 0);
  g_assert_cmpstr (fixture->log->str, ==, "close;");
  g_assert_cmpuint (fixture->emulator->n_spawns, ==, 1);
}

static void
test_pane_exit_hold (Fixture *fixture,
                     gconstpointer user_data)
{
  g_signal_connect (fixture->pane, "close-request", G_CALLBACK (log_close_request_cb), fixture);
  g_signal_connect (fixture->pane, "exit-held", G_CALLBACK (log_exit_held_cb), fixture);

  g_settings_set_enum (fixture->profile, TESSEL_PROFILE_EXIT_ACTION_KEY, TESSEL_EXIT_HOLD);
  tessel_pane_spawn (fixture->pane, "/srv");
  tessel_test_emulator_child_exited (fixture->emulator, 7 << 8);

  g_assert_cmpstr (fixture->log->str, ==, "held:The child process exited normally with status 7.;");
  g_assert_cmpuint (fixture->emulator->n_spawns, ==, 1);

  /* Relaunch from the info bar */
  tessel_pane_relaunch (fixture->pane);
  g_assert_cmpuint (fixture->emulator->n_spawns, ==, 2);
  g_assert_cmpstr (fixture->emulator->spawn_working_directory, ==, "/srv");
  g_assert_cmpint (tessel_pane_get_child_pid (fixture->pane), ==, 1001);
}

static void
test_pane_exit_none (Fixture *fixture,
                     gconstpointer user_data)
{
  g_signal_connect (fixture->pane, "close-request", G_CALLBACK (log_close_request_cb), fixture);
  g_signal_connect (fixture->pane, "exit-held", G_CALLBACK (log_exit_held_cb), fixture);

  g_settings_set_enum (fixture->profile, TESSEL_PROFILE_EXIT_ACTION_KEY, TESSEL_EXIT_NONE);
  tessel_pane_spawn (fixture->pane, nullptr);
  tessel_test_emulator_child_exited (fixture->emulator, 0);

  g_assert_cmpstr (fixture->log->str, ==, "");
  g_assert_cmpuint (fixture->emulator->n_spawns, ==, 1);
  g_assert_cmpint (tessel_pane_get_child_pid (fixture->pane), ==, -1);
}

static void
test_pane_process_running (Fixture *fixture,
                           gconstpointer user_data)
{
  g_assert_false (tessel_pane_is_process_running (fixture->pane));

  tessel_pane_spawn (fixture->pane, nullptr);
  g_assert_false (tessel_pane_is_process_running (fixture->pane));

  fixture->emulator->foreground_pgid = 4242;
  g_assert_true (tessel_pane_is_process_running (fixture->pane));

  fixture->emulator->foreground_pgid = tessel_pane_get_child_pid (fixture->pane);
  g_assert_false (tessel_pane_is_process_running (fixture->pane));
}

static void
test_pane_overrides (void)
{
  g_autoptr(TesselContext) context =
    tessel_test_context_new (tessel_overrides_new ("/var/tmp", "top -b", "Default"));
  g_autoptr(TesselTestEmulator) emulator_a = tessel_test_emulator_new ();
  g_autoptr(TesselTestEmulator) emulator_b = tessel_test_emulator_new ();
  g_autoptr(TesselPane) a = tessel_pane_new (context, TESSEL_EMULATOR (emulator_a), nullptr);
  g_autoptr(TesselPane) b = tessel_pane_new (context, TESSEL_EMULATOR (emulator_b), nullptr);
  const char *expected[] = { "top", "-b", nullptr };

  tessel_pane_spawn (a, "/home");
  g_assert_cmpstr (emulator_a->spawn_working_directory, ==, "/var/tmp");
  g_assert_cmpstrv (emulator_a->spawn_argv, expected);

  /* Consumed by the first pane */
  tessel_pane_spawn (b, "/home");
  g_assert_cmpstr (emulator_b->spawn_working_directory, ==, "/home");
  g_assert_true (emulator_b->spawn_flags & G_SPAWN_FILE_AND_ARGV_ZERO);

  /* A relaunch keeps the directory and runs the shell */
  tessel_pane_relaunch (a);
  g_assert_cmpstr (emulator_a->spawn_working_directory, ==, "/var/tmp");
  g_assert_true (emulator_a->spawn_flags & G_SPAWN_FILE_AND_ARGV_ZERO);
}

static void
test_pane_unknown_profile (Fixture *fixture,
                           gconstpointer user_data)
{
  g_autofree char *before = g_strdup (tessel_pane_get_profile_uuid (fixture->pane));

  g_test_expect_message (G_LOG_DOMAIN, G_LOG_LEVEL_WARNING, "Failed to set profile*");
  tessel_pane_set_profile_uuid (fixture->pane, "6e1f3a2b-1c4d-4e5f-8a9b-0c1d2e3f4a5b");
  g_test_assert_expected_messages ();

  g_assert_cmpstr (tessel_pane_get_profile_uuid (fixture->pane), ==, before);
  g_assert_nonnull (tessel_pane_get_profile (fixture->pane));
  g_assert_cmpuint (fixture->emulator->calls->len, ==, 0);
}

/* Clipboard */

static void
test_pane_paste (Fixture *fixture,
                 gconstpointer user_data)
{
  TesselTestEmulator *emulator = fixture->emulator;

  g_signal_connect (fixture->pane, "unsafe-paste-requested", G_CALLBACK (log_unsafe_paste_cb), fixture);

  tessel_pane_paste_text (fixture->pane, "ls -l");
  g_assert_cmpstr (emulator->pasted->str, ==, "ls -l");

  tessel_pane_paste_text (fixture->pane, "sudo reboot");
  g_assert_cmpstr (fixture->log->str, ==, "unsafe:sudo reboot;");
  g_assert_cmpstr (emulator->pasted->str, ==, "ls -l");

  tessel_pane_confirm_unsafe_paste (fixture->pane, "sudo reboot", FALSE);
  g_assert_cmpstr (emulator->pasted->str, ==, "ls -l");

  tessel_pane_paste_text (fixture->pane, "sudo reboot");
  tessel_pane_confirm_unsafe_paste (fixture->pane, "sudo reboot", TRUE);
  g_assert_cmpstr (emulator->pasted->str, ==, "ls -lsudo reboot");

  /* Confirmed once, no more prompts */
  g_string_truncate (fixture->log, 0);
  tessel_pane_paste_text (fixture->pane, "sudo halt");
  g_assert_cmpstr (fixture->log->str, ==, "");
  g_assert_true (g_str_has_suffix (emulator->pasted->str, "sudo halt"));
}

static void
test_pane_paste_alert_disabled (Fixture *fixture,
                                gconstpointer user_data)
{
  GSettings *settings = tessel_context_get_global_settings (fixture->context);

  g_signal_connect (fixture->pane, "unsafe-paste-requested", G_CALLBACK (log_unsafe_paste_cb), fixture);

  g_settings_set_boolean (settings, TESSEL_SETTING_UNSAFE_PASTE_ALERT_KEY, FALSE);
  tessel_pane_paste_text (fixture->pane, "sudo reboot");

  g_assert_cmpstr (fixture->log->str, ==, "");
  g_assert_cmpstr (fixture->emulator->pasted->str, ==, "sudo reboot");
}

static void
test_pane_paste_strip (Fixture *fixture,
                       gconstpointer user_data)
{
  GSettings *settings = tessel_context_get_global_settings (fixture->context);
  TesselTestEmulator *emulator = fixture->emulator;

  tessel_pane_paste_text (fixture->pane, "$ make");
  g_assert_cmpstr (emulator->pasted->str, ==, "$ make");

  g_settings_set_boolean (settings, TESSEL_SETTING_STRIP_FIRST_COMMENT_CHAR_KEY, TRUE);

  tessel_pane_paste_text (fixture->pane, "$ make");
  g_assert_cmpstr (emulator->fed_child->str, ==, " make");

  tessel_pane_paste_text (fixture->pane, "## comment");
  g_assert_cmpstr (emulator->fed_child->str, ==, " make# comment");

  tessel_pane_paste_text (fixture->pane, "make");
  g_assert_cmpstr (emulator->pasted->str, ==, "$ makemake");
}

static void
test_pane_read_only (Fixture *fixture,
                     gconstpointer user_data)
{
  TesselTestEmulator *emulator = fixture->emulator;

  tessel_pane_set_read_only (fixture->pane, TRUE);
  g_assert_false (emulator->input_enabled);

  tessel_pane_paste_text (fixture->pane, "ls");
  tessel_pane_echo_key_press (fixture->pane, GDK_KEY_a, 0);
  g_assert_cmpstr (emulator->pasted->str, ==, "");
  g_assert_cmpstr (emulator->fed_child->str, ==, "");

  tessel_pane_set_read_only (fixture->pane, FALSE);
  g_assert_true (emulator->input_enabled);

  tessel_pane_paste_text (fixture->pane, "ls");
  g_assert_cmpstr (emulator->pasted->str, ==, "ls");
}

static void
test_pane_feed_dropped_text (Fixture *fixture,
                             gconstpointer user_data)
{
  GSettings *settings = tessel_context_get_global_settings (fixture->context);
  TesselTestEmulator *emulator = fixture->emulator;

  g_signal_connect (fixture->pane, "unsafe-paste-requested", G_CALLBACK (log_unsafe_paste_cb), fixture);
  g_settings_set_boolean (settings, TESSEL_SETTING_STRIP_FIRST_COMMENT_CHAR_KEY, TRUE);

  tessel_pane_feed_dropped_text (fixture->pane, "'/etc/sudoers.d/x' ");
  tessel_pane_feed_dropped_text (fixture->pane, "'#notes.txt' ");
  tessel_pane_feed_dropped_text (fixture->pane, "x sudo y");

  g_assert_cmpstr (fixture->log->str, ==, "");
  g_assert_cmpstr (emulator->pasted->str, ==, "");
  g_assert_cmpstr (emulator->fed_child->str, ==, "'/etc/sudoers.d/x' '#notes.txt' x sudo y");

  tessel_pane_set_read_only (fixture->pane, TRUE);
  tessel_pane_feed_dropped_text (fixture->pane, "ignored");
  g_assert_cmpstr (emulator->fed_child->str, ==, "'/etc/sudoers.d/x' '#notes.txt' x sudo y");
}

/* Focus and input */

static void
focus_first_cb (TesselPane *pane,
                Fixture *fixture)
{
  g_string_append (fixture->log, "first;");
}

static void
focus_second_cb (TesselPane *pane,
                 Fixture *fixture)
{
  g_string_append (fixture->log, "second;");
}

static void
focus_third_cb (TesselPane *pane,
                Fixture *fixture)
{
  g_string_append (fixture->log, "third;");
}

static void
test_pane_focus_listeners (Fixture *fixture,
                           gconstpointer user_data)
{
  g_signal_connect (fixture->pane, "focus-in", G_CALLBACK (focus_first_cb), fixture);
  gulong second_id = g_signal_connect (fixture->pane, "focus-in", G_CALLBACK (focus_second_cb), fixture);
  g_signal_connect (fixture->pane, "focus-in", G_CALLBACK (focus_third_cb), fixture);

  tessel_pane_focus_in (fixture->pane);
  g_assert_cmpstr (fixture->log->str, ==, "first;second;third;");
  g_assert_true (tessel_pane_get_focused (fixture->pane));

  g_signal_handler_disconnect (fixture->pane, second_id);
  g_string_truncate (fixture->log, 0);

  tessel_pane_focus_in (fixture->pane);
  g_assert_cmpstr (fixture->log->str, ==, "first;third;");

  tessel_pane_focus_out (fixture->pane);
  g_assert_false (tessel_pane_get_focused (fixture->pane));
}

static void
test_pane_key_sync (Fixture *fixture,
                    gconstpointer user_data)
{
  TesselPane *pane = fixture->pane;

  g_signal_connect (pane, "key-press-sync", G_CALLBACK (log_key_press_sync_cb), fixture);

  g_assert_false (tessel_pane_key_pressed (pane, GDK_KEY_a, 0, FALSE));
  g_assert_cmpstr (fixture->log->str, ==, "");

  tessel_pane_set_synchronize_input (pane, TRUE);
  g_assert_true (tessel_pane_key_pressed (pane, GDK_KEY_a, 0, FALSE));
  g_assert_false (tessel_pane_key_pressed (pane, GDK_KEY_b, 0, TRUE));

  g_autofree char *expected = g_strdup_printf ("key:%u:0;", GDK_KEY_a);
  g_assert_cmpstr (fixture->log->str, ==, expected);

  tessel_pane_echo_key_press (pane, GDK_KEY_a, 0);
  tessel_pane_echo_key_press (pane, GDK_KEY_c, GDK_CONTROL_MASK);
  tessel_pane_echo_key_press (pane, GDK_KEY_Return, 0);
  tessel_pane_echo_key_press (pane, GDK_KEY_Up, 0);
  tessel_pane_echo_key_press (pane, GDK_KEY_x, GDK_ALT_MASK);
  g_assert_cmpstr (fixture->emulator->fed_child->str, ==, "a\x03\r\x1b[A\x1bx");

  /* Ctrl+Space and Ctrl+@ both send NUL */
  g_string_truncate (fixture->emulator->fed_child, 0);
  tessel_pane_echo_key_press (pane, GDK_KEY_space, GDK_CONTROL_MASK);
  tessel_pane_echo_key_press (pane, GDK_KEY_at, GDK_CONTROL_MASK);
  tessel_pane_echo_key_press (pane, GDK_KEY_bracketleft, GDK_CONTROL_MASK);
  g_assert_cmpmem (fixture->emulator->fed_child->str, fixture->emulator->fed_child->len,
                   "\0\0\x1b", 3);
}

static void
test_pane_process_notification (Fixture *fixture,
                                gconstpointer user_data)
{
  TesselTestEmulator *emulator = fixture->emulator;

  g_signal_connect (fixture->pane, "process-notification", G_CALLBACK (log_notification_cb), fixture);

  /* Nothing until the terminal has started */
  tessel_test_emulator_notify (emulator, "make", "done");
  g_assert_cmpstr (fixture->log->str, ==, "");

  tessel_test_emulator_set_window_title (emulator, "bash");

  tessel_pane_focus_in (fixture->pane);
  tessel_test_emulator_notify (emulator, "make", "done");
  g_assert_cmpstr (fixture->log->str, ==, "");

  tessel_pane_focus_out (fixture->pane);
  tessel_test_emulator_notify (emulator, "make", "done");
  g_assert_cmpstr (fixture->log->str, ==, "notify:make:done;");
}

/* Requests */

static void
test_pane_split_request (Fixture *fixture,
                         gconstpointer user_data)
{
  g_signal_connect (fixture->pane, "split-request", G_CALLBACK (log_split_request_cb), fixture);
  g_signal_connect (fixture->pane, "close-request", G_CALLBACK (log_close_request_cb), fixture);

  tessel_pane_request_split (fixture->pane, TESSEL_ORIENTATION_VERTICAL);
  tessel_pane_request_close (fixture->pane);

  g_autofree char *expected = g_strdup_printf ("split:%d;close;", TESSEL_ORIENTATION_VERTICAL);
  g_assert_cmpstr (fixture->log->str, ==, expected);
}

static void
test_pane_detach (Fixture *fixture,
                  gconstpointer user_data)
{
  TesselPane *pane = fixture->pane;

  g_signal_connect (pane, "detach-request", G_CALLBACK (log_detach_request_cb), fixture);

  g_assert_true (tessel_pane_request_detach (pane, 10, 20));
  g_assert_cmpstr (fixture->log->str, ==, "detach:10,20;");

  g_string_truncate (fixture->log, 0);
  gulong veto_id = g_signal_connect (pane, "detach-veto", G_CALLBACK (veto_detach_cb), fixture);

  g_assert_false (tessel_pane_request_detach (pane, 10, 20));
  g_assert_cmpstr (fixture->log->str, ==, "veto;");

  g_signal_handler_disconnect (pane, veto_id);
  g_string_truncate (fixture->log, 0);

  /* A drag that ended on a target does not detach */
  tessel_pane_drag_end (pane, TRUE, 5, 6);
  g_assert_cmpstr (fixture->log->str, ==, "");

  tessel_pane_drag_end (pane, FALSE, 5, 6);
  g_assert_cmpstr (fixture->log->str, ==, "detach:5,6;");
}

static void
test_pane_drag_drop (Fixture *fixture,
                     gconstpointer user_data)
{
  g_autoptr(TesselTestEmulator) other_emulator = tessel_test_emulator_new ();
  g_autoptr(TesselPane) other = tessel_pane_new (fixture->context, TESSEL_EMULATOR (other_emulator), nullptr);
  TesselPane *pane = fixture->pane;

  g_signal_connect (pane, "move-request", G_CALLBACK (log_move_request_cb), fixture);

  g_assert_cmpint (tessel_pane_drag_motion (pane, 50, 10, 100, 100), ==, TESSEL_DRAG_QUADRANT_TOP);
  g_assert_true (tessel_pane_get_drag_active (pane));
  g_assert_cmpint (tessel_pane_get_drag_quadrant (pane), ==, TESSEL_DRAG_QUADRANT_TOP);

  tessel_pane_drag_leave (pane);
  g_assert_false (tessel_pane_get_drag_active (pane));

  /* Dropping a pane on itself */
  tessel_pane_drag_motion (pane, 90, 50, 100, 100);
  g_assert_false (tessel_pane_drag_drop (pane, tessel_pane_get_uuid (pane), 90, 50, 100, 100));
  g_assert_false (tessel_pane_get_drag_active (pane));
  g_assert_cmpstr (fixture->log->str, ==, "");

  /* Unknown pane */
  g_assert_false (tessel_pane_drag_drop (pane, "6e1f3a2b-1c4d-4e5f-8a9b-0c1d2e3f4a5b", 90, 50, 100, 100));
  g_assert_cmpstr (fixture->log->str, ==, "");

  g_assert_true (tessel_pane_drag_drop (pane, tessel_pane_get_uuid (other), 90, 50, 100, 100));
  g_autofree char *expected = g_strdup_printf ("move:%s:%d;",
                                               tessel_pane_get_uuid (other),
                                               TESSEL_DRAG_QUADRANT_RIGHT);
  g_assert_cmpstr (fixture->log->str, ==, expected);
}

int
main (int argc,
      char *argv[])
{
  g_test_init (&argc, &argv, nullptr);

#define ADD_TEST(path, func) \
  g_test_add ("/tessel/pane/" path, Fixture, nullptr, fixture_setup, func, fixture_teardown)

  ADD_TEST ("title", test_pane_title);
  ADD_TEST ("title-directory", test_pane_title_directory);
  ADD_TEST ("spawn", test_pane_spawn);
  ADD_TEST ("spawn-superseded", test_pane_spawn_superseded);
  ADD_TEST ("spawn-login-shell", test_pane_spawn_login_shell);
  ADD_TEST ("spawn-custom-command", test_pane_spawn_custom_command);
  ADD_TEST ("spawn-bad-command", test_pane_spawn_bad_command);
  ADD_TEST ("spawn-failure", test_pane_spawn_failure);
  ADD_TEST ("exit-restart", test_pane_exit_restart);
  ADD_TEST ("exit-close", test_pane_exit_close);
  ADD_TEST ("exit-hold", test_pane_exit_hold);
  ADD_TEST ("exit-none", test_pane_exit_none);
  ADD_TEST ("process-running", test_pane_process_running);
  ADD_TEST ("unknown-profile", test_pane_unknown_profile);
  ADD_TEST ("paste", test_pane_paste);
  ADD_TEST ("paste-alert-disabled", test_pane_paste_alert_disabled);
  ADD_TEST ("paste-strip", test_pane_paste_strip);
  ADD_TEST ("read-only", test_pane_read_only);
  ADD_TEST ("feed-dropped-text", test_pane_feed_dropped_text);
  ADD_TEST ("focus-listeners", test_pane_focus_listeners);
  ADD_TEST ("key-sync", test_pane_key_sync);
  ADD_TEST ("process-notification", test_pane_process_notification);
  ADD_TEST ("split-request", test_pane_split_request);
  ADD_TEST ("detach", test_pane_detach);
  ADD_TEST ("drag-drop", test_pane_drag_drop);

#undef ADD_TEST

  g_test_add_func ("/tessel/pane/overrides", test_pane_overrides);

  return g_test_run ();
}
