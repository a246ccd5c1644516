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

#include <glib/gi18n.h>
#include <adwaita.h>

#include "tessel-debug.hh"
#include "tessel-defines.hh"
#include "tessel-encoding.hh"
#include "tessel-find-bar.hh"
#include "tessel-info-bar.hh"
#include "tessel-pane-view.hh"
#include "tessel-quadrant.hh"
#include "tessel-schemas.hh"
#include "tessel-util.hh"

#define TEXT_URI_LIST "text/uri-list"

#define DROP_REQUEST_PRIORITY G_PRIORITY_HIGH

#define RESPONSE_RELAUNCH (1)

struct _TesselPaneView
{
  GtkWidget parent_instance;

  TesselContext *context;
  TesselPane *pane;

  /* Only used until the pane is created */
  char *profile_uuid;

  GSettings *profile;
  gulong profile_encoding_changed_id;

  GMenu *profiles_menu;
  GMenu *encodings_menu;

  GtkWidget *box;
  GtkWidget *titlebar;
  GtkWidget *title_label;
  GtkWidget *read_only_icon;
  GtkWidget *sync_icon;
  GtkWidget *menu_button;
  GtkWidget *find_revealer;
  GtkWidget *find_bar;
  GtkWidget *overlay;
  GtkWidget *scrolled_window;
  GtkWidget *vte;
  GtkWidget *drop_highlight;
  GtkDragSource *drag_source;
  GtkDropTargetAsync *drop_target;

  GtkWidget *info_bar;

  GtkPopoverMenu *context_menu;
  char *popup_url;

  GtkWidget *close_dialog;
  GtkWidget *title_dialog;
  GtkWidget *paste_dialog;

  GdkDrag *drag;
  gboolean drag_no_target;
  gboolean drop_is_pane;
};

enum {
  PROP_0,
  PROP_CONTEXT,
  PROP_PROFILE_UUID,
  PROP_READ_ONLY,
  PROP_SYNCHRONIZE_INPUT,
  PROP_ENCODING,
  N_PROPS
};

static GParamSpec *pspecs[N_PROPS];

G_DEFINE_FINAL_TYPE (TesselPaneView, tessel_pane_view, GTK_TYPE_WIDGET)

typedef struct {
  TesselPaneView *view;
  GdkDrop *drop;
  GPtrArray *uris;
  int x;
  int y;
  int width;
  int height;
} DropState;

static void
drop_state_free (DropState *state)
{
  g_clear_object (&state->view);
  g_clear_object (&state->drop);
  g_clear_pointer (&state->uris, g_ptr_array_unref);
  g_free (state);
}

G_DEFINE_AUTOPTR_CLEANUP_FUNC (DropState, drop_state_free)

static const char *pane_mime_types[] = { TESSEL_DND_PANE_MIME_TYPE, nullptr };
static const char *uri_list_mime_types[] = { TEXT_URI_LIST, nullptr };

/* helper functions */

static GtkWindow *
tessel_pane_view_get_window (TesselPaneView *view)
{
  auto const root = gtk_widget_get_root (GTK_WIDGET (view));

  return GTK_IS_WINDOW (root) ? GTK_WINDOW (root) : nullptr;
}

static void
tessel_pane_view_update_title (TesselPaneView *view)
{
  auto const title = tessel_pane_get_title (view->pane);

  gtk_label_set_markup (GTK_LABEL (view->title_label), title ? title : "");
}

static void
tessel_pane_view_update_submenus (TesselPaneView *view)
{
  auto const profiles_list = tessel_context_get_profiles_list (view->context);
  auto const settings = tessel_context_get_global_settings (view->context);

  g_menu_remove_all (view->profiles_menu);

  g_auto(GStrv) uuids = tessel_profiles_list_dupv_children (profiles_list);
  for (guint i = 0; uuids != nullptr && uuids[i]; ++i) {
    g_autofree char *name = tessel_profiles_list_dup_visible_name (profiles_list, uuids[i]);
    g_autoptr(GMenuItem) item = g_menu_item_new (name ? name : uuids[i], nullptr);

    g_menu_item_set_action_and_target_value (item, "pane.profile",
                                             g_variant_new_string (uuids[i]));
    g_menu_append_item (view->profiles_menu, item);
  }

  g_menu_remove_all (view->encodings_menu);

  g_auto(GStrv) encodings = g_settings_get_strv (settings, TESSEL_SETTING_ENCODINGS_KEY);
  tessel_encodings_append_menu (view->encodings_menu, encodings, "pane.encoding");
}

static void
tessel_pane_view_build_menu (TesselPaneView *view)
{
  g_autoptr(GMenu) menu = g_menu_new ();

  g_autoptr(GMenu) section1 = g_menu_new ();
  g_menu_append (section1, _("Split _Right"), "pane.split-right");
  g_menu_append (section1, _("Split _Down"), "pane.split-down");
  g_menu_append_section (menu, nullptr, G_MENU_MODEL (section1));

  g_autoptr(GMenu) section2 = g_menu_new ();
  g_menu_append (section2, _("_Find…"), "pane.find");
  g_menu_append (section2, _("_Title…"), "pane.set-title");
  g_menu_append_section (menu, nullptr, G_MENU_MODEL (section2));

  g_autoptr(GMenu) section3 = g_menu_new ();
  g_menu_append (section3, _("Read-_Only"), "pane.read-only");
  g_menu_append (section3, _("_Synchronize Input"), "pane.synchronize-input");
  g_menu_append_section (menu, nullptr, G_MENU_MODEL (section3));

  g_autoptr(GMenu) section4 = g_menu_new ();
  g_menu_append_submenu (section4, _("P_rofiles"), G_MENU_MODEL (view->profiles_menu));
  g_menu_append_submenu (section4, _("_Encoding"), G_MENU_MODEL (view->encodings_menu));
  g_menu_append_section (menu, nullptr, G_MENU_MODEL (section4));

  g_autoptr(GMenu) section5 = g_menu_new ();
  g_menu_append (section5, _("_Close"), "pane.close");
  g_menu_append_section (menu, nullptr, G_MENU_MODEL (section5));

  gtk_menu_button_set_menu_model (GTK_MENU_BUTTON (view->menu_button), G_MENU_MODEL (menu));

  tessel_pane_view_update_submenus (view);
}

static void
tessel_pane_view_profile_encoding_changed_cb (GSettings *profile,
                                              const char *key,
                                              TesselPaneView *view)
{
  g_object_notify_by_pspec (G_OBJECT (view), pspecs[PROP_ENCODING]);
}

static void
tessel_pane_view_update_profile (TesselPaneView *view)
{
  auto const profile = tessel_pane_get_profile (view->pane);

  if (profile == view->profile)
    return;

  if (view->profile_encoding_changed_id != 0) {
    g_signal_handler_disconnect (view->profile, view->profile_encoding_changed_id);
    view->profile_encoding_changed_id = 0;
  }

  g_set_object (&view->profile, profile);

  if (view->profile != nullptr)
    view->profile_encoding_changed_id =
      g_signal_connect (view->profile, "changed::" TESSEL_PROFILE_ENCODING_KEY,
                        G_CALLBACK (tessel_pane_view_profile_encoding_changed_cb), view);

  g_object_notify_by_pspec (G_OBJECT (view), pspecs[PROP_ENCODING]);
}

static void
tessel_pane_view_remove_info_bar (TesselPaneView *view)
{
  if (view->info_bar == nullptr)
    return;

  gtk_overlay_remove_overlay (GTK_OVERLAY (view->overlay), view->info_bar);
  view->info_bar = nullptr;
}

/* Pane callbacks */

static void
pane_notify_title_cb (TesselPane *pane,
                      GParamSpec *pspec,
                      TesselPaneView *view)
{
  tessel_pane_view_update_title (view);
}

static void
pane_notify_focused_cb (TesselPane *pane,
                        GParamSpec *pspec,
                        TesselPaneView *view)
{
  gtk_widget_set_sensitive (view->title_label, tessel_pane_get_focused (pane));
}

static void
pane_notify_read_only_cb (TesselPane *pane,
                          GParamSpec *pspec,
                          TesselPaneView *view)
{
  gtk_widget_set_visible (view->read_only_icon, tessel_pane_get_read_only (pane));
  g_object_notify_by_pspec (G_OBJECT (view), pspecs[PROP_READ_ONLY]);
}

static void
pane_notify_synchronize_input_cb (TesselPane *pane,
                                  GParamSpec *pspec,
                                  TesselPaneView *view)
{
  gtk_widget_set_visible (view->sync_icon, tessel_pane_get_synchronize_input (pane));
  g_object_notify_by_pspec (G_OBJECT (view), pspecs[PROP_SYNCHRONIZE_INPUT]);
}

static void
pane_notify_scrollbar_visible_cb (TesselPane *pane,
                                  GParamSpec *pspec,
                                  TesselPaneView *view)
{
  gtk_scrolled_window_set_policy (GTK_SCROLLED_WINDOW (view->scrolled_window),
                                  GTK_POLICY_NEVER,
                                  tessel_pane_get_scrollbar_visible (pane) ? GTK_POLICY_AUTOMATIC
                                                                           : GTK_POLICY_NEVER);
}

static void
pane_notify_profile_uuid_cb (TesselPane *pane,
                             GParamSpec *pspec,
                             TesselPaneView *view)
{
  tessel_pane_view_update_profile (view);
  g_object_notify_by_pspec (G_OBJECT (view), pspecs[PROP_PROFILE_UUID]);
}

static void
unsafe_paste_response_cb (GtkDialog *dialog,
                          int response,
                          TesselPaneView *view)
{
  g_autofree char *text = (char*)g_object_steal_data (G_OBJECT (dialog), "paste-text");

  gtk_window_destroy (GTK_WINDOW (dialog));

  tessel_pane_confirm_unsafe_paste (view->pane, text, response == GTK_RESPONSE_ACCEPT);
}

static void
pane_unsafe_paste_requested_cb (TesselPane *pane,
                                const char *text,
                                TesselPaneView *view)
{
  if (view->paste_dialog != nullptr)
    gtk_window_destroy (GTK_WINDOW (view->paste_dialog));

  auto dialog = view->paste_dialog =
    gtk_message_dialog_new (tessel_pane_view_get_window (view),
                            GtkDialogFlags(GTK_DIALOG_MODAL |
                                           GTK_DIALOG_DESTROY_WITH_PARENT),
                            GTK_MESSAGE_WARNING,
                            GTK_BUTTONS_NONE,
                            "%s", _("This command is asking for Administrative access to your computer"));

  g_autofree char *escaped = g_markup_escape_text (text, -1);
  gtk_message_dialog_format_secondary_markup (GTK_MESSAGE_DIALOG (dialog),
                                              "%s\n\n<tt><b>%s</b></tt>",
                                              _("Copying commands from the internet can be dangerous. "
                                                "Be sure you understand what each part of this command does."),
                                              escaped);

  gtk_window_set_title (GTK_WINDOW (dialog), "");

  gtk_dialog_add_button (GTK_DIALOG (dialog), _("_Don't Paste"), GTK_RESPONSE_CANCEL);
  GtkWidget *paste_button = gtk_dialog_add_button (GTK_DIALOG (dialog), _("Paste _Anyway"), GTK_RESPONSE_ACCEPT);
  gtk_widget_add_css_class (paste_button, "destructive-action");
  gtk_dialog_set_default_response (GTK_DIALOG (dialog), GTK_RESPONSE_CANCEL);

  g_object_set_data_full (G_OBJECT (dialog), "paste-text", g_strdup (text), g_free);

  g_signal_connect_swapped (dialog, "destroy",
                            G_CALLBACK (g_nullify_pointer),
                            &view->paste_dialog);
  g_signal_connect (dialog, "response",
                    G_CALLBACK (unsafe_paste_response_cb), view);

  gtk_window_present (GTK_WINDOW (dialog));
}

static void
info_bar_response_cb (TesselInfoBar *info_bar,
                      int response,
                      TesselPaneView *view)
{
  tessel_pane_view_remove_info_bar (view);

  if (response == RESPONSE_RELAUNCH)
    tessel_pane_relaunch (view->pane);
}

static void
pane_exit_held_cb (TesselPane *pane,
                   const char *message,
                   TesselPaneView *view)
{
  tessel_pane_view_remove_info_bar (view);

  auto info_bar = tessel_info_bar_new (GTK_MESSAGE_INFO,
                                       _("_Relaunch"), RESPONSE_RELAUNCH,
                                       nullptr);
  tessel_info_bar_format_text (TESSEL_INFO_BAR (info_bar), "%s", message);
  gtk_widget_set_halign (info_bar, GTK_ALIGN_FILL);
  gtk_widget_set_valign (info_bar, GTK_ALIGN_START);

  g_signal_connect (info_bar, "response",
                    G_CALLBACK (info_bar_response_cb), view);

  gtk_overlay_add_overlay (GTK_OVERLAY (view->overlay), info_bar);
  view->info_bar = info_bar;
}

/* Template callbacks */

static void
tessel_pane_view_menu_button_active_cb (TesselPaneView *view,
                                        GParamSpec *pspec,
                                        GtkMenuButton *button)
{
  if (gtk_menu_button_get_active (button))
    tessel_pane_view_update_submenus (view);
}

static gboolean
tessel_pane_view_key_pressed_cb (TesselPaneView *view,
                                 guint keyval,
                                 guint keycode,
                                 GdkModifierType state,
                                 GtkEventControllerKey *controller)
{
  tessel_pane_key_pressed (view->pane, keyval,
                           state & gtk_accelerator_get_default_mod_mask (),
                           FALSE);
  return FALSE;
}

static void
tessel_pane_view_focus_enter_cb (TesselPaneView *view,
                                 GtkEventControllerFocus *controller)
{
  tessel_pane_focus_in (view->pane);
}

static void
tessel_pane_view_focus_leave_cb (TesselPaneView *view,
                                 GtkEventControllerFocus *controller)
{
  tessel_pane_focus_out (view->pane);
}

static void
tessel_pane_view_pointer_enter_cb (TesselPaneView *view,
                                   double x,
                                   double y,
                                   GtkEventControllerMotion *controller)
{
  auto const settings = tessel_context_get_global_settings (view->context);

  if (!g_settings_get_boolean (settings, TESSEL_SETTING_FOCUS_FOLLOWS_MOUSE_KEY))
    return;

  if (!gtk_widget_has_focus (view->vte))
    gtk_widget_grab_focus (view->vte);
}

static void
tessel_pane_view_show_popup_menu_cb (TesselPaneView *view,
                                     double x,
                                     double y,
                                     TesselVte *vte)
{
  g_free (view->popup_url);
  view->popup_url = tessel_vte_check_match (vte, x, y);

  gtk_widget_action_set_enabled (GTK_WIDGET (view), "pane.open-link", view->popup_url != nullptr);
  gtk_widget_action_set_enabled (GTK_WIDGET (view), "pane.copy-link", view->popup_url != nullptr);

  g_autoptr(GMenu) menu = g_menu_new ();

  if (view->popup_url != nullptr) {
    g_autoptr(GMenu) section1 = g_menu_new ();

    g_menu_append (section1, _("_Open Link"), "pane.open-link");
    g_menu_append (section1, _("Copy _Link"), "pane.copy-link");
    g_menu_append_section (menu, nullptr, G_MENU_MODEL (section1));
  }

  g_autoptr(GMenu) section2 = g_menu_new ();
  g_menu_append (section2, _("_Copy"), "pane.copy");
  g_menu_append (section2, _("_Paste"), "pane.paste");
  g_menu_append (section2, _("Select _All"), "pane.select-all");
  g_menu_append_section (menu, nullptr, G_MENU_MODEL (section2));

  g_autoptr(GMenu) section3 = g_menu_new ();
  g_menu_append (section3, _("Split _Right"), "pane.split-right");
  g_menu_append (section3, _("Split _Down"), "pane.split-down");
  g_menu_append (section3, _("Read-_Only"), "pane.read-only");
  g_menu_append_section (menu, nullptr, G_MENU_MODEL (section3));

  if (view->context_menu == nullptr) {
    view->context_menu = GTK_POPOVER_MENU (gtk_popover_menu_new_from_model (nullptr));
    gtk_popover_set_has_arrow (GTK_POPOVER (view->context_menu), FALSE);
    gtk_popover_set_position (GTK_POPOVER (view->context_menu), GTK_POS_BOTTOM);
    gtk_widget_set_halign (GTK_WIDGET (view->context_menu), GTK_ALIGN_START);
    gtk_widget_set_parent (GTK_WIDGET (view->context_menu), GTK_WIDGET (view));
  }

  graphene_point_t point = {float(x), float(y)};
  if (gtk_widget_compute_point (GTK_WIDGET (vte), GTK_WIDGET (view), &point, &point)) {
    cairo_rectangle_int_t rect = {int(point.x), int(point.y), 1, 1};
    gtk_popover_menu_set_menu_model (view->context_menu, G_MENU_MODEL (menu));
    gtk_popover_set_pointing_to (GTK_POPOVER (view->context_menu), &rect);
    gtk_popover_popup (GTK_POPOVER (view->context_menu));
  }
}

static gboolean
tessel_pane_view_overlay_get_child_position_cb (TesselPaneView *view,
                                                GtkWidget *widget,
                                                GdkRectangle *allocation,
                                                GtkOverlay *overlay)
{
  if (widget != view->drop_highlight)
    return FALSE;

  int width = gtk_widget_get_width (GTK_WIDGET (overlay));
  int height = gtk_widget_get_height (GTK_WIDGET (overlay));

  if (view->drop_is_pane && tessel_pane_get_drag_active (view->pane)) {
    auto const rect = tessel_drag_quadrant_get_highlight_rect (tessel_pane_get_drag_quadrant (view->pane),
                                                               width, height);
    allocation->x = rect.x;
    allocation->y = rect.y;
    allocation->width = rect.width;
    allocation->height = rect.height;
  } else {
    allocation->x = 0;
    allocation->y = 0;
    allocation->width = width;
    allocation->height = height;
  }

  return TRUE;
}

/* Drag source */

static GdkContentProvider *
tessel_pane_view_drag_prepare_cb (TesselPaneView *view,
                                  double x,
                                  double y,
                                  GtkDragSource *source)
{
  auto const uuid = tessel_pane_get_uuid (view->pane);
  g_autoptr(GBytes) bytes = g_bytes_new (uuid, strlen (uuid));

  _tessel_debug_print (TESSEL_DEBUG_DND, "[pane %s] drag prepare\n", uuid);

  return gdk_content_provider_new_for_bytes (TESSEL_DND_PANE_MIME_TYPE, bytes);
}

static void
tessel_pane_view_drag_begin_cb (TesselPaneView *view,
                                GdkDrag *drag,
                                GtkDragSource *source)
{
  view->drag = drag;
  view->drag_no_target = FALSE;

  g_autoptr(GdkPaintable) paintable = gtk_widget_paintable_new (view->vte);
  gtk_drag_source_set_icon (source, paintable, 0, 0);
}

static gboolean
tessel_pane_view_drag_cancel_cb (TesselPaneView *view,
                                 GdkDrag *drag,
                                 GdkDragCancelReason reason,
                                 GtkDragSource *source)
{
  _tessel_debug_print (TESSEL_DEBUG_DND,
                       "[pane %s] drag cancelled, reason %d\n",
                       tessel_pane_get_uuid (view->pane), int (reason));

  view->drag_no_target = (reason == GDK_DRAG_CANCEL_NO_TARGET);

  /* Without a target the pane detaches; skip the failure animation */
  return view->drag_no_target;
}

static void
tessel_pane_view_drag_end_cb (TesselPaneView *view,
                              GdkDrag *drag,
                              gboolean delete_data,
                              GtkDragSource *source)
{
  double x = 0, y = 0;
  gdk_device_get_surface_at_position (gdk_drag_get_device (drag), &x, &y);

  gboolean dropped = !view->drag_no_target;

  view->drag = nullptr;
  view->drag_no_target = FALSE;

  tessel_pane_drag_end (view->pane, dropped, x, y);
}

/* Drop target */

static void
tessel_pane_view_drop_file_list (TesselPaneView *view,
                                 const GList *files)
{
  g_autofree char *text = tessel_util_quote_file_list (files);

  if (!tessel_str_empty0 (text))
    tessel_pane_feed_dropped_text (view->pane, text);
}

static void
tessel_pane_view_drop_uris (TesselPaneView *view,
                            GPtrArray *uris)
{
  if (uris == nullptr)
    return;

  g_ptr_array_add (uris, nullptr);
  g_autofree char *text = tessel_util_quote_uri_list ((char **) uris->pdata);

  if (!tessel_str_empty0 (text))
    tessel_pane_feed_dropped_text (view->pane, text);
}

static void
tessel_pane_view_drop_uri_list_line_cb (GObject *object,
                                        GAsyncResult *result,
                                        gpointer user_data)
{
  GDataInputStream *line_reader = G_DATA_INPUT_STREAM (object);
  g_autoptr(DropState) state = (DropState*)user_data;
  g_autoptr(GError) error = nullptr;
  gsize len = 0;

  g_autofree char *line = g_data_input_stream_read_line_finish_utf8 (line_reader, result, &len, &error);

  if (error != nullptr) {
    g_debug ("Failed to receive '%s': %s", TEXT_URI_LIST, error->message);
    gdk_drop_finish (state->drop, GdkDragAction(0));
    return;
  }

  if (line == nullptr) {
    if (state->view->pane != nullptr)
      tessel_pane_view_drop_uris (state->view, state->uris);
    gdk_drop_finish (state->drop, GDK_ACTION_COPY);
    return;
  }

  if (line[0] != 0 && line[0] != '#') {
    if (state->uris == nullptr)
      state->uris = g_ptr_array_new_with_free_func (g_free);
    g_ptr_array_add (state->uris, g_steal_pointer (&line));
  }

  g_data_input_stream_read_line_async (line_reader,
                                       DROP_REQUEST_PRIORITY,
                                       nullptr,
                                       tessel_pane_view_drop_uri_list_line_cb,
                                       g_steal_pointer (&state));
}

static void
tessel_pane_view_drop_uri_list_cb (GObject *object,
                                   GAsyncResult *result,
                                   gpointer user_data)
{
  GdkDrop *drop = (GdkDrop *)object;
  g_autoptr(TesselPaneView) view = TESSEL_PANE_VIEW (user_data);
  g_autoptr(GError) error = nullptr;
  const char *mime_type = nullptr;

  g_autoptr(GInputStream) stream = gdk_drop_read_finish (drop, result, &mime_type, &error);
  if (stream == nullptr) {
    g_debug ("Failed to receive text/uri-list offer: %s", error->message);
    gdk_drop_finish (drop, GdkDragAction(0));
    return;
  }

  g_autoptr(GDataInputStream) line_reader = g_data_input_stream_new (stream);
  g_data_input_stream_set_newline_type (line_reader,
                                        G_DATA_STREAM_NEWLINE_TYPE_CR_LF);

  auto state = g_new0 (DropState, 1);
  state->view = (TesselPaneView*)g_object_ref (view);
  state->drop = (GdkDrop*)g_object_ref (drop);

  g_data_input_stream_read_line_async (line_reader,
                                       DROP_REQUEST_PRIORITY,
                                       nullptr,
                                       tessel_pane_view_drop_uri_list_line_cb,
                                       state);
}

static void
tessel_pane_view_drop_file_list_cb (GObject *object,
                                    GAsyncResult *result,
                                    gpointer user_data)
{
  GdkDrop *drop = (GdkDrop *)object;
  g_autoptr(TesselPaneView) view = TESSEL_PANE_VIEW (user_data);
  g_autoptr(GError) error = nullptr;

  auto const value = gdk_drop_read_value_finish (drop, result, &error);
  if (value == nullptr) {
    g_debug ("Failed to receive file-list offer: %s", error->message);

    if (gdk_content_formats_contain_mime_type (gdk_drop_get_formats (drop), TEXT_URI_LIST))
      gdk_drop_read_async (drop,
                           uri_list_mime_types,
                           DROP_REQUEST_PRIORITY,
                           nullptr,
                           tessel_pane_view_drop_uri_list_cb,
                           g_object_ref (view));
    else
      gdk_drop_finish (drop, GdkDragAction(0));

    return;
  }

  if (view->pane != nullptr)
    tessel_pane_view_drop_file_list (view, (const GList *)g_value_get_boxed (value));
  gdk_drop_finish (drop, GDK_ACTION_COPY);
}

static void
tessel_pane_view_drop_string_cb (GObject *object,
                                 GAsyncResult *result,
                                 gpointer user_data)
{
  GdkDrop *drop = (GdkDrop *)object;
  g_autoptr(TesselPaneView) view = TESSEL_PANE_VIEW (user_data);
  g_autoptr(GError) error = nullptr;

  auto const value = gdk_drop_read_value_finish (drop, result, &error);
  if (value == nullptr) {
    gdk_drop_finish (drop, GdkDragAction(0));
    return;
  }

  auto const string = g_value_get_string (value);

  if (!tessel_str_empty0 (string) && view->pane != nullptr)
    tessel_pane_feed_dropped_text (view->pane, string);

  gdk_drop_finish (drop, GDK_ACTION_COPY);
}

static void
tessel_pane_view_drop_pane_line_cb (GObject *object,
                                    GAsyncResult *result,
                                    gpointer user_data)
{
  GDataInputStream *line_reader = G_DATA_INPUT_STREAM (object);
  g_autoptr(DropState) state = (DropState*)user_data;
  g_autoptr(GError) error = nullptr;
  gsize len = 0;

  g_autofree char *uuid = g_data_input_stream_read_line_finish_utf8 (line_reader, result, &len, &error);

  if (error != nullptr) {
    g_debug ("Failed to receive '%s': %s", TESSEL_DND_PANE_MIME_TYPE, error->message);
    gdk_drop_finish (state->drop, GdkDragAction(0));
    return;
  }

  gboolean accepted = FALSE;
  if (state->view->pane != nullptr)
    accepted = tessel_pane_drag_drop (state->view->pane, uuid,
                                      state->x, state->y,
                                      state->width, state->height);

  gdk_drop_finish (state->drop, accepted ? GDK_ACTION_MOVE : GdkDragAction(0));
}

static void
tessel_pane_view_drop_pane_cb (GObject *object,
                               GAsyncResult *result,
                               gpointer user_data)
{
  GdkDrop *drop = (GdkDrop *)object;
  g_autoptr(DropState) state = (DropState*)user_data;
  g_autoptr(GError) error = nullptr;
  const char *mime_type = nullptr;

  g_autoptr(GInputStream) stream = gdk_drop_read_finish (drop, result, &mime_type, &error);
  if (stream == nullptr) {
    g_debug ("Failed to receive pane offer: %s", error->message);
    if (state->view->pane != nullptr)
      tessel_pane_drag_leave (state->view->pane);
    gdk_drop_finish (drop, GdkDragAction(0));
    return;
  }

  g_autoptr(GDataInputStream) line_reader = g_data_input_stream_new (stream);

  g_data_input_stream_read_line_async (line_reader,
                                       DROP_REQUEST_PRIORITY,
                                       nullptr,
                                       tessel_pane_view_drop_pane_line_cb,
                                       g_steal_pointer (&state));
}

static GdkDragAction
tessel_pane_view_drop_target_drag_motion_cb (TesselPaneView *view,
                                             GdkDrop *drop,
                                             double x,
                                             double y,
                                             GtkDropTargetAsync *drop_target)
{
  auto const formats = gdk_drop_get_formats (drop);

  if (!gdk_content_formats_contain_mime_type (formats, TESSEL_DND_PANE_MIME_TYPE)) {
    view->drop_is_pane = FALSE;
    gtk_widget_set_visible (view->drop_highlight, TRUE);
    return GDK_ACTION_COPY;
  }

  /* A pane cannot be dropped on itself */
  if (view->drag != nullptr && gdk_drop_get_drag (drop) == view->drag) {
    gtk_widget_set_visible (view->drop_highlight, FALSE);
    return GdkDragAction(0);
  }

  view->drop_is_pane = TRUE;
  tessel_pane_drag_motion (view->pane, int (x), int (y),
                           gtk_widget_get_width (view->vte),
                           gtk_widget_get_height (view->vte));

  gtk_widget_set_visible (view->drop_highlight, TRUE);
  gtk_widget_queue_allocate (view->overlay);

  return GDK_ACTION_MOVE;
}

static GdkDragAction
tessel_pane_view_drop_target_drag_enter_cb (TesselPaneView *view,
                                            GdkDrop *drop,
                                            double x,
                                            double y,
                                            GtkDropTargetAsync *drop_target)
{
  return tessel_pane_view_drop_target_drag_motion_cb (view, drop, x, y, drop_target);
}

static void
tessel_pane_view_drop_target_drag_leave_cb (TesselPaneView *view,
                                            GdkDrop *drop,
                                            GtkDropTargetAsync *drop_target)
{
  gtk_widget_set_visible (view->drop_highlight, FALSE);
  view->drop_is_pane = FALSE;

  tessel_pane_drag_leave (view->pane);
}

static gboolean
tessel_pane_view_drop_target_drop_cb (TesselPaneView *view,
                                      GdkDrop *drop,
                                      double x,
                                      double y,
                                      GtkDropTargetAsync *drop_target)
{
  gtk_widget_set_visible (view->drop_highlight, FALSE);

  auto const formats = gdk_drop_get_formats (drop);

  if (gdk_content_formats_contain_mime_type (formats, TESSEL_DND_PANE_MIME_TYPE)) {
    auto state = g_new0 (DropState, 1);
    state->view = (TesselPaneView*)g_object_ref (view);
    state->x = int (x);
    state->y = int (y);
    state->width = gtk_widget_get_width (view->vte);
    state->height = gtk_widget_get_height (view->vte);

    gdk_drop_read_async (drop,
                         pane_mime_types,
                         DROP_REQUEST_PRIORITY,
                         nullptr,
                         tessel_pane_view_drop_pane_cb,
                         state);
    return TRUE;
  } else if (gdk_content_formats_contain_gtype (formats, GDK_TYPE_FILE_LIST) ||
             gdk_content_formats_contain_mime_type (formats, TEXT_URI_LIST)) {
    gdk_drop_read_value_async (drop,
                               GDK_TYPE_FILE_LIST,
                               DROP_REQUEST_PRIORITY,
                               nullptr,
                               tessel_pane_view_drop_file_list_cb,
                               g_object_ref (view));
    return TRUE;
  } else if (gdk_content_formats_contain_gtype (formats, G_TYPE_STRING)) {
    gdk_drop_read_value_async (drop,
                               G_TYPE_STRING,
                               DROP_REQUEST_PRIORITY,
                               nullptr,
                               tessel_pane_view_drop_string_cb,
                               g_object_ref (view));
    return TRUE;
  }

  return FALSE;
}

/* Actions */

static void
tessel_pane_view_split_action (GtkWidget *widget,
                               const char *action_name,
                               GVariant *parameter)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (widget);

  tessel_pane_request_split (view->pane,
                             g_str_equal (action_name, "pane.split-right") ? TESSEL_ORIENTATION_HORIZONTAL
                                                                          : TESSEL_ORIENTATION_VERTICAL);
}

static void
find_bar_dismissed_cb (TesselPaneView *view)
{
  gtk_revealer_set_reveal_child (GTK_REVEALER (view->find_revealer), FALSE);
  gtk_widget_grab_focus (GTK_WIDGET (view->vte));
}

static void
tessel_pane_view_find_action (GtkWidget *widget,
                              const char *action_name,
                              GVariant *parameter)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (widget);
  auto revealer = GTK_REVEALER (view->find_revealer);

  gtk_revealer_set_reveal_child (revealer, TRUE);
  gtk_widget_grab_focus (view->find_bar);
}

static void
set_title_response_cb (GtkDialog *dialog,
                       int response,
                       TesselPaneView *view)
{
  if (response == GTK_RESPONSE_OK) {
    auto entry = GTK_EDITABLE (g_object_get_data (G_OBJECT (dialog), "title-entry"));
    tessel_pane_set_override_title (view->pane, gtk_editable_get_text (entry));
  }

  gtk_window_destroy (GTK_WINDOW (dialog));
}

static void
tessel_pane_view_set_title_action (GtkWidget *widget,
                                   const char *action_name,
                                   GVariant *parameter)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (widget);

  if (view->title_dialog != nullptr) {
    gtk_window_present (GTK_WINDOW (view->title_dialog));
    return;
  }

  auto dialog = view->title_dialog =
    gtk_message_dialog_new (tessel_pane_view_get_window (view),
                            GtkDialogFlags(GTK_DIALOG_MODAL |
                                           GTK_DIALOG_DESTROY_WITH_PARENT),
                            GTK_MESSAGE_QUESTION,
                            GTK_BUTTONS_OK_CANCEL,
                            "%s", _("Set Title"));
  gtk_message_dialog_format_secondary_text (GTK_MESSAGE_DIALOG (dialog),
                                            "%s", _("Leave the title empty to use the profile's title."));

  auto entry = gtk_entry_new ();
  auto const override_title = tessel_pane_get_override_title (view->pane);
  gtk_editable_set_text (GTK_EDITABLE (entry), override_title ? override_title : "");
  gtk_entry_set_activates_default (GTK_ENTRY (entry), TRUE);
  gtk_box_append (GTK_BOX (gtk_message_dialog_get_message_area (GTK_MESSAGE_DIALOG (dialog))), entry);
  g_object_set_data (G_OBJECT (dialog), "title-entry", entry);

  gtk_dialog_set_default_response (GTK_DIALOG (dialog), GTK_RESPONSE_OK);

  g_signal_connect_swapped (dialog, "destroy",
                            G_CALLBACK (g_nullify_pointer),
                            &view->title_dialog);
  g_signal_connect (dialog, "response",
                    G_CALLBACK (set_title_response_cb), view);

  gtk_window_present (GTK_WINDOW (dialog));
}

static void
tessel_pane_view_copy_action (GtkWidget *widget,
                              const char *action_name,
                              GVariant *parameter)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (widget);

  vte_terminal_copy_clipboard_format (VTE_TERMINAL (view->vte), VTE_FORMAT_TEXT);
}

static void
clipboard_read_text_cb (GObject *object,
                        GAsyncResult *result,
                        gpointer user_data)
{
  g_autoptr(TesselPaneView) view = TESSEL_PANE_VIEW (user_data);
  g_autoptr(GError) error = nullptr;

  g_autofree char *text = gdk_clipboard_read_text_finish (GDK_CLIPBOARD (object), result, &error);
  if (text == nullptr) {
    if (error != nullptr)
      _tessel_debug_print (TESSEL_DEBUG_CLIPBOARD,
                           "Failed to read the clipboard: %s\n", error->message);
    return;
  }

  if (view->pane != nullptr)
    tessel_pane_paste_text (view->pane, text);
}

static void
tessel_pane_view_paste_action (GtkWidget *widget,
                               const char *action_name,
                               GVariant *parameter)
{
  gdk_clipboard_read_text_async (gtk_widget_get_clipboard (widget),
                                 nullptr,
                                 clipboard_read_text_cb,
                                 g_object_ref (widget));
}

static void
tessel_pane_view_select_all_action (GtkWidget *widget,
                                    const char *action_name,
                                    GVariant *parameter)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (widget);

  vte_terminal_select_all (VTE_TERMINAL (view->vte));
}

static void
tessel_pane_view_open_link_action (GtkWidget *widget,
                                   const char *action_name,
                                   GVariant *parameter)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (widget);

  if (view->popup_url != nullptr)
    tessel_vte_open_url (TESSEL_VTE (view->vte), view->popup_url);
}

static void
tessel_pane_view_copy_link_action (GtkWidget *widget,
                                   const char *action_name,
                                   GVariant *parameter)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (widget);

  if (view->popup_url != nullptr)
    gdk_clipboard_set_text (gtk_widget_get_clipboard (widget), view->popup_url);
}

static void
tessel_pane_view_close_action (GtkWidget *widget,
                               const char *action_name,
                               GVariant *parameter)
{
  tessel_pane_view_close (TESSEL_PANE_VIEW (widget));
}

/* Class implementation */

static void
tessel_pane_view_init (TesselPaneView *view)
{
  view->profiles_menu = g_menu_new ();
  view->encodings_menu = g_menu_new ();

  gtk_widget_init_template (GTK_WIDGET (view));
}

static void
tessel_pane_view_constructed (GObject *object)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (object);

  G_OBJECT_CLASS (tessel_pane_view_parent_class)->constructed (object);

  view->pane = tessel_pane_new (view->context, TESSEL_EMULATOR (view->vte), view->profile_uuid);
  g_clear_pointer (&view->profile_uuid, g_free);

  tessel_find_bar_set_vte (TESSEL_FIND_BAR (view->find_bar), TESSEL_VTE (view->vte));
  g_signal_connect_swapped (view->find_bar, "dismissed",
                            G_CALLBACK (find_bar_dismissed_cb), view);

  g_signal_connect (view->pane, "notify::title",
                    G_CALLBACK (pane_notify_title_cb), view);
  g_signal_connect (view->pane, "notify::focused",
                    G_CALLBACK (pane_notify_focused_cb), view);
  g_signal_connect (view->pane, "notify::read-only",
                    G_CALLBACK (pane_notify_read_only_cb), view);
  g_signal_connect (view->pane, "notify::synchronize-input",
                    G_CALLBACK (pane_notify_synchronize_input_cb), view);
  g_signal_connect (view->pane, "notify::scrollbar-visible",
                    G_CALLBACK (pane_notify_scrollbar_visible_cb), view);
  g_signal_connect (view->pane, "notify::profile-uuid",
                    G_CALLBACK (pane_notify_profile_uuid_cb), view);
  g_signal_connect (view->pane, "unsafe-paste-requested",
                    G_CALLBACK (pane_unsafe_paste_requested_cb), view);
  g_signal_connect (view->pane, "exit-held",
                    G_CALLBACK (pane_exit_held_cb), view);

  g_signal_connect_object (tessel_context_get_profiles_list (view->context),
                           "children-changed",
                           G_CALLBACK (tessel_pane_view_update_submenus),
                           view, G_CONNECT_SWAPPED);
  g_signal_connect_object (tessel_context_get_global_settings (view->context),
                           "changed::" TESSEL_SETTING_ENCODINGS_KEY,
                           G_CALLBACK (tessel_pane_view_update_submenus),
                           view, G_CONNECT_SWAPPED);

  GdkContentFormatsBuilder *builder = gdk_content_formats_builder_new ();
  gdk_content_formats_builder_add_mime_type (builder, TESSEL_DND_PANE_MIME_TYPE);
  gdk_content_formats_builder_add_gtype (builder, GDK_TYPE_FILE_LIST);
  gdk_content_formats_builder_add_mime_type (builder, TEXT_URI_LIST);
  gdk_content_formats_builder_add_gtype (builder, G_TYPE_STRING);
  g_autoptr(GdkContentFormats) formats = gdk_content_formats_builder_free_to_formats (builder);

  gtk_drop_target_async_set_actions (view->drop_target,
                                     GdkDragAction(GDK_ACTION_COPY|GDK_ACTION_MOVE));
  gtk_drop_target_async_set_formats (view->drop_target, formats);

  /* Clipboard shortcuts must win over the terminal's own key handling */
  auto shortcuts = gtk_shortcut_controller_new ();
  gtk_event_controller_set_propagation_phase (shortcuts, GTK_PHASE_CAPTURE);
  gtk_shortcut_controller_add_shortcut (GTK_SHORTCUT_CONTROLLER (shortcuts),
                                        gtk_shortcut_new (gtk_shortcut_trigger_parse_string ("<Control><Shift>c"),
                                                          gtk_named_action_new ("pane.copy")));
  gtk_shortcut_controller_add_shortcut (GTK_SHORTCUT_CONTROLLER (shortcuts),
                                        gtk_shortcut_new (gtk_shortcut_trigger_parse_string ("<Control><Shift>v"),
                                                          gtk_named_action_new ("pane.paste")));
  gtk_shortcut_controller_add_shortcut (GTK_SHORTCUT_CONTROLLER (shortcuts),
                                        gtk_shortcut_new (gtk_shortcut_trigger_parse_string ("<Control><Shift>f"),
                                                          gtk_named_action_new ("pane.find")));
  gtk_widget_add_controller (GTK_WIDGET (view), shortcuts);

  tessel_pane_view_build_menu (view);

  gtk_widget_action_set_enabled (GTK_WIDGET (view), "pane.open-link", FALSE);
  gtk_widget_action_set_enabled (GTK_WIDGET (view), "pane.copy-link", FALSE);

  tessel_pane_view_update_title (view);
  tessel_pane_view_update_profile (view);
  pane_notify_focused_cb (view->pane, nullptr, view);
  pane_notify_read_only_cb (view->pane, nullptr, view);
  pane_notify_synchronize_input_cb (view->pane, nullptr, view);
  pane_notify_scrollbar_visible_cb (view->pane, nullptr, view);
}

static void
tessel_pane_view_size_allocate (GtkWidget *widget,
                                int width,
                                int height,
                                int baseline)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (widget);

  GTK_WIDGET_CLASS (tessel_pane_view_parent_class)->size_allocate (widget, width, height, baseline);

  if (view->context_menu != nullptr)
    gtk_popover_present (GTK_POPOVER (view->context_menu));
}

static gboolean
tessel_pane_view_grab_focus (GtkWidget *widget)
{
  return gtk_widget_grab_focus (TESSEL_PANE_VIEW (widget)->vte);
}

static void
tessel_pane_view_dispose (GObject *object)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (object);
  GtkWidget *child;

  g_clear_pointer (&view->close_dialog, gtk_window_destroy);
  g_clear_pointer (&view->title_dialog, gtk_window_destroy);
  g_clear_pointer (&view->paste_dialog, gtk_window_destroy);
  g_clear_pointer ((GtkWidget **)&view->context_menu, gtk_widget_unparent);

  if (view->profile_encoding_changed_id != 0) {
    g_signal_handler_disconnect (view->profile, view->profile_encoding_changed_id);
    view->profile_encoding_changed_id = 0;
  }
  g_clear_object (&view->profile);

  if (view->pane != nullptr)
    g_signal_handlers_disconnect_by_data (view->pane, view);

  view->info_bar = nullptr;

  gtk_widget_dispose_template (GTK_WIDGET (view), TESSEL_TYPE_PANE_VIEW);

  while ((child = gtk_widget_get_first_child (GTK_WIDGET (view))))
    gtk_widget_unparent (child);

  g_clear_object (&view->pane);

  G_OBJECT_CLASS (tessel_pane_view_parent_class)->dispose (object);
}

static void
tessel_pane_view_finalize (GObject *object)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (object);

  g_clear_object (&view->context);
  g_clear_object (&view->profiles_menu);
  g_clear_object (&view->encodings_menu);
  g_free (view->profile_uuid);
  g_free (view->popup_url);

  G_OBJECT_CLASS (tessel_pane_view_parent_class)->finalize (object);
}

static void
tessel_pane_view_get_property (GObject *object,
                               guint prop_id,
                               GValue *value,
                               GParamSpec *pspec)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (object);

  switch (prop_id) {
    case PROP_CONTEXT:
      g_value_set_object (value, view->context);
      break;
    case PROP_PROFILE_UUID: {
      auto const uuid = view->pane ? tessel_pane_get_profile_uuid (view->pane) : view->profile_uuid;
      g_value_set_string (value, uuid ? uuid : "");
      break;
    }
    case PROP_READ_ONLY:
      g_value_set_boolean (value, view->pane && tessel_pane_get_read_only (view->pane));
      break;
    case PROP_SYNCHRONIZE_INPUT:
      g_value_set_boolean (value, view->pane && tessel_pane_get_synchronize_input (view->pane));
      break;
    case PROP_ENCODING:
      if (view->profile != nullptr)
        g_value_take_string (value, g_settings_get_string (view->profile, TESSEL_PROFILE_ENCODING_KEY));
      else
        g_value_set_string (value, "");
      break;
    default:
      G_OBJECT_WARN_INVALID_PROPERTY_ID (object, prop_id, pspec);
      break;
  }
}

static void
tessel_pane_view_set_property (GObject *object,
                               guint prop_id,
                               const GValue *value,
                               GParamSpec *pspec)
{
  TesselPaneView *view = TESSEL_PANE_VIEW (object);

  switch (prop_id) {
    case PROP_CONTEXT:
      view->context = (TesselContext*)g_value_dup_object (value);
      break;
    case PROP_PROFILE_UUID:
      if (view->pane != nullptr)
        tessel_pane_set_profile_uuid (view->pane, g_value_get_string (value));
      else {
        g_free (view->profile_uuid);
        view->profile_uuid = g_value_dup_string (value);
      }
      break;
    case PROP_READ_ONLY:
      tessel_pane_set_read_only (view->pane, g_value_get_boolean (value));
      break;
    case PROP_SYNCHRONIZE_INPUT:
      tessel_pane_set_synchronize_input (view->pane, g_value_get_boolean (value));
      break;
    case PROP_ENCODING:
      tessel_pane_select_encoding (view->pane, g_value_get_string (value));
      break;
    default:
      G_OBJECT_WARN_INVALID_PROPERTY_ID (object, prop_id, pspec);
      break;
  }
}

static void
tessel_pane_view_class_init (TesselPaneViewClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);
  GtkWidgetClass *widget_class = GTK_WIDGET_CLASS (klass);

  object_class->constructed = tessel_pane_view_constructed;
  object_class->dispose = tessel_pane_view_dispose;
  object_class->finalize = tessel_pane_view_finalize;
  object_class->get_property = tessel_pane_view_get_property;
  object_class->set_property = tessel_pane_view_set_property;

  widget_class->size_allocate = tessel_pane_view_size_allocate;
  widget_class->grab_focus = tessel_pane_view_grab_focus;

  pspecs[PROP_CONTEXT] =
    g_param_spec_object ("context", nullptr, nullptr,
                         TESSEL_TYPE_CONTEXT,
                         GParamFlags(G_PARAM_READWRITE |
                                     G_PARAM_CONSTRUCT_ONLY |
                                     G_PARAM_STATIC_STRINGS));

  pspecs[PROP_PROFILE_UUID] =
    g_param_spec_string ("profile-uuid", nullptr, nullptr,
                         nullptr,
                         GParamFlags(G_PARAM_READWRITE |
                                     G_PARAM_CONSTRUCT |
                                     G_PARAM_EXPLICIT_NOTIFY |
                                     G_PARAM_STATIC_STRINGS));

  pspecs[PROP_READ_ONLY] =
    g_param_spec_boolean ("read-only", nullptr, nullptr,
                          FALSE,
                          GParamFlags(G_PARAM_READWRITE |
                                      G_PARAM_EXPLICIT_NOTIFY |
                                      G_PARAM_STATIC_STRINGS));

  pspecs[PROP_SYNCHRONIZE_INPUT] =
    g_param_spec_boolean ("synchronize-input", nullptr, nullptr,
                          FALSE,
                          GParamFlags(G_PARAM_READWRITE |
                                      G_PARAM_EXPLICIT_NOTIFY |
                                      G_PARAM_STATIC_STRINGS));

  pspecs[PROP_ENCODING] =
    g_param_spec_string ("encoding", nullptr, nullptr,
                         nullptr,
                         GParamFlags(G_PARAM_READWRITE |
                                     G_PARAM_EXPLICIT_NOTIFY |
                                     G_PARAM_STATIC_STRINGS));

  g_object_class_install_properties (object_class, N_PROPS, pspecs);

  g_type_ensure (TESSEL_TYPE_VTE);
  g_type_ensure (TESSEL_TYPE_FIND_BAR);
  g_type_ensure (ADW_TYPE_BIN);

  gtk_widget_class_set_template_from_resource (widget_class, TESSEL_RESOURCE_PATH "/ui/pane-view.ui");
  gtk_widget_class_set_layout_manager_type (widget_class, GTK_TYPE_BIN_LAYOUT);
  gtk_widget_class_set_css_name (widget_class, "pane");

  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, box);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, titlebar);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, title_label);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, read_only_icon);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, sync_icon);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, menu_button);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, find_revealer);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, find_bar);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, overlay);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, scrolled_window);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, vte);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, drop_highlight);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, drag_source);
  gtk_widget_class_bind_template_child (widget_class, TesselPaneView, drop_target);

  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_menu_button_active_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_key_pressed_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_focus_enter_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_focus_leave_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_pointer_enter_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_show_popup_menu_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_overlay_get_child_position_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_drag_prepare_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_drag_begin_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_drag_cancel_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_drag_end_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_drop_target_drag_enter_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_drop_target_drag_motion_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_drop_target_drag_leave_cb);
  gtk_widget_class_bind_template_callback (widget_class, tessel_pane_view_drop_target_drop_cb);

  gtk_widget_class_install_action (widget_class, "pane.split-right", nullptr, tessel_pane_view_split_action);
  gtk_widget_class_install_action (widget_class, "pane.split-down", nullptr, tessel_pane_view_split_action);
  gtk_widget_class_install_action (widget_class, "pane.find", nullptr, tessel_pane_view_find_action);
  gtk_widget_class_install_action (widget_class, "pane.set-title", nullptr, tessel_pane_view_set_title_action);
  gtk_widget_class_install_action (widget_class, "pane.copy", nullptr, tessel_pane_view_copy_action);
  gtk_widget_class_install_action (widget_class, "pane.paste", nullptr, tessel_pane_view_paste_action);
  gtk_widget_class_install_action (widget_class, "pane.select-all", nullptr, tessel_pane_view_select_all_action);
  gtk_widget_class_install_action (widget_class, "pane.open-link", nullptr, tessel_pane_view_open_link_action);
  gtk_widget_class_install_action (widget_class, "pane.copy-link", nullptr, tessel_pane_view_copy_link_action);
  gtk_widget_class_install_action (widget_class, "pane.close", nullptr, tessel_pane_view_close_action);

  gtk_widget_class_install_property_action (widget_class, "pane.read-only", "read-only");
  gtk_widget_class_install_property_action (widget_class, "pane.synchronize-input", "synchronize-input");
  gtk_widget_class_install_property_action (widget_class, "pane.profile", "profile-uuid");
  gtk_widget_class_install_property_action (widget_class, "pane.encoding", "encoding");
}

/* public API */

GtkWidget *
tessel_pane_view_new (TesselContext *context,
                      const char *profile_uuid)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  return reinterpret_cast<GtkWidget*>(g_object_new (TESSEL_TYPE_PANE_VIEW,
                                                    "context", context,
                                                    "profile-uuid", profile_uuid,
                                                    nullptr));
}

TesselPane *
tessel_pane_view_get_pane (TesselPaneView *view)
{
  g_return_val_if_fail (TESSEL_IS_PANE_VIEW (view), nullptr);

  return view->pane;
}

TesselVte *
tessel_pane_view_get_vte (TesselPaneView *view)
{
  g_return_val_if_fail (TESSEL_IS_PANE_VIEW (view), nullptr);

  return TESSEL_VTE (view->vte);
}

/**
 * tessel_pane_view_get_from_pane:
 * @pane: a #TesselPane
 *
 * Returns: (transfer none) (nullable): the view hosting @pane's terminal
 */
TesselPaneView *
tessel_pane_view_get_from_pane (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), nullptr);

  auto const emulator = tessel_pane_get_emulator (pane);
  if (emulator == nullptr || !GTK_IS_WIDGET (emulator))
    return nullptr;

  auto const view = gtk_widget_get_ancestor (GTK_WIDGET (emulator), TESSEL_TYPE_PANE_VIEW);
  return view ? TESSEL_PANE_VIEW (view) : nullptr;
}

static void
confirm_close_response_cb (GtkDialog *dialog,
                           int response,
                           TesselPaneView *view)
{
  gtk_window_destroy (GTK_WINDOW (dialog));

  if (response == GTK_RESPONSE_ACCEPT)
    tessel_pane_request_close (view->pane);
}

/**
 * tessel_pane_view_close:
 * @view:
 *
 * Asks the session to close the pane. When a process is running in the
 * terminal and the confirm-close setting is on, the user is asked first.
 */
void
tessel_pane_view_close (TesselPaneView *view)
{
  g_return_if_fail (TESSEL_IS_PANE_VIEW (view));

  if (view->close_dialog != nullptr) {
    gtk_window_present (GTK_WINDOW (view->close_dialog));
    return;
  }

  auto const settings = tessel_context_get_global_settings (view->context);
  if (!g_settings_get_boolean (settings, TESSEL_SETTING_CONFIRM_CLOSE_KEY) ||
      !tessel_pane_is_process_running (view->pane)) {
    tessel_pane_request_close (view->pane);
    return;
  }

  auto dialog = view->close_dialog =
    gtk_message_dialog_new (tessel_pane_view_get_window (view),
                            GtkDialogFlags(GTK_DIALOG_MODAL |
                                           GTK_DIALOG_DESTROY_WITH_PARENT),
                            GTK_MESSAGE_WARNING,
                            GTK_BUTTONS_CANCEL,
                            "%s", _("Close this terminal?"));
  gtk_message_dialog_format_secondary_text (GTK_MESSAGE_DIALOG (dialog),
                                            "%s", _("There are processes that are still running, close anyway?"));

  gtk_window_set_title (GTK_WINDOW (dialog), "");

  GtkWidget *remove_button = gtk_dialog_add_button (GTK_DIALOG (dialog), _("C_lose Terminal"), GTK_RESPONSE_ACCEPT);
  gtk_widget_add_css_class (remove_button, "destructive-action");
  gtk_dialog_set_default_response (GTK_DIALOG (dialog), GTK_RESPONSE_ACCEPT);

  g_signal_connect_swapped (dialog, "destroy",
                            G_CALLBACK (g_nullify_pointer),
                            &view->close_dialog);
  g_signal_connect (dialog, "response",
                    G_CALLBACK (confirm_close_response_cb), view);

  gtk_window_present (GTK_WINDOW (dialog));
}
