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

#include <glib/gi18n.h>

#include "tessel-debug.hh"
#include "tessel-intl.hh"
#include "tessel-quadrant.hh"
#include "tessel-session.hh"

struct _TesselSession
{
  GtkWidget parent_instance;

  TesselContext *context;

  /* A TesselPaneView, or a GtkPaned whose leaves are TesselPaneViews */
  GtkWidget *root;

  TesselPaneView *active_view;
};

enum {
  PROP_0,
  PROP_CONTEXT,
  PROP_ACTIVE_VIEW,
  N_PROPS
};

enum {
  EMPTY,
  DETACH_VIEW,
  LAST_SIGNAL
};

static GParamSpec *pspecs[N_PROPS];
static guint signals[LAST_SIGNAL];

G_DEFINE_FINAL_TYPE (TesselSession, tessel_session, GTK_TYPE_WIDGET)

static void tessel_session_connect_view (TesselSession *session,
                                         TesselPaneView *view);

static void tessel_session_disconnect_view (TesselSession *session,
                                            TesselPaneView *view);

/* Tree handling */

static void
collect_views (GtkWidget *widget,
               GList **list)
{
  if (widget == nullptr)
    return;

  if (TESSEL_IS_PANE_VIEW (widget)) {
    *list = g_list_prepend (*list, widget);
  } else if (GTK_IS_PANED (widget)) {
    collect_views (gtk_paned_get_start_child (GTK_PANED (widget)), list);
    collect_views (gtk_paned_get_end_child (GTK_PANED (widget)), list);
  }
}

static void
tessel_session_renumber (TesselSession *session)
{
  GList *views = tessel_session_list_views (session);
  int id = 1;

  for (GList *l = views; l != nullptr; l = l->next)
    tessel_pane_set_id (tessel_pane_view_get_pane (TESSEL_PANE_VIEW (l->data)), id++);

  g_list_free (views);
}

static void
tessel_session_set_active_view (TesselSession *session,
                                 TesselPaneView *view)
{
  if (session->active_view == view)
    return;

  session->active_view = view;
  g_object_notify_by_pspec (G_OBJECT (session), pspecs[PROP_ACTIVE_VIEW]);
}

static void
tessel_session_replace_widget (TesselSession *session,
                               GtkWidget *old_widget,
                               GtkWidget *new_widget)
{
  GtkWidget *parent = gtk_widget_get_parent (old_widget);

  if (parent == GTK_WIDGET (session)) {
    gtk_widget_unparent (old_widget);
    gtk_widget_set_parent (new_widget, GTK_WIDGET (session));
    session->root = new_widget;
  } else if (gtk_paned_get_start_child (GTK_PANED (parent)) == old_widget) {
    gtk_paned_set_start_child (GTK_PANED (parent), new_widget);
  } else {
    gtk_paned_set_end_child (GTK_PANED (parent), new_widget);
  }
}

/* Removes @widget from the tree; the caller must hold a reference to
 * @widget if it is to survive. The paned holding it collapses into the
 * sibling.
 */
static void
tessel_session_remove_widget (TesselSession *session,
                              GtkWidget *widget)
{
  GtkWidget *parent = gtk_widget_get_parent (widget);

  if (parent == GTK_WIDGET (session)) {
    gtk_widget_unparent (widget);
    session->root = nullptr;
    return;
  }

  auto const paned = GTK_PANED (parent);
  GtkWidget *sibling = gtk_paned_get_start_child (paned) == widget ? gtk_paned_get_end_child (paned)
                                                                   : gtk_paned_get_start_child (paned);

  g_object_ref (sibling);
  gtk_paned_set_start_child (paned, nullptr);
  gtk_paned_set_end_child (paned, nullptr);
  tessel_session_replace_widget (session, GTK_WIDGET (paned), sibling);
  g_object_unref (sibling);
}

static void
tessel_session_insert_view (TesselSession *session,
                            TesselPaneView *target,
                            TesselPaneView *view,
                            GtkOrientation orientation,
                            gboolean after)
{
  if (target == nullptr) {
    g_return_if_fail (session->root == nullptr);

    gtk_widget_set_parent (GTK_WIDGET (view), GTK_WIDGET (session));
    session->root = GTK_WIDGET (view);
  } else {
    auto const paned = gtk_paned_new (orientation);
    gtk_paned_set_shrink_start_child (GTK_PANED (paned), FALSE);
    gtk_paned_set_shrink_end_child (GTK_PANED (paned), FALSE);

    g_object_ref (target);
    tessel_session_replace_widget (session, GTK_WIDGET (target), paned);

    gtk_paned_set_start_child (GTK_PANED (paned), GTK_WIDGET (after ? target : view));
    gtk_paned_set_end_child (GTK_PANED (paned), GTK_WIDGET (after ? view : target));
    g_object_unref (target);
  }

  tessel_session_connect_view (session, view);
  tessel_session_renumber (session);
}

static void
tessel_session_move_view (TesselSession *session,
                          TesselPaneView *target,
                          const char *source_uuid,
                          TesselDragQuadrant quadrant)
{
  auto const source_pane = tessel_context_get_pane_by_uuid (session->context, source_uuid);
  if (source_pane == nullptr) {
    _tessel_debug_print (TESSEL_DEBUG_SESSION,
                         "Pane %s is gone, not moving it\n", source_uuid);
    return;
  }

  auto const source_view = tessel_pane_view_get_from_pane (source_pane);
  if (source_view == nullptr || source_view == target)
    return;

  if (gtk_widget_get_ancestor (GTK_WIDGET (target), TESSEL_TYPE_SESSION) != GTK_WIDGET (session))
    return;

  auto const source_session = gtk_widget_get_ancestor (GTK_WIDGET (source_view), TESSEL_TYPE_SESSION);
  if (source_session == nullptr)
    return;

  _tessel_debug_print (TESSEL_DEBUG_SESSION,
                       "Moving pane %s to the %s of pane %s\n",
                       source_uuid, tessel_drag_quadrant_to_string (quadrant),
                       tessel_pane_get_uuid (tessel_pane_view_get_pane (target)));

  g_autoptr(TesselPaneView) view = tessel_session_take_view (TESSEL_SESSION (source_session), source_view);

  tessel_session_insert_view (session, target, view,
                              tessel_drag_quadrant_is_horizontal (quadrant) ? GTK_ORIENTATION_HORIZONTAL
                                                                            : GTK_ORIENTATION_VERTICAL,
                              tessel_drag_quadrant_is_after (quadrant));

  tessel_session_set_active_view (session, view);
  gtk_widget_grab_focus (GTK_WIDGET (view));
}

typedef struct {
  TesselSession *session;
  TesselPaneView *target;
  char *source_uuid;
  TesselDragQuadrant quadrant;
} MoveData;

static void
move_data_free (MoveData *data)
{
  g_object_unref (data->session);
  g_object_unref (data->target);
  g_free (data->source_uuid);
  g_free (data);
}

static gboolean
move_idle_cb (gpointer user_data)
{
  auto const data = (MoveData*)user_data;

  tessel_session_move_view (data->session, data->target, data->source_uuid, data->quadrant);

  return G_SOURCE_REMOVE;
}

/* Pane callbacks */

static void
pane_focus_in_cb (TesselPane *pane,
                  TesselSession *session)
{
  tessel_session_set_active_view (session, tessel_pane_view_get_from_pane (pane));
}

typedef struct {
  TesselSession *session;
  TesselPaneView *view;
} CloseData;

static void
close_data_free (CloseData *data)
{
  g_object_unref (data->session);
  g_object_unref (data->view);
  g_free (data);
}

static gboolean
close_idle_cb (gpointer user_data)
{
  auto const data = (CloseData*)user_data;
  auto const session = data->session;

  if (gtk_widget_get_ancestor (GTK_WIDGET (data->view), TESSEL_TYPE_SESSION) != GTK_WIDGET (session))
    return G_SOURCE_REMOVE;

  g_autoptr(TesselPaneView) closed = tessel_session_take_view (session, data->view);

  if (session->active_view != nullptr)
    gtk_widget_grab_focus (GTK_WIDGET (session->active_view));

  return G_SOURCE_REMOVE;
}

static void
pane_close_request_cb (TesselPane *pane,
                       TesselSession *session)
{
  auto const view = tessel_pane_view_get_from_pane (pane);
  if (view == nullptr)
    return;

  _tessel_debug_print (TESSEL_DEBUG_SESSION,
                       "Closing pane %s\n", tessel_pane_get_uuid (pane));

  /* The request may come from inside the terminal's own signal emission */
  auto data = g_new0 (CloseData, 1);
  data->session = (TesselSession*)g_object_ref (session);
  data->view = (TesselPaneView*)g_object_ref (view);

  g_idle_add_full (G_PRIORITY_DEFAULT_IDLE, close_idle_cb, data, (GDestroyNotify) close_data_free);
}

static void
pane_split_request_cb (TesselPane *pane,
                       TesselOrientation orientation,
                       TesselSession *session)
{
  auto const view = tessel_pane_view_get_from_pane (pane);
  if (view == nullptr)
    return;

  tessel_session_split (session, view, orientation);
}

static void
pane_move_request_cb (TesselPane *pane,
                      const char *source_uuid,
                      int quadrant,
                      TesselSession *session)
{
  auto const target = tessel_pane_view_get_from_pane (pane);
  if (target == nullptr)
    return;

  /* The source pane is still being dragged; rearrange once the drag is over */
  auto data = g_new0 (MoveData, 1);
  data->session = (TesselSession*)g_object_ref (session);
  data->target = (TesselPaneView*)g_object_ref (target);
  data->source_uuid = g_strdup (source_uuid);
  data->quadrant = TesselDragQuadrant (quadrant);

  g_idle_add_full (G_PRIORITY_DEFAULT_IDLE, move_idle_cb, data, (GDestroyNotify) move_data_free);
}

static gboolean
pane_detach_veto_cb (TesselPane *pane,
                     TesselSession *session)
{
  /* The last pane of a window has nowhere to go */
  return tessel_session_get_n_views (session) <= 1;
}

static void
pane_detach_request_cb (TesselPane *pane,
                        double x,
                        double y,
                        TesselSession *session)
{
  auto const view = tessel_pane_view_get_from_pane (pane);
  if (view == nullptr)
    return;

  g_signal_emit (session, signals[DETACH_VIEW], 0, view, x, y);
}

static void
pane_key_press_sync_cb (TesselPane *pane,
                        guint keyval,
                        guint state,
                        TesselSession *session)
{
  GList *views = tessel_session_list_views (session);

  for (GList *l = views; l != nullptr; l = l->next) {
    auto const other = tessel_pane_view_get_pane (TESSEL_PANE_VIEW (l->data));

    if (other != pane && tessel_pane_get_synchronize_input (other))
      tessel_pane_echo_key_press (other, keyval, state);
  }

  g_list_free (views);
}

static void
pane_process_notification_cb (TesselPane *pane,
                              const char *summary,
                              const char *body,
                              TesselSession *session)
{
  auto const application = g_application_get_default ();
  if (application == nullptr)
    return;

  g_autoptr(GNotification) notification = g_notification_new (summary);
  if (body != nullptr)
    g_notification_set_body (notification, body);

  g_application_send_notification (application, tessel_pane_get_uuid (pane), notification);
}

static void
tessel_session_connect_view (TesselSession *session,
                             TesselPaneView *view)
{
  auto const pane = tessel_pane_view_get_pane (view);

  g_signal_connect_object (pane, "focus-in",
                           G_CALLBACK (pane_focus_in_cb), session, GConnectFlags(0));
  g_signal_connect_object (pane, "close-request",
                           G_CALLBACK (pane_close_request_cb), session, GConnectFlags(0));
  g_signal_connect_object (pane, "split-request",
                           G_CALLBACK (pane_split_request_cb), session, GConnectFlags(0));
  g_signal_connect_object (pane, "move-request",
                           G_CALLBACK (pane_move_request_cb), session, GConnectFlags(0));
  g_signal_connect_object (pane, "detach-veto",
                           G_CALLBACK (pane_detach_veto_cb), session, GConnectFlags(0));
  g_signal_connect_object (pane, "detach-request",
                           G_CALLBACK (pane_detach_request_cb), session, GConnectFlags(0));
  g_signal_connect_object (pane, "key-press-sync",
                           G_CALLBACK (pane_key_press_sync_cb), session, GConnectFlags(0));
  g_signal_connect_object (pane, "process-notification",
                           G_CALLBACK (pane_process_notification_cb), session, GConnectFlags(0));
}

static void
tessel_session_disconnect_view (TesselSession *session,
                                TesselPaneView *view)
{
  auto const pane = tessel_pane_view_get_pane (view);

  if (pane != nullptr)
    g_signal_handlers_disconnect_by_data (pane, session);
}

/* Class implementation */

static void
tessel_session_init (TesselSession *session)
{
}

static void
tessel_session_dispose (GObject *object)
{
  TesselSession *session = TESSEL_SESSION (object);

  GList *views = tessel_session_list_views (session);
  for (GList *l = views; l != nullptr; l = l->next)
    tessel_session_disconnect_view (session, TESSEL_PANE_VIEW (l->data));
  g_list_free (views);

  session->active_view = nullptr;
  g_clear_pointer (&session->root, gtk_widget_unparent);

  G_OBJECT_CLASS (tessel_session_parent_class)->dispose (object);
}

static void
tessel_session_finalize (GObject *object)
{
  TesselSession *session = TESSEL_SESSION (object);

  g_clear_object (&session->context);

  G_OBJECT_CLASS (tessel_session_parent_class)->finalize (object);
}

static void
tessel_session_get_property (GObject *object,
                             guint prop_id,
                             GValue *value,
                             GParamSpec *pspec)
{
  TesselSession *session = TESSEL_SESSION (object);

  switch (prop_id) {
    case PROP_CONTEXT:
      g_value_set_object (value, session->context);
      break;
    case PROP_ACTIVE_VIEW:
      g_value_set_object (value, session->active_view);
      break;
    default:
      G_OBJECT_WARN_INVALID_PROPERTY_ID (object, prop_id, pspec);
      break;
  }
}

static void
tessel_session_set_property (GObject *object,
                             guint prop_id,
                             const GValue *value,
                             GParamSpec *pspec)
{
  TesselSession *session = TESSEL_SESSION (object);

  switch (prop_id) {
    case PROP_CONTEXT:
      session->context = (TesselContext*)g_value_dup_object (value);
      break;
    default:
      G_OBJECT_WARN_INVALID_PROPERTY_ID (object, prop_id, pspec);
      break;
  }
}

static void
tessel_session_class_init (TesselSessionClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);
  GtkWidgetClass *widget_class = GTK_WIDGET_CLASS (klass);

  object_class->dispose = tessel_session_dispose;
  object_class->finalize = tessel_session_finalize;
  object_class->get_property = tessel_session_get_property;
  object_class->set_property = tessel_session_set_property;

  pspecs[PROP_CONTEXT] =
    g_param_spec_object ("context", nullptr, nullptr,
                         TESSEL_TYPE_CONTEXT,
                         GParamFlags(G_PARAM_READWRITE |
                                     G_PARAM_CONSTRUCT_ONLY |
                                     G_PARAM_STATIC_STRINGS));

  pspecs[PROP_ACTIVE_VIEW] =
    g_param_spec_object ("active-view", nullptr, nullptr,
                         TESSEL_TYPE_PANE_VIEW,
                         GParamFlags(G_PARAM_READABLE |
                                     G_PARAM_EXPLICIT_NOTIFY |
                                     G_PARAM_STATIC_STRINGS));

  g_object_class_install_properties (object_class, N_PROPS, pspecs);

  signals[EMPTY] =
    g_signal_new (I_("empty"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  0,
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__VOID,
                  G_TYPE_NONE, 0);

  signals[DETACH_VIEW] =
    g_signal_new (I_("detach-view"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  0,
                  nullptr, nullptr,
                  nullptr,
                  G_TYPE_NONE,
                  3, TESSEL_TYPE_PANE_VIEW, G_TYPE_DOUBLE, G_TYPE_DOUBLE);

  gtk_widget_class_set_layout_manager_type (widget_class, GTK_TYPE_BIN_LAYOUT);
  gtk_widget_class_set_css_name (widget_class, "session");
}

/* public API */

GtkWidget *
tessel_session_new (TesselContext *context)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  return reinterpret_cast<GtkWidget*>(g_object_new (TESSEL_TYPE_SESSION,
                                                    "context", context,
                                                    nullptr));
}

TesselContext *
tessel_session_get_context (TesselSession *session)
{
  g_return_val_if_fail (TESSEL_IS_SESSION (session), nullptr);

  return session->context;
}

/**
 * tessel_session_start:
 * @session: an empty session
 * @profile_uuid: (nullable): the profile of the first pane
 * @working_directory: (nullable): where to start the shell
 *
 * Creates the first pane of @session and spawns its process.
 *
 * Returns: (transfer none): the new view
 */
TesselPaneView *
tessel_session_start (TesselSession *session,
                      const char *profile_uuid,
                      const char *working_directory)
{
  g_return_val_if_fail (TESSEL_IS_SESSION (session), nullptr);
  g_return_val_if_fail (session->root == nullptr, nullptr);

  auto const view = TESSEL_PANE_VIEW (tessel_pane_view_new (session->context, profile_uuid));

  tessel_session_insert_view (session, nullptr, view, GTK_ORIENTATION_HORIZONTAL, TRUE);
  tessel_session_set_active_view (session, view);

  tessel_pane_spawn (tessel_pane_view_get_pane (view), working_directory);

  return view;
}

/**
 * tessel_session_add_view:
 * @session:
 * @view: a view not in any session
 *
 * Adds @view to @session, next to the active view if there is one.
 */
void
tessel_session_add_view (TesselSession *session,
                         TesselPaneView *view)
{
  g_return_if_fail (TESSEL_IS_SESSION (session));
  g_return_if_fail (TESSEL_IS_PANE_VIEW (view));
  g_return_if_fail (gtk_widget_get_parent (GTK_WIDGET (view)) == nullptr);

  tessel_session_insert_view (session,
                              session->root ? session->active_view : nullptr,
                              view, GTK_ORIENTATION_HORIZONTAL, TRUE);
  tessel_session_set_active_view (session, view);
}

/**
 * tessel_session_take_view:
 * @session:
 * @view: a view in @session
 *
 * Removes @view from @session. Emits "empty" when it was the last one.
 *
 * Returns: (transfer full): @view
 */
TesselPaneView *
tessel_session_take_view (TesselSession *session,
                          TesselPaneView *view)
{
  g_return_val_if_fail (TESSEL_IS_SESSION (session), nullptr);
  g_return_val_if_fail (TESSEL_IS_PANE_VIEW (view), nullptr);
  g_return_val_if_fail (gtk_widget_get_ancestor (GTK_WIDGET (view), TESSEL_TYPE_SESSION) == GTK_WIDGET (session), nullptr);

  g_object_ref (view);

  tessel_session_disconnect_view (session, view);
  tessel_session_remove_widget (session, GTK_WIDGET (view));
  tessel_session_renumber (session);

  if (session->active_view == view) {
    GList *views = tessel_session_list_views (session);
    tessel_session_set_active_view (session, views ? TESSEL_PANE_VIEW (views->data) : nullptr);
    g_list_free (views);
  }

  if (session->root == nullptr)
    g_signal_emit (session, signals[EMPTY], 0);

  return view;
}

/**
 * tessel_session_split:
 * @session:
 * @view: the view to split
 * @orientation: %TESSEL_ORIENTATION_HORIZONTAL puts the new pane to the
 *   right of @view, %TESSEL_ORIENTATION_VERTICAL below it
 *
 * Creates a pane with @view's profile, started in @view's current directory.
 *
 * Returns: (transfer none): the new view
 */
TesselPaneView *
tessel_session_split (TesselSession *session,
                      TesselPaneView *view,
                      TesselOrientation orientation)
{
  g_return_val_if_fail (TESSEL_IS_SESSION (session), nullptr);
  g_return_val_if_fail (TESSEL_IS_PANE_VIEW (view), nullptr);

  auto const pane = tessel_pane_view_get_pane (view);
  auto const new_view = TESSEL_PANE_VIEW (tessel_pane_view_new (session->context,
                                                                tessel_pane_get_profile_uuid (pane)));

  tessel_session_insert_view (session, view, new_view,
                              orientation == TESSEL_ORIENTATION_HORIZONTAL ? GTK_ORIENTATION_HORIZONTAL
                                                                           : GTK_ORIENTATION_VERTICAL,
                              TRUE);
  tessel_session_set_active_view (session, new_view);

  g_autofree char *working_directory = tessel_pane_dup_current_directory (pane);
  tessel_pane_spawn (tessel_pane_view_get_pane (new_view), working_directory);

  gtk_widget_grab_focus (GTK_WIDGET (new_view));

  return new_view;
}

TesselPaneView *
tessel_session_get_active_view (TesselSession *session)
{
  g_return_val_if_fail (TESSEL_IS_SESSION (session), nullptr);

  return session->active_view;
}

/**
 * tessel_session_list_views:
 * @session:
 *
 * Returns: (transfer container): the views of @session, in tree order
 */
GList *
tessel_session_list_views (TesselSession *session)
{
  g_return_val_if_fail (TESSEL_IS_SESSION (session), nullptr);

  GList *views = nullptr;
  collect_views (session->root, &views);

  return g_list_reverse (views);
}

guint
tessel_session_get_n_views (TesselSession *session)
{
  GList *views = tessel_session_list_views (session);
  guint n = g_list_length (views);

  g_list_free (views);
  return n;
}

gboolean
tessel_session_has_running_processes (TesselSession *session)
{
  g_return_val_if_fail (TESSEL_IS_SESSION (session), FALSE);

  GList *views = tessel_session_list_views (session);
  gboolean running = FALSE;

  for (GList *l = views; l != nullptr && !running; l = l->next)
    running = tessel_pane_is_process_running (tessel_pane_view_get_pane (TESSEL_PANE_VIEW (l->data)));

  g_list_free (views);
  return running;
}
