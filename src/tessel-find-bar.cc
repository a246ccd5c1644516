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
#include "tessel-defines.hh"
#include "tessel-find-bar.hh"
#include "tessel-intl.hh"
#include "tessel-pcre2.hh"
#include "tessel-util.hh"

struct _TesselFindBar
{
  GtkWidget parent_instance;

  TesselVte *vte;
  TesselFindFlags flags;

  GtkEntry *entry;
  GtkCheckButton *match_case;
  GtkCheckButton *whole_words;
  GtkCheckButton *use_regex;
  GtkCheckButton *wrap_around;
};

enum {
  PROP_0,
  PROP_VTE,
  PROP_FLAGS,
  N_PROPS
};

enum {
  DISMISSED,
  LAST_SIGNAL
};

static GParamSpec *pspecs[N_PROPS];
static guint signals[LAST_SIGNAL];

G_DEFINE_FINAL_TYPE (TesselFindBar, tessel_find_bar, GTK_TYPE_WIDGET)

/**
 * tessel_find_regex_new:
 * @text: the search text
 * @flags: how to match @text
 * @error: return location for a #GError
 *
 * Compiles @text into a search regex. Unless %TESSEL_FIND_REGEX is set,
 * @text is matched literally.
 *
 * Returns: (transfer full) (nullable): the regex, or %NULL with @error
 *   set. Empty @text yields %NULL without an error.
 */
VteRegex *
tessel_find_regex_new (const char *text,
                       TesselFindFlags flags,
                       GError **error)
{
  if (tessel_str_empty0 (text))
    return nullptr;

  uint32_t compile_flags = PCRE2_UTF | PCRE2_NO_UTF_CHECK | PCRE2_UCP | PCRE2_MULTILINE;
  uint32_t extra_flags = 0;

  if (!(flags & TESSEL_FIND_MATCH_CASE))
    compile_flags |= PCRE2_CASELESS;
  if (flags & TESSEL_FIND_WHOLE_WORDS)
    extra_flags |= PCRE2_EXTRA_MATCH_WORD;

  g_autofree char *pattern = (flags & TESSEL_FIND_REGEX) ? g_strdup (text)
                                                         : g_regex_escape_string (text, -1);

  gsize error_offset = 0;
  auto regex = vte_regex_new_for_search_full (pattern, -1, compile_flags, extra_flags,
                                              &error_offset, error);
  if (regex == nullptr)
    return nullptr;

  /* JIT is an optimisation only */
  if (!vte_regex_jit (regex, PCRE2_JIT_COMPLETE, nullptr) ||
      !vte_regex_jit (regex, PCRE2_JIT_PARTIAL_SOFT, nullptr))
    _tessel_debug_print (TESSEL_DEBUG_PANE, "Search regex \"%s\" not JIT compiled\n", pattern);

  return regex;
}

static TesselFindFlags
find_bar_collect_flags (TesselFindBar *bar)
{
  unsigned flags = 0;

  if (gtk_check_button_get_active (bar->match_case))
    flags |= TESSEL_FIND_MATCH_CASE;
  if (gtk_check_button_get_active (bar->whole_words))
    flags |= TESSEL_FIND_WHOLE_WORDS;
  if (gtk_check_button_get_active (bar->use_regex))
    flags |= TESSEL_FIND_REGEX;

  return TesselFindFlags (flags);
}

static void
find_bar_set_error (TesselFindBar *bar,
                    const char *message)
{
  auto const entry = GTK_WIDGET (bar->entry);

  if (message != nullptr)
    gtk_widget_add_css_class (entry, "error");
  else
    gtk_widget_remove_css_class (entry, "error");

  gtk_widget_set_tooltip_text (entry, message);
}

static void
find_bar_update (TesselFindBar *bar)
{
  auto const flags = find_bar_collect_flags (bar);
  if (flags != bar->flags) {
    bar->flags = flags;
    g_object_notify_by_pspec (G_OBJECT (bar), pspecs[PROP_FLAGS]);
  }

  if (bar->vte == nullptr)
    return;

  auto const terminal = VTE_TERMINAL (bar->vte);
  g_autoptr(GError) error = nullptr;
  g_autoptr(VteRegex) regex = tessel_find_regex_new (gtk_editable_get_text (GTK_EDITABLE (bar->entry)),
                                                     flags, &error);

  if (error != nullptr) {
    /* Keep the previous search active while the pattern is incomplete */
    find_bar_set_error (bar, error->message);
    return;
  }

  find_bar_set_error (bar, nullptr);
  vte_terminal_search_set_regex (terminal, regex, 0);
  vte_terminal_search_set_wrap_around (terminal, gtk_check_button_get_active (bar->wrap_around));
}

static void
tessel_find_bar_changed_cb (TesselFindBar *bar)
{
  find_bar_update (bar);
}

/* Actions */

static void
find_bar_next_action (GtkWidget *widget,
                      const char *action_name,
                      GVariant *parameter)
{
  TesselFindBar *bar = TESSEL_FIND_BAR (widget);

  if (bar->vte != nullptr)
    vte_terminal_search_find_next (VTE_TERMINAL (bar->vte));
}

static void
find_bar_previous_action (GtkWidget *widget,
                          const char *action_name,
                          GVariant *parameter)
{
  TesselFindBar *bar = TESSEL_FIND_BAR (widget);

  if (bar->vte != nullptr)
    vte_terminal_search_find_previous (VTE_TERMINAL (bar->vte));
}

static void
find_bar_dismiss_action (GtkWidget *widget,
                         const char *action_name,
                         GVariant *parameter)
{
  TesselFindBar *bar = TESSEL_FIND_BAR (widget);

  if (bar->vte != nullptr)
    vte_terminal_search_set_regex (VTE_TERMINAL (bar->vte), nullptr, 0);

  g_signal_emit (bar, signals[DISMISSED], 0);
}

/* GtkWidgetClass impl */

static gboolean
tessel_find_bar_grab_focus (GtkWidget *widget)
{
  TesselFindBar *bar = TESSEL_FIND_BAR (widget);

  if (!gtk_widget_grab_focus (GTK_WIDGET (bar->entry)))
    return FALSE;

  gtk_editable_select_region (GTK_EDITABLE (bar->entry), 0, -1);
  return TRUE;
}

/* GObjectClass impl */

static void
tessel_find_bar_init (TesselFindBar *bar)
{
  gtk_widget_init_template (GTK_WIDGET (bar));

  bar->flags = find_bar_collect_flags (bar);
}

static void
tessel_find_bar_dispose (GObject *object)
{
  TesselFindBar *bar = TESSEL_FIND_BAR (object);

  gtk_widget_dispose_template (GTK_WIDGET (bar), TESSEL_TYPE_FIND_BAR);

  GtkWidget *child;
  while ((child = gtk_widget_get_first_child (GTK_WIDGET (bar))))
    gtk_widget_unparent (child);

  g_clear_object (&bar->vte);

  G_OBJECT_CLASS (tessel_find_bar_parent_class)->dispose (object);
}

static void
tessel_find_bar_get_property (GObject *object,
                              guint prop_id,
                              GValue *value,
                              GParamSpec *pspec)
{
  TesselFindBar *bar = TESSEL_FIND_BAR (object);

  switch (prop_id) {
  case PROP_VTE:
    g_value_set_object (value, bar->vte);
    break;
  case PROP_FLAGS:
    g_value_set_uint (value, bar->flags);
    break;
  default:
    G_OBJECT_WARN_INVALID_PROPERTY_ID (object, prop_id, pspec);
    break;
  }
}

static void
tessel_find_bar_set_property (GObject *object,
                              guint prop_id,
                              const GValue *value,
                              GParamSpec *pspec)
{
  TesselFindBar *bar = TESSEL_FIND_BAR (object);

  switch (prop_id) {
  case PROP_VTE:
    tessel_find_bar_set_vte (bar, reinterpret_cast<TesselVte*>(g_value_get_object (value)));
    break;
  default:
    G_OBJECT_WARN_INVALID_PROPERTY_ID (object, prop_id, pspec);
    break;
  }
}

static void
tessel_find_bar_class_init (TesselFindBarClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);
  GtkWidgetClass *widget_class = GTK_WIDGET_CLASS (klass);

  object_class->dispose = tessel_find_bar_dispose;
  object_class->get_property = tessel_find_bar_get_property;
  object_class->set_property = tessel_find_bar_set_property;

  widget_class->grab_focus = tessel_find_bar_grab_focus;

  pspecs[PROP_VTE] =
    g_param_spec_object ("vte", nullptr, nullptr,
                         TESSEL_TYPE_VTE,
                         GParamFlags(G_PARAM_READWRITE |
                                     G_PARAM_EXPLICIT_NOTIFY |
                                     G_PARAM_STATIC_STRINGS));

  pspecs[PROP_FLAGS] =
    g_param_spec_uint ("flags", nullptr, nullptr,
                       0, G_MAXUINT, 0,
                       GParamFlags(G_PARAM_READABLE |
                                   G_PARAM_EXPLICIT_NOTIFY |
                                   G_PARAM_STATIC_STRINGS));

  g_object_class_install_properties (object_class, N_PROPS, pspecs);

  /**
   * TesselFindBar::dismissed:
   *
   * Emitted when the user closes the bar; the search highlight has
   * already been cleared.
   */
  signals[DISMISSED] =
    g_signal_new (I_("dismissed"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  0,
                  nullptr, nullptr,
                  nullptr,
                  G_TYPE_NONE, 0);

  gtk_widget_class_set_template_from_resource (widget_class, TESSEL_RESOURCE_PATH "/ui/find-bar.ui");
  gtk_widget_class_set_layout_manager_type (widget_class, GTK_TYPE_BIN_LAYOUT);
  gtk_widget_class_set_css_name (widget_class, "findbar");

  gtk_widget_class_bind_template_child (widget_class, TesselFindBar, entry);
  gtk_widget_class_bind_template_child (widget_class, TesselFindBar, match_case);
  gtk_widget_class_bind_template_child (widget_class, TesselFindBar, whole_words);
  gtk_widget_class_bind_template_child (widget_class, TesselFindBar, use_regex);
  gtk_widget_class_bind_template_child (widget_class, TesselFindBar, wrap_around);
  gtk_widget_class_bind_template_callback (widget_class, tessel_find_bar_changed_cb);

  gtk_widget_class_install_action (widget_class, "find.next", nullptr, find_bar_next_action);
  gtk_widget_class_install_action (widget_class, "find.previous", nullptr, find_bar_previous_action);
  gtk_widget_class_install_action (widget_class, "find.dismiss", nullptr, find_bar_dismiss_action);

  /* The scrollback lies above the cursor, so Return searches backwards */
  gtk_widget_class_add_binding_action (widget_class, GDK_KEY_Escape, GdkModifierType(0), "find.dismiss", nullptr);
  gtk_widget_class_add_binding_action (widget_class, GDK_KEY_Return, GdkModifierType(0), "find.previous", nullptr);
  gtk_widget_class_add_binding_action (widget_class, GDK_KEY_KP_Enter, GdkModifierType(0), "find.previous", nullptr);
  gtk_widget_class_add_binding_action (widget_class, GDK_KEY_Return, GDK_SHIFT_MASK, "find.next", nullptr);
  gtk_widget_class_add_binding_action (widget_class, GDK_KEY_g, GDK_CONTROL_MASK, "find.previous", nullptr);
  gtk_widget_class_add_binding_action (widget_class, GDK_KEY_g, GdkModifierType(GDK_CONTROL_MASK | GDK_SHIFT_MASK), "find.next", nullptr);
}

/* Public API */

TesselVte *
tessel_find_bar_get_vte (TesselFindBar *bar)
{
  g_return_val_if_fail (TESSEL_IS_FIND_BAR (bar), nullptr);

  return bar->vte;
}

void
tessel_find_bar_set_vte (TesselFindBar *bar,
                         TesselVte *vte)
{
  g_return_if_fail (TESSEL_IS_FIND_BAR (bar));
  g_return_if_fail (vte == nullptr || TESSEL_IS_VTE (vte));

  if (!g_set_object (&bar->vte, vte))
    return;

  gtk_editable_set_text (GTK_EDITABLE (bar->entry), "");
  find_bar_set_error (bar, nullptr);

  g_object_notify_by_pspec (G_OBJECT (bar), pspecs[PROP_VTE]);
}
