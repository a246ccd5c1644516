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

#include <config.h>

#include <glib/gi18n.h>

#include "tessel-info-bar.hh"
#include "tessel-intl.hh"

struct _TesselInfoBar
{
  GtkWidget parent_instance;

  GtkWidget *box;
  GtkWidget *content_box;
  GtkWidget *action_box;
};

enum {
  RESPONSE,
  LAST_SIGNAL
};

static guint signals[LAST_SIGNAL];

G_DEFINE_FINAL_TYPE (TesselInfoBar, tessel_info_bar, GTK_TYPE_WIDGET)

#define RESPONSE_ID_KEY "tessel-response-id"

/* helper functions */

static void
tessel_info_bar_button_clicked_cb (GtkButton *button,
                                   TesselInfoBar *bar)
{
  int response_id = GPOINTER_TO_INT (g_object_get_data (G_OBJECT (button), RESPONSE_ID_KEY));

  g_signal_emit (bar, signals[RESPONSE], 0, response_id);
}

static GtkWidget *
tessel_info_bar_add_button (TesselInfoBar *bar,
                            const char *text,
                            int response_id)
{
  GtkWidget *button = text ? gtk_button_new_with_mnemonic (text) : gtk_button_new ();

  g_object_set_data (G_OBJECT (button), RESPONSE_ID_KEY, GINT_TO_POINTER (response_id));
  g_signal_connect (button, "clicked",
                    G_CALLBACK (tessel_info_bar_button_clicked_cb), bar);
  gtk_box_append (GTK_BOX (bar->action_box), button);

  return button;
}

static void
tessel_info_bar_init (TesselInfoBar *bar)
{
  bar->box = gtk_box_new (GTK_ORIENTATION_HORIZONTAL, 12);
  gtk_widget_add_css_class (bar->box, "toolbar");
  gtk_widget_set_parent (bar->box, GTK_WIDGET (bar));

  bar->content_box = gtk_box_new (GTK_ORIENTATION_VERTICAL, 6);
  gtk_widget_set_hexpand (bar->content_box, TRUE);
  gtk_widget_set_valign (bar->content_box, GTK_ALIGN_CENTER);
  gtk_box_append (GTK_BOX (bar->box), bar->content_box);

  bar->action_box = gtk_box_new (GTK_ORIENTATION_HORIZONTAL, 6);
  gtk_widget_set_valign (bar->action_box, GTK_ALIGN_CENTER);
  gtk_box_append (GTK_BOX (bar->box), bar->action_box);
}

static void
tessel_info_bar_dispose (GObject *object)
{
  TesselInfoBar *bar = TESSEL_INFO_BAR (object);

  g_clear_pointer (&bar->box, gtk_widget_unparent);

  G_OBJECT_CLASS (tessel_info_bar_parent_class)->dispose (object);
}

static void
tessel_info_bar_class_init (TesselInfoBarClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);
  GtkWidgetClass *widget_class = GTK_WIDGET_CLASS (klass);

  object_class->dispose = tessel_info_bar_dispose;

  signals[RESPONSE] =
    g_signal_new (I_("response"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  0,
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__INT,
                  G_TYPE_NONE,
                  1, G_TYPE_INT);

  gtk_widget_class_set_layout_manager_type (widget_class, GTK_TYPE_BIN_LAYOUT);
  gtk_widget_class_set_css_name (widget_class, "infobar");
}

/* public API */

/**
 * tessel_info_bar_new:
 * @type: a #GtkMessageType
 * @first_button_text: the mnemonic label of the first button, followed by
 *   its response ID and further label and response ID pairs
 *
 * Returns: a new #TesselInfoBar
 */
GtkWidget *
tessel_info_bar_new (GtkMessageType type,
                     const char *first_button_text,
                     ...)
{
  TesselInfoBar *bar;
  va_list args;

  bar = reinterpret_cast<TesselInfoBar*>(g_object_new (TESSEL_TYPE_INFO_BAR, nullptr));

  switch (type) {
  case GTK_MESSAGE_ERROR:
    gtk_widget_add_css_class (GTK_WIDGET (bar), "error");
    break;
  case GTK_MESSAGE_WARNING:
    gtk_widget_add_css_class (GTK_WIDGET (bar), "warning");
    break;
  default:
    gtk_widget_add_css_class (GTK_WIDGET (bar), "info");
    break;
  }

  va_start (args, first_button_text);
  while (first_button_text != nullptr) {
    int response_id;

    response_id = va_arg (args, int);
    tessel_info_bar_add_button (bar, first_button_text, response_id);

    first_button_text = va_arg (args, const char *);
  }
  va_end (args);

  GtkWidget *close_button = tessel_info_bar_add_button (bar, nullptr, GTK_RESPONSE_CLOSE);
  gtk_button_set_icon_name (GTK_BUTTON (close_button), "window-close-symbolic");
  gtk_widget_set_tooltip_text (close_button, _("Close"));
  gtk_widget_add_css_class (close_button, "flat");

  return GTK_WIDGET (bar);
}

void
tessel_info_bar_format_text (TesselInfoBar *bar,
                             const char *format,
                             ...)
{
  g_autofree char *text = nullptr;
  GtkWidget *label;
  va_list args;

  g_return_if_fail (TESSEL_IS_INFO_BAR (bar));

  va_start (args, format);
  text = g_strdup_vprintf (format, args);
  va_end (args);

  label = gtk_label_new (text);

  gtk_label_set_wrap (GTK_LABEL (label), TRUE);
  gtk_label_set_selectable (GTK_LABEL (label), TRUE);
  gtk_label_set_xalign (GTK_LABEL (label), 0.0);
  gtk_label_set_yalign (GTK_LABEL (label), 0.0);

  gtk_box_append (GTK_BOX (bar->content_box), label);
}
