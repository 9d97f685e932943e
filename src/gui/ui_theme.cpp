#include "ui_theme.hpp"

#include <QApplication>
#include <QFont>
#include <QFontDatabase>
#include <QPair>
#include <QVector>

namespace qmatch::ui {

const UiThemeTokens& tokens() {
  static UiThemeTokens t;
  return t;
}

QString noticeColor(const QString& level) {
  const auto& t = tokens();
  if (level == "success") return t.success;
  if (level == "warning") return t.warning;
  if (level == "error") return t.error;
  return t.accent;
}

void applyAppTheme(QApplication& app) {
  const auto& t = tokens();
  app.setStyle("Fusion");

  const QStringList families = QFontDatabase::families();
  QString family = "Segoe UI";
  if (families.contains("SF Pro Text")) family = "SF Pro Text";
  else if (families.contains("Noto Sans")) family = "Noto Sans";
  else if (families.contains("DejaVu Sans")) family = "DejaVu Sans";
  app.setFont(QFont(family, t.fontBase));

  QString mono = t.fontMono;
  if (!families.contains(mono)) {
    mono = QFontDatabase::systemFont(QFontDatabase::FixedFont).family();
  }

  // Each rule is a selector plus declarations; {name} placeholders are theme tokens.
  const QVector<QPair<QString, QString>> rules = {
      {"QWidget", "background: {bgApp}; color: {text};"},
      {"QFrame#card", "background: {bgCard}; border: 1px solid {border}; border-radius: {radiusCard}px;"},
      {"QLabel#titleLabel", "background: transparent; font-size: 17px; font-weight: 600;"},
      {"QLabel#subtitleLabel", "background: transparent; color: {textMuted}; font-size: 12px;"},
      {"QLineEdit, QComboBox, QSpinBox, QPushButton",
       "background: {bgCard}; border: 1px solid {border}; border-radius: {radiusControl}px; min-height: 28px;"},
      {"QLineEdit, QComboBox, QSpinBox", "padding-left: 6px;"},
      {"QPushButton", "padding: 0 12px;"},
      {"QPushButton#primaryButton", "background: {accent}; color: white; border-color: {accent}; font-weight: 600;"},
      {"QPushButton#primaryButton:disabled", "background: {border}; color: {textMuted};"},
      {"QLineEdit:focus, QComboBox:focus, QSpinBox:focus", "border-color: {accent};"},
      {"QTextEdit, QListWidget", "background: {bgCard}; border: 1px solid {border}; border-radius: {radiusControl}px;"},
      {"QTextEdit#sequenceView", "font-family: \"{mono}\";"},
      {"QTableWidget#matchTable",
       "background: {bgCard}; border: 1px solid {border}; font-family: \"{mono}\"; gridline-color: {border};"},
      {"QTableWidget#matchTable::item:selected", "background: {accent}; color: white;"},
      {"QHeaderView::section", "background: {bgApp}; border: 0; border-bottom: 1px solid {border}; padding: 4px 6px;"},
      {"QListWidget#navList", "background: transparent; border: 0; outline: 0;"},
      {"QListWidget#navList::item", "padding: 8px 10px; border-radius: {radiusControl}px;"},
      {"QListWidget#navList::item:selected", "background: {accent}; color: white;"},
      {"QStatusBar", "background: {bgCard}; border-top: 1px solid {border};"},
  };

  const QVector<QPair<QString, QString>> values = {
      {"bgApp", t.bgApp},
      {"bgCard", t.bgCard},
      {"text", t.textPrimary},
      {"textMuted", t.textSecondary},
      {"border", t.border},
      {"accent", t.accent},
      {"mono", mono},
      {"radiusCard", QString::number(t.radiusCard)},
      {"radiusControl", QString::number(t.radiusControl)},
  };

  QString qss;
  for (const auto& rule : rules) {
    QString body = rule.second;
    for (const auto& value : values) {
      body.replace("{" + value.first + "}", value.second);
    }
    qss += rule.first + " { " + body + " }\n";
  }
  app.setStyleSheet(qss);
}

}  // namespace qmatch::ui
