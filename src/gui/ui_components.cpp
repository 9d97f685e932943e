#include "ui_components.hpp"

#include "ui_theme.hpp"

#include <QColor>
#include <QFont>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QTextCharFormat>
#include <QTextCursor>
#include <QTextEdit>
#include <QTimer>
#include <QWidget>

#include <algorithm>

namespace qmatch::ui {

namespace {

QString logLevelForKey(const QString& key) {
  if (key == "Config") return "config";
  if (key == "Stats") return "stats";
  if (key == "Matches" || key == "Saved") return "success";
  if (key == "Error") return "error";
  if (key == "Running" || key == "Load" || key == "Cancel") return "running";
  return "info";
}

QTextCharFormat badgeFormatForLevel(const QString& level) {
  QColor bg("#E9EAEE");
  QColor fg("#4A4A4A");
  if (level == "config") {
    bg = QColor("#E8F0FE");
    fg = QColor("#2557D6");
  } else if (level == "stats") {
    bg = QColor("#FFF4E5");
    fg = QColor("#A15A00");
  } else if (level == "running") {
    bg = QColor("#EAF2FF");
    fg = QColor("#3367D6");
  } else if (level == "success") {
    bg = QColor("#E8F7ED");
    fg = QColor("#1E7A3D");
  } else if (level == "error") {
    bg = QColor("#FDEBEC");
    fg = QColor("#B3261E");
  }
  QTextCharFormat fmt;
  fmt.setForeground(fg);
  fmt.setBackground(bg);
  fmt.setFontWeight(QFont::DemiBold);
  return fmt;
}

}  // namespace

void showToast(QWidget* parent, const QString& message, const QString& level, int durationMs) {
  if (!parent) {
    return;
  }
  auto* toast = new QLabel(message, parent);
  toast->setStyleSheet(QString("background:%1;color:white;padding:8px 12px;border-radius:8px;")
                           .arg(noticeColor(level)));
  toast->setAttribute(Qt::WA_DeleteOnClose, true);
  toast->adjustSize();

  const int x = parent->width() - toast->width() - 24;
  toast->move(std::max(12, x), 18);
  toast->show();

  QTimer::singleShot(durationMs, toast, [toast]() { toast->close(); });
}

QWidget* createFastaPathRow(QWidget* parent, QLineEdit** pathEdit, QPushButton** browseButton) {
  auto* row = new QWidget(parent);
  auto* layout = new QHBoxLayout(row);
  layout->setContentsMargins(0, 0, 0, 0);
  layout->setSpacing(6);
  *pathEdit = new QLineEdit(row);
  (*pathEdit)->setPlaceholderText("FASTA file (optional)");
  *browseButton = new QPushButton("Browse", row);
  layout->addWidget(*pathEdit, 1);
  layout->addWidget(*browseButton);
  return row;
}

void appendBadgeLog(QTextEdit* log, const QString& text) {
  QTextCursor c = log->textCursor();
  c.movePosition(QTextCursor::End);

  const int p = text.indexOf(':');
  const QString key = p > 0 ? text.left(p).trimmed() : QString();
  if (key.isEmpty()) {
    c.insertText(text + "\n");
    log->setTextCursor(c);
    return;
  }
  const QString body = text.mid(p + 1).trimmed();

  QTextCharFormat badgeFmt = badgeFormatForLevel(logLevelForKey(key));
  badgeFmt.setFontPointSize(10.0);
  c.insertText(" " + key + " ", badgeFmt);

  QTextCharFormat bodyFmt;
  bodyFmt.setForeground(QColor("#3A3A3C"));
  bodyFmt.setFontPointSize(10.5);
  c.insertText(" " + body + "\n", bodyFmt);
  log->setTextCursor(c);
}

}  // namespace qmatch::ui
