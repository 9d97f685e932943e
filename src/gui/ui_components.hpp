#pragma once

#include <QString>

class QLineEdit;
class QPushButton;
class QTextEdit;
class QWidget;

namespace qmatch::ui {

void showToast(QWidget* parent, const QString& message, const QString& level = "info", int durationMs = 2200);

// Line edit plus "Browse" button; the button opens a FASTA file dialog.
QWidget* createFastaPathRow(QWidget* parent, QLineEdit** pathEdit, QPushButton** browseButton);

// Appends "Key: body" as a coloured badge followed by the body text.
void appendBadgeLog(QTextEdit* log, const QString& text);

}  // namespace qmatch::ui
