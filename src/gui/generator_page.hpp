#pragma once

#include "qmatch/types.hpp"

#include <QWidget>

class QLabel;
class QPushButton;
class QSpinBox;
class QTextEdit;

class GeneratorPage : public QWidget {
  Q_OBJECT

 public:
  explicit GeneratorPage(QWidget* parent = nullptr);

 signals:
  void demoReady(const QString& query, const QString& text, int n, int k);

 private slots:
  void onGenerate();
  void onSaveFasta();

 private:
  QSpinBox* m_{nullptr};
  QSpinBox* p_{nullptr};
  QSpinBox* n_{nullptr};
  QSpinBox* k_{nullptr};
  QSpinBox* seed_{nullptr};
  QTextEdit* textView_{nullptr};
  QTextEdit* queryView_{nullptr};
  QLabel* embedLabel_{nullptr};
  QPushButton* sendBtn_{nullptr};
  QPushButton* saveBtn_{nullptr};
  qmatch::DemoCase current_;
  bool hasCase_{false};
};
