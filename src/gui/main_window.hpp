#pragma once

#include "qmatch/facade.hpp"

#include <QMainWindow>

class GeneratorPage;
class MatchPage;
class QCloseEvent;
class QLabel;
class QListWidget;
class QStackedWidget;

class MainWindow : public QMainWindow {
  Q_OBJECT

 public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

 protected:
  void closeEvent(QCloseEvent* event) override;

 private slots:
  void onNavChanged(int row);

 private:
  void setupUi();
  void setupConnections();
  void setStatusIcon(const QString& level, const QString& tooltip = QString());

 private:
  qmatch::QueryMatchFacade facade_;

  QListWidget* navList_{nullptr};
  QStackedWidget* pages_{nullptr};
  QLabel* headerTitle_{nullptr};
  QLabel* headerSubTitle_{nullptr};
  QLabel* statusIcon_{nullptr};

  MatchPage* matchPage_{nullptr};
  GeneratorPage* generatorPage_{nullptr};
};
