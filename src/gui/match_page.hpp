#pragma once

#include "qmatch/facade.hpp"

#include <QHash>
#include <QWidget>

#include <atomic>
#include <memory>

class QComboBox;
class QFutureWatcherBase;
class QLabel;
class QLineEdit;
class QPushButton;
class QSpinBox;
class QTableWidget;
class QTextEdit;

class MatchPage : public QWidget {
  Q_OBJECT

 public:
  explicit MatchPage(qmatch::QueryMatchFacade* facade, QWidget* parent = nullptr);
  bool isSearchRunning() const { return searchRunning_; }
  // Raises the cancel flag of a running search and blocks until its worker returns.
  void cancelAndWait();
  void setSequences(const QString& query, const QString& text, int n, int k);

 signals:
  void searchStarted(int n, int k);
  void searchFinished(int hits, bool cancelled);
  void searchFailed(const QString& errorMessage);

 private slots:
  void onRunSearch();
  void onCancelSearch();

 private:
  struct Side {
    QLineEdit* fastaPath{nullptr};
    QComboBox* seqCombo{nullptr};
    QLineEdit* rawSeq{nullptr};
    int loadToken{0};
  };

  QWidget* buildSideInputs(Side& side, const QString& label, QWidget* parent);
  void loadSequenceNames(Side& side);
  void fillTable(const qmatch::MatchRequest& request, const qmatch::MatchResult& result);
  void setRunning(bool running);

 private:
  qmatch::QueryMatchFacade* facade_;
  Side query_;
  Side text_;
  QSpinBox* n_{nullptr};
  QSpinBox* k_{nullptr};
  QSpinBox* threads_{nullptr};
  QComboBox* method_{nullptr};
  QLabel* seedLabel_{nullptr};
  QLabel* summary_{nullptr};
  QTableWidget* table_{nullptr};
  QTextEdit* log_{nullptr};
  QPushButton* runBtn_{nullptr};
  QPushButton* cancelBtn_{nullptr};
  bool searchRunning_{false};
  std::shared_ptr<std::atomic<bool>> cancelFlag_;
  QFutureWatcherBase* searchWatcher_{nullptr};
  QHash<QString, QStringList> fastaNamesCache_;
};
