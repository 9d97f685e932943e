#include "match_page.hpp"

#include "ui_components.hpp"
#include "ui_theme.hpp"

#include "qmatch/fasta_io.hpp"
#include "qmatch/matcher.hpp"

#include <QBrush>
#include <QColor>
#include <QComboBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QFrame>
#include <QFutureWatcher>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QTableWidget>
#include <QTextEdit>
#include <QVBoxLayout>
#include <QtConcurrent/QtConcurrent>

#include <algorithm>
#include <stdexcept>

namespace {

constexpr int kMaxTableRows = 5000;

struct SearchTaskResult {
  qmatch::MatchRequest request;
  qmatch::MatchResult result;
  QString error;
};

struct FastaNameLoadResult {
  QStringList names;
  QString error;
};

std::string resolveSequence(const std::string& raw, const std::string& fastaPath, const std::string& seqName) {
  if (!raw.empty()) {
    return raw;
  }
  if (fastaPath.empty()) {
    throw std::runtime_error("no sequence or FASTA file given");
  }
  return qmatch::readFastaSequence(fastaPath, seqName);
}

// Text n-mer with the positions that differ from the query n-mer lower-cased.
QString markMismatches(const std::string& q, const std::string& t) {
  QString out;
  out.reserve(static_cast<qsizetype>(t.size()));
  for (std::size_t i = 0; i < t.size(); ++i) {
    const QChar c = QChar::fromLatin1(t[i]);
    out.append(i < q.size() && q[i] != t[i] ? c.toLower() : c);
  }
  return out;
}

}  // namespace

MatchPage::MatchPage(qmatch::QueryMatchFacade* facade, QWidget* parent)
    : QWidget(parent), facade_(facade) {
  auto* outer = new QVBoxLayout(this);
  outer->setContentsMargins(14, 14, 14, 14);
  outer->setSpacing(10);

  auto* card = new QFrame(this);
  card->setObjectName("card");
  auto* layout = new QVBoxLayout(card);
  layout->setContentsMargins(14, 14, 14, 14);
  layout->setSpacing(10);

  auto* inputs = new QHBoxLayout();
  inputs->addWidget(buildSideInputs(query_, "Query", card), 1);
  inputs->addWidget(buildSideInputs(text_, "Text", card), 1);
  layout->addLayout(inputs);

  auto* optRow = new QHBoxLayout();
  n_ = new QSpinBox(card);
  n_->setRange(1, 100000);
  n_->setValue(15);
  k_ = new QSpinBox(card);
  k_->setRange(0, 99999);
  k_->setValue(2);
  threads_ = new QSpinBox(card);
  threads_->setRange(1, 128);
  threads_->setValue(1);
  method_ = new QComboBox(card);
  method_->addItem("l-mer filtration", static_cast<int>(qmatch::MatchMethod::LmerFilter));
  method_->addItem("brute force", static_cast<int>(qmatch::MatchMethod::BruteForce));
  seedLabel_ = new QLabel(card);
  seedLabel_->setObjectName("subtitleLabel");

  optRow->addWidget(new QLabel("n", card));
  optRow->addWidget(n_);
  optRow->addWidget(new QLabel("k", card));
  optRow->addWidget(k_);
  optRow->addWidget(new QLabel("Threads", card));
  optRow->addWidget(threads_);
  optRow->addWidget(new QLabel("Method", card));
  optRow->addWidget(method_);
  optRow->addWidget(seedLabel_);
  optRow->addStretch(1);
  layout->addLayout(optRow);

  auto* btnRow = new QHBoxLayout();
  runBtn_ = new QPushButton("Run search", card);
  runBtn_->setObjectName("primaryButton");
  cancelBtn_ = new QPushButton("Cancel", card);
  cancelBtn_->setEnabled(false);
  auto* clearBtn = new QPushButton("Clear log", card);
  summary_ = new QLabel("No search executed.", card);
  summary_->setObjectName("subtitleLabel");
  btnRow->addWidget(runBtn_);
  btnRow->addWidget(cancelBtn_);
  btnRow->addWidget(clearBtn);
  btnRow->addWidget(summary_, 1);
  layout->addLayout(btnRow);

  table_ = new QTableWidget(card);
  table_->setObjectName("matchTable");
  table_->setColumnCount(5);
  table_->setHorizontalHeaderLabels({"query_start", "text_start", "mismatches", "query n-mer", "text n-mer"});
  table_->setAlternatingRowColors(true);
  table_->setEditTriggers(QAbstractItemView::NoEditTriggers);
  table_->horizontalHeader()->setStretchLastSection(true);
  layout->addWidget(table_, 3);

  log_ = new QTextEdit(card);
  log_->setReadOnly(true);
  log_->setMinimumHeight(140);
  layout->addWidget(log_, 1);

  outer->addWidget(card, 1);

  auto updateSeedLabel = [this]() {
    const int n = n_->value();
    const int k = k_->value();
    if (k + 1 > n) {
      seedLabel_->setText("k must be smaller than n");
    } else {
      seedLabel_->setText(QString("seed length l = %1").arg(n / (k + 1)));
    }
  };
  connect(n_, &QSpinBox::valueChanged, this, updateSeedLabel);
  connect(k_, &QSpinBox::valueChanged, this, updateSeedLabel);
  updateSeedLabel();

  connect(runBtn_, &QPushButton::clicked, this, &MatchPage::onRunSearch);
  connect(cancelBtn_, &QPushButton::clicked, this, &MatchPage::onCancelSearch);
  connect(clearBtn, &QPushButton::clicked, log_, &QTextEdit::clear);
}

QWidget* MatchPage::buildSideInputs(Side& side, const QString& label, QWidget* parent) {
  auto* box = new QWidget(parent);
  auto* form = new QFormLayout(box);
  form->setContentsMargins(0, 0, 0, 0);
  form->setHorizontalSpacing(10);
  form->setVerticalSpacing(8);

  QPushButton* browse = nullptr;
  form->addRow(label + " FASTA", qmatch::ui::createFastaPathRow(box, &side.fastaPath, &browse));

  side.seqCombo = new QComboBox(box);
  side.seqCombo->setEditable(true);
  side.seqCombo->setInsertPolicy(QComboBox::NoInsert);
  form->addRow(label + " record", side.seqCombo);

  side.rawSeq = new QLineEdit(box);
  side.rawSeq->setPlaceholderText("or paste ACGT... (takes precedence)");
  form->addRow(label + " sequence", side.rawSeq);

  Side* sidePtr = &side;
  connect(browse, &QPushButton::clicked, this, [this, sidePtr, label]() {
    const QString p = QFileDialog::getOpenFileName(this,
                                                    "Select " + label.toLower() + " FASTA",
                                                    QString(),
                                                    "FASTA (*.fa *.fasta *.fna);;All files (*)");
    if (!p.isEmpty()) {
      sidePtr->fastaPath->setText(p);
      loadSequenceNames(*sidePtr);
    }
  });
  connect(side.fastaPath, &QLineEdit::editingFinished, this, [this, sidePtr]() { loadSequenceNames(*sidePtr); });
  return box;
}

void MatchPage::loadSequenceNames(Side& side) {
  const int token = ++side.loadToken;
  const QString path = side.fastaPath->text().trimmed();
  QComboBox* combo = side.seqCombo;
  combo->clear();
  combo->setEnabled(true);
  if (path.isEmpty()) {
    return;
  }

  auto it = fastaNamesCache_.find(path);
  if (it != fastaNamesCache_.end()) {
    combo->addItems(it.value());
    return;
  }

  combo->setEnabled(false);
  combo->addItem("Loading sequence names...");

  Side* sidePtr = &side;
  auto* watcher = new QFutureWatcher<FastaNameLoadResult>(this);
  connect(watcher, &QFutureWatcher<FastaNameLoadResult>::finished, this, [this, watcher, sidePtr, path, token]() {
    watcher->deleteLater();
    if (token != sidePtr->loadToken) {
      return;
    }
    const FastaNameLoadResult loaded = watcher->result();
    QComboBox* combo = sidePtr->seqCombo;
    combo->clear();
    combo->setEnabled(true);
    if (!loaded.error.isEmpty()) {
      qmatch::ui::appendBadgeLog(log_, QString("Load: failed to load FASTA names: %1").arg(loaded.error));
      return;
    }
    fastaNamesCache_.insert(path, loaded.names);
    combo->addItems(loaded.names);
  });

  const std::string stdPath = path.toStdString();
  watcher->setFuture(QtConcurrent::run([stdPath]() {
    FastaNameLoadResult out;
    try {
      for (const auto& n : qmatch::readFastaNames(stdPath)) {
        out.names.push_back(QString::fromStdString(n));
      }
    } catch (const std::exception& e) {
      out.error = QString::fromUtf8(e.what());
    }
    return out;
  }));
}

void MatchPage::setSequences(const QString& query, const QString& text, int n, int k) {
  query_.rawSeq->setText(query);
  text_.rawSeq->setText(text);
  n_->setValue(n);
  k_->setValue(k);
  qmatch::ui::appendBadgeLog(log_, QString("Load: query (%1 bp) and text (%2 bp) from generator")
                                       .arg(query.size())
                                       .arg(text.size()));
}

void MatchPage::setRunning(bool running) {
  searchRunning_ = running;
  runBtn_->setEnabled(!running);
  cancelBtn_->setEnabled(running);
}

void MatchPage::onRunSearch() {
  if (searchRunning_) {
    qmatch::ui::appendBadgeLog(log_, "Running: a search is already in progress.");
    return;
  }

  const std::string queryRaw = query_.rawSeq->text().trimmed().toUpper().toStdString();
  const std::string textRaw = text_.rawSeq->text().trimmed().toUpper().toStdString();
  const std::string queryFasta = query_.fastaPath->text().trimmed().toStdString();
  const std::string textFasta = text_.fastaPath->text().trimmed().toStdString();
  if ((queryRaw.empty() && queryFasta.empty()) || (textRaw.empty() && textFasta.empty())) {
    QMessageBox::warning(this, "Missing input", "Please provide a query and a text (FASTA or pasted sequence).");
    return;
  }
  const std::string querySeq = query_.seqCombo->currentText().trimmed().toStdString();
  const std::string textSeq = text_.seqCombo->currentText().trimmed().toStdString();

  qmatch::MatchRequest base;
  base.n = n_->value();
  base.k = k_->value();
  base.threads = threads_->value();
  base.method = static_cast<qmatch::MatchMethod>(method_->currentData().toInt());

  cancelFlag_ = std::make_shared<std::atomic<bool>>(false);
  table_->setRowCount(0);
  setRunning(true);
  qmatch::ui::appendBadgeLog(log_, QString("Config: n=%1 k=%2 threads=%3 method=%4")
                                       .arg(base.n)
                                       .arg(base.k)
                                       .arg(base.threads)
                                       .arg(qmatch::methodName(base.method)));
  qmatch::ui::appendBadgeLog(log_, "Running: search started in background...");
  emit searchStarted(base.n, base.k);

  auto* watcher = new QFutureWatcher<SearchTaskResult>(this);
  searchWatcher_ = watcher;
  connect(watcher, &QFutureWatcher<SearchTaskResult>::finished, this, [this, watcher]() {
    const SearchTaskResult task = watcher->result();
    watcher->deleteLater();
    searchWatcher_ = nullptr;
    setRunning(false);
    if (!task.error.isEmpty()) {
      qmatch::ui::appendBadgeLog(log_, QString("Error: %1").arg(task.error));
      summary_->setText("Search failed.");
      QMessageBox::critical(this, "Search failed", task.error);
      emit searchFailed(task.error);
      return;
    }
    const auto& s = task.result.stats;
    qmatch::ui::appendBadgeLog(log_, QString("Stats: windows=%1 candidates=%2 out_of_bounds=%3 verified=%4 accepted=%5")
                                         .arg(s.windowsScanned)
                                         .arg(s.candidates)
                                         .arg(s.outOfBounds)
                                         .arg(s.verified)
                                         .arg(s.accepted));
    if (task.result.cancelled) {
      summary_->setText("Search cancelled.");
      qmatch::ui::appendBadgeLog(log_, "Cancel: search stopped, no results kept.");
    } else {
      fillTable(task.request, task.result);
      qmatch::ui::appendBadgeLog(log_, QString("Matches: %1").arg(static_cast<qulonglong>(task.result.pairs.size())));
    }
    emit searchFinished(static_cast<int>(task.result.pairs.size()), task.result.cancelled);
  });

  std::shared_ptr<std::atomic<bool>> cancel = cancelFlag_;
  watcher->setFuture(QtConcurrent::run(
      [facade = facade_, base, cancel, queryRaw, textRaw, queryFasta, textFasta, querySeq, textSeq]() {
        SearchTaskResult out;
        try {
          out.request = base;
          out.request.query = resolveSequence(queryRaw, queryFasta, querySeq);
          out.request.text = resolveSequence(textRaw, textFasta, textSeq);
          out.request.cancel = cancel.get();
          out.result = facade->match(out.request);
          out.request.cancel = nullptr;
        } catch (const std::exception& e) {
          out.error = QString::fromUtf8(e.what());
        }
        return out;
      }));
}

void MatchPage::onCancelSearch() {
  if (searchRunning_ && cancelFlag_) {
    cancelFlag_->store(true);
    qmatch::ui::appendBadgeLog(log_, "Cancel: requested, waiting for the current window to finish...");
  }
}

void MatchPage::cancelAndWait() {
  if (!searchRunning_ || searchWatcher_ == nullptr) {
    return;
  }
  if (cancelFlag_) {
    cancelFlag_->store(true);
  }
  searchWatcher_->waitForFinished();
}

void MatchPage::fillTable(const qmatch::MatchRequest& request, const qmatch::MatchResult& result) {
  const int total = static_cast<int>(result.pairs.size());
  const int rows = std::min(total, kMaxTableRows);
  table_->setRowCount(rows);
  const QBrush mismatchBrush(QColor(qmatch::ui::tokens().mismatch));
  for (int row = 0; row < rows; ++row) {
    const auto& pair = result.pairs[static_cast<std::size_t>(row)];
    const std::string q = request.query.substr(static_cast<std::size_t>(pair.queryStart - 1),
                                               static_cast<std::size_t>(request.n));
    const std::string t = request.text.substr(static_cast<std::size_t>(pair.textStart - 1),
                                              static_cast<std::size_t>(request.n));
    const int mismatches = qmatch::hammingDistance(q, t);
    table_->setItem(row, 0, new QTableWidgetItem(QString::number(pair.queryStart)));
    table_->setItem(row, 1, new QTableWidgetItem(QString::number(pair.textStart)));
    table_->setItem(row, 2, new QTableWidgetItem(QString::number(mismatches)));
    table_->setItem(row, 3, new QTableWidgetItem(QString::fromStdString(q)));
    auto* textItem = new QTableWidgetItem(markMismatches(q, t));
    if (mismatches > 0) {
      textItem->setBackground(mismatchBrush);
    }
    table_->setItem(row, 4, textItem);
  }
  if (total > rows) {
    summary_->setText(QString("%1 matches (showing first %2), seed length %3").arg(total).arg(rows).arg(result.seedLength));
  } else {
    summary_->setText(QString("%1 matches, seed length %2").arg(total).arg(result.seedLength));
  }
}
