#include "main_window.hpp"

#include "generator_page.hpp"
#include "match_page.hpp"
#include "ui_components.hpp"

#include <QCloseEvent>
#include <QCoreApplication>
#include <QFrame>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QSplitter>
#include <QStackedWidget>
#include <QStatusBar>
#include <QVBoxLayout>
#include <QWidget>

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
  setWindowTitle("qmatch");
  resize(1280, 860);
  setupUi();
  setupConnections();
}

// The search worker reads facade_, so it has to be gone before the members are.
MainWindow::~MainWindow() {
  if (matchPage_) {
    matchPage_->cancelAndWait();
  }
}

void MainWindow::setupUi() {
  auto* central = new QWidget(this);
  auto* root = new QVBoxLayout(central);
  root->setContentsMargins(12, 12, 12, 8);
  root->setSpacing(10);

  auto* header = new QFrame(central);
  header->setObjectName("card");
  auto* headerLayout = new QVBoxLayout(header);
  headerLayout->setContentsMargins(14, 10, 14, 10);
  headerLayout->setSpacing(4);

  headerTitle_ = new QLabel(header);
  headerTitle_->setObjectName("titleLabel");
  headerSubTitle_ = new QLabel(header);
  headerSubTitle_->setObjectName("subtitleLabel");
  headerLayout->addWidget(headerTitle_);
  headerLayout->addWidget(headerSubTitle_);
  root->addWidget(header);

  auto* splitter = new QSplitter(Qt::Horizontal, central);
  splitter->setChildrenCollapsible(false);

  auto* navCard = new QFrame(splitter);
  navCard->setObjectName("card");
  auto* navLayout = new QVBoxLayout(navCard);
  navLayout->setContentsMargins(8, 10, 8, 10);
  navLayout->setSpacing(8);

  auto* navTitle = new QLabel("Workspace", navCard);
  navTitle->setObjectName("subtitleLabel");
  navLayout->addWidget(navTitle);

  navList_ = new QListWidget(navCard);
  navList_->setObjectName("navList");
  navList_->setFocusPolicy(Qt::NoFocus);
  navList_->addItem("Query Match");
  navList_->addItem("Demo Generator");
  navLayout->addWidget(navList_, 1);

  pages_ = new QStackedWidget(splitter);
  matchPage_ = new MatchPage(&facade_, pages_);
  generatorPage_ = new GeneratorPage(pages_);
  pages_->addWidget(matchPage_);
  pages_->addWidget(generatorPage_);

  splitter->addWidget(navCard);
  splitter->addWidget(pages_);
  splitter->setStretchFactor(0, 0);
  splitter->setStretchFactor(1, 1);
  splitter->setSizes({200, 1080});

  root->addWidget(splitter, 1);
  setCentralWidget(central);

  statusIcon_ = new QLabel("●", this);
  statusIcon_->setObjectName("statusDot");
  statusIcon_->setFixedWidth(18);
  statusIcon_->setAlignment(Qt::AlignCenter);
  statusBar()->addPermanentWidget(statusIcon_);
  setStatusIcon("idle", "Ready");

  navList_->setCurrentRow(0);
  onNavChanged(0);
}

void MainWindow::setupConnections() {
  connect(navList_, &QListWidget::currentRowChanged, this, &MainWindow::onNavChanged);

  connect(matchPage_, &MatchPage::searchStarted, this, [this](int n, int k) {
    const QString msg = QString("Searching %1-mers with <= %2 mismatches...").arg(n).arg(k);
    setStatusIcon("running", msg);
    statusBar()->showMessage(msg);
  });

  connect(matchPage_, &MatchPage::searchFinished, this, [this](int hits, bool cancelled) {
    if (cancelled) {
      setStatusIcon("warning", "Search cancelled");
      statusBar()->showMessage("Search cancelled");
      return;
    }
    const QString msg = QString("Search finished: %1 matches").arg(hits);
    setStatusIcon("success", msg);
    statusBar()->showMessage(msg);
    qmatch::ui::showToast(this, msg, "success");
  });

  connect(matchPage_, &MatchPage::searchFailed, this, [this](const QString& errorMessage) {
    setStatusIcon("error", errorMessage);
    statusBar()->showMessage(QString("Search failed: %1").arg(errorMessage));
  });

  connect(generatorPage_,
          &GeneratorPage::demoReady,
          this,
          [this](const QString& query, const QString& text, int n, int k) {
            matchPage_->setSequences(query, text, n, k);
            navList_->setCurrentRow(0);
            statusBar()->showMessage("Demo case loaded into Query Match");
          });
}

void MainWindow::onNavChanged(int row) {
  if (row < 0 || row >= pages_->count()) {
    return;
  }
  pages_->setCurrentIndex(row);

  switch (row) {
    case 0:
      headerTitle_->setText("Query Match");
      headerSubTitle_->setText("Find every query n-mer occurring in the text with at most k mismatches");
      break;
    case 1:
      headerTitle_->setText("Demo Generator");
      headerSubTitle_->setText("Build a random text and a query carrying a mutated copy of one of its n-mers");
      break;
    default:
      break;
  }
}

void MainWindow::setStatusIcon(const QString& level, const QString& tooltip) {
  QString color = "#8E8E93";  // idle gray
  if (level == "success") color = "#30D158";
  else if (level == "running") color = "#0A84FF";
  else if (level == "warning") color = "#FF9F0A";
  else if (level == "error") color = "#FF453A";

  statusIcon_->setStyleSheet(QString("color:%1; font-size:14px;").arg(color));
  statusIcon_->setToolTip(tooltip);
}

void MainWindow::closeEvent(QCloseEvent* event) {
  if (matchPage_ && matchPage_->isSearchRunning()) {
    statusBar()->showMessage("Search is still running. Cancelling before exit...");
    QCoreApplication::processEvents();
    matchPage_->cancelAndWait();
  }
  QMainWindow::closeEvent(event);
}
