#include "generator_page.hpp"

#include "ui_components.hpp"

#include "qmatch/dna_generator.hpp"
#include "qmatch/fasta_io.hpp"

#include <QFileDialog>
#include <QFormLayout>
#include <QFrame>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QRandomGenerator>
#include <QSpinBox>
#include <QTextEdit>
#include <QVBoxLayout>

#include <cstdint>
#include <random>

namespace {

QSpinBox* createSpin(QWidget* parent, int lo, int hi, int value) {
  auto* spin = new QSpinBox(parent);
  spin->setRange(lo, hi);
  spin->setValue(value);
  return spin;
}

QTextEdit* createSequenceView(QWidget* parent) {
  auto* view = new QTextEdit(parent);
  view->setObjectName("sequenceView");
  view->setReadOnly(true);
  view->setLineWrapMode(QTextEdit::WidgetWidth);
  view->setWordWrapMode(QTextOption::WrapAnywhere);
  return view;
}

}  // namespace

GeneratorPage::GeneratorPage(QWidget* parent) : QWidget(parent) {
  const qmatch::DemoParams defaults;

  auto* outer = new QVBoxLayout(this);
  outer->setContentsMargins(14, 14, 14, 14);
  outer->setSpacing(10);

  auto* card = new QFrame(this);
  card->setObjectName("card");
  auto* layout = new QVBoxLayout(card);
  layout->setContentsMargins(14, 14, 14, 14);
  layout->setSpacing(10);

  auto* form = new QFormLayout();
  m_ = createSpin(card, 1, 10000000, defaults.m);
  p_ = createSpin(card, 1, 1000000, defaults.p);
  n_ = createSpin(card, 1, 100000, defaults.n);
  k_ = createSpin(card, 0, 99999, defaults.k);
  seed_ = createSpin(card, 0, 2147483647, static_cast<int>(QRandomGenerator::global()->bounded(1000000)));
  form->addRow("Text length (m)", m_);
  form->addRow("Query length (p)", p_);
  form->addRow("n-mer length (n)", n_);
  form->addRow("Mismatches (k)", k_);
  form->addRow("Seed", seed_);
  layout->addLayout(form);

  auto* btnRow = new QHBoxLayout();
  auto* generateBtn = new QPushButton("Generate", card);
  generateBtn->setObjectName("primaryButton");
  sendBtn_ = new QPushButton("Search this case", card);
  sendBtn_->setEnabled(false);
  saveBtn_ = new QPushButton("Save FASTA", card);
  saveBtn_->setEnabled(false);
  btnRow->addWidget(generateBtn);
  btnRow->addWidget(sendBtn_);
  btnRow->addWidget(saveBtn_);
  btnRow->addStretch(1);
  layout->addLayout(btnRow);

  embedLabel_ = new QLabel("No case generated.", card);
  embedLabel_->setObjectName("subtitleLabel");
  layout->addWidget(embedLabel_);

  layout->addWidget(new QLabel("Text", card));
  textView_ = createSequenceView(card);
  layout->addWidget(textView_, 2);
  layout->addWidget(new QLabel("Query", card));
  queryView_ = createSequenceView(card);
  layout->addWidget(queryView_, 1);

  outer->addWidget(card, 1);

  connect(generateBtn, &QPushButton::clicked, this, &GeneratorPage::onGenerate);
  connect(saveBtn_, &QPushButton::clicked, this, &GeneratorPage::onSaveFasta);
  connect(sendBtn_, &QPushButton::clicked, this, [this]() {
    if (hasCase_) {
      emit demoReady(QString::fromStdString(current_.query),
                     QString::fromStdString(current_.text),
                     current_.params.n,
                     current_.params.k);
    }
  });
}

void GeneratorPage::onGenerate() {
  qmatch::DemoParams params;
  params.m = m_->value();
  params.p = p_->value();
  params.n = n_->value();
  params.k = k_->value();

  try {
    std::mt19937 rng(static_cast<std::uint32_t>(seed_->value()));
    current_ = qmatch::buildDemoCase(params, rng);
  } catch (const std::exception& e) {
    QMessageBox::warning(this, "Invalid parameters", e.what());
    return;
  }
  hasCase_ = true;
  sendBtn_->setEnabled(true);
  saveBtn_->setEnabled(true);
  textView_->setPlainText(QString::fromStdString(current_.text));
  queryView_->setPlainText(QString::fromStdString(current_.query));
  embedLabel_->setText(QString("Mutated %1-mer embedded at query %2, copied from text %3 (up to %4 substitutions)")
                           .arg(params.n)
                           .arg(current_.queryEmbedStart)
                           .arg(current_.textEmbedStart)
                           .arg(params.k));
}

void GeneratorPage::onSaveFasta() {
  if (!hasCase_) {
    return;
  }
  const QString path = QFileDialog::getSaveFileName(this, "Save demo FASTA", "demo.fa", "FASTA (*.fa *.fasta)");
  if (path.isEmpty()) {
    return;
  }
  try {
    qmatch::writeFasta(path.toStdString(), {{"text", current_.text}, {"query", current_.query}});
    qmatch::ui::showToast(this, "Saved " + path, "success");
  } catch (const std::exception& e) {
    QMessageBox::critical(this, "Save failed", e.what());
  }
}
