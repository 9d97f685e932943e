#pragma once

#include <QString>

class QApplication;

namespace qmatch::ui {

struct UiThemeTokens {
  int fontBase{13};
  QString fontMono{"Menlo"};

  QString bgApp{"#F5F5F7"};
  QString bgCard{"#FFFFFF"};
  QString textPrimary{"#1D1D1F"};
  QString textSecondary{"#6E6E73"};
  QString border{"#E5E5EA"};
  QString accent{"#3F678F"};
  QString success{"#30D158"};
  QString warning{"#FF9F0A"};
  QString error{"#FF453A"};
  QString mismatch{"#FDEBEC"};

  int radiusCard{10};
  int radiusControl{7};
};

const UiThemeTokens& tokens();
void applyAppTheme(QApplication& app);
QString noticeColor(const QString& level);

}  // namespace qmatch::ui
