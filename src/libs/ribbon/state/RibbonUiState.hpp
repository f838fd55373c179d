// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonError.hpp"
#include "ribbon/RibbonGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QVariant>

#include <memory>

QT_BEGIN_NAMESPACE
class QSettings;
QT_END_NAMESPACE

namespace Ribbon {

class RibbonModel;

struct RIBBON_EXPORT RibbonUiStateConfig final {
    QString applicationName = QStringLiteral("QtRibbon");
    // Directory used instead of the platform config location when set.
    QString configRootOverride;
};

// Ribbon presentation state persisted across sessions in an INI file.
class RIBBON_EXPORT RibbonUiState final
{
public:
    RibbonUiState();
    explicit RibbonUiState(RibbonUiStateConfig config);

    const QString& settingsFilePath() const { return m_path; }

    int ribbonHeight(int fallback) const;
    void setRibbonHeight(int height);

    bool collapsed(bool fallback) const;
    void setCollapsed(bool collapsed);

    int currentIndex(int fallback) const;
    void setCurrentIndex(int index);

    void save(const RibbonModel& model);
    RibbonResult restore(RibbonModel& model) const;

private:
    std::unique_ptr<QSettings> openSettings() const;
    QVariant value(const QString& key, const QVariant& fallback) const;
    void setValue(const QString& key, const QVariant& value);

    QString m_path;
};

} // namespace Ribbon
