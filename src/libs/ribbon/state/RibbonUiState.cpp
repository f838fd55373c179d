// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/state/RibbonUiState.hpp"

#include "ribbon/RibbonModel.hpp"

#include <QtCore/QDebug>
#include <QtCore/QDir>
#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>

namespace Ribbon {

namespace {

using namespace Qt::StringLiterals;

const QString kRibbonHeightKey = u"ribbon/height"_s;
const QString kCollapsedKey = u"ribbon/collapsed"_s;
const QString kCurrentIndexKey = u"ribbon/currentIndex"_s;

QString resolveSettingsPath(const RibbonUiStateConfig& cfg)
{
    const QString root = !cfg.configRootOverride.isEmpty()
                             ? cfg.configRootOverride
                             : QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    const QString app = cfg.applicationName.isEmpty() ? u"QtRibbon"_s : cfg.applicationName;
    return QDir(QDir(root).filePath(app)).absoluteFilePath(u"ribbon.ini"_s);
}

} // namespace

RibbonUiState::RibbonUiState()
    : RibbonUiState(RibbonUiStateConfig{})
{
}

RibbonUiState::RibbonUiState(RibbonUiStateConfig config)
    : m_path(resolveSettingsPath(config))
{
}

std::unique_ptr<QSettings> RibbonUiState::openSettings() const
{
    auto settings = std::make_unique<QSettings>(m_path, QSettings::IniFormat);
    settings->setFallbacksEnabled(false);
    return settings;
}

QVariant RibbonUiState::value(const QString& key, const QVariant& fallback) const
{
    return openSettings()->value(key, fallback);
}

void RibbonUiState::setValue(const QString& key, const QVariant& value)
{
    auto settings = openSettings();
    settings->setValue(key, value);
    settings->sync();
    if (settings->status() != QSettings::NoError)
        qCWarning(ribbonlog).noquote() << "RibbonUiState: failed to write" << key << "to" << m_path;
}

int RibbonUiState::ribbonHeight(int fallback) const
{
    bool ok = false;
    const int h = value(kRibbonHeightKey, fallback).toInt(&ok);
    return (ok && h > 0) ? h : fallback;
}

void RibbonUiState::setRibbonHeight(int height)
{
    if (height <= 0)
        return;
    setValue(kRibbonHeightKey, height);
}

bool RibbonUiState::collapsed(bool fallback) const
{
    return value(kCollapsedKey, fallback).toBool();
}

void RibbonUiState::setCollapsed(bool collapsed)
{
    setValue(kCollapsedKey, collapsed);
}

int RibbonUiState::currentIndex(int fallback) const
{
    bool ok = false;
    const int idx = value(kCurrentIndexKey, fallback).toInt(&ok);
    return ok ? idx : fallback;
}

void RibbonUiState::setCurrentIndex(int index)
{
    setValue(kCurrentIndexKey, index);
}

void RibbonUiState::save(const RibbonModel& model)
{
    setRibbonHeight(model.ribbonHeight());
    setCollapsed(model.isCollapsed());
    setCurrentIndex(model.currentIndex());
}

RibbonResult RibbonUiState::restore(RibbonModel& model) const
{
    const RibbonResult height = model.setRibbonHeight(ribbonHeight(model.ribbonHeight()));
    if (!height)
        return height;

    model.setCollapsed(collapsed(model.isCollapsed()));

    const int index = currentIndex(-1);
    if (index < 0)
        return RibbonResult::success();

    // Tabs may have changed since the state was saved; keep the current tab then.
    const RibbonResult current = model.setCurrentIndex(index);
    if (!current)
        qCDebug(ribbonlog).noquote() << "RibbonUiState: not restoring tab:" << current.error.message();

    return RibbonResult::success();
}

} // namespace Ribbon
