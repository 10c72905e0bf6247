// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/logging.h"
#include <QList>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <optional>

namespace PlasmaBaskets {

/**
 * @brief Shared D-Bus adaptor helper functions
 *
 * These helpers take a logging category template parameter so each adaptor
 * can log under its own category while sharing the validation logic.
 */
namespace DbusHelpers {

// ═══════════════════════════════════════════════════════════════════════════════
// Locator Validation
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Parse item locators received over D-Bus
 * @param locators URLs ("file:///...", "https://...") or absolute local paths
 * @param operation Description for error logging (e.g., "addItems")
 * @param category Logging category to use
 * @return Valid URLs in input order, or std::nullopt when none are usable
 *
 * Invalid entries are dropped with a warning; the remaining ones are kept.
 */
template <typename LogCategory>
std::optional<QList<QUrl>> parseLocators(const QStringList& locators, const QString& operation,
                                         LogCategory category)
{
    if (locators.isEmpty()) {
        qCWarning(category) << "Cannot" << operation << "- empty locator list";
        return std::nullopt;
    }

    QList<QUrl> urls;
    urls.reserve(locators.size());
    for (const QString& locator : locators) {
        const QString trimmed = locator.trimmed();
        const QUrl url = trimmed.isEmpty() ? QUrl()
                                           : QUrl::fromUserInput(trimmed, QString(), QUrl::AssumeLocalFile);
        if (!url.isValid()) {
            qCWarning(category) << "Ignoring invalid locator for" << operation << ":" << locator;
            continue;
        }
        urls.append(url);
    }

    if (urls.isEmpty()) {
        qCWarning(category) << "Cannot" << operation << "- no valid locators in" << locators;
        return std::nullopt;
    }
    return urls;
}

/**
 * @brief Overload using default lcDbus category
 */
inline std::optional<QList<QUrl>> parseLocators(const QStringList& locators, const QString& operation)
{
    return parseLocators(locators, operation, lcDbus);
}

/**
 * @brief Parse a single item locator received over D-Bus
 * @return The URL, or std::nullopt when @p locator is blank or invalid
 */
template <typename LogCategory>
std::optional<QUrl> parseLocator(const QString& locator, const QString& operation, LogCategory category)
{
    const auto urls = parseLocators(QStringList{locator}, operation, category);
    if (!urls) {
        return std::nullopt;
    }
    return urls->constFirst();
}

inline std::optional<QUrl> parseLocator(const QString& locator, const QString& operation)
{
    return parseLocator(locator, operation, lcDbus);
}

} // namespace DbusHelpers

} // namespace PlasmaBaskets
