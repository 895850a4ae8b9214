#pragma once

#include "IChartTheme.hpp"
#include <QString>
#include <QStringList>
#include <map>
#include <memory>

/**
 * Holds the chart themes known to the application.
 * Created with the built-in dark theme registered.
 */
class ChartThemeRegistry {
public:
    ChartThemeRegistry();

    /**
     * Register a theme, replacing any theme with the same id.
     */
    void registerTheme(std::unique_ptr<IChartTheme> theme);

    /**
     * Resolve a theme by id. Unknown ids resolve to the dark theme.
     */
    const IChartTheme& resolve(const QString& themeId) const;

    bool contains(const QString& themeId) const;

    /**
     * Get list of available theme IDs.
     */
    QStringList availableThemes() const;

    static constexpr const char* kDefaultThemeId = "dark";

private:
    std::map<QString, std::unique_ptr<IChartTheme>> m_themes;
};
