/************************************************************************\

    Spatial Folders - Spatial file browser
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include <QDir>
#include <QSettings>
#include <QTemporaryDir>

#include <memory>

#include <gtest/gtest.h>

#include "AppSettings.h"

namespace {

class AppSettingsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_settings.reset(new QSettings(QDir(m_dir.path()).filePath("settings.ini"), QSettings::IniFormat));
    }

    QTemporaryDir m_dir;
    std::unique_ptr<QSettings> m_settings;
};

} // namespace

TEST_F(AppSettingsTest, DefaultsWhenNothingIsSet)
{
    const AppSettings settings = AppSettings::load(*m_settings);

    EXPECT_EQ(settings.startDirectory, QDir::homePath());
    EXPECT_DOUBLE_EQ(settings.cellWidth, 100.0);
    EXPECT_DOUBLE_EQ(settings.cellHeight, 100.0);
    EXPECT_DOUBLE_EQ(settings.spacing, 20.0);
    EXPECT_DOUBLE_EQ(settings.margin, 20.0);
    EXPECT_TRUE(settings.caseSensitiveSort);
    EXPECT_EQ(settings.watcherDebounceMs, 150);
    EXPECT_EQ(settings.bundleExtensions, QStringList({"app", "appdir"}));
}

TEST_F(AppSettingsTest, ReadsConfiguredValues)
{
    m_settings->setValue("startDirectory", m_dir.path());
    m_settings->setValue("grid/cellWidth", 80);
    m_settings->setValue("grid/cellHeight", 90);
    m_settings->setValue("grid/spacing", 8);
    m_settings->setValue("grid/margin", 0);
    m_settings->setValue("sorting/caseSensitive", false);
    m_settings->setValue("watcher/debounceMs", 0);
    m_settings->setValue("bundles/extensions", QStringList({".APP", "pkg", "app"}));

    const AppSettings settings = AppSettings::load(*m_settings);

    EXPECT_EQ(settings.startDirectory, QDir(m_dir.path()).absolutePath());
    EXPECT_DOUBLE_EQ(settings.cellWidth, 80.0);
    EXPECT_DOUBLE_EQ(settings.cellHeight, 90.0);
    EXPECT_DOUBLE_EQ(settings.spacing, 8.0);
    EXPECT_DOUBLE_EQ(settings.margin, 0.0);
    EXPECT_FALSE(settings.caseSensitiveSort);
    EXPECT_EQ(settings.watcherDebounceMs, 0);
    EXPECT_EQ(settings.bundleExtensions, QStringList({"app", "pkg"}));
}

TEST_F(AppSettingsTest, InvalidValuesFallBackToDefaults)
{
    m_settings->setValue("startDirectory", QDir(m_dir.path()).filePath("missing"));
    m_settings->setValue("grid/cellWidth", 0);
    m_settings->setValue("grid/cellHeight", "wide");
    m_settings->setValue("grid/spacing", -4);
    m_settings->setValue("watcher/debounceMs", -1);
    m_settings->setValue("bundles/extensions", QStringList({" ", "."}));

    const AppSettings settings = AppSettings::load(*m_settings);

    EXPECT_EQ(settings.startDirectory, QDir::homePath());
    EXPECT_DOUBLE_EQ(settings.cellWidth, 100.0);
    EXPECT_DOUBLE_EQ(settings.cellHeight, 100.0);
    EXPECT_DOUBLE_EQ(settings.spacing, 20.0);
    EXPECT_EQ(settings.watcherDebounceMs, 150);
    EXPECT_EQ(settings.bundleExtensions, QStringList({"app", "appdir"}));
}
