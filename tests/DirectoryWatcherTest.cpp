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
#include <QSignalSpy>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "DirectoryWatcher.h"
#include "TestUtils.h"

namespace {

class DirectoryWatcherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_watcher.setDebounceInterval(20);
    }

    QString path(const QString &name) const
    {
        return QDir(m_dir.path()).filePath(name);
    }

    QTemporaryDir m_dir;
    DirectoryWatcher m_watcher;
};

} // namespace

TEST_F(DirectoryWatcherTest, StartFailsOnMissingFolder)
{
    QString error;
    EXPECT_FALSE(m_watcher.start(path("missing"), &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(m_watcher.isActive());
}

TEST_F(DirectoryWatcherTest, StartFailsOnFile)
{
    ASSERT_TRUE(TestUtils::writeFile(path("file.txt")));
    EXPECT_FALSE(m_watcher.start(path("file.txt")));
    EXPECT_FALSE(m_watcher.isActive());
}

TEST_F(DirectoryWatcherTest, StopIsIdempotent)
{
    ASSERT_TRUE(m_watcher.start(m_dir.path()));
    EXPECT_TRUE(m_watcher.isActive());
    EXPECT_EQ(m_watcher.path(), QDir(m_dir.path()).absolutePath());

    m_watcher.stop();
    EXPECT_FALSE(m_watcher.isActive());
    EXPECT_TRUE(m_watcher.path().isEmpty());
    m_watcher.stop();
    EXPECT_FALSE(m_watcher.isActive());
}

TEST_F(DirectoryWatcherTest, ReportsNewFile)
{
    QSignalSpy changes(&m_watcher, &DirectoryWatcher::directoryChanged);
    ASSERT_TRUE(m_watcher.start(m_dir.path()));

    ASSERT_TRUE(TestUtils::writeFile(path("new.txt")));
    ASSERT_TRUE(TestUtils::waitFor([&changes]() { return changes.count() > 0; }));
    EXPECT_EQ(changes.at(0).at(0).toString(), QDir(m_dir.path()).absolutePath());
}

TEST_F(DirectoryWatcherTest, CoalescesBurstsIntoOneDelivery)
{
    m_watcher.setDebounceInterval(300);
    QSignalSpy changes(&m_watcher, &DirectoryWatcher::directoryChanged);
    ASSERT_TRUE(m_watcher.start(m_dir.path()));

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(TestUtils::writeFile(path(QStringLiteral("burst-%1.txt").arg(i))));
    }
    ASSERT_TRUE(TestUtils::waitFor([&changes]() { return changes.count() > 0; }));
    TestUtils::spin(100);
    EXPECT_EQ(changes.count(), 1);
}

TEST_F(DirectoryWatcherTest, StoppedWatcherStaysQuiet)
{
    QSignalSpy changes(&m_watcher, &DirectoryWatcher::directoryChanged);
    ASSERT_TRUE(m_watcher.start(m_dir.path()));
    m_watcher.stop();

    ASSERT_TRUE(TestUtils::writeFile(path("after-stop.txt")));
    TestUtils::spin(200);
    EXPECT_EQ(changes.count(), 0);
}

TEST_F(DirectoryWatcherTest, RestartOnAnotherFolderReleasesTheFirst)
{
    ASSERT_TRUE(TestUtils::makeDir(path("first")));
    ASSERT_TRUE(TestUtils::makeDir(path("second")));
    QSignalSpy changes(&m_watcher, &DirectoryWatcher::directoryChanged);
    ASSERT_TRUE(m_watcher.start(path("first")));
    ASSERT_TRUE(m_watcher.start(path("second")));

    ASSERT_TRUE(TestUtils::writeFile(path("first/ignored.txt")));
    TestUtils::spin(200);
    EXPECT_EQ(changes.count(), 0);

    ASSERT_TRUE(TestUtils::writeFile(path("second/seen.txt")));
    ASSERT_TRUE(TestUtils::waitFor([&changes]() { return changes.count() > 0; }));
    EXPECT_EQ(changes.at(0).at(0).toString(), QDir(path("second")).absolutePath());
}

TEST_F(DirectoryWatcherTest, RecreatedFolderIsWatchedAgain)
{
    ASSERT_TRUE(TestUtils::makeDir(path("watched")));
    QSignalSpy changes(&m_watcher, &DirectoryWatcher::directoryChanged);
    QSignalSpy lost(&m_watcher, &DirectoryWatcher::watchLost);
    ASSERT_TRUE(m_watcher.start(path("watched")));

    ASSERT_TRUE(QDir(path("watched")).removeRecursively());
    // Give the drop time to be noticed before the folder comes back.
    TestUtils::spin(200);
    EXPECT_TRUE(m_watcher.isActive());
    const int beforeRecreate = changes.count();

    ASSERT_TRUE(TestUtils::makeDir(path("watched")));
    ASSERT_TRUE(TestUtils::waitFor([&changes, beforeRecreate]() { return changes.count() > beforeRecreate; }));

    const int afterRecreate = changes.count();
    ASSERT_TRUE(TestUtils::writeFile(path("watched/late.txt")));
    ASSERT_TRUE(TestUtils::waitFor([&changes, afterRecreate]() { return changes.count() > afterRecreate; }));
    EXPECT_TRUE(m_watcher.isActive());
    EXPECT_EQ(lost.count(), 0);
}

TEST_F(DirectoryWatcherTest, LosingFolderAndParentEndsSubscription)
{
    ASSERT_TRUE(TestUtils::makeDir(path("outer/inner")));
    QSignalSpy lost(&m_watcher, &DirectoryWatcher::watchLost);
    ASSERT_TRUE(m_watcher.start(path("outer/inner")));

    ASSERT_TRUE(QDir(path("outer")).removeRecursively());
    ASSERT_TRUE(TestUtils::waitFor([&lost]() { return lost.count() > 0; }));

    EXPECT_EQ(lost.count(), 1);
    EXPECT_EQ(lost.at(0).at(0).toString(), QDir(path("outer/inner")).absolutePath());
    EXPECT_FALSE(m_watcher.isActive());
}

TEST_F(DirectoryWatcherTest, NegativeDebounceIsClamped)
{
    m_watcher.setDebounceInterval(-5);
    EXPECT_EQ(m_watcher.debounceInterval(), 0);
}
