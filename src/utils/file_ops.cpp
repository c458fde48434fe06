/*
 * Copyright (C) Canonical, Ltd.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 3.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include <vmlease/file_ops.h>
#include <vmlease/format.h>

#include <stdexcept>

namespace vl = vmlease;

vl::FileOps::FileOps(const Singleton<FileOps>::PrivatePass& pass) noexcept : Singleton<FileOps>::Singleton{pass}
{
}

bool vl::FileOps::exists(const QDir& dir) const
{
    return dir.exists();
}

bool vl::FileOps::mkpath(const QDir& dir, const QString& dir_name) const
{
    return dir.mkpath(dir_name);
}

bool vl::FileOps::remove_recursively(QDir& dir) const
{
    return dir.removeRecursively();
}

bool vl::FileOps::exists(const QFile& file) const
{
    return file.exists();
}

bool vl::FileOps::open(QIODevice& file, QIODevice::OpenMode mode) const
{
    return file.open(mode);
}

QByteArray vl::FileOps::read_all(QIODevice& file) const
{
    return file.readAll();
}

qint64 vl::FileOps::write(QIODevice& file, const QByteArray& data) const
{
    return file.write(data);
}

bool vl::FileOps::commit(QSaveFile& file) const
{
    return file.commit();
}

void vl::FileOps::setStaleLockTime(QLockFile& lock, std::chrono::milliseconds time) const
{
    lock.setStaleLockTime(static_cast<int>(time.count()));
}

bool vl::FileOps::tryLock(QLockFile& lock, std::chrono::milliseconds timeout) const
{
    return lock.tryLock(static_cast<int>(timeout.count()));
}

void vl::FileOps::write_transactionally(const QString& file_name, const QByteArray& data) const
{
    const QFileInfo info{file_name};
    if (!mkpath(info.absoluteDir(), "."))
        throw std::runtime_error{fmt::format("Could not create directory for {}", file_name)};

    QSaveFile file{file_name};
    if (!open(file, QIODevice::WriteOnly))
        throw std::runtime_error{fmt::format("Could not open {} for writing: {}", file_name, file.errorString())};

    if (write(file, data) != data.size())
        throw std::runtime_error{fmt::format("Could not write to {}: {}", file_name, file.errorString())};

    if (!commit(file))
        throw std::runtime_error{fmt::format("Could not commit {}: {}", file_name, file.errorString())};
}
