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

#ifndef VMLEASE_FILE_OPS_H
#define VMLEASE_FILE_OPS_H

#include "singleton.h"

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QLockFile>
#include <QSaveFile>
#include <QString>

#include <chrono>

#define VL_FILEOPS vmlease::FileOps::instance()

namespace vmlease
{
class FileOps : public Singleton<FileOps>
{
public:
    FileOps(const Singleton<FileOps>::PrivatePass&) noexcept;

    // QDir operations
    virtual bool exists(const QDir& dir) const;
    virtual bool mkpath(const QDir& dir, const QString& dir_name) const;
    virtual bool remove_recursively(QDir& dir) const;

    // QFile and QSaveFile operations
    virtual bool exists(const QFile& file) const;
    virtual bool open(QIODevice& file, QIODevice::OpenMode mode) const;
    virtual QByteArray read_all(QIODevice& file) const;
    virtual qint64 write(QIODevice& file, const QByteArray& data) const;
    virtual bool commit(QSaveFile& file) const;

    // QLockFile operations
    virtual void setStaleLockTime(QLockFile& lock, std::chrono::milliseconds time) const;
    virtual bool tryLock(QLockFile& lock, std::chrono::milliseconds timeout) const;

    // Replace the contents of file_name atomically, throwing std::runtime_error on failure
    virtual void write_transactionally(const QString& file_name, const QByteArray& data) const;
};
} // namespace vmlease

#endif // VMLEASE_FILE_OPS_H
