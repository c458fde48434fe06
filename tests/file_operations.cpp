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

#include "file_operations.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <stdexcept>

namespace vlt = vmlease::test;

QByteArray vlt::load(const QString& path)
{
    QFile file(path);
    if (file.exists() && file.open(QIODevice::ReadOnly))
        return file.readAll();

    throw std::invalid_argument(path.toStdString() + " does not exist");
}

void vlt::make_file_with_content(const QString& file_name, const std::string& content)
{
    // bypass FileOps, which tests may have mocked
    QDir{}.mkpath(QFileInfo{file_name}.absolutePath());

    QFile file(file_name);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        throw std::runtime_error(file_name.toStdString() + " could not be created");

    file.write(content.data(), static_cast<qint64>(content.size()));
}
