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

#ifndef VMLEASE_VMX_FILE_H
#define VMLEASE_VMX_FILE_H

#include <QString>
#include <QStringList>

#include <optional>

namespace vmlease
{
// Key/value view of a VMware .vmx configuration file. Line order and unrelated lines are kept.
class VmxFile
{
public:
    static VmxFile load(const QString& path);

    std::optional<QString> value(const QString& key) const;
    void set(const QString& key, const QString& value);
    void remove(const QString& key);
    void save() const;

    const QString& path() const
    {
        return file_path;
    }

private:
    VmxFile(const QString& path, QStringList lines);
    int find(const QString& key) const;

    QString file_path;
    QStringList lines;
};
} // namespace vmlease

#endif // VMLEASE_VMX_FILE_H
