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

#include "vmx_file.h"

#include <vmlease/exceptions/vm_operation_exception.h>
#include <vmlease/file_ops.h>
#include <vmlease/format.h>

#include <QRegularExpression>

namespace vl = vmlease;

namespace
{
const QRegularExpression entry_re{R"(^\s*([^=#\s][^=]*?)\s*=\s*"?(.*?)"?\s*$)"};
} // namespace

vl::VmxFile vl::VmxFile::load(const QString& path)
{
    QFile file{path};
    if (!VL_FILEOPS.open(file, QIODevice::ReadOnly | QIODevice::Text))
        throw VMOperationException{ErrorKind::unknown, "Could not read VM configuration {}: {}", path,
                                   file.errorString()};

    auto contents = QString::fromUtf8(VL_FILEOPS.read_all(file));
    auto lines = contents.split('\n');
    if (!lines.isEmpty() && lines.last().isEmpty())
        lines.removeLast();

    return VmxFile{path, std::move(lines)};
}

vl::VmxFile::VmxFile(const QString& path, QStringList lines) : file_path{path}, lines{std::move(lines)}
{
}

int vl::VmxFile::find(const QString& key) const
{
    for (int i = 0; i < lines.size(); ++i)
    {
        const auto match = entry_re.match(lines[i]);
        if (match.hasMatch() && match.captured(1).compare(key, Qt::CaseInsensitive) == 0)
            return i;
    }

    return -1;
}

std::optional<QString> vl::VmxFile::value(const QString& key) const
{
    const auto index = find(key);
    if (index < 0)
        return std::nullopt;

    return entry_re.match(lines[index]).captured(2);
}

void vl::VmxFile::set(const QString& key, const QString& value)
{
    const auto line = QString{"%1 = \"%2\""}.arg(key, value);
    const auto index = find(key);
    if (index < 0)
        lines.append(line);
    else
        lines[index] = line;
}

void vl::VmxFile::remove(const QString& key)
{
    const auto index = find(key);
    if (index >= 0)
        lines.removeAt(index);
}

void vl::VmxFile::save() const
{
    try
    {
        VL_FILEOPS.write_transactionally(file_path, (lines.join('\n') + '\n').toUtf8());
    }
    catch (const std::runtime_error& e)
    {
        throw VMOperationException{ErrorKind::unknown, "Could not update VM configuration: {}", e.what()};
    }
}
