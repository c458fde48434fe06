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

#ifndef VMLEASE_FILE_OPERATIONS_H
#define VMLEASE_FILE_OPERATIONS_H

#include <QByteArray>
#include <QString>

#include <string>

namespace vmlease
{
namespace test
{
QByteArray load(const QString& path);
void make_file_with_content(const QString& file_name, const std::string& content = "this is a test file");
}
}
#endif // VMLEASE_FILE_OPERATIONS_H
