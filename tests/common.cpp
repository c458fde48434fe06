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

#include "common.h"

#include <vmlease/notification.h>
#include <vmlease/vm_record.h>

#include <QString>

#include <ostream>

QT_BEGIN_NAMESPACE
void PrintTo(const QString& qstr, std::ostream* os)
{
    *os << "QString(\"" << qUtf8Printable(qstr) << "\")";
}
QT_END_NAMESPACE

void vmlease::PrintTo(const TaskState& task, std::ostream* os)
{
    *os << "TaskState(" << as_string(task.phase) << ", " << task.progress << ", "
        << (task.message ? "\"" + *task.message + "\"" : std::string{"null"}) << ")";
}

void vmlease::PrintTo(const NotificationEvent& event, std::ostream* os)
{
    *os << "NotificationEvent(" << as_string(event.outcome) << ", " << as_string(event.routing.audience) << ", \""
        << event.summary << "\")";
}
