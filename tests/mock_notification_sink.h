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

#ifndef VMLEASE_MOCK_NOTIFICATION_SINK_H
#define VMLEASE_MOCK_NOTIFICATION_SINK_H

#include "common.h"

#include <vmlease/notification_sink.h>

namespace vmlease::test
{
class MockNotificationSink : public NotificationSink
{
public:
    MOCK_METHOD(void, notify, (const NotificationEvent&), (override));
};

inline auto has_outcome(Outcome outcome)
{
    return testing::Field(&NotificationEvent::outcome, outcome);
}

inline auto has_audience(Audience audience)
{
    return testing::Field(&NotificationEvent::routing, testing::Field(&NotificationRouting::audience, audience));
}

template <typename NameMatcher, typename ValueMatcher>
auto has_field(NameMatcher&& name, ValueMatcher&& value)
{
    return testing::Field(&NotificationEvent::fields,
                          testing::Contains(testing::AllOf(
                              testing::Field(&NotificationField::name, std::forward<NameMatcher>(name)),
                              testing::Field(&NotificationField::value, std::forward<ValueMatcher>(value)))));
}
} // namespace vmlease::test

#endif // VMLEASE_MOCK_NOTIFICATION_SINK_H
