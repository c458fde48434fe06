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

#ifndef VMLEASE_COMMON_H
#define VMLEASE_COMMON_H

#include <vmlease/format.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

// Extra macros for testing exceptions.
//
//    * VL_{ASSERT|EXPECT}_THROW_THAT(statement, expected_exception, matcher):
//         Tests that the statement throws an exception of the expected type, matching the provided matcher
#define VL_EXPECT_THROW_THAT(statement, expected_exception, matcher)                                                   \
    EXPECT_THROW(                                                                                                      \
        {                                                                                                              \
            try                                                                                                        \
            {                                                                                                          \
                statement;                                                                                             \
            }                                                                                                          \
            catch (const expected_exception& e)                                                                        \
            {                                                                                                          \
                EXPECT_THAT(e, matcher);                                                                               \
                throw;                                                                                                 \
            }                                                                                                          \
        },                                                                                                             \
        expected_exception)

#define VL_ASSERT_THROW_THAT(statement, expected_exception, matcher)                                                   \
    ASSERT_THROW(                                                                                                      \
        {                                                                                                              \
            try                                                                                                        \
            {                                                                                                          \
                statement;                                                                                             \
            }                                                                                                          \
            catch (const expected_exception& e)                                                                        \
            {                                                                                                          \
                ASSERT_THAT(e, matcher);                                                                               \
                throw;                                                                                                 \
            }                                                                                                          \
        },                                                                                                             \
        expected_exception)

// Macros to make a mock delegate calls on a base class by default.
// For example, if `mock_widget` is an object of type `MockWidget` which mocks `Widget`, one can say:
//     `VL_DELEGATE_MOCK_CALLS_ON_BASE(mock_widget, render, Widget);`
// This will cause calls to `mock_widget.render()` to delegate on the base implementation in `MockWidget`.
#define VL_DELEGATE_MOCK_CALLS_ON_BASE(mock, method, BaseT)                                                            \
    VL_DELEGATE_MOCK_CALLS_ON_BASE_WITH_MATCHERS(mock, method, BaseT, )

// This second form accepts matchers, which are useful to disambiguate overloaded methods.
#define VL_DELEGATE_MOCK_CALLS_ON_BASE_WITH_MATCHERS(mock, method, BaseT, ...)                                         \
    ON_CALL(mock, method __VA_ARGS__).WillByDefault([m = &mock](auto&&... args) {                                      \
        return m->BaseT::method(std::forward<decltype(args)>(args)...);                                                \
    })

// Teach GTest to print Qt stuff
QT_BEGIN_NAMESPACE
class QString;
void PrintTo(const QString& qstr, std::ostream* os);
QT_END_NAMESPACE

// Teach GTest to print vmlease stuff
namespace vmlease
{
struct TaskState;
struct NotificationEvent;

void PrintTo(const TaskState& task, std::ostream* os);
void PrintTo(const NotificationEvent& event, std::ostream* os);
} // namespace vmlease

// Matchers
namespace vmlease::test
{
template <typename MsgMatcher>
auto match_what(MsgMatcher&& matcher)
{
    return testing::Property(&std::exception::what, std::forward<MsgMatcher>(matcher));
}

template <typename StrMatcher>
auto match_qstring(StrMatcher&& matcher)
{
    return testing::Property(&QString::toStdString, std::forward<StrMatcher>(matcher));
}
} // namespace vmlease::test

#endif // VMLEASE_COMMON_H
