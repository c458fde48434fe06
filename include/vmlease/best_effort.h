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

#pragma once

#include <vmlease/logging/log.h>

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace vmlease
{
// Result of a step whose failure must not abort the caller. A failed step keeps its diagnostic.
class BestEffort
{
public:
    static BestEffort ok()
    {
        return BestEffort{std::nullopt};
    }

    static BestEffort failed(std::string diagnostic)
    {
        return BestEffort{std::move(diagnostic)};
    }

    bool succeeded() const noexcept
    {
        return !diag.has_value();
    }

    const std::optional<std::string>& diagnostic() const noexcept
    {
        return diag;
    }

private:
    explicit BestEffort(std::optional<std::string> diag) : diag{std::move(diag)}
    {
    }

    std::optional<std::string> diag;
};

/**
 * Run @p f, turning a std::exception into a failed BestEffort that is logged as a warning.
 *
 * @param category Log category
 * @param step Short description of the step, used in the log line and the diagnostic
 * @param f The step. It may return void or a BestEffort of its own.
 */
template <typename Fun>
BestEffort best_effort(const std::string& category, std::string_view step, Fun&& f)
{
    try
    {
        if constexpr (std::is_same_v<std::invoke_result_t<Fun>, BestEffort>)
        {
            return std::forward<Fun>(f)();
        }
        else
        {
            std::forward<Fun>(f)();
            return BestEffort::ok();
        }
    }
    catch (const std::exception& e)
    {
        logging::warn(category, "{} failed, continuing: {}", step, e.what());
        return BestEffort::failed(fmt::format("{}: {}", step, e.what()));
    }
}
} // namespace vmlease
