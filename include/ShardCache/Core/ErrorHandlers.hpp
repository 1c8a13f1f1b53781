// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <string>
namespace ShardCache::Core
{
    /// <summary>
    /// Decides what happens after a failed open. Returning true continues (retry
    /// the URL, or move past it once retries are exhausted); returning false stops
    /// the whole stream. A handler may also rethrow.
    /// </summary>
    using ErrorHandler = std::function<bool(std::exception_ptr)>;

    struct ErrorHandlers
    {
        [[nodiscard]] static ErrorHandler Reraise();
        [[nodiscard]] static ErrorHandler IgnoreAndContinue();
        [[nodiscard]] static ErrorHandler IgnoreAndStop();
        [[nodiscard]] static ErrorHandler WarnAndContinue(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        [[nodiscard]] static ErrorHandler WarnAndStop(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        [[nodiscard]] static std::string Describe(std::exception_ptr error);
    };
}
