// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/Configuration.hpp"
#include "ShardCache/Core/ErrorHandlers.hpp"
#include "ShardCache/Core/FileOpener.hpp"
#include "ShardCache/Core/Models/UrlRequest.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <memory>
#include <optional>
namespace ShardCache::Core
{
    /// <summary>
    /// Turns a source of URL requests into a single pass sequence of open streams.
    /// Each URL gets a bounded number of attempts; every failure is routed through
    /// the error handler, whose answer decides between retrying and stopping.
    /// </summary>
    class StreamOpener
    {
        enum class AttemptOutcome
        {
            Success,
            Retry,
            Stop,
        };

        std::shared_ptr<FileOpener> m_opener;
        Models::UrlSource m_source;
        ErrorHandler m_handler;
        int m_maxAttempts;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
        bool m_exhausted;

    public:
        StreamOpener(std::shared_ptr<FileOpener> opener,
            Models::UrlSource source,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            ErrorHandler handler = ErrorHandlers::Reraise(),
            int maxAttempts = Configuration::MaxOpenAttempts);

        /// <summary>
        /// Pulls requests until one opens, the source runs dry, or the handler
        /// stops the stream.
        /// </summary>
        /// <returns>The next open stream, or std::nullopt once the sequence has ended.</returns>
        [[nodiscard]] std::optional<Models::OpenStreamResult> Next();

        [[nodiscard]] bool IsExhausted() const noexcept;

    private:
        AttemptOutcome Attempt(const Models::UrlRequest& request, std::optional<Models::OpenStreamResult>& result);
        bool HandleError(std::exception_ptr error);
    };
}
