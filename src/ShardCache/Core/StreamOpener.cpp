// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/StreamOpener.hpp"
#include "ShardCache/Core/Errors.hpp"
using namespace boost::log::trivial;
namespace ShardCache::Core
{
    StreamOpener::StreamOpener(std::shared_ptr<FileOpener> opener,
        Models::UrlSource source,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        ErrorHandler handler,
        int maxAttempts)
        : m_opener(std::move(opener)),
        m_source(std::move(source)),
        m_handler(std::move(handler)),
        m_maxAttempts(maxAttempts > 0 ? maxAttempts : 1),
        m_logger(std::move(logger)),
        m_exhausted(false)
    {
    }

    std::optional<Models::OpenStreamResult> StreamOpener::Next()
    {
        while (!m_exhausted)
        {
            auto request = m_source();
            if (!request)
            {
                m_exhausted = true;
                break;
            }

            std::optional<Models::OpenStreamResult> result;
            auto outcome = AttemptOutcome::Retry;
            int attempts = 0;
            while (outcome == AttemptOutcome::Retry && attempts < m_maxAttempts)
            {
                ++attempts;
                outcome = Attempt(*request, result);
            }

            if (outcome == AttemptOutcome::Success)
            {
                return result;
            }

            if (outcome == AttemptOutcome::Stop)
            {
                BOOST_LOG_SEV(*m_logger, info) << "Error handler stopped the stream at '" << request->GetUrl() << "'";
                m_exhausted = true;
                break;
            }

            BOOST_LOG_SEV(*m_logger, warning) << "Giving up on '" << request->GetUrl() << "' after " << attempts << " attempts";
            if (!HandleError(std::make_exception_ptr(RetriesExhaustedError(request->GetUrl(), attempts))))
            {
                m_exhausted = true;
            }
        }

        return std::nullopt;
    }

    bool StreamOpener::IsExhausted() const noexcept
    {
        return m_exhausted;
    }

    StreamOpener::AttemptOutcome StreamOpener::Attempt(const Models::UrlRequest& request, std::optional<Models::OpenStreamResult>& result)
    {
        try
        {
            auto opened = m_opener->OpenFile(request.GetUrl());
            result = Models::OpenStreamResult{ request.GetUrl(), request.GetMetadata(), std::move(opened.stream), std::move(opened.localPath) };
            return AttemptOutcome::Success;
        }
        catch (const std::exception& e)
        {
            BOOST_LOG_SEV(*m_logger, debug) << "Attempt to open '" << request.GetUrl() << "' failed. Error: " << e.what();
            return HandleError(std::current_exception()) ? AttemptOutcome::Retry : AttemptOutcome::Stop;
        }
    }

    bool StreamOpener::HandleError(std::exception_ptr error)
    {
        try
        {
            return m_handler(std::move(error));
        }
        catch (...)
        {
            // A rethrowing handler ends the stream for good.
            m_exhausted = true;
            throw;
        }
    }
}
