// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/ErrorHandlers.hpp"
using namespace boost::log::trivial;
namespace ShardCache::Core
{
    ErrorHandler ErrorHandlers::Reraise()
    {
        return [](std::exception_ptr error) -> bool
        {
            std::rethrow_exception(error);
        };
    }

    ErrorHandler ErrorHandlers::IgnoreAndContinue()
    {
        return [](std::exception_ptr)
        {
            return true;
        };
    }

    ErrorHandler ErrorHandlers::IgnoreAndStop()
    {
        return [](std::exception_ptr)
        {
            return false;
        };
    }

    ErrorHandler ErrorHandlers::WarnAndContinue(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
    {
        return [logger = std::move(logger)](std::exception_ptr error)
        {
            BOOST_LOG_SEV(*logger, warning) << Describe(error) << ". Continuing";
            return true;
        };
    }

    ErrorHandler ErrorHandlers::WarnAndStop(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
    {
        return [logger = std::move(logger)](std::exception_ptr error)
        {
            BOOST_LOG_SEV(*logger, warning) << Describe(error) << ". Stopping";
            return false;
        };
    }

    std::string ErrorHandlers::Describe(std::exception_ptr error)
    {
        if (!error)
        {
            return "No error";
        }

        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception& e)
        {
            return e.what();
        }
        catch (...)
        {
            return "Unknown error";
        }
    }
}
