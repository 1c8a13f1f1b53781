// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/StreamOpener.hpp"
#include "ShardCache/Core/Errors.hpp"
#include "ShardCache/Core/FileCache.hpp"
#include "ShardCache/Core/LocalFilesystem.hpp"
#include "ShardCache/Core/Mocks/FileOpenerMock.hpp"
#include "ShardCache/Core/Mocks/TransportMock.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>
using boost::log::trivial::severity_level;
using boost::log::sources::severity_logger_mt;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Throw;
using ShardCache::Core::ErrorHandler;
using ShardCache::Core::ErrorHandlers;
using ShardCache::Core::FetchError;
using ShardCache::Core::FileCache;
using ShardCache::Core::InputStream;
using ShardCache::Core::LocalFilesystem;
using ShardCache::Core::OpenedFile;
using ShardCache::Core::RetriesExhaustedError;
using ShardCache::Core::StreamOpener;
using ShardCache::Core::ValidationError;
using ShardCache::Core::Models::CacheOptions;
using ShardCache::Core::Models::MakeUrlSource;
using ShardCache::Core::Models::UrlRequest;
using ShardCache::Core::Mocks::FileOpenerMock;
using ShardCache::Core::Mocks::TransportMock;
using ShardCache::Core::Testing::MakeTarArchive;
using ShardCache::Core::Testing::MemoryStream;
using ShardCache::Core::Testing::ReadAll;
using ShardCache::Core::Testing::TemporaryDirectory;
class StreamOpenerTests : public ::testing::Test
{
protected:
    std::shared_ptr<FileOpenerMock> m_opener;
    std::shared_ptr<severity_logger_mt<severity_level>> m_logger;
    std::vector<std::exception_ptr> m_handledErrors;

public:
    StreamOpenerTests()
        : m_opener(std::make_shared<FileOpenerMock>()),
        m_logger(std::make_shared<severity_logger_mt<severity_level>>())
    {
    }

    static OpenedFile Opened(const std::string& content, const std::filesystem::path& localPath = {})
    {
        return OpenedFile{ std::make_unique<MemoryStream>(content), localPath };
    }

    ErrorHandler RecordingHandler(bool result)
    {
        return [this, result](std::exception_ptr error)
            {
                m_handledErrors.push_back(error);
                return result;
            };
    }
};

TEST_F(StreamOpenerTests, Next_OpensUrlsInOrderAndKeepsMetadata)
{
    // Arrange
    StreamOpener opener(m_opener, MakeUrlSource(
        {
            UrlRequest("http://host/0.tar", { { "split", "train" } }),
            "http://host/1.tar",
        }), m_logger);
    EXPECT_CALL(*m_opener, OpenFile("http://host/0.tar"))
        .WillOnce(Invoke([](const std::string&) { return Opened("zero", "/cache/0.tar"); }));
    EXPECT_CALL(*m_opener, OpenFile("http://host/1.tar"))
        .WillOnce(Invoke([](const std::string&) { return Opened("one", "/cache/1.tar"); }));

    // Act
    auto first = opener.Next();
    auto second = opener.Next();
    auto end = opener.Next();

    // Assert
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ("http://host/0.tar", first->url);
    EXPECT_EQ("train", first->metadata.at("split"));
    EXPECT_EQ(std::filesystem::path("/cache/0.tar"), first->localPath);
    EXPECT_EQ("zero", ReadAll(*first->stream));

    ASSERT_TRUE(second.has_value());
    EXPECT_EQ("http://host/1.tar", second->url);
    EXPECT_TRUE(second->metadata.empty());
    EXPECT_EQ("one", ReadAll(*second->stream));

    EXPECT_FALSE(end.has_value());
    EXPECT_TRUE(opener.IsExhausted());
}

TEST_F(StreamOpenerTests, Next_EmptySource)
{
    // Arrange
    StreamOpener opener(m_opener, MakeUrlSource({}), m_logger);
    EXPECT_CALL(*m_opener, OpenFile(_))
        .Times(0);

    // Act & Assert
    EXPECT_FALSE(opener.Next().has_value());
    EXPECT_TRUE(opener.IsExhausted());
}

TEST_F(StreamOpenerTests, Next_RetriesTransientFailure)
{
    // Arrange
    StreamOpener opener(m_opener, MakeUrlSource({ "http://host/0.tar" }), m_logger, RecordingHandler(true));
    EXPECT_CALL(*m_opener, OpenFile("http://host/0.tar"))
        .WillOnce(Throw(FetchError("http://host/0.tar", "HTTP 503 Service Unavailable", 503, true)))
        .WillOnce(Invoke([](const std::string&) { return Opened("zero"); }));

    // Act
    auto result = opener.Next();

    // Assert
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("zero", ReadAll(*result->stream));
    EXPECT_EQ(1, m_handledErrors.size());
}

TEST_F(StreamOpenerTests, Next_GivesUpAfterTenAttemptsAndMovesOn)
{
    // Arrange
    StreamOpener opener(m_opener, MakeUrlSource({ "http://host/bad.tar", "http://host/good.tar" }), m_logger, RecordingHandler(true));
    EXPECT_CALL(*m_opener, OpenFile("http://host/bad.tar"))
        .Times(10)
        .WillRepeatedly(Throw(FetchError("http://host/bad.tar", "HTTP 500 Internal Server Error", 500, true)));
    EXPECT_CALL(*m_opener, OpenFile("http://host/good.tar"))
        .WillOnce(Invoke([](const std::string&) { return Opened("good"); }));

    // Act
    auto result = opener.Next();

    // Assert
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("http://host/good.tar", result->url);

    // One per failed attempt plus the final give-up notice.
    ASSERT_EQ(11, m_handledErrors.size());
    EXPECT_THROW(std::rethrow_exception(m_handledErrors.front()), FetchError);
    try
    {
        std::rethrow_exception(m_handledErrors.back());
    }
    catch (const RetriesExhaustedError& e)
    {
        EXPECT_EQ("http://host/bad.tar", e.GetUrl());
        EXPECT_EQ(10, e.GetAttempts());
    }
}

TEST_F(StreamOpenerTests, Next_HandlerFalseStopsTheStream)
{
    // Arrange
    StreamOpener opener(m_opener, MakeUrlSource({ "http://host/bad.tar", "http://host/good.tar" }), m_logger, ErrorHandlers::IgnoreAndStop());
    EXPECT_CALL(*m_opener, OpenFile("http://host/bad.tar"))
        .WillOnce(Throw(FetchError("http://host/bad.tar", "HTTP 404 Not Found", 404)));
    EXPECT_CALL(*m_opener, OpenFile("http://host/good.tar"))
        .Times(0);

    // Act
    auto result = opener.Next();

    // Assert
    EXPECT_FALSE(result.has_value());
    EXPECT_TRUE(opener.IsExhausted());
    EXPECT_FALSE(opener.Next().has_value());
}

TEST_F(StreamOpenerTests, Next_GiveUpNoticeCanStopTheStream)
{
    // Arrange
    int calls = 0;
    ErrorHandler handler = [&calls](std::exception_ptr error)
        {
            ++calls;
            try
            {
                std::rethrow_exception(error);
            }
            catch (const RetriesExhaustedError&)
            {
                return false;
            }
            catch (const std::exception&)
            {
                return true;
            }
        };

    StreamOpener opener(m_opener, MakeUrlSource({ "http://host/bad.tar", "http://host/good.tar" }), m_logger, handler, 3);
    EXPECT_CALL(*m_opener, OpenFile("http://host/bad.tar"))
        .Times(3)
        .WillRepeatedly(Throw(FetchError("http://host/bad.tar", "timed out", std::nullopt, true)));
    EXPECT_CALL(*m_opener, OpenFile("http://host/good.tar"))
        .Times(0);

    // Act & Assert
    EXPECT_FALSE(opener.Next().has_value());
    EXPECT_EQ(4, calls);
}

TEST_F(StreamOpenerTests, Next_ReraisePropagatesAndEndsTheStream)
{
    // Arrange
    StreamOpener opener(m_opener, MakeUrlSource({ "http://host/bad.tar", "http://host/good.tar" }), m_logger);
    EXPECT_CALL(*m_opener, OpenFile("http://host/bad.tar"))
        .WillOnce(Throw(FetchError("http://host/bad.tar", "HTTP 403 Forbidden", 403)));
    EXPECT_CALL(*m_opener, OpenFile("http://host/good.tar"))
        .Times(0);

    // Act & Assert
    EXPECT_THROW((void)opener.Next(), FetchError);
    EXPECT_TRUE(opener.IsExhausted());
    EXPECT_FALSE(opener.Next().has_value());
}

TEST(StreamOpenerCacheTests, SkipsRejectedDownloadsAndYieldsCachedArchives)
{
    // Arrange
    TemporaryDirectory dir;
    auto logger = std::make_shared<severity_logger_mt<severity_level>>();
    auto transport = std::make_shared<TransportMock>();
    const auto archive = MakeTarArchive("0.cls", "3");

    CacheOptions options;
    options.cacheDir = dir.Path();
    options.maxCacheSize = -1;
    auto cache = std::make_shared<FileCache>(options, transport, std::make_shared<LocalFilesystem>(logger), logger);

    EXPECT_CALL(*transport, Open("http://host/error.tar"))
        .Times(2)
        .WillRepeatedly(Invoke([](const std::string&) -> std::unique_ptr<InputStream>
            {
                return std::make_unique<MemoryStream>("<Error><Code>AuthenticationFailed</Code></Error>");
            }));
    EXPECT_CALL(*transport, Open("http://host/shard.tar"))
        .WillOnce(Invoke([archive](const std::string&) -> std::unique_ptr<InputStream>
            {
                return std::make_unique<MemoryStream>(archive);
            }));

    std::vector<std::string> failures;
    StreamOpener opener(cache, MakeUrlSource({ "http://host/error.tar", "http://host/shard.tar" }), logger,
        [&failures](std::exception_ptr error)
        {
            failures.push_back(ErrorHandlers::Describe(error));
            return true;
        }, 2);

    // Act
    auto result = opener.Next();

    // Assert
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("http://host/shard.tar", result->url);
    EXPECT_EQ(dir.Path() / "shard.tar", result->localPath);
    EXPECT_EQ(archive, ReadAll(*result->stream));
    ASSERT_EQ(3, failures.size());
    EXPECT_NE(failures[0].find("is not a tar archive"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(dir.Path() / "error.tar"));
}
