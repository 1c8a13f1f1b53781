// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/DirectOpener.hpp"
#include "ShardCache/Core/Errors.hpp"
#include "ShardCache/Core/LocalFilesystem.hpp"
#include "ShardCache/Core/LocalTransport.hpp"
#include "ShardCache/Core/SchemeTransport.hpp"
#include "ShardCache/Core/Mocks/TransportMock.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>
using boost::log::trivial::severity_level;
using boost::log::sources::severity_logger_mt;
using ::testing::_;
using ::testing::Invoke;
using ShardCache::Core::DirectOpener;
using ShardCache::Core::FetchError;
using ShardCache::Core::InputStream;
using ShardCache::Core::LocalFilesystem;
using ShardCache::Core::LocalTransport;
using ShardCache::Core::SchemeTransport;
using ShardCache::Core::Mocks::TransportMock;
using ShardCache::Core::Testing::MemoryStream;
using ShardCache::Core::Testing::ReadAll;
using ShardCache::Core::Testing::TemporaryDirectory;
using ShardCache::Core::Testing::WriteFile;

TEST(SchemeTransportTests, RoutesBySchemeIgnoringCase)
{
    // Arrange
    auto http = std::make_shared<TransportMock>();
    auto azure = std::make_shared<TransportMock>();
    SchemeTransport transport;
    transport.Register("HTTP", http);
    transport.Register("az", azure);

    EXPECT_CALL(*http, Open("Http://host/a.tar"))
        .WillOnce(Invoke([](const std::string&) -> std::unique_ptr<InputStream>
            {
                return std::make_unique<MemoryStream>("http");
            }));
    EXPECT_CALL(*azure, Open(_))
        .Times(0);

    // Act
    auto stream = transport.Open("Http://host/a.tar");

    // Assert
    EXPECT_EQ("http", ReadAll(*stream));
    EXPECT_TRUE(transport.Supports("http"));
    EXPECT_TRUE(transport.Supports("AZ"));
    EXPECT_FALSE(transport.Supports("s3"));
}

TEST(SchemeTransportTests, UnknownSchemeIsFetchError)
{
    SchemeTransport transport;
    EXPECT_THROW(transport.Open("s3://bucket/a.tar"), FetchError);
}

TEST(LocalTransportTests, OpensPlainPathsAndFileUrls)
{
    // Arrange
    TemporaryDirectory dir;
    auto logger = std::make_shared<severity_logger_mt<severity_level>>();
    LocalTransport transport(std::make_shared<LocalFilesystem>(logger));
    WriteFile(dir.Path() / "a.tar", "bytes");

    // Act
    auto plain = transport.Open((dir.Path() / "a.tar").string());
    auto url = transport.Open("file://" + (dir.Path() / "a.tar").string());

    // Assert
    EXPECT_EQ("bytes", ReadAll(*plain));
    EXPECT_EQ("bytes", ReadAll(*url));
    EXPECT_THROW(transport.Open((dir.Path() / "missing.tar").string()), FetchError);
    EXPECT_THROW(transport.Open("http://host/a.tar"), FetchError);
}

TEST(DirectOpenerTests, StreamsRemoteUrlsWithoutLocalPath)
{
    // Arrange
    TemporaryDirectory dir;
    auto logger = std::make_shared<severity_logger_mt<severity_level>>();
    auto remote = std::make_shared<TransportMock>();
    DirectOpener opener(remote, std::make_shared<LocalFilesystem>(logger));
    WriteFile(dir.Path() / "a.tar", "local");

    EXPECT_CALL(*remote, Open("https://host/b.tar"))
        .WillOnce(Invoke([](const std::string&) -> std::unique_ptr<InputStream>
            {
                return std::make_unique<MemoryStream>("remote");
            }));

    // Act
    auto local = opener.OpenFile((dir.Path() / "a.tar").string());
    auto streamed = opener.OpenFile("https://host/b.tar");

    // Assert
    EXPECT_EQ(dir.Path() / "a.tar", local.localPath);
    EXPECT_EQ("local", ReadAll(*local.stream));
    EXPECT_TRUE(streamed.localPath.empty());
    EXPECT_EQ("remote", ReadAll(*streamed.stream));
}
