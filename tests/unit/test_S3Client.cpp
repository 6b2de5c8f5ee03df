#include <gtest/gtest.h>
#include "storage/Errors.hpp"
#include "storage/s3/ClientCache.hpp"
#include "storage/s3/CredentialResolver.hpp"
#include "storage/s3/S3Controller.hpp"
#include "support/FakeObjectStore.hpp"
#include "util/s3Helpers.hpp"

#include <atomic>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace mg;
using namespace mg::storage;
using namespace mg::storage::s3;

class CredentialResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("WASABI_ACCESS_KEY_ID", "wasabi-key", 1);
        setenv("WASABI_SECRET_ACCESS_KEY", "wasabi-secret", 1);
        setenv("AWS_ACCESS_KEY_ID", "aws-key", 1);
        setenv("AWS_SECRET_ACCESS_KEY", "aws-secret", 1);
        unsetenv("TIGRIS_ACCESS_KEY_ID");
        unsetenv("TIGRIS_SECRET_ACCESS_KEY");
    }

    void TearDown() override {
        for (const auto* v : {"WASABI_ACCESS_KEY_ID", "WASABI_SECRET_ACCESS_KEY", "AWS_ACCESS_KEY_ID", "AWS_SECRET_ACCESS_KEY"})
            unsetenv(v);
    }
};

TEST_F(CredentialResolverTest, WasabiRegionComesFromHost) {
    const CredentialResolver resolver(config::ObjectStoreConfig{});
    const auto creds = resolver.resolve("s3.eu-central-2.wasabisys.com");
    EXPECT_EQ(creds.region, "eu-central-2");
    EXPECT_EQ(creds.accessKey, "wasabi-key");
    EXPECT_EQ(creds.secretKey, "wasabi-secret");
    EXPECT_EQ(creds.endpoint, "https://s3.eu-central-2.wasabisys.com");
}

TEST_F(CredentialResolverTest, AwsRegionComesFromHost) {
    const CredentialResolver resolver(config::ObjectStoreConfig{});
    EXPECT_EQ(resolver.resolve("s3.ap-southeast-1.amazonaws.com").region, "ap-southeast-1");
}

TEST_F(CredentialResolverTest, MissingKeysAreConfigurationErrors) {
    const CredentialResolver resolver(config::ObjectStoreConfig{});
    EXPECT_THROW((void)resolver.resolve("fly.storage.tigris.dev"), ConfigurationError);
}

TEST_F(CredentialResolverTest, UnknownHostIsConfigurationError) {
    const CredentialResolver resolver(config::ObjectStoreConfig{});
    EXPECT_THROW((void)resolver.resolve("storage.example.org"), ConfigurationError);
}

TEST_F(CredentialResolverTest, ConfiguredProviderWithInlineKeys) {
    config::ObjectStoreConfig cfg;
    cfg.scheme = "http";
    cfg.providers.insert(cfg.providers.begin(), config::ProviderConfig{
        .name = "MinIO",
        .hosts = {"minio.local.test"},
        .region = "us-west-1",
        .access_key = "inline-key",
        .secret_key = "inline-secret"
    });

    const CredentialResolver resolver(cfg);
    const auto creds = resolver.resolve("minio.local.test");
    EXPECT_EQ(creds.region, "us-west-1");
    EXPECT_EQ(creds.accessKey, "inline-key");
    EXPECT_EQ(creds.endpoint, "http://minio.local.test");
}

TEST(ClientCacheTest, BuildsOneClientPerHost) {
    std::atomic<int> calls{0};
    ClientCache cache([&](const std::string&) {
        ++calls;
        return std::make_shared<test::FakeObjectStore>();
    });

    const auto a = cache.get("s3.us-east-1.amazonaws.com");
    const auto b = cache.get("s3.us-east-1.amazonaws.com");
    const auto c = cache.get("s3.eu-central-1.wasabisys.com");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(ClientCacheTest, ConcurrentFirstUseBuildsOnce) {
    std::atomic<int> calls{0};
    ClientCache cache([&](const std::string&) {
        ++calls;
        return std::make_shared<test::FakeObjectStore>();
    });

    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<ObjectClient>> seen(8);
    for (size_t i = 0; i < seen.size(); ++i)
        threads.emplace_back([&, i] { seen[i] = cache.get("s3.us-east-1.amazonaws.com"); });
    for (auto& t : threads) t.join();

    EXPECT_EQ(calls.load(), 1);
    for (const auto& s : seen) EXPECT_EQ(s, seen.front());
}

TEST(ClientCacheTest, FactoryFailureIsNotCached) {
    int calls = 0;
    ClientCache cache([&](const std::string&) -> std::shared_ptr<ObjectClient> {
        if (++calls == 1) throw ConfigurationError("no credentials");
        return std::make_shared<test::FakeObjectStore>();
    });

    EXPECT_THROW((void)cache.get("s3.us-east-1.amazonaws.com"), ConfigurationError);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_NE(cache.get("s3.us-east-1.amazonaws.com"), nullptr);
}

TEST(S3HelpersTest, Sha256OfEmptyPayload) {
    EXPECT_EQ(util::sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(S3HelpersTest, ParseResponseHeadersKeepsLastBlock) {
    const std::string raw =
        "HTTP/1.1 100 Continue\r\n\r\n"
        "HTTP/1.1 200 OK\r\n"
        "ETag: \"abc123\"\r\n"
        "Content-Length: 42\r\n\r\n";
    const auto headers = util::parseResponseHeaders(raw);
    EXPECT_EQ(headers.at("etag"), "\"abc123\"");
    EXPECT_EQ(headers.at("content-length"), "42");

    std::string etag;
    ASSERT_TRUE(util::extractETag(raw, etag));
    EXPECT_EQ(etag, "\"abc123\"");
}

TEST(S3HelpersTest, DerivesSigningKeyFromSecret) {
    const auto key = util::deriveSigningKey("wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY", "20120215", "us-east-1", "iam");
    EXPECT_EQ(util::toHex(reinterpret_cast<const unsigned char*>(key.data()), key.size()),
              "f4780e2d9f65fa895f9c67b32ce1baf0b0d8a43505a000a1a9e090d414db404d");
}

TEST(S3HelpersTest, CompleteMultipartBodyNumbersPartsFromOne) {
    EXPECT_EQ(util::composeMultiPartUploadXMLBody({"\"a\"", "\"b\""}),
              "<CompleteMultipartUpload>"
              "<Part><PartNumber>1</PartNumber><ETag>\"a\"</ETag></Part>"
              "<Part><PartNumber>2</PartNumber><ETag>\"b\"</ETag></Part>"
              "</CompleteMultipartUpload>");
}

TEST(S3ResponseTest, NotFoundWinsOverCurlErrorCode) {
    // CURLOPT_FAILONERROR style responses carry both
    EXPECT_THROW(throwForResponse({.curl = CURLE_HTTP_RETURNED_ERROR, .http = 404}, "getObject b/k"), NotFoundError);
    EXPECT_THROW(throwForResponse({.curl = CURLE_OK, .http = 404}, "headObject b/k"), NotFoundError);
}

TEST(S3ResponseTest, OtherFailuresAreTransient) {
    EXPECT_THROW(throwForResponse({.curl = CURLE_COULDNT_CONNECT, .http = 0}, "getObject b/k"), TransientIOError);
    EXPECT_THROW(throwForResponse({.curl = CURLE_OK, .http = 503, .body = "<Error>SlowDown</Error>"}, "putObject b/k"),
                 TransientIOError);
}

TEST(S3ResponseTest, HeadHeadersBecomeObjectHead) {
    const auto head = headFromResponseHeaders({
        {"content-length", "1048576"},
        {"content-type", "video/mp4"},
        {"x-amz-meta-last-modified", "2024-01-02T03:04:05.678Z"},
        {"etag", "\"abc\""}
    }, "headObject b/k");

    EXPECT_EQ(head.contentLength, 1048576u);
    EXPECT_EQ(head.contentType, std::optional<std::string>("video/mp4"));
    ASSERT_EQ(head.metadata.size(), 1u);
    EXPECT_EQ(head.metadata.at("last-modified"), "2024-01-02T03:04:05.678Z");
}

TEST(S3ResponseTest, MalformedContentLengthIsTransient) {
    EXPECT_THROW((void)headFromResponseHeaders({{"content-length", "lots"}}, "headObject b/k"), TransientIOError);
    EXPECT_THROW((void)headFromResponseHeaders({{"content-length", "12abc"}}, "headObject b/k"), TransientIOError);
    EXPECT_THROW((void)headFromResponseHeaders({{"content-length", "99999999999999999999999"}}, "headObject b/k"),
                 TransientIOError);
}
