#pragma once

#include <QtCore/QString>
#include <chrono>
#include <memory>
#include <optional>
#include "ObjectStore.hpp"

namespace Aws {
namespace S3 {
class S3Client;
enum class S3Errors;
} // namespace S3
} // namespace Aws

namespace Scribe {

/**
 * @brief ObjectStore over the AWS SDK S3 client
 *
 * Path-style addressing against the configured endpoint with static
 * credentials. The SDK is initialised once per process and shut down at
 * exit. Each call builds its own SDK client, so one S3Client may be used
 * from several threads. SDK retries are off; callers retry through
 * RetryManager.
 */
class S3Client : public ObjectStore {
public:
    explicit S3Client(const MinioSettings& settings);

    Expected<ObjectListing, StoreFailure> listObjects(const QString& prefix,
                                                      const QString& delimiter = QString(),
                                                      int maxKeys = 0) override;

    Expected<qint64, StoreFailure> download(const QString& key,
                                            const QString& destinationPath) override;

    // Applied to both connect and request timeouts of the SDK client.
    void setRequestTimeout(std::chrono::milliseconds timeout) { requestTimeout_ = timeout; }
    std::chrono::milliseconds requestTimeout() const { return requestTimeout_; }

    static ObjectStoreFactory factory();

    struct Endpoint {
        QString address;   // host[:port], as the SDK endpoint override
        bool secure = false;
    };
    // Accepts "host:port" or a full URL; a missing scheme means http.
    static std::optional<Endpoint> parseEndpoint(const QString& url);

    static StoreFailure classifyError(Aws::S3::S3Errors type, int httpStatus,
                                      const QString& exceptionName, const QString& message,
                                      bool objectRequest);

private:
    Expected<void, StoreFailure> ensureConfigured() const;
    std::unique_ptr<Aws::S3::S3Client> makeClient() const;

    MinioSettings settings_;
    std::optional<Endpoint> endpoint_;
    std::chrono::milliseconds requestTimeout_{15000};
};

// Idempotent; S3Client calls it before building SDK clients.
void ensureAwsInitialised();

} // namespace Scribe
