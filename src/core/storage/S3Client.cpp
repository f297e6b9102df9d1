#include "S3Client.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QUrl>
#include <cstdlib>
#include <mutex>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>

namespace Scribe {

namespace {

constexpr int MAX_LIST_PAGES = 10000;
constexpr const char* ALLOCATION_TAG = "ScribeS3Client";

std::once_flag awsInitFlag;
Aws::SDKOptions awsOptions;

void shutdownAws() {
    Aws::ShutdownAPI(awsOptions);
}

void initAws() {
    // Static credentials and an explicit region; never ask EC2 metadata.
    qputenv("AWS_EC2_METADATA_DISABLED", "true");
    Aws::InitAPI(awsOptions);
    std::atexit(shutdownAws);
    SCRIBE_DEBUG("AWS SDK initialised");
}

Aws::String toAws(const QString& value) {
    const QByteArray utf8 = value.toUtf8();
    return Aws::String(utf8.constData(), static_cast<size_t>(utf8.size()));
}

QString fromAws(const Aws::String& value) {
    return QString::fromStdString(std::string(value.c_str(), value.size()));
}

template<typename Outcome>
StoreFailure failureFromOutcome(const Outcome& outcome, bool objectRequest) {
    const auto& error = outcome.GetError();
    return S3Client::classifyError(error.GetErrorType(),
                                   static_cast<int>(error.GetResponseCode()),
                                   fromAws(error.GetExceptionName()),
                                   fromAws(error.GetMessage()),
                                   objectRequest);
}

} // namespace

void ensureAwsInitialised() {
    std::call_once(awsInitFlag, initAws);
}

S3Client::S3Client(const MinioSettings& settings)
    : settings_(settings)
    , endpoint_(parseEndpoint(settings.url)) {
}

ObjectStoreFactory S3Client::factory() {
    return [](const MinioSettings& settings) -> std::unique_ptr<ObjectStore> {
        return std::make_unique<S3Client>(settings);
    };
}

std::optional<S3Client::Endpoint> S3Client::parseEndpoint(const QString& url) {
    QString trimmed = url.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    if (!trimmed.contains("://")) {
        trimmed.prepend("http://");
    }

    const QUrl parsed(trimmed, QUrl::TolerantMode);
    if (!parsed.isValid() || parsed.host().isEmpty()) {
        return std::nullopt;
    }

    const QString scheme = parsed.scheme().toLower();
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    Endpoint endpoint;
    endpoint.secure = scheme == "https";
    endpoint.address = parsed.host();
    if (parsed.port() > 0) {
        endpoint.address += QStringLiteral(":%1").arg(parsed.port());
    }
    return endpoint;
}

StoreFailure S3Client::classifyError(Aws::S3::S3Errors type, int httpStatus,
                                     const QString& exceptionName, const QString& message,
                                     bool objectRequest) {
    using Aws::S3::S3Errors;

    const bool responded = httpStatus > 0;
    QString detail;
    if (responded) {
        detail = exceptionName.isEmpty()
            ? QStringLiteral("HTTP %1").arg(httpStatus)
            : QStringLiteral("HTTP %1 %2: %3").arg(httpStatus).arg(exceptionName, message);
    } else {
        detail = message.isEmpty() ? exceptionName : message;
    }

    StoreFailure failure{StoreError::InvalidResponse, responded ? httpStatus : 0, detail};

    switch (type) {
        case S3Errors::NO_SUCH_BUCKET:
            failure.kind = StoreError::BucketMissing;
            return failure;
        case S3Errors::NO_SUCH_KEY:
            failure.kind = StoreError::NotFound;
            return failure;
        case S3Errors::ACCESS_DENIED:
        case S3Errors::INVALID_ACCESS_KEY_ID:
        case S3Errors::SIGNATURE_DOES_NOT_MATCH:
        case S3Errors::INVALID_SIGNATURE:
        case S3Errors::UNRECOGNIZED_CLIENT:
        case S3Errors::INVALID_CLIENT_TOKEN_ID:
        case S3Errors::MISSING_AUTHENTICATION_TOKEN:
            failure.kind = StoreError::AuthFailed;
            return failure;
        case S3Errors::REQUEST_TIMEOUT:
            failure.kind = StoreError::Timeout;
            return failure;
        default:
            break;
    }

    if (httpStatus == 401 || httpStatus == 403) {
        failure.kind = StoreError::AuthFailed;
    } else if (httpStatus == 408) {
        failure.kind = StoreError::Timeout;
    } else if (!responded) {
        const bool timedOut = message.contains("timeout", Qt::CaseInsensitive) ||
                              message.contains("timed out", Qt::CaseInsensitive);
        failure.kind = timedOut ? StoreError::Timeout : StoreError::NetworkError;
        if (failure.message.isEmpty()) {
            failure.message = QStringLiteral("Connection failed");
        }
    } else if (httpStatus == 404) {
        failure.kind = objectRequest ? StoreError::NotFound : StoreError::BucketMissing;
    } else if (httpStatus >= 500 || type == S3Errors::SERVICE_UNAVAILABLE ||
               type == S3Errors::INTERNAL_FAILURE || type == S3Errors::SLOW_DOWN ||
               type == S3Errors::THROTTLING) {
        failure.kind = StoreError::ServerError;
    } else if (type == S3Errors::NETWORK_CONNECTION) {
        failure.kind = StoreError::NetworkError;
    }

    return failure;
}

Expected<void, StoreFailure> S3Client::ensureConfigured() const {
    if (!settings_.isComplete()) {
        return makeUnexpected(StoreFailure{StoreError::IncompleteConfig, 0,
                                           QStringLiteral("MinIO config is incomplete")});
    }
    if (!endpoint_) {
        return makeUnexpected(StoreFailure{StoreError::IncompleteConfig, 0,
                                           QStringLiteral("Invalid MinIO endpoint URL: %1").arg(settings_.url)});
    }
    return {};
}

std::unique_ptr<Aws::S3::S3Client> S3Client::makeClient() const {
    ensureAwsInitialised();

    Aws::Client::ClientConfiguration config;
    config.endpointOverride = toAws(endpoint_->address);
    config.scheme = endpoint_->secure ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    config.region = toAws(settings_.effectiveRegion());
    config.connectTimeoutMs = static_cast<long>(requestTimeout_.count());
    config.requestTimeoutMs = static_cast<long>(requestTimeout_.count());
    config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(ALLOCATION_TAG, 0L, 0L);

    const Aws::Auth::AWSCredentials credentials(toAws(settings_.accessKey.trimmed()),
                                                toAws(settings_.secretKey.trimmed()));

    return std::make_unique<Aws::S3::S3Client>(
        credentials, config,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        false /* path-style addressing */);
}

Expected<ObjectListing, StoreFailure> S3Client::listObjects(const QString& prefix,
                                                            const QString& delimiter,
                                                            int maxKeys) {
    auto configured = ensureConfigured();
    if (configured.hasError()) {
        return makeUnexpected(configured.error());
    }

    const auto client = makeClient();
    ObjectListing listing;
    Aws::String continuationToken;

    for (int page = 0; page < MAX_LIST_PAGES; ++page) {
        Aws::S3::Model::ListObjectsV2Request request;
        request.SetBucket(toAws(settings_.bucket.trimmed()));
        if (!prefix.isEmpty()) {
            request.SetPrefix(toAws(prefix));
        }
        if (!delimiter.isEmpty()) {
            request.SetDelimiter(toAws(delimiter));
        }
        if (maxKeys > 0) {
            request.SetMaxKeys(maxKeys);
        }
        if (!continuationToken.empty()) {
            request.SetContinuationToken(continuationToken);
        }

        auto outcome = client->ListObjectsV2(request);
        if (!outcome.IsSuccess()) {
            return makeUnexpected(failureFromOutcome(outcome, false));
        }

        const auto& result = outcome.GetResult();
        for (const auto& object : result.GetContents()) {
            listing.keys << fromAws(object.GetKey());
        }
        for (const auto& common : result.GetCommonPrefixes()) {
            listing.commonPrefixes << fromAws(common.GetPrefix());
        }

        if (maxKeys > 0 || !result.GetIsTruncated()) {
            return listing;
        }
        if (result.GetNextContinuationToken().empty()) {
            SCRIBE_WARN("Truncated listing for prefix '{}' without continuation token", prefix.toStdString());
            return listing;
        }
        continuationToken = result.GetNextContinuationToken();
    }

    SCRIBE_WARN("Listing for prefix '{}' stopped after {} pages", prefix.toStdString(), MAX_LIST_PAGES);
    return listing;
}

Expected<qint64, StoreFailure> S3Client::download(const QString& key, const QString& destinationPath) {
    auto configured = ensureConfigured();
    if (configured.hasError()) {
        return makeUnexpected(configured.error());
    }

    const QFileInfo destination(destinationPath);
    if (!QDir().mkpath(destination.absolutePath())) {
        return makeUnexpected(StoreFailure{StoreError::FileSystemError, 0,
                                           QStringLiteral("Cannot create %1").arg(destination.absolutePath())});
    }

    const QString partialPath = destinationPath + ".part";
    {
        QFile partialFile(partialPath);
        if (!partialFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            return makeUnexpected(StoreFailure{StoreError::FileSystemError, 0, partialFile.errorString()});
        }
    }

    const QByteArray encodedPath = QFile::encodeName(partialPath);
    const Aws::String streamPath(encodedPath.constData(), static_cast<size_t>(encodedPath.size()));
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(toAws(settings_.bucket.trimmed()));
    request.SetKey(toAws(key));
    request.SetResponseStreamFactory([streamPath]() {
        return Aws::New<Aws::FStream>(ALLOCATION_TAG, streamPath.c_str(),
                                      std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    });

    std::optional<StoreFailure> failure;
    long long expectedLength = -1;
    {
        // The outcome owns the file stream; it closes when the outcome goes away.
        const auto client = makeClient();
        auto outcome = client->GetObject(request);
        if (!outcome.IsSuccess()) {
            failure = failureFromOutcome(outcome, true);
        } else {
            expectedLength = outcome.GetResult().GetContentLength();
        }
    }

    if (failure) {
        QFile::remove(partialPath);
        return makeUnexpected(*failure);
    }

    const qint64 written = QFileInfo(partialPath).size();
    if (expectedLength >= 0 && written != expectedLength) {
        QFile::remove(partialPath);
        return makeUnexpected(StoreFailure{StoreError::FileSystemError, 0,
                                           QStringLiteral("Failed writing %1: %2 of %3 bytes")
                                               .arg(partialPath).arg(written).arg(expectedLength)});
    }

    if (QFile::exists(destinationPath) && !QFile::remove(destinationPath)) {
        QFile::remove(partialPath);
        return makeUnexpected(StoreFailure{StoreError::FileSystemError, 0,
                                           QStringLiteral("Cannot replace %1").arg(destinationPath)});
    }
    QFile partial(partialPath);
    if (!partial.rename(destinationPath)) {
        const QString error = partial.errorString();
        partial.remove();
        return makeUnexpected(StoreFailure{StoreError::FileSystemError, 0, error});
    }

    SCRIBE_DEBUG("Downloaded {} ({} bytes)", key.toStdString(), written);
    return written;
}

} // namespace Scribe
