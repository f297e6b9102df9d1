#include "MockComponents.hpp"
#include "TestUtils.hpp"
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QMutexLocker>
#include <QtCore/QSet>

namespace Scribe {
namespace Test {

namespace {

// Forwards to a shared InMemoryObjectStore.
class ForwardingObjectStore : public ObjectStore {
public:
    explicit ForwardingObjectStore(std::shared_ptr<InMemoryObjectStore> target)
        : target_(std::move(target)) {}

    Expected<ObjectListing, StoreFailure> listObjects(const QString& prefix,
                                                      const QString& delimiter,
                                                      int maxKeys) override {
        return target_->listObjects(prefix, delimiter, maxKeys);
    }

    Expected<qint64, StoreFailure> download(const QString& key, const QString& destinationPath) override {
        return target_->download(key, destinationPath);
    }

private:
    std::shared_ptr<InMemoryObjectStore> target_;
};

} // namespace

void InMemoryObjectStore::putObject(const QString& key, const QByteArray& data) {
    QMutexLocker locker(&mutex_);
    objects_.insert(key, data);
}

void InMemoryObjectStore::removeObject(const QString& key) {
    QMutexLocker locker(&mutex_);
    objects_.remove(key);
}

void InMemoryObjectStore::setListFailure(std::optional<StoreFailure> failure) {
    QMutexLocker locker(&mutex_);
    listFailure_ = std::move(failure);
}

void InMemoryObjectStore::failNextDownloads(int count, const StoreFailure& failure) {
    QMutexLocker locker(&mutex_);
    failingDownloads_ = count;
    downloadFailure_ = failure;
}

Expected<ObjectListing, StoreFailure> InMemoryObjectStore::listObjects(const QString& prefix,
                                                                      const QString& delimiter,
                                                                      int maxKeys) {
    ++listCalls_;
    QMutexLocker locker(&mutex_);
    if (listFailure_) {
        return makeUnexpected(*listFailure_);
    }

    ObjectListing listing;
    QSet<QString> seenPrefixes;
    for (auto it = objects_.constBegin(); it != objects_.constEnd(); ++it) {
        const QString& key = it.key();
        if (!key.startsWith(prefix)) {
            continue;
        }
        const QString remainder = key.mid(prefix.size());
        const auto cut = delimiter.isEmpty() ? -1 : remainder.indexOf(delimiter);
        if (cut >= 0) {
            const QString commonPrefix = prefix + remainder.left(cut + delimiter.size());
            if (!seenPrefixes.contains(commonPrefix)) {
                seenPrefixes.insert(commonPrefix);
                listing.commonPrefixes.append(commonPrefix);
            }
        } else {
            listing.keys.append(key);
        }
        if (maxKeys > 0 && listing.keys.size() + listing.commonPrefixes.size() >= maxKeys) {
            break;
        }
    }
    return listing;
}

Expected<qint64, StoreFailure> InMemoryObjectStore::download(const QString& key, const QString& destinationPath) {
    ++downloadCalls_;
    QByteArray data;
    {
        QMutexLocker locker(&mutex_);
        if (failingDownloads_ > 0) {
            --failingDownloads_;
            return makeUnexpected(downloadFailure_);
        }
        if (!objects_.contains(key)) {
            return makeUnexpected(StoreFailure{StoreError::NotFound, 404, QStringLiteral("NoSuchKey: %1").arg(key)});
        }
        data = objects_.value(key);
    }

    QFile file(destinationPath);
    if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size()) {
        return makeUnexpected(StoreFailure{StoreError::FileSystemError, 0, file.errorString()});
    }
    return static_cast<qint64>(data.size());
}

ObjectStoreFactory InMemoryObjectStore::factory(std::shared_ptr<InMemoryObjectStore> store) {
    return [store](const MinioSettings&) -> std::unique_ptr<ObjectStore> {
        return std::make_unique<ForwardingObjectStore>(store);
    };
}

RecordingConfigWriter::RecordingConfigWriter(bool holdWrites, bool failWrites)
    : holdWrites_(holdWrites)
    , failWrites_(failWrites) {
}

Expected<void, QString> RecordingConfigWriter::write(const QString& filePath, const QByteArray& contents) {
    ++started_;
    if (holdWrites_) {
        gate_.acquire();
    }
    if (failWrites_) {
        return makeUnexpected(QStringLiteral("disk full"));
    }
    {
        QMutexLocker locker(&mutex_);
        payloads_.append(contents);
    }
    return diskWriter_.write(filePath, contents);
}

QList<QByteArray> RecordingConfigWriter::payloads() const {
    QMutexLocker locker(&mutex_);
    return payloads_;
}

bool FakeToolchain::install(const QString& directory) {
    if (!QDir().mkpath(directory)) {
        return false;
    }

    const QString ffmpegScript = QStringLiteral(
        "#!/bin/sh\n"
        "in=\"\"\n"
        "last=\"\"\n"
        "while [ $# -gt 0 ]; do\n"
        "  case \"$1\" in\n"
        "    -i) in=\"$2\"; shift 2 ;;\n"
        "    *) last=\"$1\"; shift ;;\n"
        "  esac\n"
        "done\n"
        "echo \"Input #0, wav, from '$in':\" 1>&2\n"
        "echo \"  Duration: 00:00:10.00, start: 0.000000, bitrate: 256 kb/s\" 1>&2\n"
        "%1"
        "exit %2\n")
        .arg(ffmpegWritesOutput ? QStringLiteral("cp \"$in\" \"$last\" || exit 3\n") : QString())
        .arg(ffmpegExitCode);

    const QString whisperScript = QStringLiteral(
        "#!/bin/sh\n"
        "out=\"\"\n"
        "while [ $# -gt 0 ]; do\n"
        "  case \"$1\" in\n"
        "    -of) out=\"$2\"; shift 2 ;;\n"
        "    *) shift ;;\n"
        "  esac\n"
        "done\n"
        "echo \"whisper_print_progress_callback: progress =  10%\" 1>&2\n"
        "echo \"[00:00:00.000 --> 00:00:04.000]   Good morning everyone.\"\n"
        "echo \"whisper_print_progress_callback: progress =  55%\" 1>&2\n"
        "echo \"[00:00:04.000 --> 00:00:09.500]   Let's start the review.\"\n"
        "echo \"whisper_print_progress_callback: progress = 100%\" 1>&2\n"
        "cat > \"$out.json\" <<'SCRIBE_JSON'\n"
        "%1\n"
        "SCRIBE_JSON\n"
        "printf 'Good morning everyone.\\nLet us start the review.\\n' > \"$out.txt\"\n"
        "exit %2\n")
        .arg(whisperJson)
        .arg(whisperExitCode);

    ffmpegPath = TestUtils::createExecutableScript(directory, QStringLiteral("ffmpeg"), ffmpegScript);
    whisperPath = TestUtils::createExecutableScript(directory, QStringLiteral("whisper-cli"), whisperScript);
    modelPath = TestUtils::createTestTextFile(directory, QStringLiteral("model"), QStringLiteral("ggml-test.bin"));

    return QFile::exists(ffmpegPath) && QFile::exists(whisperPath) && QFile::exists(modelPath);
}

} // namespace Test
} // namespace Scribe
