#pragma once
#include <QString>
#include <QHash>
#include <QProcessEnvironment>

#include "errors.h"

enum class EncoderChoice { Software, Hardware };

struct ShardSpec {
    int index = 0;  // 0-based
    int count = 1;  // >= 1
};

// Immutable run configuration. Built once by ConfigLoader in main() and passed
// by const reference; no component reads the process environment itself.
struct RunConfig {
    // Source bucket
    QString bucket;
    QString region = "us-east-1";
    QString s3Endpoint;          // empty -> https://<bucket>.s3.<region>.amazonaws.com
    QString awsAccessKeyId;
    QString awsSecretAccessKey;
    QString awsSessionToken;
    bool checkSourceForConverted = true;
    bool publishToSourceBucket = false;

    // Destination drive
    bool driveEnabled = true;
    bool requireDestination = false;
    QString driveRootFolderId;
    QString driveCredentialsPath = "oauth-credentials.json";
    QString driveTokensPath = "oauth-tokens.json";

    // Transcode
    EncoderChoice encoder = EncoderChoice::Software;
    QString inputCodec = "hevc";
    QString ffmpegPath = "ffmpeg";

    // Run
    ShardSpec shard;
    QString workDir = ".";
    QString workListPath = "id_list.txt";
    QString errorLogPath = "error_transcode.txt";
    QString appLogPath = "mediarelay.log";
    QString logLevel = "INFO";
    int networkTimeoutMs = 60000;

    // Dedupe
    bool duplicateScanEnabled = false;
    int batchSize = 10;
    int batchDelayMs = 1000;
    int refreshTimeoutMs = 10000;
};

QString encoderChoiceName(EncoderChoice e);
bool parseEncoderChoice(const QString& text, EncoderChoice* out);

class ConfigLoader {
public:
    // Keys use the INI "group/key" form, e.g. "run/instance" or "transcode/encoder".
    using Overrides = QHash<QString, QString>;

    // Reads iniPath (may be empty or missing), then applies environment
    // variables, then overrides. Validation failures are ErrorKind::Config.
    static bool load(const QString& iniPath,
                     const QProcessEnvironment& env,
                     const Overrides& overrides,
                     RunConfig* out,
                     OpError* err);

    static bool validate(const RunConfig& cfg, OpError* err);
};
