#include "run_config.h"

#include <QSettings>
#include <QFileInfo>

namespace {

// INI key -> environment variable consulted before command-line overrides.
struct EnvBinding { const char* key; const char* env; };
constexpr EnvBinding kEnvBindings[] = {
    {"source/bucket", "BUCKET"},
    {"source/region", "REGION"},
    {"source/access_key_id", "AWS_ACCESS_KEY_ID"},
    {"source/secret_access_key", "AWS_SECRET_ACCESS_KEY"},
    {"source/session_token", "AWS_SESSION_TOKEN"},
    {"destination/root_folder_id", "GOOGLE_DRIVE_FOLDER_ID"},
    {"run/log_level", "MEDIARELAY_LOG_LEVEL"},
};

class Layered {
public:
    Layered(QSettings* ini, const QProcessEnvironment& env, const ConfigLoader::Overrides& ov)
        : m_ini(ini), m_env(env), m_ov(ov) {}

    QString str(const QString& key, const QString& def) const {
        if (m_ov.contains(key)) return m_ov.value(key);
        for (const auto& b : kEnvBindings) {
            if (key == QLatin1String(b.key) && m_env.contains(b.env))
                return m_env.value(b.env);
        }
        if (m_ini && m_ini->contains(key)) return m_ini->value(key).toString();
        return def;
    }

    bool integer(const QString& key, int def, int* out, OpError* err) const {
        const QString s = str(key, QString::number(def)).trimmed();
        bool ok = false;
        const int v = s.toInt(&ok);
        if (!ok) return setError(err, ErrorKind::Config, QString("%1: not an integer: '%2'").arg(key, s));
        *out = v;
        return true;
    }

    bool boolean(const QString& key, bool def, bool* out, OpError* err) const {
        const QString s = str(key, def ? "true" : "false").trimmed().toLower();
        if (s == "1" || s == "true" || s == "yes" || s == "on") { *out = true; return true; }
        if (s == "0" || s == "false" || s == "no" || s == "off") { *out = false; return true; }
        return setError(err, ErrorKind::Config, QString("%1: not a boolean: '%2'").arg(key, s));
    }

private:
    QSettings* m_ini;
    const QProcessEnvironment& m_env;
    const ConfigLoader::Overrides& m_ov;
};

} // namespace

QString encoderChoiceName(EncoderChoice e)
{
    return e == EncoderChoice::Hardware ? "hardware" : "software";
}

bool parseEncoderChoice(const QString& text, EncoderChoice* out)
{
    const QString t = text.trimmed().toLower();
    if (t == "software" || t == "cpu") { *out = EncoderChoice::Software; return true; }
    if (t == "hardware" || t == "gpu") { *out = EncoderChoice::Hardware; return true; }
    return false;
}

bool ConfigLoader::load(const QString& iniPath, const QProcessEnvironment& env,
                        const Overrides& overrides, RunConfig* out, OpError* err)
{
    QScopedPointer<QSettings> ini;
    if (!iniPath.isEmpty()) {
        if (!QFileInfo::exists(iniPath))
            return setError(err, ErrorKind::Config, QString("config file not found: %1").arg(iniPath));
        ini.reset(new QSettings(iniPath, QSettings::IniFormat));
        if (ini->status() != QSettings::NoError)
            return setError(err, ErrorKind::Config, QString("cannot parse config file: %1").arg(iniPath));
    }

    const Layered v(ini.data(), env, overrides);
    RunConfig c;

    c.bucket = v.str("source/bucket", c.bucket);
    c.region = v.str("source/region", c.region);
    c.s3Endpoint = v.str("source/endpoint", c.s3Endpoint);
    c.awsAccessKeyId = v.str("source/access_key_id", c.awsAccessKeyId);
    c.awsSecretAccessKey = v.str("source/secret_access_key", c.awsSecretAccessKey);
    c.awsSessionToken = v.str("source/session_token", c.awsSessionToken);
    if (!v.boolean("source/check_converted", c.checkSourceForConverted, &c.checkSourceForConverted, err)) return false;
    if (!v.boolean("source/publish_converted", c.publishToSourceBucket, &c.publishToSourceBucket, err)) return false;

    if (!v.boolean("destination/enabled", c.driveEnabled, &c.driveEnabled, err)) return false;
    if (!v.boolean("destination/required", c.requireDestination, &c.requireDestination, err)) return false;
    c.driveRootFolderId = v.str("destination/root_folder_id", c.driveRootFolderId);
    c.driveCredentialsPath = v.str("destination/credentials", c.driveCredentialsPath);
    c.driveTokensPath = v.str("destination/tokens", c.driveTokensPath);

    const QString enc = v.str("transcode/encoder", encoderChoiceName(c.encoder));
    if (!parseEncoderChoice(enc, &c.encoder))
        return setError(err, ErrorKind::Config, QString("transcode/encoder: unknown encoder '%1'").arg(enc));
    c.inputCodec = v.str("transcode/input_codec", c.inputCodec);
    c.ffmpegPath = v.str("transcode/ffmpeg", c.ffmpegPath);

    if (!v.integer("run/instance", c.shard.index, &c.shard.index, err)) return false;
    if (!v.integer("run/instances", c.shard.count, &c.shard.count, err)) return false;
    c.workDir = v.str("run/work_dir", c.workDir);
    c.workListPath = v.str("run/work_list", c.workListPath);
    c.errorLogPath = v.str("run/error_log", c.errorLogPath);
    c.appLogPath = v.str("run/app_log", c.appLogPath);
    c.logLevel = v.str("run/log_level", c.logLevel).toUpper();
    if (!v.integer("run/network_timeout_ms", c.networkTimeoutMs, &c.networkTimeoutMs, err)) return false;

    if (!v.boolean("dedupe/enabled", c.duplicateScanEnabled, &c.duplicateScanEnabled, err)) return false;
    if (!v.integer("dedupe/batch_size", c.batchSize, &c.batchSize, err)) return false;
    if (!v.integer("dedupe/batch_delay_ms", c.batchDelayMs, &c.batchDelayMs, err)) return false;
    if (!v.integer("dedupe/refresh_timeout_ms", c.refreshTimeoutMs, &c.refreshTimeoutMs, err)) return false;

    if (!validate(c, err)) return false;
    *out = c;
    return true;
}

bool ConfigLoader::validate(const RunConfig& cfg, OpError* err)
{
    if (cfg.shard.count < 1)
        return setError(err, ErrorKind::Config, QString("instance count must be >= 1 (got %1)").arg(cfg.shard.count));
    if (cfg.shard.index < 0 || cfg.shard.index >= cfg.shard.count)
        return setError(err, ErrorKind::Config,
                        QString("instance index %1 outside [0, %2)").arg(cfg.shard.index).arg(cfg.shard.count));
    if (cfg.batchSize < 1)
        return setError(err, ErrorKind::Config, QString("dedupe/batch_size must be >= 1 (got %1)").arg(cfg.batchSize));
    if (cfg.batchDelayMs < 0 || cfg.refreshTimeoutMs < 1 || cfg.networkTimeoutMs < 1)
        return setError(err, ErrorKind::Config, "timeouts and delays must be positive");
    static const QStringList levels{"DEBUG", "INFO", "WARN", "ERROR"};
    if (!levels.contains(cfg.logLevel))
        return setError(err, ErrorKind::Config, QString("unknown log level '%1'").arg(cfg.logLevel));
    return true;
}
