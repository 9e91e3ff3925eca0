#include "core/ReceiverConfig.hpp"
#include <fsp/Protocol.hpp>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <algorithm>
#include <fstream>

namespace fastsync {

YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (base.IsMap() && overlay.IsMap()) {
        YAML::Node result = YAML::Clone(base);
        for (auto it = overlay.begin(); it != overlay.end(); ++it) {
            const auto key = it->first.as<std::string>();
            if (result[key])
                result[key] = mergeYaml(result[key], it->second);
            else
                result[key] = YAML::Clone(it->second);
        }
        return result;
    }

    return YAML::Clone(overlay);
}

ReceiverConfig::ReceiverConfig()
{
    initDefaults();
}

void ReceiverConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["server"]["bind_address"] = "0.0.0.0";
    root_["server"]["port"] = static_cast<int>(fsp::DEFAULT_PORT);
    root_["server"]["max_body_bytes"] = static_cast<long long>(fsp::MAX_BODY_BYTES);
    root_["server"]["worker_threads"] = 4;
    root_["server"]["read_timeout_ms"] = 30000;

    root_["notifications"]["app_name"] = "FastSync";
    root_["notifications"]["preview_chars"] = 100;
    root_["notifications"]["photo_ttl_ms"] = 30000;
    root_["notifications"]["sms_ttl_ms"] = 60000;
    root_["notifications"]["clipboard_ttl_ms"] = 30000;
    root_["notifications"]["temp_dir"] = "";
    root_["notifications"]["report_failures"] = true;

    root_["discovery"]["enabled"] = true;
    root_["discovery"]["service_type"] = fsp::SERVICE_TYPE;
    root_["discovery"]["instance_suffix"] = fsp::INSTANCE_SUFFIX;

    root_["identity"]["app_id"] = "com.duoduojuzi.fastsync";
    root_["identity"]["display_name"] = "FastSync Receiver";

    root_["save"]["default_file_name"] = "image.png";

    root_["logging"]["level"] = "info";
}

bool ReceiverConfig::load(const QString& filePath)
{
    initDefaults();
    if (!QFile::exists(filePath))
        return false;

    try {
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = mergeYaml(root_, loaded);
    } catch (const YAML::Exception& e) {
        qWarning() << "[Config] Failed to parse" << filePath << ":" << e.what()
                   << "- using defaults";
        initDefaults();
        return false;
    }
    return true;
}

bool ReceiverConfig::save(const QString& filePath) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());
    std::ofstream fout(filePath.toStdString());
    if (!fout) {
        qWarning() << "[Config] Cannot write" << filePath;
        return false;
    }
    fout << root_ << "\n";
    return fout.good();
}

QString ReceiverConfig::defaultPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
           + "/fastsync/config.yaml";
}

namespace {

QString str(const YAML::Node& node, const char* fallback)
{
    try {
        return QString::fromStdString(node.as<std::string>(fallback));
    } catch (const YAML::Exception&) {
        return QString::fromUtf8(fallback);
    }
}

template <typename T>
T num(const YAML::Node& node, T fallback)
{
    try {
        return node.as<T>(fallback);
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

} // namespace

// --- Server ---

QString ReceiverConfig::bindAddress() const
{
    return str(root_["server"]["bind_address"], "0.0.0.0");
}

uint16_t ReceiverConfig::port() const
{
    int p = num<int>(root_["server"]["port"], fsp::DEFAULT_PORT);
    if (p < 0 || p > 65535) return fsp::DEFAULT_PORT;
    return static_cast<uint16_t>(p);
}

void ReceiverConfig::setPort(uint16_t v)
{
    root_["server"]["port"] = static_cast<int>(v);
}

qint64 ReceiverConfig::maxBodyBytes() const
{
    const auto fallback = static_cast<long long>(fsp::MAX_BODY_BYTES);
    long long bytes = num<long long>(root_["server"]["max_body_bytes"], fallback);
    if (bytes <= 0) return fallback;
    return bytes;
}

int ReceiverConfig::workerThreads() const
{
    return std::max(1, num<int>(root_["server"]["worker_threads"], 4));
}

int ReceiverConfig::readTimeoutMs() const
{
    return num<int>(root_["server"]["read_timeout_ms"], 30000);
}

// --- Notifications ---

QString ReceiverConfig::appName() const
{
    return str(root_["notifications"]["app_name"], "FastSync");
}

int ReceiverConfig::previewChars() const
{
    return num<int>(root_["notifications"]["preview_chars"], 100);
}

int ReceiverConfig::photoTtlMs() const
{
    return num<int>(root_["notifications"]["photo_ttl_ms"], 30000);
}

int ReceiverConfig::smsTtlMs() const
{
    return num<int>(root_["notifications"]["sms_ttl_ms"], 60000);
}

int ReceiverConfig::clipboardTtlMs() const
{
    return num<int>(root_["notifications"]["clipboard_ttl_ms"], 30000);
}

QString ReceiverConfig::tempDir() const
{
    return str(root_["notifications"]["temp_dir"], "");
}

bool ReceiverConfig::reportFailures() const
{
    return num<bool>(root_["notifications"]["report_failures"], true);
}

// --- Discovery ---

bool ReceiverConfig::discoveryEnabled() const
{
    return num<bool>(root_["discovery"]["enabled"], true);
}

QString ReceiverConfig::serviceType() const
{
    return str(root_["discovery"]["service_type"], fsp::SERVICE_TYPE);
}

QString ReceiverConfig::instanceSuffix() const
{
    return str(root_["discovery"]["instance_suffix"], fsp::INSTANCE_SUFFIX);
}

// --- Identity ---

QString ReceiverConfig::appId() const
{
    return str(root_["identity"]["app_id"], "com.duoduojuzi.fastsync");
}

QString ReceiverConfig::displayName() const
{
    return str(root_["identity"]["display_name"], "FastSync Receiver");
}

QString ReceiverConfig::defaultSaveFileName() const
{
    return str(root_["save"]["default_file_name"], "image.png");
}

QString ReceiverConfig::logLevel() const
{
    return str(root_["logging"]["level"], "info");
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool ok = false;
    qlonglong i = s.toLongLong(&ok);
    if (ok) return QVariant(i);

    double d = s.toDouble(&ok);
    if (ok) return QVariant(d);

    return QVariant(s);
}

QVariant ReceiverConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

} // namespace fastsync
