#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace fastsync {

// Deep merge: overlay values override base values.
// Mappings recurse, sequences and scalars override entirely,
// missing keys in overlay preserve base defaults.
YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay);

class ReceiverConfig {
public:
    ReceiverConfig();

    /// Merge the file over the built-in defaults. A missing or unparsable
    /// file leaves the defaults in place and returns false.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    /// $XDG_CONFIG_HOME/fastsync/config.yaml
    static QString defaultPath();

    // Server
    QString bindAddress() const;
    uint16_t port() const;
    void setPort(uint16_t v);
    qint64 maxBodyBytes() const;
    int workerThreads() const;
    int readTimeoutMs() const;

    // Notifications
    QString appName() const;
    int previewChars() const;
    int photoTtlMs() const;
    int smsTtlMs() const;
    int clipboardTtlMs() const;
    QString tempDir() const;    // empty means the system temp location
    bool reportFailures() const;

    // Discovery
    bool discoveryEnabled() const;
    QString serviceType() const;
    QString instanceSuffix() const;

    // Identity
    QString appId() const;
    QString displayName() const;

    QString defaultSaveFileName() const;
    QString logLevel() const;

    // Generic dot-path access (e.g. "server.port")
    QVariant valueByPath(const QString& dottedKey) const;

private:
    YAML::Node root_;

    void initDefaults();
};

} // namespace fastsync
