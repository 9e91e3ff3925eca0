#pragma once

#include <fsp/Payload/Payload.hpp>
#include <QDateTime>
#include <QList>
#include <QString>
#include <memory>

namespace fastsync {

namespace tags {
constexpr const char* PHOTO = "CurrentPhoto";
constexpr const char* SMS = "sms_sync";
constexpr const char* CLIPBOARD = "clipboard_sync";
constexpr const char* ACTION_ERROR = "action_error";
constexpr const char* GROUP = "FastSync";
} // namespace tags

namespace actions {
constexpr const char* SAVE = "save";
constexpr const char* COPY = "copy";
constexpr const char* COPY_CONTENT = "copy_content";
constexpr const char* COPY_CODE = "copy_code";
constexpr const char* COPY_CLIPBOARD = "copy_clipboard";
constexpr const char* IGNORE = "ignore";
} // namespace actions

struct NotificationAction {
    QString label;
    QString actionId;
};

struct NotificationDescriptor {
    QString tag;
    QString group = tags::GROUP;
    QString title;          // already markup-escaped
    QString bodyPreview;    // truncated, then markup-escaped
    QString imagePath;      // staged photo, empty for text content
    QDateTime expiry;       // absolute, UTC
    int ttlMs = 0;
    QList<NotificationAction> actions;
    std::shared_ptr<const fsp::Payload> originPayload;

    bool hasAction(const QString& actionId) const;
};

namespace NotificationText {

/// First maxChars code points plus "..." when the text is longer, else unchanged.
QString previewText(const QString& text, int maxChars = 100);

/// Escape & < > for embedding in notification body markup.
QString escapeMarkup(const QString& text);
QString unescapeMarkup(const QString& text);

} // namespace NotificationText

/// Builds the fixed per-content-class descriptor for an accepted payload.
class DescriptorBuilder {
public:
    struct Options {
        int previewChars = 100;
        int photoTtlMs = 30000;
        int smsTtlMs = 60000;
        int clipboardTtlMs = 30000;
    };

    DescriptorBuilder() = default;
    explicit DescriptorBuilder(const Options& options) : options_(options) {}

    NotificationDescriptor build(std::shared_ptr<const fsp::Payload> payload,
                                 const QString& imagePath,
                                 const QDateTime& now = QDateTime::currentDateTimeUtc()) const;

    /// Non-interactive toast used to surface a failed action.
    NotificationDescriptor buildFailureNotice(const QString& reason,
                                              const QDateTime& now = QDateTime::currentDateTimeUtc()) const;

    static QString tagFor(fsp::ContentClass contentClass);

private:
    Options options_;
};

} // namespace fastsync
