#pragma once

#include <QString>
#include <QStringList>
#include <memory>

#include "coffeechat/core/Result.hpp"

namespace coffeechat {
namespace mail {

struct TemplateVariables
{
    QString recipientName;
    QString senderName;
    QStringList availabilities;
};

struct RenderedMessage
{
    QString subject;
    QString body;
};

struct TemplateTree;

// Subject and body templates with {{ variable }} substitution and
// {% for item in availabilities %}...{% endfor %} loops. Known variables are
// recipient_name, sender_name and availabilities.
class EmailTemplate
{
public:
    static core::Result<EmailTemplate> fromContent(const QString &subject, const QString &body);

    // File layout: "Subject: <subject>" on the first line, "---" on the second, body after.
    static core::Result<EmailTemplate> load(const QString &path);
    static core::Result<EmailTemplate> parseFile(const QString &content);

    const QString &subjectTemplate() const { return m_subject; }
    const QString &bodyTemplate() const { return m_body; }

    RenderedMessage render(const TemplateVariables &variables) const;

private:
    EmailTemplate() = default;

    QString m_subject;
    QString m_body;
    std::shared_ptr<const TemplateTree> m_subjectTree;
    std::shared_ptr<const TemplateTree> m_bodyTree;
};

} // namespace mail
} // namespace coffeechat
