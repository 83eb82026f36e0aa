#include "coffeechat/mail/EmailTemplate.hpp"

#include <QFile>
#include <QHash>
#include <QRegularExpression>
#include <QSet>
#include <QTextStream>
#include <vector>

namespace coffeechat {
namespace mail {

namespace {
const QString RecipientNameVar = QStringLiteral("recipient_name");
const QString SenderNameVar = QStringLiteral("sender_name");
const QString AvailabilitiesVar = QStringLiteral("availabilities");
} // namespace

struct TemplateNode
{
    enum class Kind
    {
        Text,
        Variable,
        Loop,
    };

    Kind kind = Kind::Text;
    // Text: literal content. Variable: variable name. Loop: item name.
    QString value;
    std::vector<TemplateNode> children;
};

struct TemplateTree
{
    std::vector<TemplateNode> nodes;
};

namespace {

using ParseResult = core::Result<std::shared_ptr<const TemplateTree>>;

ParseResult parseError(const QString &part, const QString &message)
{
    return ParseResult::failure(core::Error::invalidInput(QStringLiteral("Template %1: %2").arg(part, message)));
}

ParseResult parseTemplate(const QString &text, const QString &part)
{
    static const QRegularExpression tagRegex(
        QStringLiteral("\\{\\{\\s*([A-Za-z_][A-Za-z0-9_]*)\\s*\\}\\}|\\{%\\s*(.*?)\\s*%\\}"));
    static const QRegularExpression forRegex(QStringLiteral("^for\\s+([A-Za-z_][A-Za-z0-9_]*)\\s+in\\s+([A-Za-z_][A-Za-z0-9_]*)$"));

    auto tree = std::make_shared<TemplateTree>();
    std::vector<TemplateNode> loops;
    QSet<QString> scope{ RecipientNameVar, SenderNameVar, AvailabilitiesVar };

    auto currentNodes = [&]() -> std::vector<TemplateNode> & {
        return loops.empty() ? tree->nodes : loops.back().children;
    };
    auto appendText = [&](const QString &literal) {
        if (!literal.isEmpty()) {
            currentNodes().push_back({ TemplateNode::Kind::Text, literal, {} });
        }
    };

    int position = 0;
    auto it = tagRegex.globalMatch(text);
    while (it.hasNext()) {
        const auto match = it.next();
        appendText(text.mid(position, match.capturedStart() - position));
        position = match.capturedEnd();

        if (match.capturedLength(1) > 0) {
            const QString name = match.captured(1);
            if (!scope.contains(name)) {
                return parseError(part, QStringLiteral("unknown variable '%1'").arg(name));
            }
            currentNodes().push_back({ TemplateNode::Kind::Variable, name, {} });
            continue;
        }

        const QString statement = match.captured(2);
        if (statement == QLatin1String("endfor")) {
            if (loops.empty()) {
                return parseError(part, QStringLiteral("'endfor' without matching 'for'"));
            }
            TemplateNode loop = std::move(loops.back());
            loops.pop_back();
            scope.remove(loop.value);
            currentNodes().push_back(std::move(loop));
            continue;
        }

        const auto forMatch = forRegex.match(statement);
        if (!forMatch.hasMatch()) {
            return parseError(part, QStringLiteral("unsupported statement '%1'").arg(statement));
        }
        const QString item = forMatch.captured(1);
        if (forMatch.captured(2) != AvailabilitiesVar) {
            return parseError(part, QStringLiteral("cannot iterate over '%1'").arg(forMatch.captured(2)));
        }
        if (scope.contains(item)) {
            return parseError(part, QStringLiteral("loop variable '%1' shadows another variable").arg(item));
        }
        scope.insert(item);
        loops.push_back({ TemplateNode::Kind::Loop, item, {} });
    }
    if (!loops.empty()) {
        return parseError(part, QStringLiteral("missing 'endfor' for loop over '%1'").arg(loops.back().value));
    }
    appendText(text.mid(position));
    return ParseResult::success(std::move(tree));
}

struct RenderContext
{
    const TemplateVariables &variables;
    // Loop item name -> current value, for every enclosing loop.
    QHash<QString, QString> loopItems;
};

void renderNodes(const std::vector<TemplateNode> &nodes, RenderContext &context, QString &out)
{
    for (const auto &node : nodes) {
        switch (node.kind) {
        case TemplateNode::Kind::Text:
            out += node.value;
            break;
        case TemplateNode::Kind::Variable:
            if (context.loopItems.contains(node.value)) {
                out += context.loopItems.value(node.value);
            } else if (node.value == RecipientNameVar) {
                out += context.variables.recipientName;
            } else if (node.value == SenderNameVar) {
                out += context.variables.senderName;
            } else if (node.value == AvailabilitiesVar) {
                out += context.variables.availabilities.join(QLatin1Char('\n'));
            }
            break;
        case TemplateNode::Kind::Loop: {
            RenderContext inner{ context.variables, context.loopItems };
            for (const auto &availability : context.variables.availabilities) {
                inner.loopItems.insert(node.value, availability);
                renderNodes(node.children, inner, out);
            }
            break;
        }
        }
    }
}

QString renderTree(const TemplateTree &tree, const TemplateVariables &variables)
{
    QString out;
    RenderContext context{ variables, {} };
    renderNodes(tree.nodes, context, out);
    return out;
}

} // namespace

core::Result<EmailTemplate> EmailTemplate::fromContent(const QString &subject, const QString &body)
{
    auto subjectTree = parseTemplate(subject, QStringLiteral("subject"));
    if (!subjectTree) {
        return core::Result<EmailTemplate>::failure(subjectTree.error());
    }
    auto bodyTree = parseTemplate(body, QStringLiteral("body"));
    if (!bodyTree) {
        return core::Result<EmailTemplate>::failure(bodyTree.error());
    }

    EmailTemplate result;
    result.m_subject = subject;
    result.m_body = body;
    result.m_subjectTree = subjectTree.takeValue();
    result.m_bodyTree = bodyTree.takeValue();
    return core::Result<EmailTemplate>::success(std::move(result));
}

core::Result<EmailTemplate> EmailTemplate::load(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return core::Result<EmailTemplate>::failure(core::Error::invalidInput(
            QStringLiteral("Failed to read template file '%1': %2").arg(path, file.errorString())));
    }
    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    return parseFile(stream.readAll());
}

core::Result<EmailTemplate> EmailTemplate::parseFile(const QString &content)
{
    QString normalized = content;
    normalized.remove(QLatin1Char('\r'));
    QStringList lines = normalized.split(QLatin1Char('\n'));
    const QString subjectPrefix = QStringLiteral("Subject:");
    if (lines.size() < 2 || !lines.at(0).startsWith(subjectPrefix) || lines.at(1) != QLatin1String("---")) {
        return core::Result<EmailTemplate>::failure(core::Error::invalidInput(
            QStringLiteral("Template format error: missing 'Subject:' line or '---' separator")));
    }
    const QString subject = lines.at(0).mid(subjectPrefix.size()).trimmed();
    lines.erase(lines.begin(), lines.begin() + 2);
    return fromContent(subject, lines.join(QLatin1Char('\n')));
}

RenderedMessage EmailTemplate::render(const TemplateVariables &variables) const
{
    RenderedMessage message;
    if (m_subjectTree) {
        message.subject = renderTree(*m_subjectTree, variables);
    }
    if (m_bodyTree) {
        message.body = renderTree(*m_bodyTree, variables);
    }
    return message;
}

} // namespace mail
} // namespace coffeechat
