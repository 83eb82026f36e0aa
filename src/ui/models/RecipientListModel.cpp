#include "coffeechat/ui/models/RecipientListModel.hpp"

namespace coffeechat {
namespace ui {

RecipientListModel::RecipientListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

int RecipientListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_recipients.size();
}

QVariant RecipientListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_recipients.size()) {
        return {};
    }

    const auto &recipient = m_recipients.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
        return tr("%1 (%2)").arg(recipient.name, recipient.email);
    case Qt::ToolTipRole:
        return QStringLiteral("%1 <%2>").arg(recipient.name, recipient.email);
    default:
        return {};
    }
}

void RecipientListModel::setRecipients(QVector<data::Recipient> recipients)
{
    beginResetModel();
    m_recipients = std::move(recipients);
    endResetModel();
    emit recipientsChanged();
}

const QVector<data::Recipient> &RecipientListModel::recipients() const
{
    return m_recipients;
}

bool RecipientListModel::addRecipient(const data::Recipient &recipient)
{
    data::Recipient trimmed{ recipient.name.trimmed(), recipient.email.trimmed() };
    if (!trimmed.isValid()) {
        return false;
    }
    const int row = m_recipients.size();
    beginInsertRows(QModelIndex(), row, row);
    m_recipients.append(trimmed);
    endInsertRows();
    emit recipientsChanged();
    return true;
}

bool RecipientListModel::removeRecipient(int row)
{
    if (row < 0 || row >= m_recipients.size()) {
        return false;
    }
    beginRemoveRows(QModelIndex(), row, row);
    m_recipients.removeAt(row);
    endRemoveRows();
    emit recipientsChanged();
    return true;
}

} // namespace ui
} // namespace coffeechat
