#pragma once

#include <QAbstractListModel>
#include <QVector>

#include "coffeechat/data/Recipient.hpp"

namespace coffeechat {
namespace ui {

class RecipientListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    explicit RecipientListModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;

    void setRecipients(QVector<data::Recipient> recipients);
    const QVector<data::Recipient> &recipients() const;

    // Rejects entries without a name or with a malformed address.
    bool addRecipient(const data::Recipient &recipient);
    bool removeRecipient(int row);

signals:
    void recipientsChanged();

private:
    QVector<data::Recipient> m_recipients;
};

} // namespace ui
} // namespace coffeechat
