#pragma once

#include <QAbstractListModel>
#include <QTimeZone>
#include <vector>

#include "coffeechat/data/Interval.hpp"

namespace coffeechat {
namespace ui {

class SlotListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles
    {
        StartRole = Qt::UserRole + 1,
        EndRole,
    };

    explicit SlotListModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;

    void setSlots(std::vector<data::Interval> slots);
    void setTimeZone(const QTimeZone &zone);
    const std::vector<data::Interval> &slots() const;

private:
    std::vector<data::Interval> m_slots;
    QTimeZone m_zone = QTimeZone::systemTimeZone();
};

} // namespace ui
} // namespace coffeechat
