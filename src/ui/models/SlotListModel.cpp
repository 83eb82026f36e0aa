#include "coffeechat/ui/models/SlotListModel.hpp"

#include "coffeechat/core/SlotFormatter.hpp"

namespace coffeechat {
namespace ui {

SlotListModel::SlotListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

int SlotListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(m_slots.size());
}

QVariant SlotListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= rowCount()) {
        return {};
    }

    const auto &slot = m_slots.at(static_cast<std::size_t>(index.row()));
    switch (role) {
    case Qt::DisplayRole:
        return core::formatSlot(slot, m_zone);
    case Qt::ToolTipRole: {
        const qint64 minutes = slot.durationSecs() / 60;
        if (minutes >= 60) {
            return tr("%1h %2m free").arg(minutes / 60).arg(minutes % 60);
        }
        return tr("%1m free").arg(minutes);
    }
    case StartRole:
        return slot.start;
    case EndRole:
        return slot.end;
    default:
        return {};
    }
}

void SlotListModel::setSlots(std::vector<data::Interval> slots)
{
    beginResetModel();
    m_slots = std::move(slots);
    endResetModel();
}

void SlotListModel::setTimeZone(const QTimeZone &zone)
{
    m_zone = zone;
    if (m_slots.empty()) {
        return;
    }
    emit dataChanged(index(0, 0), index(rowCount() - 1, 0), { Qt::DisplayRole });
}

const std::vector<data::Interval> &SlotListModel::slots() const
{
    return m_slots;
}

} // namespace ui
} // namespace coffeechat
