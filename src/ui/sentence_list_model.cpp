// Copyright (c) 2025 VAM Japanese Audio Transcriber
// SentenceListModel - Implementation

#include "ui/sentence_list_model.hpp"
#include "app/seek_mapper.hpp"

#include <QString>

SentenceListModel::SentenceListModel(QObject* parent)
    : QAbstractListModel(parent)
{
}

int SentenceListModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) {
        return 0;
    }
    return count();
}

QVariant SentenceListModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || index.row() < 0 || index.row() >= count()) {
        return QVariant();
    }

    const app::Segment& seg = segments_[static_cast<size_t>(index.row())];
    switch (role) {
        case Qt::DisplayRole:
            return QString::fromStdString(app::format_row(seg));
        case TextRole:
            return QString::fromStdString(seg.text);
        case StartTimeRole:
            return seg.start_time;
        case EndTimeRole:
            return seg.end_time;
        case StartLabelRole:
            return QString::fromStdString(app::format_timestamp(seg.start_time));
        case EndLabelRole:
            return QString::fromStdString(app::format_timestamp(seg.end_time));
        default:
            return QVariant();
    }
}

QHash<int, QByteArray> SentenceListModel::roleNames() const {
    QHash<int, QByteArray> roles;
    roles[TextRole] = "text";
    roles[StartTimeRole] = "startTime";
    roles[EndTimeRole] = "endTime";
    roles[StartLabelRole] = "startLabel";
    roles[EndLabelRole] = "endLabel";
    return roles;
}

void SentenceListModel::setTranscript(const app::Transcript& transcript) {
    const int old_count = count();
    beginResetModel();
    segments_ = transcript;
    endResetModel();
    if (old_count != count()) {
        emit countChanged();
    }
}
