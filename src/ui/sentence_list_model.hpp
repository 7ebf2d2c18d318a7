// Copyright (c) 2025 VAM Japanese Audio Transcriber
// SentenceListModel - transcript rows for the QML sentence list

#pragma once

#include "app/transcription_types.hpp"

#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QVariant>

class SentenceListModel : public QAbstractListModel {
    Q_OBJECT

    Q_PROPERTY(int count READ count NOTIFY countChanged)

public:
    enum SentenceRoles {
        TextRole = Qt::UserRole + 1,
        StartTimeRole,
        EndTimeRole,
        StartLabelRole,
        EndLabelRole
    };
    Q_ENUM(SentenceRoles)

    explicit SentenceListModel(QObject* parent = nullptr);

    // QAbstractListModel interface
    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    int count() const { return static_cast<int>(segments_.size()); }

    /// Replace all rows (empty transcript clears the list)
    void setTranscript(const app::Transcript& transcript);

signals:
    void countChanged();

private:
    app::Transcript segments_;
};
