#include "batcher.h"

#include <QDebug>
#include <algorithm>

namespace Replica {

QList<Batcher::Chunk> Batcher::batch(const QList<Record> &records, int size)
{
    QList<Chunk> chunks;
    const int step = std::max(1, size);

    for (int i = 0; i < records.size(); i += step) {
        chunks.append(records.mid(i, step));
    }
    return chunks;
}

Checkpoint Batcher::makeCheckpoint(int batchIndex,
                                   const Chunk &chunk,
                                   const QString &keyField,
                                   int processedSoFar)
{
    Checkpoint checkpoint;
    checkpoint.batchIndex = batchIndex;
    checkpoint.lastKey = chunk.isEmpty() ? QString() : chunk.last().value(keyField).toString();
    checkpoint.recordsProcessed = processedSoFar;
    checkpoint.timestamp = QDateTime::currentDateTimeUtc();
    return checkpoint;
}

QList<Batcher::Chunk> Batcher::resumeFrom(const QList<Chunk> &chunks,
                                          const Checkpoint &checkpoint,
                                          const QString &keyField,
                                          int *startIndex)
{
    if (startIndex) *startIndex = 0;

    if (!checkpoint.isValid()) {
        return chunks;
    }

    const int index = checkpoint.batchIndex;
    if (index < chunks.size()) {
        const Chunk &confirmed = chunks.at(index);
        if (!confirmed.isEmpty()
            && confirmed.last().value(keyField).toString() == checkpoint.lastKey) {
            if (startIndex) *startIndex = index + 1;
            return chunks.mid(index + 1);
        }
    }

    // Batch layout no longer matches: find lastKey in the flat sequence
    QList<Record> flat;
    int chunkSize = 0;
    for (const Chunk &chunk : chunks) {
        chunkSize = std::max(chunkSize, static_cast<int>(chunk.size()));
        flat.append(chunk);
    }

    for (int i = 0; i < flat.size(); ++i) {
        if (flat.at(i).value(keyField).toString() == checkpoint.lastKey) {
            qDebug() << "[Batcher] Source changed since checkpoint, resuming after key"
                     << checkpoint.lastKey;
            if (startIndex) *startIndex = index + 1;
            return batch(flat.mid(i + 1), chunkSize);
        }
    }

    qDebug() << "[Batcher] Checkpoint key" << checkpoint.lastKey
             << "no longer present, replaying all batches";
    return chunks;
}

} // namespace Replica
