#ifndef BATCHER_H
#define BATCHER_H

#include <QList>
#include <QString>
#include "synctypes.h"

namespace Replica {

/**
 * @brief Splits record sequences into batches and resumes from checkpoints
 *
 * Batch N+1 is never written before batch N's checkpoint is recorded, so a
 * checkpoint always marks a prefix of the batch sequence that is known to
 * be written. Replaying from it is at-least-once; per-record writes are
 * idempotent at the destination.
 */
class Batcher
{
public:
    using Chunk = QList<Record>;

    /**
     * @brief Order-preserving chunks of at most size records
     *
     * The last chunk may be smaller. A size below 1 is treated as 1.
     * Empty input yields no chunks.
     */
    static QList<Chunk> batch(const QList<Record> &records, int size);

    /**
     * @brief Checkpoint marking a batch as written
     * @param batchIndex Index of the confirmed batch
     * @param chunk The batch itself (its last key is recorded)
     * @param keyField Primary key field
     * @param processedSoFar Source records covered including this batch
     */
    static Checkpoint makeCheckpoint(int batchIndex,
                                     const Chunk &chunk,
                                     const QString &keyField,
                                     int processedSoFar);

    /**
     * @brief Chunks still to be written after a checkpoint
     *
     * An invalid checkpoint yields every chunk. When the chunk at the
     * checkpoint's index still ends with its last key, the chunks after it
     * are returned unchanged. Otherwise the source changed between runs:
     * the records after lastKey in the flattened sequence are re-chunked,
     * and if lastKey is gone everything is replayed.
     *
     * @param startIndex If given, receives the batch number of the first
     *        returned chunk: 0 when everything is replayed, otherwise the
     *        batch after the checkpoint's
     */
    static QList<Chunk> resumeFrom(const QList<Chunk> &chunks,
                                   const Checkpoint &checkpoint,
                                   const QString &keyField,
                                   int *startIndex = nullptr);
};

} // namespace Replica

#endif // BATCHER_H
