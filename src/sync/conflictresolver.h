#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QString>
#include <QJsonValue>
#include "synctypes.h"

namespace Replica {

/**
 * @brief Decides what happens when both sides hold the same key
 *
 * Only called when source and destination records share a key and their
 * checksums differ. The resolver never touches a store; it tells the
 * engine what to write.
 */
class ConflictResolver
{
public:
    /**
     * @brief Outcome of resolving one conflict
     */
    struct Resolution {
        enum Action {
            Apply,              ///< Write record to the destination
            KeepDestination,    ///< Leave the destination as it is
            Queue               ///< Deferred for manual review (see entry)
        };

        Action action = Apply;
        Record record;          ///< Record to write (Apply) or the kept one
        ConflictEntry entry;    ///< Filled when action == Queue
    };

    /**
     * @brief Resolve a conflict
     *
     * - SourceWins: source record unchanged
     * - DestinationWins: destination kept, source discarded
     * - NewestWins: compare timestampField numerically, ties favor source
     * - Merge: destination fields overlaid with every source field;
     *   array values are replaced wholesale, never merged element-wise
     * - ManualReview: nothing applied, a ConflictEntry is returned
     */
    static Resolution resolve(const Record &source,
                              const Record &destination,
                              ConflictResolution strategy,
                              const QString &timestampField = QStringLiteral("_updated"),
                              const QString &keyField = QStringLiteral("_key"));

    /**
     * @brief Overlay source fields on destination fields (top level)
     */
    static Record merge(const Record &source, const Record &destination);

    /**
     * @brief Numeric value of a timestamp field
     *
     * Numbers are taken as is, strings holding a number are parsed;
     * anything else (missing, null, non-numeric) counts as 0.
     */
    static double timestampValue(const QJsonValue &value);
};

} // namespace Replica

#endif // CONFLICTRESOLVER_H
