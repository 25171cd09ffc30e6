/**
 * @file uploadstore.h
 * @brief Durable snapshot of the upload queue.
 */

#ifndef UPLOADSTORE_H
#define UPLOADSTORE_H

#include <QList>
#include <QString>

#include "models/uploaditem.h"

/**
 * @brief Persists the upload queue as a single JSON document.
 *
 * The whole queue is written on every save through QSaveFile, so a crash
 * mid-write leaves the previous snapshot intact. Loading never fails: a
 * missing or unreadable file yields an empty queue, and individual entries
 * that cannot be decoded are skipped.
 *
 * @par Example usage:
 * @code
 * UploadStore store;  // AppDataLocation/uploads.json
 * QList<UploadItem> items = store.load();
 * items.append(UploadItem::create("/videos/clip.mp4", configId, "12345"));
 * store.save(items);
 * @endcode
 */
class UploadStore
{
public:
    /// File name used inside the data directory
    static constexpr const char* FileName = "uploads.json";

    /**
     * @brief Constructs a store.
     * @param filePath Explicit snapshot path; empty selects the default
     *                 location under QStandardPaths::AppDataLocation.
     */
    explicit UploadStore(const QString &filePath = QString());

    [[nodiscard]] QString filePath() const { return filePath_; }

    /**
     * @brief Atomically overwrites the snapshot.
     * @return True if the snapshot was committed.
     */
    bool save(const QList<UploadItem> &items) const;

    /**
     * @brief Reads the last snapshot.
     * @return The saved entries, or an empty list if absent or corrupt.
     */
    [[nodiscard]] QList<UploadItem> load() const;

    [[nodiscard]] static QString defaultFilePath();

private:
    QString filePath_;
};

#endif // UPLOADSTORE_H
