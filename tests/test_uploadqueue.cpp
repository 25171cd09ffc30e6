/**
 * @file test_uploadqueue.cpp
 * @brief Unit tests for UploadQueue.
 *
 * Tests verify:
 * - FIFO admission with a single active upload
 * - Missing credentials fail entries without network traffic
 * - Pause, resume and reachability changes continue from the server offset
 * - Cancel and history removal issue at most one remote delete
 * - Start-up restores interrupted uploads
 * - Remote metadata refresh, ready polling and library reconciliation
 */

#include <QtTest/QtTest>
#include <QSettings>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTimeZone>

#include "models/uploadqueue.h"
#include "services/idlesleepguard.h"
#include "services/librarystore.h"
#include "services/uploadstore.h"
#include "mocks/mockhttptransport.h"
#include "mocks/mockvideoservice.h"

class TestUploadQueue : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    // Admission
    void testUploadsRunOneAtATimeInOrder();
    void testEnqueueWithoutApiKeyFailsWithoutRequests();
    void testAdmitNextIsIdempotent();
    void testSessionFailureMovesToNextEntry();
    void testRetryExhaustionFailsOnce();
    void testEqualCreationTimesAdmitLowerIdFirst();

    // Pause and resume
    void testPauseAndResumeContinuesFromOffset();
    void testConnectivityLossPausesAndRegainResumes();
    void testRegainWithoutAutoResumeKeepsPaused();
    void testPauseAllAndResumeAll();
    void testPauseDuringVideoCreationKeepsVideoId();

    // Cancel and removal
    void testCancelActiveDeletesRemoteOnce();
    void testCancelPendingWithoutVideoIsLocal();
    void testCancelSuccessIsLocal();
    void testCancelRemovesEvenWhenDeleteFails();
    void testCancelDuringVideoCreationDeletesNewVideo();
    void testRemoveFromHistory();
    void testClearAll();

    // Persistence
    void testLoadResumesInterruptedUpload();
    void testLoadWithoutAutoResumePausesInterrupted();
    void testStateIsPersisted();
    void testLoadRepeatsInterruptedCancelDelete();

    // Remote metadata
    void testProcessingReadyNotifiesOnce();
    void testRefreshNotFoundRemovesEntry();
    void testUpdateTitleRefreshesEntry();
    void testUploadThumbnailClearsCachedPath();
    void testDeleteFromRemote();
    void testFailedDeleteOfActiveUploadKeepsQueueMoving();
    void testSyncLibraryMergesCatalog();
    void testSyncLibraryReadsAllPages();

    // Ambient
    void testSleepGuardFollowsQueue();
    void testModelRoles();

private:
    QString createFile(const QString &name, int size);
    UploadStatus statusOf(const QString &id) const { return queue_->item(id).status; }
    QString completeOneUpload();

    QTemporaryDir *tempDir_ = nullptr;
    MockHttpTransport *http_ = nullptr;
    MockVideoService *api_ = nullptr;
    LibraryStore *libraries_ = nullptr;
    UploadStore *store_ = nullptr;
    IdleSleepGuard *guard_ = nullptr;
    UploadQueue *queue_ = nullptr;
    QString configId_;
};

static const int ChunkSize = 1024;

void TestUploadQueue::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QCoreApplication::setOrganizationName("streamlift-tests");
    QCoreApplication::setApplicationName("test_uploadqueue");
    qRegisterMetaType<ErrorCategory>();
}

void TestUploadQueue::init()
{
    QSettings().clear();

    tempDir_ = new QTemporaryDir();
    QVERIFY(tempDir_->isValid());

    http_ = new MockHttpTransport(this);
    api_ = new MockVideoService(this);
    libraries_ = new LibraryStore(this);
    configId_ = libraries_->addLibrary("Main", "12345", "secret-key");
    QVERIFY(!configId_.isEmpty());
    store_ = new UploadStore(tempDir_->filePath("uploads.json"));
    guard_ = new IdleSleepGuard(this);

    queue_ = new UploadQueue(this);
    queue_->setHttpTransport(http_);
    queue_->setVideoService(api_);
    queue_->setLibraryStore(libraries_);
    queue_->setUploadStore(store_);
    queue_->setSleepGuard(guard_);
    queue_->setTusEndpoint(QUrl("https://video.example.com/tusupload"));
    queue_->setChunkSize(ChunkSize);
    queue_->setPollIntervalMs(10);

    TusRetryPolicy policy;
    policy.backoffMs = {0, 0, 0, 0, 0, 0, 0};
    policy.probeRetryMs = 0;
    policy.lockedRetryMs = 0;
    queue_->setRetryPolicy(policy);
}

void TestUploadQueue::cleanup()
{
    delete queue_;
    queue_ = nullptr;
    delete http_;
    http_ = nullptr;
    delete api_;
    api_ = nullptr;
    delete guard_;
    guard_ = nullptr;
    delete store_;
    store_ = nullptr;
    delete libraries_;
    libraries_ = nullptr;
    delete tempDir_;
    tempDir_ = nullptr;
}

QString TestUploadQueue::createFile(const QString &name, int size)
{
    const QString path = tempDir_->filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return QString();
    }
    file.write(QByteArray(size, 'v'));
    file.close();
    return path;
}

QString TestUploadQueue::completeOneUpload()
{
    const QStringList ids = queue_->enqueue({createFile("done.mp4", 2 * ChunkSize)}, configId_);
    if (ids.size() != 1) {
        return QString();
    }
    QSignalSpy completedSpy(queue_, &UploadQueue::uploadCompleted);
    if (!completedSpy.wait(5000)) {
        return QString();
    }
    return ids.first();
}

// === Admission ===

void TestUploadQueue::testUploadsRunOneAtATimeInOrder()
{
    const QStringList files = {createFile("a.mp4", 2 * ChunkSize),
                               createFile("b.mp4", 3 * ChunkSize),
                               createFile("c.mp4", ChunkSize)};

    int maxUploading = 0;
    connect(queue_, &UploadQueue::itemChanged, this, [&maxUploading, this](const QString &) {
        maxUploading = qMax(maxUploading, queue_->uploadingCount());
    });
    QSignalSpy startedSpy(queue_, &UploadQueue::uploadStarted);
    QSignalSpy finishedSpy(queue_, &UploadQueue::allUploadsFinished);

    const QStringList ids = queue_->enqueue(files, configId_);
    QCOMPARE(ids.size(), 3);
    QCOMPARE(statusOf(ids.at(0)), UploadStatus::Pending);

    for (const QString &id : ids) {
        QTRY_COMPARE(statusOf(id), UploadStatus::Success);
    }

    QCOMPARE(maxUploading, 1);
    QCOMPARE(startedSpy.count(), 3);
    for (int i = 0; i < 3; ++i) {
        QCOMPARE(startedSpy.at(i).at(0).toString(), ids.at(i));
    }
    QVERIFY(finishedSpy.count() >= 1);

    const UploadItem first = queue_->item(ids.at(0));
    QCOMPARE(first.progress, 1.0);
    QCOMPARE(first.bytesUploaded, first.totalBytes);
    QVERIFY(first.completedAt.isValid());
    QVERIFY(first.hasVideo());
    QCOMPARE(api_->mockCallCount(IVideoService::OpCreateVideo), 3);
}

void TestUploadQueue::testEnqueueWithoutApiKeyFailsWithoutRequests()
{
    const QString noKey = libraries_->addLibrary("No key", "999", QString());
    QSignalSpy failedSpy(queue_, &UploadQueue::uploadFailed);

    const QStringList ids = queue_->enqueue({createFile("a.mp4", ChunkSize),
                                             createFile("b.mp4", ChunkSize)}, noKey);
    QCOMPARE(ids.size(), 2);
    for (const QString &id : ids) {
        QCOMPARE(statusOf(id), UploadStatus::Failed);
        QVERIFY(queue_->item(id).errorMessage.contains("Missing API key"));
    }
    QCOMPARE(failedSpy.count(), 2);
    QCOMPARE(failedSpy.at(0).at(1).value<ErrorCategory>(), ErrorCategory::Configuration);

    QTest::qWait(20);
    QCOMPARE(http_->mockRequests().size(), 0);
    QCOMPARE(api_->mockCalls().size(), 0);

    const QList<UploadItem> saved = store_->load();
    QCOMPARE(saved.size(), 2);
    QCOMPARE(saved.first().status, UploadStatus::Failed);
}

void TestUploadQueue::testAdmitNextIsIdempotent()
{
    http_->mockSetAutoRespond(false);
    const QStringList ids = queue_->enqueue({createFile("a.mp4", ChunkSize),
                                             createFile("b.mp4", ChunkSize)}, configId_);
    queue_->flushEventQueue();
    QCOMPARE(statusOf(ids.at(0)), UploadStatus::Uploading);

    queue_->admitNext();
    queue_->admitNext();
    queue_->admitNext();

    QCOMPARE(queue_->uploadingCount(), 1);
    QCOMPARE(statusOf(ids.at(1)), UploadStatus::Pending);
    QCOMPARE(api_->mockCallCount(IVideoService::OpCreateVideo), 1);
}

void TestUploadQueue::testSessionFailureMovesToNextEntry()
{
    const QString missing = createFile("gone.mp4", ChunkSize);
    const QString present = createFile("ok.mp4", ChunkSize);
    QSignalSpy failedSpy(queue_, &UploadQueue::uploadFailed);

    const QStringList ids = queue_->enqueue({missing, present}, configId_);
    QVERIFY(QFile::remove(missing));

    QTRY_COMPARE(statusOf(ids.at(1)), UploadStatus::Success);
    QCOMPARE(statusOf(ids.at(0)), UploadStatus::Failed);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(1).value<ErrorCategory>(), ErrorCategory::LocalFile);
    QVERIFY(!queue_->item(ids.at(0)).errorMessage.isEmpty());
}

void TestUploadQueue::testRetryExhaustionFailsOnce()
{
    http_->mockSetResponder([](const HttpRequest &) { return MockHttpTransport::status(500); });
    QSignalSpy failedSpy(queue_, &UploadQueue::uploadFailed);

    const QStringList ids = queue_->enqueue({createFile("a.mp4", ChunkSize)}, configId_);

    QTRY_COMPARE(statusOf(ids.first()), UploadStatus::Failed);
    QTest::qWait(20);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(1).value<ErrorCategory>(), ErrorCategory::Protocol);
    QVERIFY(queue_->item(ids.first()).completedAt.isValid());
    QVERIFY(queue_->item(ids.first()).errorMessage.contains("after 8 attempts"));
    QCOMPARE(http_->mockRequestCount("POST"), 8);
    QVERIFY(!guard_->isActive());
}

void TestUploadQueue::testEqualCreationTimesAdmitLowerIdFirst()
{
    const QDateTime stamp = QDateTime(QDate(2024, 5, 1), QTime(12, 0), QTimeZone::utc());
    UploadItem second = UploadItem::create(createFile("b.mp4", ChunkSize), configId_, "12345",
                                           UploadStatus::Pending);
    second.id = "entry-b";
    second.createdAt = stamp;
    UploadItem first = UploadItem::create(createFile("a.mp4", ChunkSize), configId_, "12345",
                                          UploadStatus::Pending);
    first.id = "entry-a";
    first.createdAt = stamp;
    QVERIFY(store_->save({second, first}));

    QSignalSpy startedSpy(queue_, &UploadQueue::uploadStarted);
    queue_->load();

    QTRY_COMPARE(statusOf("entry-a"), UploadStatus::Success);
    QTRY_COMPARE(statusOf("entry-b"), UploadStatus::Success);
    QCOMPARE(startedSpy.count(), 2);
    QCOMPARE(startedSpy.at(0).at(0).toString(), QString("entry-a"));
    QCOMPARE(startedSpy.at(1).at(0).toString(), QString("entry-b"));
}

// === Pause and resume ===

void TestUploadQueue::testPauseAndResumeContinuesFromOffset()
{
    const QStringList ids = queue_->enqueue({createFile("clip.mp4", 4 * ChunkSize)}, configId_);
    const QString id = ids.first();

    bool paused = false;
    connect(queue_, &UploadQueue::itemChanged, this, [&, this](const QString &changed) {
        if (!paused && changed == id && queue_->item(id).bytesUploaded >= 2 * ChunkSize) {
            paused = true;
            queue_->pause(id);
        }
    });

    QTRY_COMPARE(statusOf(id), UploadStatus::Paused);
    QTest::qWait(20);

    UploadItem item = queue_->item(id);
    QCOMPARE(item.status, UploadStatus::Paused);
    QVERIFY(item.lastResumeAttempt.isValid());
    QCOMPARE(item.bytesUploaded, qint64(2 * ChunkSize));
    QVERIFY(!item.tusUploadUrl.isEmpty());
    QVERIFY(!queue_->hasSession(id));
    QCOMPARE(http_->mockServerOffset(), qint64(2 * ChunkSize));

    http_->mockClearRequests();
    queue_->resume(id);
    QTRY_COMPARE(statusOf(id), UploadStatus::Success);

    QCOMPARE(http_->mockRequestCount("POST"), 0);
    QCOMPARE(api_->mockCallCount(IVideoService::OpCreateVideo), 1);
    const QList<HttpRequest> patches = http_->mockRequests("PATCH");
    QCOMPARE(patches.size(), 2);
    QCOMPARE(patches.first().header("Upload-Offset"), QByteArray::number(2 * ChunkSize));
}

void TestUploadQueue::testConnectivityLossPausesAndRegainResumes()
{
    const QStringList ids = queue_->enqueue({createFile("a.mp4", 3 * ChunkSize),
                                             createFile("b.mp4", ChunkSize)}, configId_);

    bool lost = false;
    connect(queue_, &UploadQueue::itemChanged, this, [&, this](const QString &changed) {
        if (!lost && changed == ids.at(0) && queue_->item(changed).bytesUploaded >= ChunkSize) {
            lost = true;
            queue_->onConnectivityChanged(false);
        }
    });

    QTRY_COMPARE(statusOf(ids.at(0)), UploadStatus::Paused);
    QTest::qWait(20);
    QVERIFY(queue_->item(ids.at(0)).lastResumeAttempt.isValid());
    QCOMPARE(statusOf(ids.at(1)), UploadStatus::Pending);
    QCOMPARE(queue_->uploadingCount(), 0);

    http_->mockClearRequests();
    queue_->onConnectivityChanged(true);

    QTRY_COMPARE(statusOf(ids.at(0)), UploadStatus::Success);
    QTRY_COMPARE(statusOf(ids.at(1)), UploadStatus::Success);
    QCOMPARE(http_->mockRequests("PATCH").first().header("Upload-Offset"),
             QByteArray::number(ChunkSize));
}

void TestUploadQueue::testRegainWithoutAutoResumeKeepsPaused()
{
    queue_->setAutoResume(false);
    const QStringList ids = queue_->enqueue({createFile("a.mp4", 3 * ChunkSize)}, configId_);

    bool lost = false;
    connect(queue_, &UploadQueue::itemChanged, this, [&, this](const QString &changed) {
        if (!lost && queue_->item(changed).bytesUploaded >= ChunkSize) {
            lost = true;
            queue_->onConnectivityChanged(false);
        }
    });
    QTRY_COMPARE(statusOf(ids.first()), UploadStatus::Paused);

    queue_->onConnectivityChanged(true);
    queue_->flushEventQueue();
    QTest::qWait(20);

    QCOMPARE(statusOf(ids.first()), UploadStatus::Paused);
    QCOMPARE(queue_->uploadingCount(), 0);
}

void TestUploadQueue::testPauseAllAndResumeAll()
{
    http_->mockSetAutoRespond(false);
    const QStringList ids = queue_->enqueue({createFile("a.mp4", ChunkSize),
                                             createFile("b.mp4", ChunkSize)}, configId_);
    queue_->flushEventQueue();
    QCOMPARE(statusOf(ids.at(0)), UploadStatus::Uploading);

    queue_->pauseAll();
    for (const QString &id : ids) {
        QCOMPARE(statusOf(id), UploadStatus::Paused);
        QVERIFY(queue_->item(id).lastResumeAttempt.isValid());
    }
    QVERIFY(!queue_->hasActiveOrPending());

    http_->mockSetAutoRespond(true);
    http_->mockProcessAll();
    queue_->resumeAll();
    for (const QString &id : ids) {
        QTRY_COMPARE(statusOf(id), UploadStatus::Success);
    }
}

void TestUploadQueue::testPauseDuringVideoCreationKeepsVideoId()
{
    api_->mockSetAutoRespond(false);
    const QStringList ids = queue_->enqueue({createFile("a.mp4", 2 * ChunkSize)}, configId_);
    const QString id = ids.first();
    queue_->flushEventQueue();
    QCOMPARE(api_->mockCallCount(IVideoService::OpCreateVideo), 1);
    QCOMPARE(api_->mockPendingCount(), 1);

    queue_->pause(id);
    queue_->resume(id);
    queue_->flushEventQueue();

    // Held until the first createVideo answers
    QCOMPARE(statusOf(id), UploadStatus::Pending);
    QVERIFY(!queue_->hasSession(id));
    QCOMPARE(api_->mockCallCount(IVideoService::OpCreateVideo), 1);

    api_->mockSetAutoRespond(true);
    api_->mockProcessAll();
    QCOMPARE(queue_->item(id).videoId, QString("video-1"));
    QCOMPARE(store_->load().first().videoId, QString("video-1"));

    QTRY_COMPARE(statusOf(id), UploadStatus::Success);
    QCOMPARE(api_->mockCallCount(IVideoService::OpCreateVideo), 1);
    QCOMPARE(api_->mockVideoCount(), 1);
    QCOMPARE(http_->mockRequests("POST").first().header("VideoId"), QByteArray("video-1"));
}

// === Cancel and removal ===

void TestUploadQueue::testCancelActiveDeletesRemoteOnce()
{
    const QStringList ids = queue_->enqueue({createFile("a.mp4", 4 * ChunkSize)}, configId_);
    const QString id = ids.first();
    QSignalSpy removedSpy(queue_, &UploadQueue::itemRemoved);

    bool canceled = false;
    connect(queue_, &UploadQueue::itemChanged, this, [&, this](const QString &changed) {
        if (!canceled && changed == id && queue_->item(id).bytesUploaded >= ChunkSize) {
            canceled = true;
            queue_->cancel(id);
        }
    });

    QTRY_COMPARE(removedSpy.count(), 1);
    QVERIFY(!queue_->contains(id));
    QCOMPARE(api_->mockCallCount(IVideoService::OpDeleteVideo), 1);
    QCOMPARE(api_->mockCalls(IVideoService::OpDeleteVideo).first().videoId, QString("video-1"));
    QVERIFY(!api_->mockHasVideo("video-1"));
    QVERIFY(store_->load().isEmpty());
}

void TestUploadQueue::testCancelPendingWithoutVideoIsLocal()
{
    http_->mockSetAutoRespond(false);
    const QStringList ids = queue_->enqueue({createFile("a.mp4", ChunkSize),
                                             createFile("b.mp4", ChunkSize)}, configId_);
    queue_->flushEventQueue();

    queue_->cancel(ids.at(1));

    QVERIFY(!queue_->contains(ids.at(1)));
    QCOMPARE(queue_->count(), 1);
    QCOMPARE(api_->mockCallCount(IVideoService::OpDeleteVideo), 0);
}

void TestUploadQueue::testCancelSuccessIsLocal()
{
    const QString id = completeOneUpload();
    QVERIFY(!id.isEmpty());
    const QString videoId = queue_->item(id).videoId;

    queue_->cancel(id);

    QVERIFY(!queue_->contains(id));
    QTest::qWait(20);
    QCOMPARE(api_->mockCallCount(IVideoService::OpDeleteVideo), 0);
    QVERIFY(api_->mockHasVideo(videoId));
}

void TestUploadQueue::testCancelRemovesEvenWhenDeleteFails()
{
    api_->mockSetFailure(IVideoService::OpDeleteVideo, "HTTP 500");
    http_->mockSetAutoRespond(false);

    const QStringList ids = queue_->enqueue({createFile("a.mp4", 2 * ChunkSize)}, configId_);
    const QString id = ids.first();
    QTRY_VERIFY(queue_->item(id).hasVideo());

    queue_->cancel(id);
    QCOMPARE(statusOf(id), UploadStatus::Canceled);
    QCOMPARE(queue_->uploadingCount(), 0);

    QTRY_VERIFY(!queue_->contains(id));
    QCOMPARE(api_->mockCallCount(IVideoService::OpDeleteVideo), 1);
}

void TestUploadQueue::testCancelDuringVideoCreationDeletesNewVideo()
{
    api_->mockSetAutoRespond(false);
    const QStringList ids = queue_->enqueue({createFile("a.mp4", ChunkSize)}, configId_);
    queue_->flushEventQueue();
    QCOMPARE(api_->mockCallCount(IVideoService::OpCreateVideo), 1);

    queue_->cancel(ids.first());
    QVERIFY(!queue_->contains(ids.first()));
    QCOMPARE(api_->mockCallCount(IVideoService::OpDeleteVideo), 0);

    api_->mockSetAutoRespond(true);
    api_->mockProcessAll();

    QTRY_COMPARE(api_->mockCallCount(IVideoService::OpDeleteVideo), 1);
    QCOMPARE(api_->mockCalls(IVideoService::OpDeleteVideo).first().videoId, QString("video-1"));
    QVERIFY(!api_->mockHasVideo("video-1"));
    QCOMPARE(queue_->count(), 0);
}

void TestUploadQueue::testRemoveFromHistory()
{
    const QString noKey = libraries_->addLibrary("No key", "999", QString());
    const QStringList failed = queue_->enqueue({createFile("a.mp4", ChunkSize)}, noKey);

    queue_->removeFromHistory(failed.first());
    QVERIFY(!queue_->contains(failed.first()));

    // A pending entry degrades to cancel
    http_->mockSetAutoRespond(false);
    const QStringList ids = queue_->enqueue({createFile("b.mp4", ChunkSize),
                                             createFile("c.mp4", ChunkSize)}, configId_);
    queue_->flushEventQueue();
    queue_->removeFromHistory(ids.at(1));
    QVERIFY(!queue_->contains(ids.at(1)));
    QCOMPARE(api_->mockCallCount(IVideoService::OpDeleteVideo), 0);
}

void TestUploadQueue::testClearAll()
{
    http_->mockSetAutoRespond(false);
    queue_->enqueue({createFile("a.mp4", ChunkSize), createFile("b.mp4", ChunkSize)}, configId_);
    queue_->flushEventQueue();
    QCOMPARE(queue_->uploadingCount(), 1);

    queue_->clearAll();

    QCOMPARE(queue_->count(), 0);
    QCOMPARE(queue_->rowCount(), 0);
    QCOMPARE(http_->mockPendingCount(), 0);
    QCOMPARE(api_->mockCallCount(IVideoService::OpDeleteVideo), 0);
    QVERIFY(store_->load().isEmpty());
}

// === Persistence ===

void TestUploadQueue::testLoadResumesInterruptedUpload()
{
    const QString path = createFile("clip.mp4", 3 * ChunkSize);
    UploadItem interrupted = UploadItem::create(path, configId_, "12345", UploadStatus::Uploading);
    interrupted.videoId = "vid-9";
    interrupted.tusUploadUrl = "https://video.example.com/tusupload/vid-9";
    interrupted.bytesUploaded = ChunkSize;
    interrupted.totalBytes = 3 * ChunkSize;
    QVERIFY(store_->save({interrupted}));

    http_->mockSetServerOffset(ChunkSize);
    http_->mockSetUploadLength(3 * ChunkSize);

    queue_->load();
    QCOMPARE(statusOf(interrupted.id), UploadStatus::Pending);

    QTRY_COMPARE(statusOf(interrupted.id), UploadStatus::Success);
    QCOMPARE(api_->mockCallCount(IVideoService::OpCreateVideo), 0);
    QCOMPARE(http_->mockRequestCount("POST"), 0);
    const QList<HttpRequest> patches = http_->mockRequests("PATCH");
    QCOMPARE(patches.size(), 2);
    QCOMPARE(patches.first().header("Upload-Offset"), QByteArray::number(ChunkSize));
    QCOMPARE(patches.first().header("VideoId"), QByteArray("vid-9"));
}

void TestUploadQueue::testLoadWithoutAutoResumePausesInterrupted()
{
    UploadItem interrupted = UploadItem::create(createFile("a.mp4", ChunkSize), configId_,
                                                "12345", UploadStatus::Uploading);
    UploadItem pending = UploadItem::create(createFile("b.mp4", ChunkSize), configId_,
                                            "12345", UploadStatus::Paused);
    QVERIFY(store_->save({interrupted, pending}));

    queue_->setAutoResume(false);
    queue_->load();
    queue_->flushEventQueue();

    QCOMPARE(statusOf(interrupted.id), UploadStatus::Paused);
    QVERIFY(queue_->item(interrupted.id).lastResumeAttempt.isValid());
    QCOMPARE(statusOf(pending.id), UploadStatus::Paused);
    QCOMPARE(queue_->uploadingCount(), 0);
}

void TestUploadQueue::testStateIsPersisted()
{
    http_->mockSetAutoRespond(false);
    const QStringList ids = queue_->enqueue({createFile("a.mp4", ChunkSize)}, configId_);
    QCOMPARE(store_->load().first().status, UploadStatus::Pending);

    queue_->flushEventQueue();
    QCOMPARE(store_->load().first().status, UploadStatus::Uploading);

    // Video id and upload URL are stored before any chunk is sent
    QTRY_VERIFY(!store_->load().first().videoId.isEmpty());
    QTRY_COMPARE(http_->mockPendingCount(), 1);
    QVERIFY(http_->mockProcessNext());  // Create upload
    QVERIFY(!store_->load().first().tusUploadUrl.isEmpty());
    QCOMPARE(http_->mockRequestCount("PATCH"), 0);

    http_->mockSetAutoRespond(true);
    http_->mockProcessAll();
    QTRY_COMPARE(statusOf(ids.first()), UploadStatus::Success);

    const UploadItem saved = store_->load().first();
    QCOMPARE(saved.status, UploadStatus::Success);
    QCOMPARE(saved.progress, 1.0);
    QVERIFY(saved.completedAt.isValid());
}

void TestUploadQueue::testLoadRepeatsInterruptedCancelDelete()
{
    UploadItem canceled = UploadItem::create("/videos/a.mp4", configId_, "12345",
                                             UploadStatus::Canceled);
    canceled.videoId = "vid-7";
    UploadItem unstarted = UploadItem::create("/videos/b.mp4", configId_, "12345",
                                              UploadStatus::Canceled);
    QVERIFY(store_->save({canceled, unstarted}));

    VideoDetails video;
    video.videoId = "vid-7";
    api_->mockAddVideo(video);

    queue_->load();
    QVERIFY(!queue_->contains(unstarted.id));

    QTRY_VERIFY(!queue_->contains(canceled.id));
    QCOMPARE(api_->mockCallCount(IVideoService::OpDeleteVideo), 1);
    QCOMPARE(api_->mockCalls(IVideoService::OpDeleteVideo).first().videoId, QString("vid-7"));
    QVERIFY(!api_->mockHasVideo("vid-7"));
    QVERIFY(store_->load().isEmpty());
}

// === Remote metadata ===

void TestUploadQueue::testProcessingReadyNotifiesOnce()
{
    QSignalSpy readySpy(queue_, &UploadQueue::videoReady);
    const QString id = completeOneUpload();
    QVERIFY(!id.isEmpty());
    const QString videoId = queue_->item(id).videoId;

    QTRY_VERIFY(api_->mockCallCount(IVideoService::OpFetchDetails) >= 2);
    QCOMPARE(readySpy.count(), 0);

    VideoDetails ready = api_->mockVideo(videoId);
    ready.encodeProgress = 100;
    ready.title = "Holiday";
    api_->mockAddVideo(ready);

    QTRY_COMPARE(readySpy.count(), 1);
    QCOMPARE(readySpy.at(0).at(1).toString(), QString("Holiday"));
    QVERIFY(queue_->item(id).processingReadyNotified);

    const int polls = api_->mockCallCount(IVideoService::OpFetchDetails);
    QTest::qWait(50);
    QCOMPARE(api_->mockCallCount(IVideoService::OpFetchDetails), polls);

    QVERIFY(queue_->refreshVideoDetails(id));
    QTRY_COMPARE(api_->mockCallCount(IVideoService::OpFetchDetails), polls + 1);
    QTest::qWait(20);
    QCOMPARE(readySpy.count(), 1);
}

void TestUploadQueue::testRefreshNotFoundRemovesEntry()
{
    const QString id = completeOneUpload();
    QVERIFY(!id.isEmpty());
    api_->mockRemoveVideo(queue_->item(id).videoId);

    QVERIFY(queue_->refreshVideoDetails(id));
    QTRY_VERIFY(!queue_->contains(id));
}

void TestUploadQueue::testUpdateTitleRefreshesEntry()
{
    const QString id = completeOneUpload();
    QVERIFY(!id.isEmpty());
    QSignalSpy titleSpy(queue_, &UploadQueue::titleUpdateFinished);

    QVERIFY(queue_->updateTitle(id, "New title"));

    QTRY_COMPARE(titleSpy.count(), 1);
    QCOMPARE(titleSpy.at(0).at(1).toBool(), true);
    QTRY_COMPARE(queue_->item(id).remoteTitle, QString("New title"));
    QCOMPARE(queue_->data(queue_->index(0), UploadQueue::TitleRole).toString(),
             QString("New title"));
}

void TestUploadQueue::testUploadThumbnailClearsCachedPath()
{
    const QString id = completeOneUpload();
    QVERIFY(!id.isEmpty());

    VideoDetails video = api_->mockVideo(queue_->item(id).videoId);
    video.thumbnailFileName = "thumbnail.jpg";
    video.encodeProgress = 100;
    api_->mockAddVideo(video);
    QVERIFY(queue_->refreshVideoDetails(id));
    QTRY_COMPARE(queue_->item(id).remoteThumbnailPath, QString("thumbnail.jpg"));

    QSignalSpy thumbSpy(queue_, &UploadQueue::thumbnailUploadFinished);
    QVERIFY(queue_->uploadThumbnail(id, QByteArray("\x89PNG", 4), "image/png"));
    QTRY_COMPARE(thumbSpy.count(), 1);
    QCOMPARE(thumbSpy.at(0).at(1).toBool(), true);
    QVERIFY(queue_->item(id).remoteThumbnailPath.isEmpty());

    const MockVideoService::Call call = api_->mockCalls(IVideoService::OpUploadThumbnail).first();
    QCOMPARE(call.mimeType, QString("image/png"));
    QCOMPARE(call.data.size(), 4);
}

void TestUploadQueue::testDeleteFromRemote()
{
    const QString id = completeOneUpload();
    QVERIFY(!id.isEmpty());
    QSignalSpy deleteSpy(queue_, &UploadQueue::remoteDeleteFinished);

    api_->mockSetFailure(IVideoService::OpDeleteVideo, "HTTP 500");
    queue_->deleteFromRemote(id);
    QTRY_COMPARE(deleteSpy.count(), 1);
    QCOMPARE(deleteSpy.at(0).at(1).toBool(), false);
    QVERIFY(queue_->contains(id));

    api_->mockSetFailure(IVideoService::OpDeleteVideo, QString());
    queue_->deleteFromRemote(id);
    QTRY_COMPARE(deleteSpy.count(), 2);
    QCOMPARE(deleteSpy.at(1).at(1).toBool(), true);
    QVERIFY(!queue_->contains(id));
}

void TestUploadQueue::testFailedDeleteOfActiveUploadKeepsQueueMoving()
{
    api_->mockSetFailure(IVideoService::OpDeleteVideo, "HTTP 500");
    http_->mockSetAutoRespond(false);

    const QStringList first = queue_->enqueue({createFile("a.mp4", 2 * ChunkSize)}, configId_);
    const QString id = first.first();
    QTRY_VERIFY(queue_->item(id).hasVideo());
    QCOMPARE(statusOf(id), UploadStatus::Uploading);
    QSignalSpy deleteSpy(queue_, &UploadQueue::remoteDeleteFinished);

    queue_->deleteFromRemote(id);
    QCOMPARE(statusOf(id), UploadStatus::Paused);
    QVERIFY(!queue_->hasSession(id));

    QTRY_COMPARE(deleteSpy.count(), 1);
    QCOMPARE(deleteSpy.at(0).at(1).toBool(), false);
    QVERIFY(queue_->contains(id));
    QCOMPARE(queue_->uploadingCount(), 0);

    http_->mockSetAutoRespond(true);
    http_->mockProcessAll();
    const QStringList second = queue_->enqueue({createFile("b.mp4", ChunkSize)}, configId_);
    QTRY_COMPARE(statusOf(second.first()), UploadStatus::Success);
    QCOMPARE(statusOf(id), UploadStatus::Paused);
}

void TestUploadQueue::testSyncLibraryMergesCatalog()
{
    const QDateTime uploaded = QDateTime(QDate(2024, 5, 1), QTime(12, 0), QTimeZone::utc());

    UploadItem known = UploadItem::create("/videos/known.mp4", configId_, "12345",
                                          UploadStatus::Success);
    known.videoId = "known-1";
    UploadItem gone = UploadItem::create("/videos/gone.mp4", configId_, "12345",
                                         UploadStatus::Success);
    gone.videoId = "gone-1";
    UploadItem paused = UploadItem::create("/videos/paused.mp4", configId_, "12345",
                                           UploadStatus::Paused);
    paused.videoId = "gone-2";
    QVERIFY(store_->save({known, gone, paused}));

    queue_->setAutoResume(false);
    queue_->load();

    VideoDetails remoteKnown;
    remoteKnown.videoId = "known-1";
    remoteKnown.title = "Known remotely";
    remoteKnown.encodeProgress = 100;
    remoteKnown.createdAt = uploaded;
    api_->mockAddVideo(remoteKnown);

    VideoDetails remoteOnly;
    remoteOnly.videoId = "remote-1";
    remoteOnly.title = "Uploaded elsewhere";
    remoteOnly.createdAt = uploaded;
    api_->mockAddVideo(remoteOnly);

    QSignalSpy syncSpy(queue_, &UploadQueue::librarySynced);
    queue_->syncLibrary(configId_);
    QTRY_COMPARE(syncSpy.count(), 1);
    QCOMPARE(syncSpy.at(0).at(1).toBool(), true);

    QCOMPARE(queue_->item(known.id).remoteTitle, QString("Known remotely"));
    QCOMPARE(queue_->item(known.id).completedAt, uploaded);
    QVERIFY(!queue_->contains(gone.id));
    QVERIFY(queue_->contains(paused.id));

    QCOMPARE(queue_->count(), 3);
    UploadItem added;
    for (const UploadItem &item : queue_->items()) {
        if (item.videoId == "remote-1") {
            added = item;
        }
    }
    QCOMPARE(added.status, UploadStatus::Success);
    QCOMPARE(added.progress, 1.0);
    QCOMPARE(added.displayTitle(), QString("Uploaded elsewhere"));
    QCOMPARE(added.createdAt, uploaded);
    QCOMPARE(added.libraryConfigId, configId_);
}

void TestUploadQueue::testSyncLibraryReadsAllPages()
{
    for (int i = 0; i < 150; ++i) {
        VideoDetails video;
        video.videoId = QString("remote-%1").arg(i);
        video.title = QString("Video %1").arg(i);
        api_->mockAddVideo(video);
    }

    QSignalSpy syncSpy(queue_, &UploadQueue::librarySynced);
    queue_->syncLibrary(configId_);
    QTRY_COMPARE(syncSpy.count(), 1);

    const QList<MockVideoService::Call> pages = api_->mockCalls(IVideoService::OpListVideos);
    QCOMPARE(pages.size(), 2);
    QCOMPARE(pages.at(0).page, 1);
    QCOMPARE(pages.at(1).page, 2);
    QCOMPARE(pages.at(0).perPage, UploadQueue::SyncPageSize);
    QCOMPARE(queue_->count(), 150);
}

// === Ambient ===

void TestUploadQueue::testSleepGuardFollowsQueue()
{
    QVERIFY(!guard_->isActive());

    http_->mockSetAutoRespond(false);
    const QStringList ids = queue_->enqueue({createFile("a.mp4", ChunkSize)}, configId_);
    QVERIFY(guard_->isActive());

    http_->mockSetAutoRespond(true);
    queue_->flushEventQueue();
    http_->mockProcessAll();
    QTRY_COMPARE(statusOf(ids.first()), UploadStatus::Success);
    QVERIFY(!guard_->isActive());
}

void TestUploadQueue::testModelRoles()
{
    const QString noKey = libraries_->addLibrary("No key", "999", QString());
    queue_->enqueue({createFile("clip.mp4", ChunkSize)}, noKey);

    QCOMPARE(queue_->rowCount(), 1);
    const QModelIndex index = queue_->index(0);
    QCOMPARE(queue_->data(index, UploadQueue::FileNameRole).toString(), QString("clip.mp4"));
    QCOMPARE(queue_->data(index, UploadQueue::StatusLabelRole).toString(), QString("Failed"));
    QCOMPARE(queue_->data(index, UploadQueue::TotalBytesRole).toLongLong(), qint64(ChunkSize));
    QCOMPARE(queue_->data(index, UploadQueue::LibraryConfigIdRole).toString(), noKey);

    const QHash<int, QByteArray> roles = queue_->roleNames();
    QCOMPARE(roles.value(UploadQueue::ProgressRole), QByteArray("progress"));
    QCOMPARE(roles.value(UploadQueue::StatusRole), QByteArray("status"));
}

QTEST_MAIN(TestUploadQueue)
#include "test_uploadqueue.moc"
