#include "tusuploadsession.h"
#include "../utils/logging.h"

#include <QCryptographicHash>
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QTimer>
#include <QUuid>

TusUploadSession::TusUploadSession(IHttpTransport *transport, IVideoService *videoService,
                                   QObject *parent)
    : QObject(parent)
    , transport_(transport)
    , videoService_(videoService)
    , endpoint_(QString::fromLatin1(DefaultEndpoint))
    , serviceTag_(QUuid::createUuid().toString(QUuid::WithoutBraces))
{
    connect(transport_, &IHttpTransport::finished,
            this, &TusUploadSession::onRequestFinished);
    connect(videoService_, &IVideoService::videoCreated,
            this, &TusUploadSession::onVideoCreated);
    connect(videoService_, &IVideoService::operationFailed,
            this, &TusUploadSession::onVideoOperationFailed);
}

TusUploadSession::~TusUploadSession()
{
    if (currentRequestId_ != 0) {
        transport_->abort(currentRequestId_);
        currentRequestId_ = 0;
    }
}

QByteArray TusUploadSession::computeSignature(const QString &libraryId,
                                              const QString &apiKey,
                                              qint64 expire,
                                              const QString &videoId)
{
    const QByteArray payload = libraryId.toUtf8() + apiKey.toUtf8()
                               + QByteArray::number(expire) + videoId.toUtf8();
    return QCryptographicHash::hash(payload, QCryptographicHash::Sha256).toHex();
}

QByteArray TusUploadSession::encodeMetadata(const QString &fileName)
{
    return "filename " + fileName.toUtf8().toBase64();
}

QUrl TusUploadSession::resolveLocation(const QByteArray &location, const QUrl &endpoint)
{
    const QUrl url = QUrl::fromEncoded(location.trimmed());
    if (url.isRelative()) {
        return endpoint.resolved(url);
    }
    return url;
}

void TusUploadSession::start(const TusUploadParams &params)
{
    if (state_ != State::Idle) {
        qWarning() << "TusUploadSession: start() called twice, ignoring";
        return;
    }

    params_ = params;
    videoId_ = params.videoId;
    uploadUrl_ = params.uploadUrl;
    state_ = State::Bootstrapping;
    elapsed_.start();

    const QFileInfo info(params_.filePath);
    if (!info.exists() || !info.isFile()) {
        // Reported from the event loop so callers never see a signal inside start()
        const QString message = tr("File not found: %1").arg(params_.filePath);
        schedule(0, [this, message]() { finishFailed(ErrorCategory::LocalFile, message); });
        return;
    }
    totalBytes_ = info.size();

    if (videoId_.isEmpty()) {
        qDebug() << "TusUploadSession: creating video for" << info.fileName();
        LibraryCredentials credentials{params_.libraryId, params_.apiKey};
        creatingVideo_ = true;
        videoService_->createVideo(serviceTag_, credentials, params_.title,
                                   params_.collectionId);
        return;
    }

    prepareSignature();
    if (uploadUrl_.isEmpty()) {
        createUpload();
    } else {
        qDebug() << "TusUploadSession: resuming" << uploadUrl_.toString();
        beginTransfer();
    }
}

void TusUploadSession::abort()
{
    if (aborted_ || isFinished()) {
        return;
    }
    aborted_ = true;
    if (currentRequestId_ != 0) {
        transport_->abort(currentRequestId_);
        currentRequestId_ = 0;
    }
    currentStage_ = Stage::None;
    if (state_ != State::Idle) {
        state_ = State::Paused;
    }
    LOG_VERBOSE() << "TusUploadSession: aborted at offset" << acknowledged_;
}

// Bootstrap

void TusUploadSession::onVideoCreated(const QString &tag, const QString &videoId)
{
    if (tag != serviceTag_) {
        return;
    }
    creatingVideo_ = false;
    if (aborted_ || state_ != State::Bootstrapping) {
        return;
    }

    videoId_ = videoId;
    emit videoCreated(videoId_);
    if (aborted_) {
        return;
    }

    prepareSignature();
    createUpload();
}

void TusUploadSession::onVideoOperationFailed(const QString &tag, const QString &operation,
                                              const QString &error)
{
    if (tag != serviceTag_ || operation != QLatin1String(IVideoService::OpCreateVideo)) {
        return;
    }
    creatingVideo_ = false;
    if (aborted_ || state_ != State::Bootstrapping) {
        return;
    }
    finishFailed(ErrorCategory::ResourceBootstrap,
                 tr("Could not create video: %1").arg(error));
}

void TusUploadSession::prepareSignature()
{
    expire_ = QDateTime::currentSecsSinceEpoch() + SignatureLifetimeSecs;
    signature_ = computeSignature(params_.libraryId, params_.apiKey, expire_, videoId_);
}

void TusUploadSession::applyTusHeaders(HttpRequest &request) const
{
    request.setHeader("Tus-Resumable", "1.0.0");
    request.setHeader("AuthorizationSignature", signature_);
    request.setHeader("AuthorizationExpire", QByteArray::number(expire_));
    request.setHeader("VideoId", videoId_.toUtf8());
    request.setHeader("LibraryId", params_.libraryId.toUtf8());
}

void TusUploadSession::send(Stage stage, HttpRequest request)
{
    applyTusHeaders(request);
    currentStage_ = stage;
    currentRequestId_ = transport_->send(request);
}

void TusUploadSession::createUpload()
{
    HttpRequest request;
    request.method = "POST";
    request.url = endpoint_;
    request.setHeader("Upload-Length", QByteArray::number(totalBytes_));
    request.setHeader("Upload-Metadata", encodeMetadata(QFileInfo(params_.filePath).fileName()));

    LOG_VERBOSE() << "TusUploadSession: POST" << endpoint_.toString()
                  << "length" << totalBytes_;
    send(Stage::Create, request);
}

void TusUploadSession::handleCreateResponse(const HttpResponse &response)
{
    if (response.isNetworkLoss()) {
        finishPaused(response.errorString);
        return;
    }

    if (response.hasResponse() && response.statusCode < 300
        && !response.header("Location").isEmpty()) {
        uploadUrl_ = resolveLocation(response.header("Location"), endpoint_);
        createAttempt_ = 0;
        qDebug() << "TusUploadSession: upload created at" << uploadUrl_.toString();
        emit uploadUrlChanged(uploadUrl_);
        if (aborted_) {
            return;
        }
        beginTransfer();
        return;
    }

    retryOrFail("create", createAttempt_, describe(response), [this]() { createUpload(); });
}

// Transfer loop

void TusUploadSession::beginTransfer()
{
    state_ = State::Transferring;
    probeRoute();
}

void TusUploadSession::probeRoute()
{
    HttpRequest request;
    request.method = "HEAD";
    request.url = uploadUrl_;
    send(Stage::Probe, request);
}

void TusUploadSession::handleProbeResponse(const HttpResponse &response)
{
    if (response.isNetworkLoss()) {
        LOG_VERBOSE() << "TusUploadSession: route probe failed," << response.errorString;
        schedule(policy_.probeRetryMs, [this]() { probeRoute(); });
        return;
    }
    // Any answer from the server means the route is usable
    discoverOffset();
}

void TusUploadSession::discoverOffset()
{
    HttpRequest request;
    request.method = "HEAD";
    request.url = uploadUrl_;
    send(Stage::Head, request);
}

void TusUploadSession::handleHeadResponse(const HttpResponse &response)
{
    if (response.isNetworkLoss()) {
        finishPaused(response.errorString);
        return;
    }

    bool ok = false;
    const qint64 offset = response.header("Upload-Offset").trimmed().toLongLong(&ok);
    const bool statusOk = response.hasResponse()
                          && (response.statusCode == 200 || response.statusCode == 204);
    if (!statusOk || !ok || offset < 0) {
        retryOrFail("head", headAttempt_, describe(response), [this]() { discoverOffset(); });
        return;
    }

    headAttempt_ = 0;
    acknowledged_ = qMin(offset, totalBytes_);
    if (sessionStartOffset_ < 0) {
        sessionStartOffset_ = acknowledged_;
    }
    LOG_VERBOSE() << "TusUploadSession: server offset" << offset << "of" << totalBytes_;
    reportProgress();
    if (aborted_) {
        return;
    }

    if (offset >= totalBytes_) {
        finishCompleted();
        return;
    }
    sendChunk(offset);
}

void TusUploadSession::sendChunk(qint64 offset)
{
    const qint64 length = qMin(chunkSize_, totalBytes_ - offset);
    if (length <= 0) {
        finishCompleted();
        return;
    }

    // The file is only held open while one chunk is read
    QFile file(params_.filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        finishFailed(ErrorCategory::LocalFile,
                     tr("Cannot read %1: %2").arg(params_.filePath, file.errorString()));
        return;
    }
    if (!file.seek(offset)) {
        finishFailed(ErrorCategory::LocalFile,
                     tr("Cannot seek in %1: %2").arg(params_.filePath, file.errorString()));
        return;
    }
    const QByteArray data = file.read(length);
    file.close();
    if (data.isEmpty()) {
        finishFailed(ErrorCategory::LocalFile,
                     tr("Unexpected end of file: %1").arg(params_.filePath));
        return;
    }

    chunkOffset_ = offset;
    chunkLength_ = data.size();

    HttpRequest request;
    request.method = "PATCH";
    request.url = uploadUrl_;
    request.setHeader("Content-Type", "application/offset+octet-stream");
    request.setHeader("Upload-Offset", QByteArray::number(offset));
    request.setHeader("Content-Length", QByteArray::number(chunkLength_));
    request.body = data;

    LOG_VERBOSE() << "TusUploadSession: PATCH offset" << offset << "length" << chunkLength_;
    send(Stage::Patch, request);
}

void TusUploadSession::handlePatchResponse(const HttpResponse &response)
{
    if (response.isNetworkLoss()) {
        finishPaused(response.errorString);
        return;
    }

    if (!response.hasResponse()) {
        retryOrFail("patch", patchAttempt_, describe(response),
                    [this]() { sendChunk(chunkOffset_); });
        return;
    }

    if (response.statusCode == 204 && response.hasHeader("Upload-Offset")) {
        bool ok = false;
        const qint64 newOffset = response.header("Upload-Offset").trimmed().toLongLong(&ok);
        if (ok && newOffset > chunkOffset_) {
            patchAttempt_ = 0;
            acknowledged_ = qMin(newOffset, totalBytes_);
            reportProgress();
            if (aborted_) {
                return;
            }
            if (newOffset >= totalBytes_) {
                finishCompleted();
                return;
            }
            sendChunk(newOffset);
            return;
        }
        if (ok) {
            retryOrFail("patch", patchAttempt_,
                        tr("server offset did not advance (%1)").arg(newOffset),
                        [this]() { sendChunk(chunkOffset_); });
            return;
        }
    }

    if (response.statusCode == 200 || response.statusCode == 204) {
        // Accepted without a usable offset; ask the server where we are
        LOG_VERBOSE() << "TusUploadSession: PATCH" << response.statusCode
                      << "without offset, re-reading offset";
        discoverOffset();
        return;
    }

    if (response.statusCode == 423) {
        qDebug() << "TusUploadSession: upload locked (423), re-reading offset";
        schedule(policy_.lockedRetryMs, [this]() { discoverOffset(); });
        return;
    }

    retryOrFail("patch", patchAttempt_, describe(response),
                [this]() { sendChunk(chunkOffset_); });
}

void TusUploadSession::onRequestFinished(quint64 requestId, const HttpResponse &response)
{
    if (requestId == 0 || requestId != currentRequestId_) {
        return;
    }
    currentRequestId_ = 0;
    const Stage stage = currentStage_;
    currentStage_ = Stage::None;

    if (aborted_ || isFinished()) {
        return;
    }

    switch (stage) {
    case Stage::Create:
        handleCreateResponse(response);
        break;
    case Stage::Probe:
        handleProbeResponse(response);
        break;
    case Stage::Head:
        handleHeadResponse(response);
        break;
    case Stage::Patch:
        handlePatchResponse(response);
        break;
    case Stage::None:
        break;
    }
}

// Retry, timers, progress

void TusUploadSession::retryOrFail(const char *stageName, int &attempt, const QString &reason,
                                   const std::function<void()> &action)
{
    if (attempt >= policy_.backoffMs.size()) {
        qWarning() << "TusUploadSession: retries exhausted at stage" << stageName << reason;
        finishFailed(ErrorCategory::Protocol,
                     tr("Upload failed at stage %1 after %2 attempts: %3")
                         .arg(QLatin1String(stageName))
                         .arg(attempt + 1)
                         .arg(reason));
        return;
    }

    const int delay = policy_.backoffMs.at(attempt);
    ++attempt;
    LOG_VERBOSE() << "TusUploadSession:" << stageName << "failed (" << reason
                  << "), retry" << attempt << "in" << delay << "ms";
    schedule(delay, action);
}

void TusUploadSession::schedule(int delayMs, const std::function<void()> &action)
{
    QTimer::singleShot(delayMs, this, [this, action]() {
        if (aborted_ || isFinished()) {
            return;
        }
        action();
    });
}

void TusUploadSession::reportProgress()
{
    const qint64 start = sessionStartOffset_ < 0 ? acknowledged_ : sessionStartOffset_;
    const TransferRate rate = TransferRate::compute(acknowledged_ - start, acknowledged_,
                                                    totalBytes_, elapsed_.elapsed());
    emit progressChanged(acknowledged_, totalBytes_, rate);
}

QString TusUploadSession::describe(const HttpResponse &response)
{
    if (!response.hasResponse()) {
        return response.errorString.isEmpty() ? tr("transport error") : response.errorString;
    }
    return tr("HTTP %1").arg(response.statusCode);
}

// Terminal states

bool TusUploadSession::isFinished() const
{
    return state_ == State::Done || state_ == State::Failed
           || (state_ == State::Paused && !aborted_);
}

void TusUploadSession::finishCompleted()
{
    state_ = State::Done;
    acknowledged_ = totalBytes_;
    qDebug() << "TusUploadSession: upload complete," << totalBytes_ << "bytes";
    emit completed();
}

void TusUploadSession::finishPaused(const QString &reason)
{
    state_ = State::Paused;
    qDebug() << "TusUploadSession: network lost, pausing at offset" << acknowledged_ << reason;
    emit paused(reason);
}

void TusUploadSession::finishFailed(ErrorCategory category, const QString &message)
{
    state_ = State::Failed;
    qWarning() << "TusUploadSession:" << ErrorHandler::categoryToString(category) << message;
    emit failed(category, message);
}
