/*
 * thumbnailrenderer.h: Renders page thumbnails via Poppler in a
 * background thread
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PDFMERGER_THUMBNAILRENDERER_H
#define PDFMERGER_THUMBNAILRENDERER_H

#include <QImage>
#include <QObject>
#include <QThread>

#include <atomic>
#include <memory>

class ThumbnailRenderer : public QObject {
    Q_OBJECT
public:
    explicit ThumbnailRenderer(QObject *parent = nullptr);
    ~ThumbnailRenderer() override;

    // Open filePath and render every page so its longer side is maxSize
    // pixels. Starting a new request abandons the previous one.
    void render(const QString &filePath, int maxSize);

Q_SIGNALS:
    void documentOpened(int pageCount);
    void thumbnailReady(int pageNumber, const QImage &image);   // 0-based
    void failed(const QString &message);

private Q_SLOTS:
    void onOpened(int pageCount, int generation);
    void onRendered(int pageNumber, const QImage &image, int generation);
    void onFailed(const QString &message, int generation);

private:
    int m_generation = 0;
    std::shared_ptr<std::atomic_int> m_currentGeneration;

    class RenderWorker;
    QThread m_renderThread;
    RenderWorker *m_worker = nullptr;
};

#endif // PDFMERGER_THUMBNAILRENDERER_H
