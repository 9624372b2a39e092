/*
 * thumbnailrenderer.cpp: Renders page thumbnails via Poppler
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "thumbnailrenderer.h"

#include <QDebug>

#include <poppler-qt6.h>

// --- Render worker (runs in background thread) ---

class ThumbnailRenderer::RenderWorker : public QObject {
    Q_OBJECT
public:
    explicit RenderWorker(std::shared_ptr<std::atomic_int> currentGeneration)
        : m_currentGeneration(std::move(currentGeneration))
    {
    }

    void renderAll(const QString &filePath, int maxSize, int generation)
    {
        std::unique_ptr<Poppler::Document> doc = Poppler::Document::load(filePath);
        if (!doc) {
            Q_EMIT failed(tr("Cannot open %1").arg(filePath), generation);
            return;
        }
        if (doc->isLocked()) {
            Q_EMIT failed(tr("%1 is password protected").arg(filePath), generation);
            return;
        }

        doc->setRenderHint(Poppler::Document::Antialiasing, true);
        doc->setRenderHint(Poppler::Document::TextAntialiasing, true);

        const int pages = doc->numPages();
        Q_EMIT opened(pages, generation);

        for (int i = 0; i < pages; ++i) {
            // A newer request supersedes this one
            if (m_currentGeneration->load() != generation)
                return;

            std::unique_ptr<Poppler::Page> page(doc->page(i));
            if (!page)
                continue;

            QSizeF pageSize = page->pageSizeF(); // in points (72 dpi)
            const qreal longest = qMax(pageSize.width(), pageSize.height());
            if (longest <= 0)
                continue;
            const qreal dpi = 72.0 * maxSize / longest;

            QImage image = page->renderToImage(dpi, dpi);
            if (image.isNull()) {
                qWarning() << "ThumbnailRenderer: failed to render page" << i + 1
                           << "of" << filePath;
                continue;
            }
            Q_EMIT rendered(i, image, generation);
        }
    }

Q_SIGNALS:
    void opened(int pageCount, int generation);
    void rendered(int pageNumber, const QImage &image, int generation);
    void failed(const QString &message, int generation);

private:
    std::shared_ptr<std::atomic_int> m_currentGeneration;
};

// --- ThumbnailRenderer ---

ThumbnailRenderer::ThumbnailRenderer(QObject *parent)
    : QObject(parent)
    , m_currentGeneration(std::make_shared<std::atomic_int>(0))
{
    m_worker = new RenderWorker(m_currentGeneration);
    m_worker->moveToThread(&m_renderThread);

    connect(m_worker, &RenderWorker::opened,
            this, &ThumbnailRenderer::onOpened, Qt::QueuedConnection);
    connect(m_worker, &RenderWorker::rendered,
            this, &ThumbnailRenderer::onRendered, Qt::QueuedConnection);
    connect(m_worker, &RenderWorker::failed,
            this, &ThumbnailRenderer::onFailed, Qt::QueuedConnection);

    m_renderThread.start();
}

ThumbnailRenderer::~ThumbnailRenderer()
{
    // Makes a render in progress stop at the next page
    m_currentGeneration->store(-1);
    m_renderThread.quit();
    m_renderThread.wait();
    delete m_worker;
}

void ThumbnailRenderer::render(const QString &filePath, int maxSize)
{
    const int generation = ++m_generation;
    m_currentGeneration->store(generation);

    RenderWorker *worker = m_worker;
    QMetaObject::invokeMethod(worker, [worker, filePath, maxSize, generation]() {
        worker->renderAll(filePath, maxSize, generation);
    }, Qt::QueuedConnection);
}

void ThumbnailRenderer::onOpened(int pageCount, int generation)
{
    if (generation != m_generation)
        return;
    Q_EMIT documentOpened(pageCount);
}

void ThumbnailRenderer::onRendered(int pageNumber, const QImage &image, int generation)
{
    // Discard stale results from a previous request
    if (generation != m_generation)
        return;
    Q_EMIT thumbnailReady(pageNumber, image);
}

void ThumbnailRenderer::onFailed(const QString &message, int generation)
{
    if (generation != m_generation)
        return;
    Q_EMIT failed(message);
}

#include "thumbnailrenderer.moc"
