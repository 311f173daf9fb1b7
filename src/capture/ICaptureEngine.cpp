#include "capture/ICaptureEngine.h"
#include "capture/QtCaptureEngine.h"

#include <QDebug>

ICaptureEngine *ICaptureEngine::createBestEngine(QObject *parent)
{
    // Region polling at a few frames per second doesn't need a streaming
    // backend, so the portable grabber serves every platform.
    auto *engine = new QtCaptureEngine(parent);
    qDebug() << "ICaptureEngine: Selected" << engine->engineName();
    return engine;
}
