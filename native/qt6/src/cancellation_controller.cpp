#include "cancellation_controller.h"

#include <QDebug>

void CancellationController::requestCancel()
{
    const int n = m_requests.fetch_add(1) + 1;
    m_requested.store(true);
    if (n == 1) qInfo() << "[Cancel] Requested";
    else qDebug() << "[Cancel] Repeated request" << n;
}

void CancellationController::reset()
{
    m_requested.store(false);
    m_requests.store(0);
}
