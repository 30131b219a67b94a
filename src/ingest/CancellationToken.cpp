#include "ingest/CancellationToken.h"

CancellationToken::CancellationToken(QObject* parent)
    : QObject(parent)
{
}

void CancellationToken::cancel()
{
    if (m_cancelled) {
        return;
    }
    m_cancelled = true;
    emit cancelled();
}
