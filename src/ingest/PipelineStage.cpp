#include "ingest/PipelineStage.h"

#include <QHash>
#include <QObject>
#include <QtGlobal>

namespace {

// The backend has shipped both vendor-prefixed and neutral spellings for the
// deep processing stages; both map to the same kind.
const QHash<QString, PipelineStage::Kind>& knownTags()
{
    using Kind = PipelineStage::Kind;
    static const QHash<QString, Kind> tags = {
        {QStringLiteral("EXISTS"), Kind::Exists},
        {QStringLiteral("PRECHECK_HIT"), Kind::Exists},
        {QStringLiteral("NOT_EXISTS"), Kind::NotExists},
        {QStringLiteral("PRECHECK_MISS"), Kind::NotExists},
        {QStringLiteral("UPLOADING"), Kind::Uploading},
        {QStringLiteral("QUEUED"), Kind::Queued},
        {QStringLiteral("MERGING"), Kind::Merging},
        {QStringLiteral("MERGED"), Kind::Merged},
        {QStringLiteral("TRANSCODING"), Kind::Transcoding},
        {QStringLiteral("CHECK"), Kind::Check},
        {QStringLiteral("REMOTE_UPLOAD"), Kind::RemoteUpload},
        {QStringLiteral("OSS_UPLOAD"), Kind::RemoteUpload},
        {QStringLiteral("REMOTE_CLEAN"), Kind::RemoteClean},
        {QStringLiteral("OSS_CLEAN"), Kind::RemoteClean},
        {QStringLiteral("SUBMIT"), Kind::Submit},
        {QStringLiteral("AI_SUBMIT"), Kind::Submit},
        {QStringLiteral("POLL"), Kind::Poll},
        {QStringLiteral("AI_POLL"), Kind::Poll},
        {QStringLiteral("DOWNLOAD_RESULTS"), Kind::DownloadResults},
        {QStringLiteral("INDEX"), Kind::Index},
        {QStringLiteral("ES_INDEX"), Kind::Index},
        {QStringLiteral("DONE"), Kind::Done},
        {QStringLiteral("FAILED"), Kind::Failed},
        {QStringLiteral("UNKNOWN"), Kind::Unknown},
    };
    return tags;
}

int percent(double progress)
{
    return qRound(qBound(0.0, progress, 1.0) * 100.0);
}

} // namespace

PipelineStage PipelineStage::fromTag(const QString& tag)
{
    const QString trimmed = tag.trimmed();
    if (trimmed.isEmpty()) {
        return PipelineStage();
    }

    const auto& tags = knownTags();
    const auto it = tags.constFind(trimmed.toUpper());
    if (it == tags.constEnd()) {
        return PipelineStage(Kind::Other, trimmed);
    }
    return PipelineStage(it.value(), trimmed);
}

QString PipelineStage::displayLabel(const PipelineStage& stage, double progress)
{
    switch (stage.kind()) {
    case Kind::Exists:
        return QObject::tr("Already processed, ready for deep processing");
    case Kind::NotExists:
        return QObject::tr("Not found on server, preparing transfer");
    case Kind::Uploading:
        return QObject::tr("Receiving segments (%1%)").arg(percent(progress));
    case Kind::Queued:
        return QObject::tr("Queued");
    case Kind::Merging:
        return QObject::tr("Merging segments (%1%)").arg(percent(progress));
    case Kind::Merged:
        return QObject::tr("Segments merged");
    case Kind::Transcoding:
        return QObject::tr("Transcoding (%1%)").arg(percent(progress));
    case Kind::Check:
        return QObject::tr("Checking history...");
    case Kind::RemoteUpload:
        return QObject::tr("Uploading to storage...");
    case Kind::RemoteClean:
        return QObject::tr("Cleaning up storage...");
    case Kind::Submit:
        return QObject::tr("Submitting for analysis...");
    case Kind::Poll:
        return QObject::tr("Analyzing (%1%)...").arg(percent(progress));
    case Kind::DownloadResults:
        return QObject::tr("Fetching analysis results...");
    case Kind::Index:
        return QObject::tr("Building knowledge cards and index...");
    case Kind::Done:
        return QObject::tr("Done");
    case Kind::Failed:
        return QObject::tr("Failed");
    case Kind::Unknown:
        return QObject::tr("Status unknown");
    case Kind::Other:
        break;
    }
    return QObject::tr("Processing on server...");
}
