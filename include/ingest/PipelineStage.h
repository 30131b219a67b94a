#ifndef PIPELINESTAGE_H
#define PIPELINESTAGE_H

#include <QMetaType>
#include <QString>

/**
 * @brief A stage tag reported by one of the remote pipelines.
 *
 * The remote vocabulary grows over time. Tags we know about map to a Kind,
 * everything else becomes Kind::Other and keeps the raw tag, so callers can
 * still forward it and show a generic "processing" label.
 */
class PipelineStage
{
public:
    enum class Kind {
        // Pseudo-stages reported by preflight
        Exists,
        NotExists,

        // Ingestion job (merge / transcode)
        Uploading,
        Queued,
        Merging,
        Merged,
        Transcoding,

        // Deep processing job
        Check,
        RemoteUpload,
        RemoteClean,
        Submit,
        Poll,
        DownloadResults,
        Index,

        // Sentinels
        Done,
        Failed,
        Unknown,

        Other
    };

    PipelineStage() = default;

    static PipelineStage fromTag(const QString& tag);

    Kind kind() const { return m_kind; }
    QString tag() const { return m_tag; }

    bool isDone() const { return m_kind == Kind::Done; }
    bool isFailure() const { return m_kind == Kind::Failed || m_kind == Kind::Unknown; }
    bool isTerminal() const { return isDone() || isFailure(); }
    bool isRecognized() const { return m_kind != Kind::Other; }

    // Human readable label for a non-terminal stage
    static QString displayLabel(const PipelineStage& stage, double progress);

    bool operator==(const PipelineStage& other) const
    {
        return m_kind == other.m_kind && m_tag == other.m_tag;
    }
    bool operator!=(const PipelineStage& other) const { return !(*this == other); }

    static constexpr const char* kDone = "DONE";
    static constexpr const char* kFailed = "FAILED";
    static constexpr const char* kUnknown = "UNKNOWN";
    static constexpr const char* kExists = "EXISTS";
    static constexpr const char* kNotExists = "NOT_EXISTS";

private:
    PipelineStage(Kind kind, const QString& tag) : m_kind(kind), m_tag(tag) {}

    Kind m_kind = Kind::Unknown;
    QString m_tag = QString::fromLatin1(kUnknown);
};

Q_DECLARE_METATYPE(PipelineStage)

#endif // PIPELINESTAGE_H
