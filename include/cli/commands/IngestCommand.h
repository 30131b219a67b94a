#ifndef INGEST_COMMAND_H
#define INGEST_COMMAND_H

#include "cli/CLICommand.h"
#include "ingest/IngestionTypes.h"

#include <functional>

class IIngestionApi;

namespace IngestKit {
namespace CLI {

/**
 * @brief Ingest a local file and wait for the server pipelines to finish
 */
class IngestCommand : public CLICommand
{
public:
    // Creates the service client for one run; the command owns the result
    using ApiFactory = std::function<IIngestionApi*(const IngestionConfig&)>;

    explicit IngestCommand(ApiFactory apiFactory = ApiFactory());

    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;

private:
    ApiFactory m_apiFactory;
};

} // namespace CLI
} // namespace IngestKit

#endif // INGEST_COMMAND_H
