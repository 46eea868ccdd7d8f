// Engine value types carried by queued signal connections.
#pragma once
#include "jobwatch/AuthHandshake.hpp"
#include "jobwatch/OperationTypes.hpp"

#include <QMetaType>

Q_DECLARE_METATYPE(jobwatch::OperationClass)
Q_DECLARE_METATYPE(jobwatch::AbortReason)
Q_DECLARE_METATYPE(jobwatch::AuthPhase)
Q_DECLARE_METATYPE(jobwatch::EngineError)
Q_DECLARE_METATYPE(jobwatch::ProgressSnapshot)
Q_DECLARE_METATYPE(jobwatch::TerminalSummary)

namespace jobwatchclient {

// Call once before connecting engine signals across threads.
inline void registerEngineMetaTypes() {
    qRegisterMetaType<jobwatch::OperationClass>("jobwatch::OperationClass");
    qRegisterMetaType<jobwatch::AbortReason>("jobwatch::AbortReason");
    qRegisterMetaType<jobwatch::AuthPhase>("jobwatch::AuthPhase");
    qRegisterMetaType<jobwatch::EngineError>("jobwatch::EngineError");
    qRegisterMetaType<jobwatch::ProgressSnapshot>("jobwatch::ProgressSnapshot");
    qRegisterMetaType<jobwatch::TerminalSummary>("jobwatch::TerminalSummary");
}

} // namespace jobwatchclient
