#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(rcCore, "recollect.core")
Q_LOGGING_CATEGORY(rcIndex, "recollect.index")
Q_LOGGING_CATEGORY(rcRanking, "recollect.ranking")
Q_LOGGING_CATEGORY(rcCorpus, "recollect.corpus")
Q_LOGGING_CATEGORY(rcModels, "recollect.models")
Q_LOGGING_CATEGORY(rcIpc, "recollect.ipc")
