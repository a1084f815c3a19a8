#include "Logging.h"

Q_LOGGING_CATEGORY(lcTrimmer, "cliptrimmer.trimmer")
Q_LOGGING_CATEGORY(lcMedia, "cliptrimmer.media")
Q_LOGGING_CATEGORY(lcConfig, "cliptrimmer.config")
