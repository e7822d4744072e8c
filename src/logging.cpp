#include "logging.h"

Q_LOGGING_CATEGORY(lcTool, "brushselect.tool")
Q_LOGGING_CATEGORY(lcGeos, "brushselect.geos")
Q_LOGGING_CATEGORY(lcGdal, "brushselect.gdal")
Q_LOGGING_CATEGORY(lcCanvas, "brushselect.canvas")
