#ifndef LOGGING_H
#define LOGGING_H

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTool)
Q_DECLARE_LOGGING_CATEGORY(lcGeos)
Q_DECLARE_LOGGING_CATEGORY(lcGdal)
Q_DECLARE_LOGGING_CATEGORY(lcCanvas)

#endif // LOGGING_H
