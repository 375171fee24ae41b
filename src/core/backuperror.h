#ifndef BACKUPERROR_H
#define BACKUPERROR_H

#include <QMetaType>

enum class ErrorKind {
    None,
    IOError,            // unreadable source, unwritable destination
    SerializationError, // metadata could not be written or parsed as JSON
    InvalidConfiguration
};

Q_DECLARE_METATYPE(ErrorKind)

#endif // BACKUPERROR_H
