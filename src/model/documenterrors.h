/*
 * documenterrors.h — Failure kinds raised while building a document
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_DOCUMENTERRORS_H
#define LEDGERPRINT_DOCUMENTERRORS_H

#include <stdexcept>

#include <QString>

// Base of every failure a document build can raise. No partial output is
// ever returned alongside one of these.
class DocumentError : public std::runtime_error {
public:
    explicit DocumentError(const QString &message)
        : std::runtime_error(message.toStdString())
        , m_message(message)
    {
    }

    QString message() const { return m_message; }

private:
    QString m_message;
};

// Payload rejected before any page was created.
class ValidationError : public DocumentError {
public:
    ValidationError(const QString &field, const QString &message)
        : DocumentError(field + QStringLiteral(": ") + message)
        , m_field(field)
    {
    }

    QString field() const { return m_field; }

private:
    QString m_field;
};

// Page guard exceeded, or a single row cannot fit an empty page.
class LayoutOverflowError : public DocumentError {
public:
    using DocumentError::DocumentError;
};

// The canvas or PDF serialization failed.
class RenderError : public DocumentError {
public:
    using DocumentError::DocumentError;
};

#endif // LEDGERPRINT_DOCUMENTERRORS_H
