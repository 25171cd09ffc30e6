/**
 * @file ihttptransport.cpp
 * @brief Implementation file for the IHttpTransport interface.
 *
 * Holds the request helpers and gives Qt's MOC a translation unit for the
 * interface's signal.
 */

#include "ihttptransport.h"

void HttpRequest::setHeader(const QByteArray &name, const QByteArray &value)
{
    for (auto &header : headers) {
        if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
            header.second = value;
            return;
        }
    }
    headers.append(qMakePair(name, value));
}

QByteArray HttpRequest::header(const QByteArray &name) const
{
    for (const auto &header : headers) {
        if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
            return header.second;
        }
    }
    return QByteArray();
}
